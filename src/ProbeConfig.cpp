#include "librbdiscovery/ProbeConfig.hpp"

#include <stdexcept>

namespace librbdiscovery {

void ProbeConfig::validate() const {
	if (user_agent.empty()) {
		throw std::invalid_argument("User agent must not be empty");
	}
	if (thread_count == 0) {
		throw std::invalid_argument("Thread count must be at least 1");
	}
	if (request_timeout <= std::chrono::milliseconds::zero()) {
		throw std::invalid_argument("Request timeout must be positive");
	}
	if (probe_deadline <= std::chrono::milliseconds::zero()) {
		throw std::invalid_argument("Probe deadline must be positive");
	}
}

}  // namespace librbdiscovery
