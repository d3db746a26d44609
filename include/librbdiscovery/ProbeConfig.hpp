#ifndef LIBRBDISCOVERY_PROBECONFIG_HPP
#define LIBRBDISCOVERY_PROBECONFIG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace librbdiscovery {

struct ProbeConfig {
	static constexpr std::size_t DEFAULT_THREADS{10};
	static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

	std::string user_agent{};
	std::optional<std::string> proxy_uri{};
	std::optional<std::string> proxy_user{};
	std::optional<std::string> proxy_password{};

	// Connect + read budget of a single stats request
	std::chrono::milliseconds request_timeout{DEFAULT_TIMEOUT};
	// How long to wait for a probe, counted from its submission to the pool
	std::chrono::milliseconds probe_deadline{DEFAULT_TIMEOUT};
	std::size_t thread_count{DEFAULT_THREADS};

	void validate() const;
};

}  // namespace librbdiscovery

#endif  // LIBRBDISCOVERY_PROBECONFIG_HPP
