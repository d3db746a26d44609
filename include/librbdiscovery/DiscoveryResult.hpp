#ifndef LIBRBDISCOVERY_DISCOVERYRESULT_HPP
#define LIBRBDISCOVERY_DISCOVERYRESULT_HPP

#include <chrono>
#include <string>

#include "ServerStats.hpp"

namespace librbdiscovery {

// A successful probe of one API endpoint
struct DiscoveryResult {
	std::string endpoint{};
	// Time spent connecting to the endpoint and retrieving its stats
	std::chrono::milliseconds duration{0};
	ServerStats stats{};
};

}  // namespace librbdiscovery

#endif  // LIBRBDISCOVERY_DISCOVERYRESULT_HPP
