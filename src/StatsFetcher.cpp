#include "librbdiscovery/StatsFetcher.hpp"

#include <utility>

namespace librbdiscovery {

ConnectionParams ConnectionParams::for_probe(std::string api_url, const ProbeConfig& config) {
	return ConnectionParams{.api_url = std::move(api_url),
	                        .timeout = config.request_timeout,
	                        .user_agent = config.user_agent,
	                        .proxy_uri = config.proxy_uri,
	                        .proxy_user = config.proxy_user,
	                        .proxy_password = config.proxy_password};
}

}  // namespace librbdiscovery
