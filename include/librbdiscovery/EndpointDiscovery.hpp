#ifndef LIBRBDISCOVERY_ENDPOINTDISCOVERY_HPP
#define LIBRBDISCOVERY_ENDPOINTDISCOVERY_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "DiscoveryResult.hpp"
#include "HostResolver.hpp"
#include "ProbeConfig.hpp"
#include "StatsFetcher.hpp"

namespace librbdiscovery {

/**
 * Discovers the radio-browser API endpoint with the lowest latency.
 *
 * All addresses behind `DNS_API_ADDRESS` are probed concurrently with a stats request. Endpoints that fail or do not
 * answer within `ProbeConfig::probe_deadline` are dropped, the rest are ranked by how long the request took.
 */
class EndpointDiscovery {
public:
	static constexpr std::string_view DNS_API_ADDRESS{"all.api.radio-browser.info"};

	explicit EndpointDiscovery(ProbeConfig config);
	EndpointDiscovery(ProbeConfig config, std::shared_ptr<const HostResolver> resolver,
	                  std::shared_ptr<const StatsFetcher> fetcher);

	[[nodiscard]] inline const ProbeConfig& config() const {
		return probe_config;
	}

	/**
	 * Gets the URLs of all API endpoints returned by DNS. Not all of them are necessarily working.
	 *
	 * @throws ResolutionError if `DNS_API_ADDRESS` can't be resolved
	 */
	[[nodiscard]] std::vector<std::string> api_urls() const;

	// Probes every URL in `api_urls`. Unreachable endpoints are not returned.
	[[nodiscard]] std::vector<DiscoveryResult> discover_api_urls(const std::vector<std::string>& api_urls) const;

	// All reachable endpoints, fastest first
	[[nodiscard]] std::vector<DiscoveryResult> ranked() const;

	/**
	 * Discovers the best performing endpoint.
	 *
	 * @return the endpoint base URL, or nothing if no endpoint answered in time
	 * @throws ResolutionError if `DNS_API_ADDRESS` can't be resolved
	 */
	[[nodiscard]] std::optional<std::string> discover() const;

private:
	ProbeConfig probe_config;
	std::shared_ptr<const HostResolver> resolver;
	std::shared_ptr<const StatsFetcher> fetcher;
};

}  // namespace librbdiscovery

#endif  // LIBRBDISCOVERY_ENDPOINTDISCOVERY_HPP
