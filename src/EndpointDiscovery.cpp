#include "librbdiscovery/EndpointDiscovery.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "librbdiscovery/HttpStatsFetcher.hpp"
#include "librbdiscovery/impl/Prober.hpp"
#include "librbdiscovery/impl/Selector.hpp"
#include "librbdiscovery/impl/Utils.hpp"

namespace librbdiscovery {

EndpointDiscovery::EndpointDiscovery(ProbeConfig config)
    : EndpointDiscovery{std::move(config), std::make_shared<AsioHostResolver>(),
                        std::make_shared<HttpStatsFetcher>()} {}

EndpointDiscovery::EndpointDiscovery(ProbeConfig config, std::shared_ptr<const HostResolver> resolver,
                                     std::shared_ptr<const StatsFetcher> fetcher)
    : probe_config{std::move(config)}, resolver{std::move(resolver)}, fetcher{std::move(fetcher)} {
	probe_config.validate();

	if (!this->resolver || !this->fetcher) {
		throw std::invalid_argument("Resolver and stats fetcher are required");
	}
}

std::vector<std::string> EndpointDiscovery::api_urls() const {
	return _impl::resolve_api_urls(*resolver, DNS_API_ADDRESS);
}

std::vector<DiscoveryResult> EndpointDiscovery::discover_api_urls(const std::vector<std::string>& api_urls) const {
	return _impl::probe_all(api_urls, probe_config, fetcher);
}

std::vector<DiscoveryResult> EndpointDiscovery::ranked() const {
	return _impl::rank_results(discover_api_urls(api_urls()));
}

std::optional<std::string> EndpointDiscovery::discover() const {
	std::optional<std::string> best = _impl::select_best(discover_api_urls(api_urls()));

	if (best) {
		spdlog::debug("Selected API endpoint {}", *best);
	} else {
		spdlog::info("No API endpoint behind {} answered in time", DNS_API_ADDRESS);
	}

	return best;
}

}  // namespace librbdiscovery
