#ifndef LIBRBDISCOVERY_PROBER_HPP
#define LIBRBDISCOVERY_PROBER_HPP

#include <memory>
#include <string>
#include <vector>

#include "librbdiscovery/DiscoveryResult.hpp"
#include "librbdiscovery/ProbeConfig.hpp"
#include "librbdiscovery/StatsFetcher.hpp"

namespace librbdiscovery::_impl {

DiscoveryResult probe(const std::string& api_url, const ProbeConfig& config, const StatsFetcher& fetcher);

/**
 * Probes every URL concurrently and returns the successful probes. Returns once every probe has either finished or
 * missed its deadline; probes that missed it keep running in the background and their results are discarded.
 */
std::vector<DiscoveryResult> probe_all(const std::vector<std::string>& api_urls, const ProbeConfig& config,
                                       std::shared_ptr<const StatsFetcher> fetcher);

}  // namespace librbdiscovery::_impl

#endif  // LIBRBDISCOVERY_PROBER_HPP
