#ifndef LIBRBDISCOVERY_SELECTOR_HPP
#define LIBRBDISCOVERY_SELECTOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "librbdiscovery/DiscoveryResult.hpp"

namespace librbdiscovery::_impl {

std::vector<DiscoveryResult> rank_results(const std::vector<DiscoveryResult>& results);
std::optional<std::string> select_best(const std::vector<DiscoveryResult>& results);

}  // namespace librbdiscovery::_impl

#endif  // LIBRBDISCOVERY_SELECTOR_HPP
