#include "librbdiscovery/impl/Selector.hpp"

#include <algorithm>
#include <functional>

namespace librbdiscovery::_impl {

std::vector<DiscoveryResult> rank_results(const std::vector<DiscoveryResult>& results) {
	std::vector<DiscoveryResult> ranked{results};

	// Stable, so that equal durations keep the probe order
	std::ranges::stable_sort(ranked, std::ranges::less{}, &DiscoveryResult::duration);

	return ranked;
}

std::optional<std::string> select_best(const std::vector<DiscoveryResult>& results) {
	if (results.empty()) {
		return std::nullopt;
	}

	const auto best = std::ranges::min_element(results, std::ranges::less{}, &DiscoveryResult::duration);

	return best->endpoint;
}

}  // namespace librbdiscovery::_impl
