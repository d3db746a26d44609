#ifndef LIBRBDISCOVERY_HTTPSTATSFETCHER_HPP
#define LIBRBDISCOVERY_HTTPSTATSFETCHER_HPP

#include <string_view>

#include "StatsFetcher.hpp"

namespace librbdiscovery {

class HttpStatsFetcher : public StatsFetcher {
public:
	static constexpr std::string_view STATS_PATH{"json/stats"};

	[[nodiscard]] ServerStats fetch_server_stats(const ConnectionParams& params) const override;
};

}  // namespace librbdiscovery

#endif  // LIBRBDISCOVERY_HTTPSTATSFETCHER_HPP
