#ifndef LIBRBDISCOVERY_SERVERSTATS_HPP
#define LIBRBDISCOVERY_SERVERSTATS_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace librbdiscovery {

// Payload of the `/json/stats` call
struct ServerStats {
	using counter_t = std::int64_t;

	counter_t supported_version{-1};
	std::string software_version{};
	std::string status{};
	counter_t stations{-1};
	counter_t stations_broken{-1};
	counter_t tags{-1};
	counter_t clicks_last_hour{-1};
	counter_t clicks_last_day{-1};
	counter_t languages{-1};
	counter_t countries{-1};

	bool operator==(const ServerStats&) const = default;
};

[[nodiscard]] ServerStats parse_server_stats(std::string_view body);

}  // namespace librbdiscovery

#endif  // LIBRBDISCOVERY_SERVERSTATS_HPP
