#ifndef LIBRBDISCOVERY_STATSFETCHER_HPP
#define LIBRBDISCOVERY_STATSFETCHER_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "ProbeConfig.hpp"
#include "ServerStats.hpp"

namespace librbdiscovery {

class StatsFetchError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct ConnectionParams {
	std::string api_url{};
	std::chrono::milliseconds timeout{ProbeConfig::DEFAULT_TIMEOUT};
	std::string user_agent{};
	std::optional<std::string> proxy_uri{};
	std::optional<std::string> proxy_user{};
	std::optional<std::string> proxy_password{};

	[[nodiscard]] static ConnectionParams for_probe(std::string api_url, const ProbeConfig& config);
};

class StatsFetcher {
public:
	virtual ~StatsFetcher() = default;

	// Performs exactly one round trip against `params.api_url`. Must be safe to call from several threads at once.
	[[nodiscard]] virtual ServerStats fetch_server_stats(const ConnectionParams& params) const = 0;
};

}  // namespace librbdiscovery

#endif  // LIBRBDISCOVERY_STATSFETCHER_HPP
