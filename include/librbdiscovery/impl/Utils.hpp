#ifndef LIBRBDISCOVERY_UTILS_HPP
#define LIBRBDISCOVERY_UTILS_HPP

#include <boost/asio/ip/basic_endpoint.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "librbdiscovery/HostResolver.hpp"

namespace librbdiscovery::_impl {

struct Url {
	std::string scheme;
	std::string host;
	boost::asio::ip::port_type port;
	std::string path;
};

boost::asio::ip::port_type parse_port(std::string_view port_string);
// Throws std::invalid_argument unless `url` is an absolute http or https URL. Without an explicit port,
// `default_port` is used, or the scheme's port if that is empty too.
Url parse_url(std::string_view url, std::optional<boost::asio::ip::port_type> default_port = std::nullopt);

using lookup_t = std::function<boost::asio::ip::tcp::resolver::results_type(const std::string& host,
                                                                             const std::string& service)>;

boost::asio::ip::tcp::resolver::results_type system_lookup(const std::string& host, const std::string& service);

/**
 * Runs `lookup` on its own thread and waits for it until `deadline`. A lookup still running at the deadline is left to
 * finish on its own and its result is dropped.
 *
 * @throws boost::system::system_error with `boost::asio::error::timed_out` once the deadline has passed, or whatever
 *         error the lookup reported
 */
boost::asio::ip::tcp::resolver::results_type lookup_until(const std::string& host, const std::string& service,
                                                          std::chrono::steady_clock::time_point deadline,
                                                          const lookup_t& lookup = system_lookup);

std::string format_api_url(std::string_view host);
std::vector<std::string> resolve_api_urls(const HostResolver& resolver, std::string_view name);

std::string basic_credentials(std::string_view user, std::string_view password);

}  // namespace librbdiscovery::_impl

#endif  // LIBRBDISCOVERY_UTILS_HPP
