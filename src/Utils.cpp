#include "librbdiscovery/impl/Utils.hpp"

#include <algorithm>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio/io_context.hpp>
#include <cctype>
#include <charconv>
#include <future>
#include <iterator>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace librbdiscovery::_impl {

boost::asio::ip::port_type parse_port(std::string_view port_str) {
	boost::asio::ip::port_type port_value;

	const std::errc ec = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port_value).ec;

	return (ec == std::errc()) ? port_value : 0;
}

Url parse_url(std::string_view url, std::optional<boost::asio::ip::port_type> default_port) {
	const auto scheme_end = url.find("://");
	if (scheme_end == std::string_view::npos || scheme_end == 0) {
		throw std::invalid_argument("Missing scheme in URL \"" + std::string{url} + "\"");
	}

	Url result{};
	result.scheme = std::string{url.substr(0, scheme_end)};
	std::ranges::transform(result.scheme, result.scheme.begin(),
	                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (result.scheme == "https") {
		result.port = default_port.value_or(443);
	} else if (result.scheme == "http") {
		result.port = default_port.value_or(80);
	} else {
		throw std::invalid_argument("Unsupported scheme in URL \"" + std::string{url} + "\"");
	}

	std::string_view rest = url.substr(scheme_end + 3);
	const auto path_start = rest.find('/');
	const std::string_view authority = rest.substr(0, path_start);
	result.path = path_start == std::string_view::npos ? "/" : std::string{rest.substr(path_start)};

	std::string_view host = authority;
	std::string_view port;

	if (authority.starts_with('[')) {
		// IPv6 literal
		const auto bracket = authority.find(']');
		if (bracket == std::string_view::npos) {
			throw std::invalid_argument("Unterminated IPv6 address in URL \"" + std::string{url} + "\"");
		}

		host = authority.substr(1, bracket - 1);
		const std::string_view after = authority.substr(bracket + 1);
		if (after.starts_with(':')) {
			port = after.substr(1);
		} else if (!after.empty()) {
			throw std::invalid_argument("Garbage after IPv6 address in URL \"" + std::string{url} + "\"");
		}
	} else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
		host = authority.substr(0, colon);
		port = authority.substr(colon + 1);
	}

	if (host.empty()) {
		throw std::invalid_argument("Missing host in URL \"" + std::string{url} + "\"");
	}
	result.host = std::string{host};

	if (!port.empty()) {
		result.port = parse_port(port);

		if (result.port == 0) {
			throw std::invalid_argument("Invalid port in URL \"" + std::string{url} + "\"");
		}
	}

	return result;
}

boost::asio::ip::tcp::resolver::results_type system_lookup(const std::string& host, const std::string& service) {
	boost::asio::io_context io_context;
	boost::asio::ip::tcp::resolver resolver(io_context);

	return resolver.resolve(host, service);
}

boost::asio::ip::tcp::resolver::results_type lookup_until(const std::string& host, const std::string& service,
                                                          std::chrono::steady_clock::time_point deadline,
                                                          const lookup_t& lookup) {
	using results_t = boost::asio::ip::tcp::resolver::results_type;

	// getaddrinfo can't be cancelled, so the lookup gets a thread that may be left behind
	auto task = std::make_shared<std::packaged_task<results_t()>>(
	    [lookup, host, service] { return lookup(host, service); });
	std::future<results_t> result = task->get_future();
	std::thread{[task] { (*task)(); }}.detach();

	if (result.wait_until(deadline) != std::future_status::ready) {
		throw boost::system::system_error(boost::asio::error::timed_out, "Resolving " + host);
	}

	return result.get();
}

std::string format_api_url(std::string_view host) {
	const bool ipv6_literal = host.find(':') != std::string_view::npos && !host.starts_with('[');

	return ipv6_literal ? "https://[" + std::string{host} + "]/" : "https://" + std::string{host} + "/";
}

std::vector<std::string> resolve_api_urls(const HostResolver& resolver, std::string_view name) {
	const std::vector<std::string> host_names = resolver.resolve_host_names(name);

	std::vector<std::string> api_urls;
	api_urls.reserve(host_names.size());
	std::ranges::transform(host_names, std::back_inserter(api_urls), format_api_url);

	spdlog::debug("Resolved {} to {} API endpoint(s)", name, api_urls.size());

	return api_urls;
}

std::string basic_credentials(std::string_view user, std::string_view password) {
	using namespace boost::archive::iterators;
	using encoder_t = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

	const std::string plain = std::string{user} + ":" + std::string{password};
	std::string encoded{encoder_t{plain.begin()}, encoder_t{plain.end()}};
	// The iterators don't pad
	encoded.append((3 - plain.size() % 3) % 3, '=');

	return "Basic " + encoded;
}

}  // namespace librbdiscovery::_impl
