#include "librbdiscovery/HostResolver.hpp"

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

namespace librbdiscovery {

std::vector<std::string> AsioHostResolver::resolve_host_names(std::string_view name) const {
	using resolver_t = boost::asio::ip::tcp::resolver;

	boost::system::error_code ec;
	boost::asio::io_context io_context;
	resolver_t resolver(io_context);

	const auto results =
	    resolver.resolve(name, "443", resolver_t::numeric_service | resolver_t::address_configured, ec);

	if (ec.failed()) {
		throw ResolutionError("Failed to resolve host \"" + std::string{name} + "\": " + ec.message());
	}

	// Keep the resolver's order, but list every address only once
	std::vector<boost::asio::ip::address> addresses;
	for (const auto& entry : results) {
		const boost::asio::ip::address address = entry.endpoint().address();

		if (std::ranges::find(addresses, address) == addresses.end()) {
			addresses.push_back(address);
		}
	}

	if (addresses.empty()) {
		throw ResolutionError("Host \"" + std::string{name} + "\" has no addresses");
	}

	std::vector<std::string> host_names;
	host_names.reserve(addresses.size());

	for (const boost::asio::ip::address& address : addresses) {
		const auto reverse = resolver.resolve(boost::asio::ip::tcp::endpoint{address, 443}, ec);

		// Without a usable PTR record the address itself is the canonical name
		if (ec.failed() || reverse.empty()) {
			spdlog::debug("Reverse lookup of {} failed: {}", address.to_string(), ec.message());
			host_names.push_back(address.to_string());
		} else {
			host_names.push_back(reverse.begin()->host_name());
		}
	}

	return host_names;
}

}  // namespace librbdiscovery
