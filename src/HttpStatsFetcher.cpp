#include "librbdiscovery/HttpStatsFetcher.hpp"

#include <openssl/ssl.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "librbdiscovery/impl/Utils.hpp"

namespace librbdiscovery {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using deadline_t = std::chrono::steady_clock::time_point;

constexpr boost::asio::ip::port_type DEFAULT_PROXY_PORT{8080};
constexpr unsigned HTTP_VERSION{11};

std::string authority(const _impl::Url& url) {
	const bool ipv6_literal = url.host.find(':') != std::string::npos;

	return (ipv6_literal ? "[" + url.host + "]" : url.host) + ":" + std::to_string(url.port);
}

std::string host_header(const _impl::Url& url) {
	const bool default_port = (url.scheme == "https" && url.port == 443) || (url.scheme == "http" && url.port == 80);

	if (default_port) {
		return url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
	}

	return authority(url);
}

_impl::Url parse_or_throw(std::string_view url, std::optional<boost::asio::ip::port_type> default_port = std::nullopt) {
	try {
		return _impl::parse_url(url, default_port);
	} catch (const std::invalid_argument& e) {
		throw StatsFetchError(e.what());
	}
}

void check(const boost::system::error_code& ec, std::string_view step, const std::string& where) {
	if (ec == beast::error::timeout || ec == boost::asio::error::timed_out ||
	    ec == boost::asio::error::operation_aborted) {
		throw StatsFetchError(std::string{step} + " " + where + " timed out");
	}
	if (ec.failed()) {
		throw StatsFetchError(std::string{step} + " " + where + " failed: " + ec.message());
	}
}

// Drives the io_context until the operation started by `start` has completed
template <typename Start>
void run_step(boost::asio::io_context& io_context, std::string_view step, const std::string& where, Start&& start) {
	boost::system::error_code ec;
	std::forward<Start>(start)([&ec](boost::system::error_code result, auto&&...) { ec = result; });

	io_context.run();
	io_context.restart();

	check(ec, step, where);
}

tcp::resolver::results_type resolve(const _impl::Url& server, deadline_t deadline) {
	try {
		return _impl::lookup_until(server.host, std::to_string(server.port), deadline);
	} catch (const boost::system::system_error& e) {
		check(e.code(), "Resolving", server.host);
		throw;
	}
}

void open_tunnel(boost::asio::io_context& io_context, beast::tcp_stream& stream, const _impl::Url& target,
                 const ConnectionParams& params) {
	const std::string where = "proxy tunnel to " + authority(target);

	http::request<http::empty_body> request{http::verb::connect, authority(target), HTTP_VERSION};
	request.set(http::field::host, authority(target));
	request.set(http::field::user_agent, params.user_agent);
	if (params.proxy_user) {
		request.set(http::field::proxy_authorization,
		            _impl::basic_credentials(*params.proxy_user, params.proxy_password.value_or("")));
	}

	run_step(io_context, "Opening", where,
	         [&](auto handler) { http::async_write(stream, request, std::move(handler)); });

	beast::flat_buffer buffer;
	http::response_parser<http::empty_body> parser;
	// A CONNECT response has no body, whatever its headers claim
	parser.skip(true);

	run_step(io_context, "Reading reply for", where,
	         [&](auto handler) { http::async_read_header(stream, buffer, parser, std::move(handler)); });

	const unsigned status = parser.get().result_int();
	if (status < 200 || status >= 300) {
		throw StatsFetchError("Proxy refused tunnel to " + authority(target) + " with status " +
		                      std::to_string(status));
	}
}

template <typename Stream>
std::string request_stats(boost::asio::io_context& io_context, Stream& stream, const _impl::Url& target,
                          const ConnectionParams& params) {
	std::string path = target.path;
	if (!path.ends_with('/')) {
		path += '/';
	}
	path += HttpStatsFetcher::STATS_PATH;

	http::request<http::empty_body> request{http::verb::get, path, HTTP_VERSION};
	request.set(http::field::host, host_header(target));
	request.set(http::field::user_agent, params.user_agent);
	request.set(http::field::accept, "application/json");

	run_step(io_context, "Sending request to", params.api_url,
	         [&](auto handler) { http::async_write(stream, request, std::move(handler)); });

	beast::flat_buffer buffer;
	http::response<http::string_body> response;

	run_step(io_context, "Reading response from", params.api_url,
	         [&](auto handler) { http::async_read(stream, buffer, response, std::move(handler)); });

	if (response.result() != http::status::ok) {
		throw StatsFetchError("Unexpected HTTP status " + std::to_string(response.result_int()) + " from " +
		                      params.api_url);
	}

	return std::move(response.body());
}

}  // namespace

ServerStats HttpStatsFetcher::fetch_server_stats(const ConnectionParams& params) const {
	const deadline_t deadline = std::chrono::steady_clock::now() + params.timeout;
	const _impl::Url target = parse_or_throw(params.api_url);

	std::optional<_impl::Url> proxy;
	if (params.proxy_uri && !params.proxy_uri->empty()) {
		const std::string& uri = *params.proxy_uri;
		proxy = parse_or_throw(uri.find("://") == std::string::npos ? "http://" + uri : uri, DEFAULT_PROXY_PORT);

		if (proxy->scheme != "http") {
			throw StatsFetchError("Unsupported proxy scheme \"" + proxy->scheme + "\"");
		}
	}

	boost::asio::io_context io_context;
	const _impl::Url& first_hop = proxy ? *proxy : target;
	const auto endpoints = resolve(first_hop, deadline);

	beast::tcp_stream tcp_stream{io_context};
	// Covers every following operation on the stream
	tcp_stream.expires_at(deadline);

	run_step(io_context, "Connecting to", authority(first_hop),
	         [&](auto handler) { tcp_stream.async_connect(endpoints, std::move(handler)); });

	if (proxy) {
		spdlog::debug("Tunneling to {} through proxy {}", authority(target), authority(*proxy));
		open_tunnel(io_context, tcp_stream, target, params);
	}

	std::string body;

	if (target.scheme == "https") {
		ssl::context ssl_context{ssl::context::tls_client};
		ssl_context.set_default_verify_paths();
		ssl_context.set_verify_mode(ssl::verify_peer);

		beast::ssl_stream<beast::tcp_stream> stream{std::move(tcp_stream), ssl_context};
		stream.set_verify_callback(ssl::host_name_verification(target.host));

		// SNI
		if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
			throw StatsFetchError("Failed to set SNI host name for " + params.api_url);
		}

		run_step(io_context, "TLS handshake with", params.api_url,
		         [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });

		body = request_stats(io_context, stream, target, params);
	} else {
		body = request_stats(io_context, tcp_stream, target, params);
	}

	return parse_server_stats(body);
}

}  // namespace librbdiscovery
