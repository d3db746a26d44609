#include "librbdiscovery/impl/Utils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <tuple>

#include "Mocks.hpp"

using namespace librbdiscovery;
using namespace librbdiscovery::_impl;
using namespace std::chrono_literals;

using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::Throw;

// Test valid port numbers
TEST(ParsePortTest, ValidPortNumbers) {
	EXPECT_EQ(parse_port("80"), 80);
	EXPECT_EQ(parse_port("443"), 443);
	EXPECT_EQ(parse_port("8080"), 8080);

	EXPECT_EQ(parse_port("1"), 1);          // Minimum valid port
	EXPECT_EQ(parse_port("65535"), 65535);  // Maximum valid port
}

// Test invalid port numbers - empty and non-numeric
TEST(ParsePortTest, InvalidInputs) {
	EXPECT_EQ(parse_port(""), 0);
	EXPECT_EQ(parse_port("https"), 0);

	EXPECT_EQ(parse_port("-80"), 0);
	EXPECT_EQ(parse_port("+80"), 0);
	EXPECT_EQ(parse_port(" 80"), 0);
}

TEST(ParsePortTest, BoundaryConditions) {
	EXPECT_EQ(parse_port("0"), 0);
	EXPECT_EQ(parse_port("65536"), 0);
	EXPECT_EQ(parse_port("4294967295"), 0);
}

// Leading digits are parsed, the rest is ignored
TEST(ParsePortTest, PartialParsing) {
	EXPECT_EQ(parse_port("80abc"), 80);
	EXPECT_EQ(parse_port("443.5"), 443);
	EXPECT_EQ(parse_port("0080"), 80);
}

// =====================================================================================================================
TEST(ParseUrlTest, HttpsWithDefaultPort) {
	const Url url = parse_url("https://de1.api.radio-browser.info/");

	EXPECT_EQ(url.scheme, "https");
	EXPECT_EQ(url.host, "de1.api.radio-browser.info");
	EXPECT_EQ(url.port, 443);
	EXPECT_EQ(url.path, "/");
}

TEST(ParseUrlTest, HttpWithPortAndPath) {
	const Url url = parse_url("HTTP://127.0.0.1:8081/api/");

	EXPECT_EQ(url.scheme, "http");
	EXPECT_EQ(url.host, "127.0.0.1");
	EXPECT_EQ(url.port, 8081);
	EXPECT_EQ(url.path, "/api/");
}

TEST(ParseUrlTest, MissingPathBecomesRoot) {
	const Url url = parse_url("http://proxy.local", 8080);

	EXPECT_EQ(url.host, "proxy.local");
	EXPECT_EQ(url.port, 8080);
	EXPECT_EQ(url.path, "/");
}

TEST(ParseUrlTest, Ipv6Literal) {
	const Url url = parse_url("https://[2001:db8::1]/");
	EXPECT_EQ(url.host, "2001:db8::1");
	EXPECT_EQ(url.port, 443);

	const Url with_port = parse_url("https://[::1]:8443/json/");
	EXPECT_EQ(with_port.host, "::1");
	EXPECT_EQ(with_port.port, 8443);
	EXPECT_EQ(with_port.path, "/json/");
}

TEST(ParseUrlTest, InvalidUrlsThrow) {
	EXPECT_THROW(std::ignore = parse_url("de1.api.radio-browser.info"), std::invalid_argument);
	EXPECT_THROW(std::ignore = parse_url("://host/"), std::invalid_argument);
	EXPECT_THROW(std::ignore = parse_url("ftp://host/"), std::invalid_argument);
	EXPECT_THROW(std::ignore = parse_url("https:///path"), std::invalid_argument);
	EXPECT_THROW(std::ignore = parse_url("https://host:0/"), std::invalid_argument);
	EXPECT_THROW(std::ignore = parse_url("https://host:http/"), std::invalid_argument);
	EXPECT_THROW(std::ignore = parse_url("https://[::1/"), std::invalid_argument);
	EXPECT_THROW(std::ignore = parse_url("https://[::1]x/"), std::invalid_argument);
}

// =====================================================================================================================
using results_t = boost::asio::ip::tcp::resolver::results_type;

TEST(LookupUntilTest, ReturnsLookupResult) {
	const auto lookup = [](const std::string& host, const std::string& service) {
		return results_t::create(
		    boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("192.0.2.7"), parse_port(service)}, host,
		    service);
	};

	const results_t results = lookup_until("stats.example", "443", std::chrono::steady_clock::now() + 2s, lookup);

	ASSERT_EQ(results.size(), 1);
	EXPECT_EQ(results.begin()->host_name(), "stats.example");
	EXPECT_EQ(results.begin()->endpoint().port(), 443);
}

TEST(LookupUntilTest, LookupErrorPropagates) {
	const auto lookup = [](const std::string&, const std::string&) -> results_t {
		throw boost::system::system_error(boost::asio::error::host_not_found, "getaddrinfo");
	};

	try {
		std::ignore = lookup_until("stats.example", "443", std::chrono::steady_clock::now() + 2s, lookup);
		FAIL() << "Expected boost::system::system_error";
	} catch (const boost::system::system_error& e) {
		EXPECT_EQ(e.code(), boost::asio::error::host_not_found);
	}
}

// A hanging system resolver must not hold the caller past its deadline
TEST(LookupUntilTest, HangingLookupTimesOut) {
	const auto lookup = [](const std::string&, const std::string&) -> results_t {
		std::this_thread::sleep_for(1500ms);
		return {};
	};

	const auto start = std::chrono::steady_clock::now();

	try {
		std::ignore = lookup_until("stats.example", "443", start + 100ms, lookup);
		FAIL() << "Expected boost::system::system_error";
	} catch (const boost::system::system_error& e) {
		EXPECT_EQ(e.code(), boost::asio::error::timed_out);
	}

	EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}

TEST(LookupUntilTest, SystemLookupOfNumericAddress) {
	const results_t results = lookup_until("127.0.0.1", "8080", std::chrono::steady_clock::now() + 2s);

	ASSERT_FALSE(results.empty());
	EXPECT_EQ(results.begin()->endpoint().address().to_string(), "127.0.0.1");
	EXPECT_EQ(results.begin()->endpoint().port(), 8080);
}

// =====================================================================================================================
TEST(FormatApiUrlTest, HostNames) {
	EXPECT_EQ(format_api_url("de1.api.radio-browser.info"), "https://de1.api.radio-browser.info/");
	EXPECT_EQ(format_api_url("192.0.2.7"), "https://192.0.2.7/");
}

TEST(FormatApiUrlTest, Ipv6LiteralsAreBracketed) {
	EXPECT_EQ(format_api_url("2001:db8::1"), "https://[2001:db8::1]/");
	EXPECT_EQ(format_api_url("[::1]"), "https://[::1]/");
}

TEST(ResolveApiUrlsTest, FormatsEveryHostInOrder) {
	MockHostResolver resolver;
	EXPECT_CALL(resolver, resolve_host_names(std::string_view{"all.example"}))
	    .WillOnce(Return(std::vector<std::string>{"b.example", "a.example", "b.example"}));

	EXPECT_THAT(resolve_api_urls(resolver, "all.example"),
	            ElementsAre("https://b.example/", "https://a.example/", "https://b.example/"));
}

TEST(ResolveApiUrlsTest, ResolutionErrorPropagates) {
	MockHostResolver resolver;
	EXPECT_CALL(resolver, resolve_host_names(::testing::_)).WillOnce(Throw(ResolutionError("Host not found")));

	EXPECT_THROW(std::ignore = resolve_api_urls(resolver, "all.example"), ResolutionError);
}

// =====================================================================================================================
TEST(BasicCredentialsTest, EncodesUserAndPassword) {
	EXPECT_EQ(basic_credentials("Aladdin", "open sesame"), "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
	EXPECT_EQ(basic_credentials("user", ""), "Basic dXNlcjo=");
}

TEST(BasicCredentialsTest, PaddingForEveryRemainder) {
	EXPECT_EQ(basic_credentials("us", "er"), "Basic dXM6ZXI=");
	EXPECT_EQ(basic_credentials("a", ""), "Basic YTo=");
	EXPECT_EQ(basic_credentials("ab", "c"), "Basic YWI6Yw==");
	EXPECT_EQ(basic_credentials("ab", ""), "Basic YWI6");
}
