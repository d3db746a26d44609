#include "librbdiscovery/ServerStats.hpp"

#include <boost/json.hpp>

#include "librbdiscovery/StatsFetcher.hpp"

namespace librbdiscovery {

namespace {

void read_counter(const boost::json::object& object, std::string_view key, ServerStats::counter_t& out) {
	const boost::json::value* value = object.if_contains(key);
	if (value == nullptr || !value->is_number()) {
		return;
	}

	boost::system::error_code ec;
	const auto number = value->to_number<ServerStats::counter_t>(ec);
	if (!ec.failed()) {
		out = number;
	}
}

void read_string(const boost::json::object& object, std::string_view key, std::string& out) {
	if (const boost::json::value* value = object.if_contains(key); value != nullptr && value->is_string()) {
		out = value->as_string().c_str();
	}
}

}  // namespace

ServerStats parse_server_stats(std::string_view body) {
	boost::system::error_code ec;
	boost::json::value parsed = boost::json::parse(body, ec);

	if (ec.failed()) {
		throw StatsFetchError("Malformed stats response: " + ec.message());
	}
	if (!parsed.is_object()) {
		throw StatsFetchError("Stats response is not a JSON object");
	}

	const boost::json::object& object = parsed.as_object();

	ServerStats stats{};
	read_counter(object, "supported_version", stats.supported_version);
	read_string(object, "software_version", stats.software_version);
	read_string(object, "status", stats.status);
	read_counter(object, "stations", stats.stations);
	read_counter(object, "stations_broken", stats.stations_broken);
	read_counter(object, "tags", stats.tags);
	read_counter(object, "clicks_last_hour", stats.clicks_last_hour);
	read_counter(object, "clicks_last_day", stats.clicks_last_day);
	read_counter(object, "languages", stats.languages);
	read_counter(object, "countries", stats.countries);

	return stats;
}

}  // namespace librbdiscovery
