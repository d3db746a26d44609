#include "librbdiscovery/impl/Prober.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <spdlog/spdlog.h>
#include <thread>
#include <utility>

namespace librbdiscovery::_impl {

namespace {

struct PendingProbe {
	std::string api_url;
	std::future<DiscoveryResult> result;
	std::chrono::steady_clock::time_point deadline;
};

}  // namespace

DiscoveryResult probe(const std::string& api_url, const ProbeConfig& config, const StatsFetcher& fetcher) {
	spdlog::debug("Starting check for {}", api_url);

	const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	ServerStats stats = fetcher.fetch_server_stats(ConnectionParams::for_probe(api_url, config));
	const std::chrono::steady_clock::time_point end = std::chrono::steady_clock::now();

	const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
	spdlog::debug("Finished check for {}, took {} ms", api_url, duration.count());

	return DiscoveryResult{api_url, duration, std::move(stats)};
}

std::vector<DiscoveryResult> probe_all(const std::vector<std::string>& api_urls, const ProbeConfig& config,
                                       std::shared_ptr<const StatsFetcher> fetcher) {
	std::vector<DiscoveryResult> results;

	if (api_urls.empty()) {
		return results;
	}

	// Probes that miss their deadline may outlive this call, so everything they touch is shared with them
	auto shared_config = std::make_shared<const ProbeConfig>(config);
	auto pool = std::make_shared<boost::asio::thread_pool>(config.thread_count);

	std::vector<PendingProbe> pending;
	pending.reserve(api_urls.size());

	for (const std::string& api_url : api_urls) {
		auto task = std::make_shared<std::packaged_task<DiscoveryResult()>>(
		    [shared_config, fetcher, api_url] { return probe(api_url, *shared_config, *fetcher); });

		pending.push_back({api_url, task->get_future(), std::chrono::steady_clock::now() + config.probe_deadline});
		boost::asio::post(*pool, [task] { (*task)(); });
	}

	bool abandoned = false;

	for (PendingProbe& entry : pending) {
		if (entry.result.wait_until(entry.deadline) != std::future_status::ready) {
			spdlog::warn("Endpoint {} did not answer within {} ms", entry.api_url, config.probe_deadline.count());
			abandoned = true;
			continue;
		}

		try {
			results.push_back(entry.result.get());
		} catch (const std::exception& e) {
			spdlog::warn("Endpoint {} had an exception: {}", entry.api_url, e.what());
		}
	}

	// Queued probes are dropped, running ones can't be interrupted
	pool->stop();

	if (abandoned) {
		std::thread{[pool] { pool->join(); }}.detach();
	} else {
		pool->join();
	}

	return results;
}

}  // namespace librbdiscovery::_impl
