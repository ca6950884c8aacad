#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "../common/configuration.h"
#include "../sequencer/polling_sequencer.h"
#include "../sequencer/self_continuing_sequencer.h"
#include "../sequencer/sequencer_errors.h"

using namespace Cadence;

namespace {

// Execution log shared by all simulated chunk writers
class OrderLog {
	public:
		void Record(int64_t index) {
			std::lock_guard<std::mutex> lock(mu_);
			order_.push_back(index);
		}
		std::vector<int64_t> Snapshot() {
			std::lock_guard<std::mutex> lock(mu_);
			return order_;
		}
	private:
		std::mutex mu_;
		std::vector<int64_t> order_;
};

// Indices [first, first + count) in a random arrival order, as chunks
// coming off a network connection would
std::vector<int64_t> ShuffledIndices(int64_t first, int count, unsigned seed) {
	std::vector<int64_t> indices(count);
	std::iota(indices.begin(), indices.end(), first);
	std::mt19937 rng(seed);
	std::shuffle(indices.begin(), indices.end(), rng);
	return indices;
}

template<typename Submit>
void SimulateArrivals(const std::vector<int64_t>& arrivals, int jitter_ms, unsigned seed, Submit submit) {
	std::mt19937 rng(seed + 1);
	std::uniform_int_distribution<int> jitter(0, std::max(jitter_ms, 0));
	for (int64_t index : arrivals) {
		submit(index);
		std::this_thread::sleep_for(std::chrono::milliseconds(jitter(rng)));
	}
}

bool IsAscending(const std::vector<int64_t>& order, int64_t first, int count) {
	if (order.size() != static_cast<size_t>(count)) return false;
	for (int i = 0; i < count; ++i) {
		if (order[i] != first + i) return false;
	}
	return true;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("cadence_demo", "Feeds out-of-order jobs into a Cadence sequencer");
	options.allow_unrecognised_options();
	options.add_options()
		("l,log_level", "Verbose log level", cxxopts::value<int>()->default_value("0"))
		("e,engine", "Sequencer engine: self or polling", cxxopts::value<std::string>())
		("j,jobs", "Number of jobs to submit", cxxopts::value<int>())
		("jitter_ms", "Max random pause between arrivals", cxxopts::value<int>())
		("seed", "Shuffle seed", cxxopts::value<unsigned>()->default_value("42"))
		("h,help", "Print usage");

	auto result = options.parse(argc, argv);
	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		std::cout << "Sequencer flags: --config <yaml> --initial-index N --delay-ms N "
		          << "--tick-interval-ms N --drain-poll-ms N --executor-threads N "
		          << "--failure-policy propagate|swallow" << std::endl;
		return 0;
	}
	FLAGS_v = result["log_level"].as<int>();

	Configuration& config = Configuration::getInstance();
	config.overrideFromCommandLine(argc, argv);
	if (result.count("engine")) config.config().demo.engine.set(result["engine"].as<std::string>());
	if (result.count("jobs")) config.config().demo.jobs.set(result["jobs"].as<int>());
	if (result.count("jitter_ms")) config.config().demo.jitter_ms.set(result["jitter_ms"].as<int>());

	if (!config.validate()) {
		LOG(ERROR) << "Configuration validation failed";
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Validation error: " << error;
		}
		return 1;
	}

	const SequencerOptions seq_options = config.toSequencerOptions();
	const std::string engine = config.config().demo.engine.get();
	const int jobs = config.config().demo.jobs.get();
	const int jitter_ms = config.config().demo.jitter_ms.get();
	const unsigned seed = result["seed"].as<unsigned>();
	const std::vector<int64_t> arrivals = ShuffledIndices(seq_options.initial_index, jobs, seed);

	LOG(INFO) << "Running " << jobs << " jobs through the " << engine << " sequencer"
	          << " (delay " << seq_options.delay.count() << "ms, initial index "
	          << seq_options.initial_index << ")";

	OrderLog log;
	auto make_job = [&log](int64_t index) {
		return [&log, index]() {
			VLOG(1) << "Chunk " << index << " written";
			log.Record(index);
		};
	};

	const auto start = std::chrono::steady_clock::now();
	try {
		if (engine == "self") {
			SelfContinuingSequencer sequencer(seq_options);
			std::vector<std::future<void>> drains;
			SimulateArrivals(arrivals, jitter_ms, seed, [&](int64_t index) {
				drains.push_back(sequencer.AddJob({index, make_job(index)}));
			});
			sequencer.WaitAndReset();
			for (auto& drain : drains) {
				drain.get();
			}
		} else {
			PollingSequencer sequencer(seq_options);
			SimulateArrivals(arrivals, jitter_ms, seed, [&](int64_t index) {
				sequencer.AddJob({index, make_job(index)});
			});
			sequencer.WaitAndDispose();
		}
	} catch (const SequencerError& e) {
		LOG(ERROR) << "Sequencer error: " << e.what();
		return 1;
	}
	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start);

	const std::vector<int64_t> order = log.Snapshot();
	std::string arrival_str, order_str;
	for (int64_t index : arrivals) arrival_str += std::to_string(index) + " ";
	for (int64_t index : order) order_str += std::to_string(index) + " ";
	LOG(INFO) << "Arrival order:   " << arrival_str;
	LOG(INFO) << "Execution order: " << order_str;
	LOG(INFO) << "Drained in " << elapsed.count() << "ms";

	if (!IsAscending(order, seq_options.initial_index, jobs)) {
		LOG(ERROR) << "Execution order is not ascending";
		return 1;
	}
	LOG(INFO) << "Execution order verified";
	return 0;
}
