#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Cadence {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["cadence"]) {
        LOG(WARNING) << "Configuration has no top-level 'cadence' key, keeping defaults";
        return;
    }
    auto root = yaml["cadence"];

    // Version
    if (root["version"]) {
        auto version = root["version"];
        if (version["major"]) config_.version.major.set(version["major"].as<int>());
        if (version["minor"]) config_.version.minor.set(version["minor"].as<int>());
    }

    // Sequencer
    if (root["sequencer"]) {
        auto sequencer = root["sequencer"];
        if (sequencer["initial_index"]) config_.sequencer.initial_index.set(sequencer["initial_index"].as<int64_t>());
        if (sequencer["delay_ms"]) config_.sequencer.delay_ms.set(sequencer["delay_ms"].as<int>());
        if (sequencer["tick_interval_ms"]) config_.sequencer.tick_interval_ms.set(sequencer["tick_interval_ms"].as<int>());
        if (sequencer["drain_poll_ms"]) config_.sequencer.drain_poll_ms.set(sequencer["drain_poll_ms"].as<int>());
        if (sequencer["executor_threads"]) config_.sequencer.executor_threads.set(sequencer["executor_threads"].as<int>());
        if (sequencer["failure_policy"]) config_.sequencer.failure_policy.set(sequencer["failure_policy"].as<std::string>());
    }

    // Demo
    if (root["demo"]) {
        auto demo = root["demo"];
        if (demo["engine"]) config_.demo.engine.set(demo["engine"].as<std::string>());
        if (demo["jobs"]) config_.demo.jobs.set(demo["jobs"].as<int>());
        if (demo["jitter_ms"]) config_.demo.jitter_ms.set(demo["jitter_ms"].as<int>());
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"initial-index", required_argument, 0, 'i'},
        {"delay-ms", required_argument, 0, 'd'},
        {"tick-interval-ms", required_argument, 0, 't'},
        {"drain-poll-ms", required_argument, 0, 'p'},
        {"executor-threads", required_argument, 0, 'n'},
        {"failure-policy", required_argument, 0, 'f'},
        {"config", required_argument, 0, 'c'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "i:d:t:p:n:f:c:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'i':
                    config_.sequencer.initial_index.set(std::stoll(optarg));
                    break;
                case 'd':
                    config_.sequencer.delay_ms.set(std::stoi(optarg));
                    break;
                case 't':
                    config_.sequencer.tick_interval_ms.set(std::stoi(optarg));
                    break;
                case 'p':
                    config_.sequencer.drain_poll_ms.set(std::stoi(optarg));
                    break;
                case 'n':
                    config_.sequencer.executor_threads.set(std::stoi(optarg));
                    break;
                case 'f':
                    config_.sequencer.failure_policy.set(optarg);
                    break;
                case 'c':
                    loadFromFile(optarg);
                    break;
                default:
                    // Ignore unknown flags; the application parser handles them
                    break;
            }
        } catch (const std::exception& e) {
            // option_index is only set for long options, so name the flag by its short form
            LOG(WARNING) << "Ignoring malformed value '" << (optarg ? optarg : "")
                         << "' for -" << static_cast<char>(c) << ": " << e.what();
        }
    }
}

void Configuration::resetToDefaults() {
    config_ = CadenceConfig();
    validation_errors_.clear();
}

SequencerOptions Configuration::toSequencerOptions() const {
    SequencerOptions options;
    options.initial_index = config_.sequencer.initial_index.get();
    options.delay = std::chrono::milliseconds(config_.sequencer.delay_ms.get());
    options.tick_interval = std::chrono::milliseconds(config_.sequencer.tick_interval_ms.get());
    options.drain_poll_interval = std::chrono::milliseconds(config_.sequencer.drain_poll_ms.get());
    options.executor_threads = static_cast<size_t>(std::max(config_.sequencer.executor_threads.get(), 1));
    const std::string policy = config_.sequencer.failure_policy.get();
    if (!policy.empty()) {
        options.failure_policy = ParseFailurePolicy(policy);
    }
    return options;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.sequencer.delay_ms.get() < 0) {
        validation_errors_.push_back("Inter-job delay cannot be negative");
    }

    if (config_.sequencer.tick_interval_ms.get() < 1) {
        validation_errors_.push_back("Tick interval must be at least 1ms");
    }

    if (config_.sequencer.drain_poll_ms.get() < 1) {
        validation_errors_.push_back("Drain poll interval must be at least 1ms");
    }

    const int threads = config_.sequencer.executor_threads.get();
    if (threads < 1 || threads > sequencer_max_executor_threads) {
        validation_errors_.push_back("Executor threads must be between 1 and " +
                                     std::to_string(sequencer_max_executor_threads) +
                                     ", got " + std::to_string(threads));
    }

    const std::string policy = config_.sequencer.failure_policy.get();
    if (!policy.empty() && !ParseFailurePolicy(policy).has_value()) {
        validation_errors_.push_back("Failure policy must be 'propagate' or 'swallow', got '" + policy + "'");
    }

    const std::string engine = config_.demo.engine.get();
    if (engine != "self" && engine != "polling") {
        validation_errors_.push_back("Demo engine must be 'self' or 'polling'");
    }

    if (config_.demo.jobs.get() < 1) {
        validation_errors_.push_back("Demo needs at least one job");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    return validate();
}

} // namespace Cadence
