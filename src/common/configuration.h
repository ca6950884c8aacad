#ifndef CADENCE_CONFIGURATION_H_
#define CADENCE_CONFIGURATION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "../sequencer/sequencer_options.h"

namespace YAML {
class Node;
}

namespace Cadence {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct CadenceConfig {
    // Version information
    struct Version {
        ConfigValue<int> major{1, "CADENCE_VERSION_MAJOR"};
        ConfigValue<int> minor{0, "CADENCE_VERSION_MINOR"};
    } version;

    struct Sequencer {
        ConfigValue<int64_t> initial_index{0, "CADENCE_INITIAL_INDEX"};
        ConfigValue<int> delay_ms{static_cast<int>(sequencer_default_delay_ms), "CADENCE_DELAY_MS"};
        // Polling engine only
        ConfigValue<int> tick_interval_ms{static_cast<int>(sequencer_default_tick_interval_ms), "CADENCE_TICK_INTERVAL_MS"};
        ConfigValue<int> drain_poll_ms{static_cast<int>(sequencer_default_drain_poll_ms), "CADENCE_DRAIN_POLL_MS"};
        // Signed so a negative value from env or flags is caught by validate()
        ConfigValue<int> executor_threads{static_cast<int>(sequencer_default_executor_threads), "CADENCE_EXECUTOR_THREADS"};
        // "propagate" or "swallow"; empty keeps each engine's default
        ConfigValue<std::string> failure_policy{"", "CADENCE_FAILURE_POLICY"};
    } sequencer;

    // cadence_demo settings
    struct Demo {
        ConfigValue<std::string> engine{"polling", "CADENCE_DEMO_ENGINE"};
        ConfigValue<int> jobs{16, "CADENCE_DEMO_JOBS"};
        ConfigValue<int> jitter_ms{5, "CADENCE_DEMO_JITTER_MS"};
    } demo;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Back to compiled-in defaults
    void resetToDefaults();

    // Get the configuration
    const CadenceConfig& config() const { return config_; }
    CadenceConfig& config() { return config_; }

    // Helper methods for common access patterns
    int64_t getInitialIndex() const { return config_.sequencer.initial_index.get(); }
    int getDelayMs() const { return config_.sequencer.delay_ms.get(); }
    int getTickIntervalMs() const { return config_.sequencer.tick_interval_ms.get(); }
    int getExecutorThreads() const { return config_.sequencer.executor_threads.get(); }

    // Builds engine options; failure_policy stays unset when not configured
    SequencerOptions toSequencerOptions() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    CadenceConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Helper methods for parsing
    void applyYAML(const YAML::Node& yaml);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Cadence

#endif // CADENCE_CONFIGURATION_H_
