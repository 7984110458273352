#ifndef BENCHKIT_CONFIGURATION_H_
#define BENCHKIT_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace Benchkit {

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

    // Explicit values (config file, command line) win over the environment.
    void set(T value) {
        value_ = value;
        env_var_.clear();
    }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Returns $TMPDIR, or /tmp when unset.
 */
std::string DefaultTempDir();

/**
 * Main configuration structure
 */
struct BenchkitConfig {
    struct Session {
        // Directory holding <env>_lock files.
        ConfigValue<std::string> lock_dir{DefaultTempDir(), "BENCHKIT_LOCK_DIR"};
        // Parent of randomized output directories.
        ConfigValue<std::string> output_root{DefaultTempDir(), "BENCHKIT_OUTPUT_ROOT"};
        // External testcase execution engine.
        ConfigValue<std::string> executor{"benchkit-exec", "BENCHKIT_EXECUTOR"};
    } session;

    struct Reporting {
        ConfigValue<std::string> testcase_suffix{".py", "BENCHKIT_TESTCASE_SUFFIX"};
        ConfigValue<std::string> artifact{"_aux/metrics.yml", "BENCHKIT_METRICS_ARTIFACT"};
        ConfigValue<std::string> gnuplot{"gnuplot", "BENCHKIT_GNUPLOT"};
        ConfigValue<int> width{1200, "BENCHKIT_PLOT_WIDTH"};
        ConfigValue<int> height{800, "BENCHKIT_PLOT_HEIGHT"};
    } reporting;
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

    // Get the configuration
    const BenchkitConfig& config() const { return config_; }
    BenchkitConfig& config() { return config_; }

    // Restore compiled-in defaults. Used by tests.
    void reset() { config_ = BenchkitConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Validates the effective values, environment overrides included.
    // Throws ConfigError listing every problem.
    void ensureValid() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    BenchkitConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Shorthand for Configuration::getInstance().config()
const BenchkitConfig& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Benchkit

#endif // BENCHKIT_CONFIGURATION_H_
