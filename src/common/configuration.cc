#include "configuration.h"
#include "errors.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Benchkit {

namespace {

template<typename T>
void SetIfPresent(const YAML::Node& node, const char* key, ConfigValue<T>& target) {
    if (node[key]) target.set(node[key].as<T>());
}

void ApplyRoot(const YAML::Node& root, BenchkitConfig& config) {
    if (root["session"]) {
        auto session = root["session"];
        SetIfPresent(session, "lock_dir", config.session.lock_dir);
        SetIfPresent(session, "output_root", config.session.output_root);
        SetIfPresent(session, "executor", config.session.executor);
    }

    if (root["reporting"]) {
        auto reporting = root["reporting"];
        SetIfPresent(reporting, "testcase_suffix", config.reporting.testcase_suffix);
        SetIfPresent(reporting, "artifact", config.reporting.artifact);
        SetIfPresent(reporting, "gnuplot", config.reporting.gnuplot);
        SetIfPresent(reporting, "width", config.reporting.width);
        SetIfPresent(reporting, "height", config.reporting.height);
    }
}

} // namespace

std::string DefaultTempDir() {
    const char* tmp = std::getenv("TMPDIR");
    if (tmp && tmp[0]) return tmp;
    return "/tmp";
}

const BenchkitConfig& GetConfig() {
    return Configuration::getInstance().config();
}

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
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val && env_val[0]) {
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
        if (yaml["benchkit"]) {
            ApplyRoot(yaml["benchkit"], config_);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (yaml["benchkit"]) {
            ApplyRoot(yaml["benchkit"], config_);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.session.lock_dir.get().empty()) {
        validation_errors_.push_back("Lock directory must not be empty");
    }
    if (config_.session.output_root.get().empty()) {
        validation_errors_.push_back("Output root must not be empty");
    }
    if (config_.session.executor.get().empty()) {
        validation_errors_.push_back("Executor command must not be empty");
    }

    if (config_.reporting.testcase_suffix.get().empty()) {
        validation_errors_.push_back("Testcase suffix must not be empty");
    }
    const std::string artifact = config_.reporting.artifact.get();
    if (artifact.empty() || artifact.front() == '/') {
        validation_errors_.push_back("Metrics artifact must be a relative path");
    }

    if (config_.reporting.width.get() < 100 || config_.reporting.height.get() < 100) {
        validation_errors_.push_back("Plot size must be at least 100x100");
    }

    for (const auto& err : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << err;
    }
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

void Configuration::ensureValid() const {
    if (validate()) return;
    std::string message = "invalid configuration:";
    for (const auto& err : validation_errors_) {
        message += " " + err + ";";
    }
    message.pop_back();
    throw ConfigError(message);
}

} // namespace Benchkit
