#include "collector.h"

#include <algorithm>
#include <filesystem>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"

namespace fs = std::filesystem;

namespace Benchkit {

MetricsCollector::MetricsCollector(std::string testcase_suffix, std::string artifact)
    : testcase_suffix_(std::move(testcase_suffix)), artifact_(std::move(artifact)) {}

bool MetricsCollector::IsResultSource(const std::string& dir_name) const {
    return dir_name.size() >= testcase_suffix_.size() &&
           dir_name.compare(dir_name.size() - testcase_suffix_.size(),
                            testcase_suffix_.size(), testcase_suffix_) == 0;
}

CollectionResult MetricsCollector::Collect(const std::string& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw ConfigError("output root is not a directory: " + root);
    }

    CollectionResult result;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ConfigError("cannot open output root " + root + ": " + ec.message());
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        // The iterator cannot advance past a failed increment.
        if (ec) break;
        const auto& entry = *it;
        std::error_code type_ec;
        if (!entry.is_directory(type_ec) || type_ec) continue;
        if (!IsResultSource(entry.path().filename().string())) continue;

        const fs::path artifact = entry.path() / artifact_;
        if (!fs::is_regular_file(artifact, type_ec)) {
            VLOG(1) << "No metrics artifact in " << entry.path();
            continue;
        }
        LoadArtifact(artifact.string(), result);
    }
    if (ec) {
        LOG(WARNING) << "Directory walk under " << root << " stopped early: " << ec.message();
        result.warnings.push_back({root, ec.message()});
    }

    LOG(INFO) << "Collected " << result.records.size() << " records from "
              << result.artifacts_read << " artifacts under " << root
              << " (" << result.warnings.size() << " warnings)";
    return result;
}

void MetricsCollector::LoadArtifact(const std::string& path, CollectionResult& result) const {
    std::string error;
    try {
        YAML::Node doc = YAML::LoadFile(path);
        if (ParseMetricRecords(doc, path, result.records, error)) {
            ++result.artifacts_read;
            VLOG(1) << "Loaded " << doc.size() << " records from " << path;
            return;
        }
    } catch (const YAML::Exception& e) {
        error = e.what();
    }
    LOG(WARNING) << "Ignoring metrics artifact " << path << ": " << error;
    result.warnings.push_back({path, error});
}

void SortBySource(std::vector<MetricRecord>& records) {
    std::stable_sort(records.begin(), records.end(),
                     [](const MetricRecord& a, const MetricRecord& b) {
                         return a.source < b.source;
                     });
}

} // namespace Benchkit
