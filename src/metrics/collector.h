#ifndef BENCHKIT_SRC_METRICS_COLLECTOR_H_
#define BENCHKIT_SRC_METRICS_COLLECTOR_H_

#include <string>
#include <vector>

#include "metric_record.h"

namespace Benchkit {

struct CollectionWarning {
    std::string path;
    std::string reason;
};

struct CollectionResult {
    std::vector<MetricRecord> records;
    // Artifacts that could not be read or parsed. Partial trees from
    // interrupted sessions routinely produce these.
    std::vector<CollectionWarning> warnings;
    size_t artifacts_read = 0;
};

/**
 * Walks an output tree and loads every metrics artifact.
 *
 * A directory is a result source when its name ends with testcase_suffix
 * and it contains artifact (a path relative to the directory). Records are
 * appended in directory visit order, which depends on the filesystem; use
 * SortBySource when a stable order is needed.
 *
 * The tree must not be written to concurrently by an active session.
 */
class MetricsCollector {
public:
    MetricsCollector(std::string testcase_suffix, std::string artifact);

    /**
     * @throws ConfigError if root does not exist or is not a directory
     */
    CollectionResult Collect(const std::string& root) const;

private:
    bool IsResultSource(const std::string& dir_name) const;
    void LoadArtifact(const std::string& path, CollectionResult& result) const;

    std::string testcase_suffix_;
    std::string artifact_;
};

/**
 * Stable-sorts records by artifact path, keeping in-file order.
 */
void SortBySource(std::vector<MetricRecord>& records);

} // namespace Benchkit

#endif // BENCHKIT_SRC_METRICS_COLLECTOR_H_
