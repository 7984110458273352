#ifndef BENCHKIT_SRC_METRICS_AGGREGATOR_H_
#define BENCHKIT_SRC_METRICS_AGGREGATOR_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "metric_record.h"

namespace Benchkit {

/**
 * Samples sharing every context parameter except the plotted axis.
 */
struct Series {
    std::string fingerprint;
    std::vector<int64_t> xvals;
    std::vector<double> yvals;
    std::string label;
    // Context minus the x key, fname and timestamp.
    Context ctx;
};

// Keyed by fingerprint; iteration order is therefore stable across runs.
using SeriesMap = std::map<std::string, Series>;

/**
 * Groups records into series by fingerprint and orders every series by x.
 *
 * For each record y = record.values[metric] and x = integer parse of
 * record.ctx[x_key]. Points with equal x keep the order of their records in
 * the input.
 *
 * A defect in any record aborts the pass: nothing is returned.
 *
 * @param label_template When set, each series is labeled by rendering it
 *        against the full context of the series' first record; otherwise
 *        the label is the fingerprint
 * @throws MissingMetric if a record has no value for metric
 * @throws MalformedContext if x_key is absent or not an integer
 * @throws TemplateError if the label template references an undefined key
 */
SeriesMap Aggregate(const std::vector<MetricRecord>& records,
                    const std::string& metric,
                    const std::string& x_key,
                    const std::optional<std::string>& label_template = std::nullopt);

} // namespace Benchkit

#endif // BENCHKIT_SRC_METRICS_AGGREGATOR_H_
