#ifndef BENCHKIT_SRC_METRICS_METRIC_RECORD_H_
#define BENCHKIT_SRC_METRICS_METRIC_RECORD_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace YAML {
class Node;
}

namespace Benchkit {

/**
 * Value of one context parameter.
 */
using ContextValue = std::variant<int64_t, double, std::string>;

/**
 * Parameters a sample was recorded under. Key order is always sorted.
 */
using Context = std::map<std::string, ContextValue>;

// Keys every context must carry; they vary per sample and never take part in grouping.
constexpr const char* kFnameKey = "fname";
constexpr const char* kTimestampKey = "timestamp";

/**
 * Renders a context value for labels and logs. Doubles use the shortest
 * representation that round-trips.
 */
std::string ToString(const ContextValue& value);

/**
 * Parses a value as a whole integer. Accepts int64 values and strings that
 * consist of an optional sign and digits only.
 */
std::optional<int64_t> ParseInteger(const ContextValue& value);

/**
 * One benchmark sample as written by the execution engine.
 */
struct MetricRecord {
    // Numeric fields such as iops, bw, lat.
    std::map<std::string, double> values;
    Context ctx;
    // Artifact the record was read from.
    std::string source;

    std::optional<double> Metric(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * Converts a YAML scalar into a ContextValue, trying int64, then double,
 * then falling back to the raw string.
 * @return false when the node is not a scalar
 */
bool DecodeContextValue(const YAML::Node& node, ContextValue& out);

/**
 * Parses one metrics artifact document: a sequence of mappings with numeric
 * top level fields and a nested "ctx" mapping.
 * @param doc Loaded YAML document
 * @param source Path stamped into every record
 * @param records Output, appended to
 * @param error Set to a description of the first defect on failure
 * @return false if the document is malformed; records is left untouched then
 */
bool ParseMetricRecords(const YAML::Node& doc, const std::string& source,
                        std::vector<MetricRecord>& records, std::string& error);

} // namespace Benchkit

#endif // BENCHKIT_SRC_METRICS_METRIC_RECORD_H_
