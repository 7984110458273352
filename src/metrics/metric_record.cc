#include "metric_record.h"

#include <charconv>
#include <iterator>

#include <yaml-cpp/yaml.h>

namespace Benchkit {

namespace {

constexpr const char* kContextNode = "ctx";

bool DecodeContext(const YAML::Node& node, Context& ctx, std::string& error) {
    if (!node.IsMap()) {
        error = "'ctx' is not a mapping";
        return false;
    }
    for (const auto& kv : node) {
        const std::string key = kv.first.as<std::string>();
        ContextValue value;
        if (!DecodeContextValue(kv.second, value)) {
            error = "context key '" + key + "' is not a scalar";
            return false;
        }
        ctx[key] = std::move(value);
    }
    for (const char* required : {kFnameKey, kTimestampKey}) {
        if (ctx.find(required) == ctx.end()) {
            error = std::string("context lacks mandatory key '") + required + "'";
            return false;
        }
    }
    return true;
}

} // namespace

std::string ToString(const ContextValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), *d);
        return std::string(buf, res.ptr);
    }
    return std::get<std::string>(value);
}

std::optional<int64_t> ParseInteger(const ContextValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    const auto* s = std::get_if<std::string>(&value);
    if (!s || s->empty()) return std::nullopt;

    const char* begin = s->data();
    const char* end = s->data() + s->size();
    if (*begin == '+') ++begin;
    int64_t out = 0;
    auto res = std::from_chars(begin, end, out);
    if (res.ec != std::errc() || res.ptr != end) return std::nullopt;
    return out;
}

bool DecodeContextValue(const YAML::Node& node, ContextValue& out) {
    if (!node.IsScalar()) return false;

    // Quoted scalars carry the non-specific "!" tag and stay strings.
    if (node.Tag() != "!") {
        int64_t i;
        if (YAML::convert<int64_t>::decode(node, i)) {
            out = i;
            return true;
        }
        double d;
        if (YAML::convert<double>::decode(node, d)) {
            out = d;
            return true;
        }
    }
    out = node.Scalar();
    return true;
}

bool ParseMetricRecords(const YAML::Node& doc, const std::string& source,
                        std::vector<MetricRecord>& records, std::string& error) {
    if (!doc.IsSequence()) {
        error = "top level is not a sequence";
        return false;
    }

    std::vector<MetricRecord> parsed;
    parsed.reserve(doc.size());
    size_t index = 0;
    for (const auto& entry : doc) {
        const std::string where = "entry " + std::to_string(index++) + ": ";
        if (!entry.IsMap()) {
            error = where + "not a mapping";
            return false;
        }

        MetricRecord record;
        record.source = source;
        bool has_ctx = false;
        for (const auto& kv : entry) {
            const std::string key = kv.first.as<std::string>();
            if (key == kContextNode) {
                std::string ctx_error;
                if (!DecodeContext(kv.second, record.ctx, ctx_error)) {
                    error = where + ctx_error;
                    return false;
                }
                has_ctx = true;
                continue;
            }
            double value;
            if (!kv.second.IsScalar() || !YAML::convert<double>::decode(kv.second, value)) {
                error = where + "field '" + key + "' is not numeric";
                return false;
            }
            record.values[key] = value;
        }
        if (!has_ctx) {
            error = where + "missing 'ctx' mapping";
            return false;
        }
        parsed.push_back(std::move(record));
    }

    records.insert(records.end(),
                   std::make_move_iterator(parsed.begin()),
                   std::make_move_iterator(parsed.end()));
    return true;
}

} // namespace Benchkit
