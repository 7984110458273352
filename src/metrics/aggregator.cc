#include "aggregator.h"

#include <algorithm>
#include <numeric>

#include <glog/logging.h>

#include "common/errors.h"
#include "fingerprint.h"
#include "report/label_renderer.h"

namespace Benchkit {

namespace {

int64_t ExtractX(const MetricRecord& record, const std::string& x_key) {
    auto it = record.ctx.find(x_key);
    if (it == record.ctx.end()) {
        throw MalformedContext("context key '" + x_key + "' missing in record from " +
                               record.source);
    }
    auto x = ParseInteger(it->second);
    if (!x) {
        throw MalformedContext("context key '" + x_key + "' is not an integer ('" +
                               ToString(it->second) + "') in record from " + record.source);
    }
    return *x;
}

// Orders points by x; std::stable_sort keeps equal x in insertion order.
void SortPoints(Series& series) {
    std::vector<size_t> order(series.xvals.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&series](size_t a, size_t b) {
        return series.xvals[a] < series.xvals[b];
    });

    std::vector<int64_t> xs;
    std::vector<double> ys;
    xs.reserve(order.size());
    ys.reserve(order.size());
    for (size_t idx : order) {
        xs.push_back(series.xvals[idx]);
        ys.push_back(series.yvals[idx]);
    }
    series.xvals = std::move(xs);
    series.yvals = std::move(ys);
}

} // namespace

SeriesMap Aggregate(const std::vector<MetricRecord>& records,
                    const std::string& metric,
                    const std::string& x_key,
                    const std::optional<std::string>& label_template) {
    SeriesMap series_map;

    for (const auto& record : records) {
        auto y = record.Metric(metric);
        if (!y) {
            throw MissingMetric(metric, record.source);
        }
        const int64_t x = ExtractX(record, x_key);

        Context reduced = ReduceContext(record.ctx, x_key);
        std::string fp = Fingerprint(reduced);

        auto it = series_map.find(fp);
        if (it == series_map.end()) {
            Series series;
            series.fingerprint = fp;
            series.label = label_template ? RenderLabel(*label_template, record.ctx) : fp;
            series.ctx = std::move(reduced);
            it = series_map.emplace(fp, std::move(series)).first;
            VLOG(2) << "New series " << fp << " label='" << it->second.label << "'";
        }
        it->second.xvals.push_back(x);
        it->second.yvals.push_back(*y);
    }

    for (auto& [fp, series] : series_map) {
        SortPoints(series);
    }

    VLOG(1) << "Aggregated " << records.size() << " records on " << metric << "/" << x_key
            << " into " << series_map.size() << " series";
    return series_map;
}

} // namespace Benchkit
