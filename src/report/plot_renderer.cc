#include "plot_renderer.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

#include <unistd.h>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/configuration.h"
#include "common/errors.h"
#include "common/process.h"

namespace Benchkit {

namespace {

std::string QuoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string TerminalForFormat(const std::string& format, int width, int height) {
    if (format == "pdf") return "pdfcairo size 11in,8in";
    return "pngcairo size " + std::to_string(width) + "," + std::to_string(height);
}

// gnuplot has no symlog/logit scale; both are expressed as nonlinear axes.
void EmitScale(std::ostringstream& script, char axis, AxisScale scale) {
    const std::string a(1, axis);
    switch (scale) {
        case AxisScale::kLinear:
            break;
        case AxisScale::kLog:
            script << "set logscale " << a << " 10\n";
            break;
        case AxisScale::kSymlog:
            script << "set nonlinear " << a << " via (" << a << " >= 0 ? log10(1 + " << a
                   << ") : -log10(1 - " << a << ")) inverse (" << a << " >= 0 ? 10**" << a
                   << " - 1 : 1 - 10**(-" << a << "))\n";
            break;
        case AxisScale::kLogit:
            script << "set nonlinear " << a << " via log(" << a << "/(1 - " << a
                   << ")) inverse 1/(1 + exp(-" << a << "))\n";
            break;
    }
}

constexpr double kMaxTicks = 64;

double NiceStep(double range) {
    const double raw = range / 5.0;
    const double magnitude = std::pow(10.0, std::floor(std::log10(raw)));
    const double residual = raw / magnitude;
    if (residual > 5.0) return 10.0 * magnitude;
    if (residual > 2.0) return 5.0 * magnitude;
    if (residual > 1.0) return 2.0 * magnitude;
    return magnitude;
}

std::string ReadFirstLine(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return line;
}

} // namespace

std::optional<AxisScale> ParseAxisScale(const std::string& name) {
    if (name == "linear") return AxisScale::kLinear;
    if (name == "log") return AxisScale::kLog;
    if (name == "symlog") return AxisScale::kSymlog;
    if (name == "logit") return AxisScale::kLogit;
    return std::nullopt;
}

const char* AxisScaleName(AxisScale scale) {
    switch (scale) {
        case AxisScale::kLinear: return "linear";
        case AxisScale::kLog: return "log";
        case AxisScale::kSymlog: return "symlog";
        case AxisScale::kLogit: return "logit";
    }
    return "linear";
}

std::optional<PlotKind> ParsePlotKind(const std::string& name) {
    if (name == "line") return PlotKind::kLine;
    if (name == "scatter") return PlotKind::kScatter;
    return std::nullopt;
}

const std::vector<Marker>& MarkerPalette() {
    static const std::vector<Marker> palette = {
        {"circle", 7},
        {"triangle-up", 9},
        {"triangle-down", 11},
        {"square", 5},
        {"diamond", 13},
        {"pentagon", 15},
        {"star", 3},
        {"plus", 1},
        {"cross", 2},
    };
    return palette;
}

const Marker& MarkerFor(size_t series_index) {
    const auto& palette = MarkerPalette();
    return palette[series_index % palette.size()];
}

const std::vector<MetricInfo>& SupportedMetrics() {
    // Raw units as written by the engine: IOPS, KiB/s, ns.
    static const std::vector<MetricInfo> metrics = {
        {"iops", "Throughput", "kIOPS", 1000.0},
        {"bw", "Bandwidth", "MiB/s", 1024.0},
        {"lat", "Latency", "\xc2\xb5s", 1000.0},
    };
    return metrics;
}

const MetricInfo* FindMetric(const std::string& key) {
    for (const auto& info : SupportedMetrics()) {
        if (key == info.key) return &info;
    }
    return nullptr;
}

const std::vector<std::string>& SupportedXKeys() {
    static const std::vector<std::string> keys = {"iodepth", "numjobs", "threads"};
    return keys;
}

std::string DefaultXLabel(const std::string& x_key) {
    if (x_key == "iodepth") return "I/O depth";
    if (x_key == "numjobs") return "Number of jobs";
    if (x_key == "threads") return "Threads";
    return x_key;
}

std::string TickFormatter::operator()(double raw) const {
    const double shown = raw / divisor_;
    std::ostringstream ss;
    ss << std::setprecision(4) << (shown == 0.0 ? 0.0 : shown);
    return ss.str();
}

std::vector<double> TickPositions(double lo, double hi, AxisScale scale) {
    std::vector<double> ticks;
    if (!std::isfinite(lo) || !std::isfinite(hi)) return ticks;
    if (lo > hi) std::swap(lo, hi);

    switch (scale) {
        case AxisScale::kLinear: {
            // Spans of a few ulps cannot be stepped through; widen them like a flat series.
            const double magnitude = std::max(std::fabs(lo), std::fabs(hi));
            const double ulp = std::nextafter(magnitude, std::numeric_limits<double>::infinity()) -
                               magnitude;
            if (hi - lo <= 4.0 * ulp) {
                const double mid = lo + (hi - lo) / 2.0;
                const double pad = mid == 0.0 ? 1.0 : std::fabs(mid) * 0.1;
                lo = mid - pad;
                hi = mid + pad;
            }
            const double step = NiceStep(hi - lo);
            if (!std::isfinite(step) || step <= 0.0) break;
            const double first = std::floor(lo / step);
            const double last = std::floor(hi / step + 1e-9);
            if (!(last - first < kMaxTicks)) break;
            // Ticks are k * step so rounding cannot accumulate or stall.
            for (int64_t k = static_cast<int64_t>(first); k <= static_cast<int64_t>(last); ++k) {
                ticks.push_back(static_cast<double>(k) * step);
            }
            break;
        }
        case AxisScale::kLog: {
            if (hi <= 0.0) break;
            if (lo <= 0.0) lo = hi / 1000.0;
            const int first = static_cast<int>(std::floor(std::log10(lo)));
            const int last = static_cast<int>(std::ceil(std::log10(hi)));
            for (int e = first; e <= last; ++e) ticks.push_back(std::pow(10.0, e));
            break;
        }
        case AxisScale::kSymlog: {
            const double extent = std::max(std::fabs(lo), std::fabs(hi));
            const int last = extent > 1.0 ? static_cast<int>(std::ceil(std::log10(extent))) : 0;
            if (lo < 0.0) {
                for (int e = last; e >= 0; --e) ticks.push_back(-std::pow(10.0, e));
            }
            ticks.push_back(0.0);
            if (hi > 0.0) {
                for (int e = 0; e <= last; ++e) ticks.push_back(std::pow(10.0, e));
            }
            break;
        }
        case AxisScale::kLogit: {
            for (double t : {0.001, 0.01, 0.1, 0.5, 0.9, 0.99, 0.999}) ticks.push_back(t);
            break;
        }
    }
    return ticks;
}

Figure::Figure(PlotConfig config) : config_(std::move(config)) {}

void Figure::AddLine(const Series& series) {
    PlotLine line;
    line.label = series.label;
    line.xs = series.xvals;
    line.ys = series.yvals;
    line.marker = MarkerFor(lines_.size());
    lines_.push_back(std::move(line));
}

std::string Figure::Title() const {
    if (config_.title) return *config_.title;
    const MetricInfo* info = FindMetric(config_.metric);
    const std::string what = info ? info->title : config_.metric;
    return what + " vs " + DefaultXLabel(config_.x_key);
}

std::string Figure::XLabel() const {
    if (config_.xlabel) return *config_.xlabel;
    return DefaultXLabel(config_.x_key);
}

std::string Figure::YLabel() const {
    if (config_.ylabel) return *config_.ylabel;
    const MetricInfo* info = FindMetric(config_.metric);
    if (!info) return config_.metric;
    return std::string(info->title) + " [" + info->unit + "]";
}

double Figure::YDivisor() const {
    const MetricInfo* info = FindMetric(config_.metric);
    return info ? info->divisor : 1.0;
}

std::string Figure::BuildScript(const std::string& terminal, const std::string& output) const {
    std::ostringstream script;
    if (!terminal.empty()) {
        script << "set terminal " << terminal << " enhanced\n";
    }
    if (!output.empty()) {
        script << "set output " << QuoteForGnuplot(output) << "\n";
    }
    script << "set title " << QuoteForGnuplot(Title()) << " noenhanced\n";
    script << "set xlabel " << QuoteForGnuplot(XLabel()) << " noenhanced\n";
    script << "set ylabel " << QuoteForGnuplot(YLabel()) << " noenhanced\n";
    script << "set grid back lw 1 dt 2\n";
    script << "set key outside right top noenhanced\n";
    script << "set tics out nomirror\n";
    EmitScale(script, 'x', config_.xscale);
    EmitScale(script, 'y', config_.yscale);

    // Y tick labels are rendered in display units; plotted values stay raw.
    double ymin = std::numeric_limits<double>::infinity();
    double ymax = -std::numeric_limits<double>::infinity();
    for (const auto& line : lines_) {
        for (double y : line.ys) {
            ymin = std::min(ymin, y);
            ymax = std::max(ymax, y);
        }
    }
    if (ymin <= ymax) {
        const TickFormatter format(YDivisor());
        const auto ticks = TickPositions(ymin, ymax, config_.yscale);
        if (!ticks.empty()) {
            script << "set ytics (";
            for (size_t i = 0; i < ticks.size(); ++i) {
                if (i) script << ", ";
                script << QuoteForGnuplot(format(ticks[i])) << " " << std::setprecision(17)
                       << ticks[i];
            }
            script << ")\n";
        }
    }

    for (size_t i = 0; i < lines_.size(); ++i) {
        script << "$series" << i << " << EOD\n";
        const auto& line = lines_[i];
        for (size_t p = 0; p < line.xs.size(); ++p) {
            script << line.xs[p] << " " << std::setprecision(17) << line.ys[p] << "\n";
        }
        script << "EOD\n";
    }

    const char* style = config_.kind == PlotKind::kScatter ? "points" : "linespoints";
    script << "plot ";
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (i) script << ", \\\n     ";
        script << "$series" << i << " using 1:2 with " << style
               << " pt " << lines_[i].marker.point_type << " ps 1.5"
               << " title " << QuoteForGnuplot(lines_[i].label);
    }
    script << "\n";
    return script.str();
}

void Figure::SaveImage(const std::string& path_stem, const std::string& format) const {
    const std::string output = path_stem + "." + format;
    if (format != "png" && format != "pdf") {
        throw IOFailure(output, "unsupported image format '" + format + "'");
    }
    if (lines_.empty()) {
        throw IOFailure(output, "no series to plot");
    }

    const std::string script_path = output + ".plt";
    const std::string err_path = output + ".err.log";
    {
        std::ofstream out(script_path);
        if (!out) {
            throw IOFailure(output, "cannot write gnuplot script " + script_path + ": " +
                                        strerror(errno));
        }
        out << BuildScript(TerminalForFormat(format, config_.width, config_.height), output);
        if (!out.good()) {
            throw IOFailure(output, "short write to " + script_path);
        }
    }

    std::error_code ec;
    std::filesystem::remove(output, ec);
    const int rc = SpawnAndWait({config_.gnuplot, script_path}, err_path);
    std::filesystem::remove(script_path, ec);

    if (rc != 0 || !std::filesystem::exists(output, ec)) {
        const std::string first_line = ReadFirstLine(err_path);
        throw IOFailure(output, "gnuplot exited with " + std::to_string(rc) +
                                    (first_line.empty() ? "" : ": " + first_line) +
                                    " (log: " + err_path + ")");
    }
    std::filesystem::remove(err_path, ec);
    LOG(INFO) << "Wrote " << output;
}

void Figure::Show() const {
    if (lines_.empty()) {
        LOG(WARNING) << "Nothing to show";
        return;
    }
    const std::string script_path =
        (std::filesystem::path(DefaultTempDir()) /
         ("benchkit-show-" + std::to_string(::getpid()) + ".plt")).string();
    {
        std::ofstream out(script_path);
        if (!out) {
            throw IOFailure(script_path, strerror(errno));
        }
        out << BuildScript("", "");
    }
    const int rc = SpawnAndWait({config_.gnuplot, "-persist", script_path});
    std::error_code ec;
    std::filesystem::remove(script_path, ec);
    if (rc != 0) {
        throw IOFailure(script_path, "gnuplot exited with " + std::to_string(rc));
    }
}

Figure RenderPlot(const SeriesMap& series_map, const PlotConfig& config) {
    Figure figure(config);
    for (const auto& [fp, series] : series_map) {
        figure.AddLine(series);
    }
    VLOG(1) << "Figure '" << figure.Title() << "' with " << figure.lines().size() << " lines";
    return figure;
}

void WriteSeriesData(const SeriesMap& series_map, const std::string& path) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [fp, series] : series_map) {
        out << YAML::Key << fp << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "xvals" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (int64_t x : series.xvals) out << static_cast<long long>(x);
        out << YAML::EndSeq;
        out << YAML::Key << "yvals" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (double y : series.yvals) out << y;
        out << YAML::EndSeq;
        out << YAML::Key << "ctx" << YAML::Value << YAML::BeginMap;
        for (const auto& [key, value] : series.ctx) {
            out << YAML::Key << key << YAML::Value;
            if (const auto* i = std::get_if<int64_t>(&value)) {
                out << static_cast<long long>(*i);
            } else if (const auto* d = std::get_if<double>(&value)) {
                out << *d;
            } else {
                // Quoted so that "4" reads back as a string.
                out << YAML::DoubleQuoted << std::get<std::string>(value);
            }
        }
        out << YAML::EndMap;
        out << YAML::Key << "label" << YAML::Value << YAML::DoubleQuoted << series.label;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        throw IOFailure(path, "YAML emitter error: " + out.GetLastError());
    }

    std::ofstream file(path);
    if (!file) {
        throw IOFailure(path, strerror(errno));
    }
    file << out.c_str() << "\n";
    file.close();
    if (!file) {
        throw IOFailure(path, "write failed");
    }
    LOG(INFO) << "Wrote series data to " << path;
}

SaveResult SaveArtifacts(const Figure& figure, const SeriesMap& series_map,
                         const std::string& path_stem,
                         const std::vector<std::string>& formats) {
    SaveResult result;
    const std::string data_path = path_stem + ".yml";
    try {
        WriteSeriesData(series_map, data_path);
        result.written.push_back(data_path);
    } catch (const IOFailure& e) {
        LOG(ERROR) << e.what();
        result.failed.push_back(e.path());
    }

    if (series_map.empty()) {
        LOG(WARNING) << "No series to plot; skipping images for " << path_stem;
        return result;
    }
    for (const auto& format : formats) {
        try {
            figure.SaveImage(path_stem, format);
            result.written.push_back(path_stem + "." + format);
        } catch (const IOFailure& e) {
            LOG(ERROR) << e.what();
            result.failed.push_back(e.path());
        }
    }
    return result;
}

} // namespace Benchkit
