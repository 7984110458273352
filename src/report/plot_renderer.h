#ifndef BENCHKIT_SRC_REPORT_PLOT_RENDERER_H_
#define BENCHKIT_SRC_REPORT_PLOT_RENDERER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "metrics/aggregator.h"

namespace Benchkit {

enum class AxisScale { kLinear, kLog, kSymlog, kLogit };

enum class PlotKind { kLine, kScatter };

std::optional<AxisScale> ParseAxisScale(const std::string& name);
const char* AxisScaleName(AxisScale scale);

std::optional<PlotKind> ParsePlotKind(const std::string& name);

/**
 * Point style of one series. point_type is the gnuplot "pt" code.
 */
struct Marker {
    const char* name;
    int point_type;
};

/**
 * Fixed marker palette. Series beyond its length reuse markers from the
 * start: series i gets palette[i % size].
 */
const std::vector<Marker>& MarkerPalette();
const Marker& MarkerFor(size_t series_index);

/**
 * Display properties of a plottable metric. Stored samples are in raw
 * units; tick labels show raw / divisor.
 */
struct MetricInfo {
    const char* key;
    const char* title;
    const char* unit;
    double divisor;
};

// Metrics selectable on the command line: iops, bw, lat.
const std::vector<MetricInfo>& SupportedMetrics();
const MetricInfo* FindMetric(const std::string& key);

// X axis keys selectable on the command line.
const std::vector<std::string>& SupportedXKeys();
std::string DefaultXLabel(const std::string& x_key);

/**
 * Formats a raw tick position in the display unit (raw / divisor).
 */
class TickFormatter {
public:
    explicit TickFormatter(double divisor) : divisor_(divisor) {}

    std::string operator()(double raw) const;

private:
    double divisor_;
};

/**
 * Tick positions, in raw units, covering [lo, hi] for the given scale.
 */
std::vector<double> TickPositions(double lo, double hi, AxisScale scale);

struct PlotConfig {
    std::string metric;
    std::string x_key;
    PlotKind kind = PlotKind::kLine;
    AxisScale xscale = AxisScale::kLinear;
    AxisScale yscale = AxisScale::kLinear;
    std::optional<std::string> title;
    std::optional<std::string> xlabel;
    std::optional<std::string> ylabel;
    int width = 1200;
    int height = 800;
    std::string gnuplot = "gnuplot";
};

struct PlotLine {
    std::string label;
    std::vector<int64_t> xs;
    std::vector<double> ys;
    Marker marker;
};

/**
 * A chart built from aggregated series. Owned by the caller; nothing about
 * it is global.
 */
class Figure {
public:
    explicit Figure(PlotConfig config);

    void AddLine(const Series& series);

    const std::vector<PlotLine>& lines() const { return lines_; }
    const PlotConfig& config() const { return config_; }

    std::string Title() const;
    std::string XLabel() const;
    std::string YLabel() const;

    // Divides raw y values for display; 1 for metrics without an entry.
    double YDivisor() const;

    /**
     * Generates a complete gnuplot script with the data inlined.
     * @param terminal gnuplot terminal definition; empty for the interactive default
     * @param output Output file; empty when showing interactively
     */
    std::string BuildScript(const std::string& terminal, const std::string& output) const;

    /**
     * Rasterizes to path_stem + "." + format.
     * @param format png or pdf
     * @throws IOFailure if gnuplot fails or produces no file
     */
    void SaveImage(const std::string& path_stem, const std::string& format) const;

    /**
     * Opens an interactive gnuplot window.
     * @throws IOFailure if gnuplot cannot be run
     */
    void Show() const;

private:
    PlotConfig config_;
    std::vector<PlotLine> lines_;
};

/**
 * One line per series in SeriesMap order, markers cycling through the palette.
 */
Figure RenderPlot(const SeriesMap& series_map, const PlotConfig& config);

/**
 * Writes fingerprint -> {xvals, yvals, ctx, label} as YAML.
 * @throws IOFailure when the file cannot be written
 */
void WriteSeriesData(const SeriesMap& series_map, const std::string& path);

struct SaveResult {
    std::vector<std::string> written;
    // Artifacts that raised IOFailure, in the order they were attempted.
    std::vector<std::string> failed;

    bool ok() const { return failed.empty(); }
};

/**
 * Writes path_stem.yml and, when the map is not empty, one image per format.
 * A failure is logged and recorded for its own artifact only; every other
 * artifact is still attempted.
 */
SaveResult SaveArtifacts(const Figure& figure, const SeriesMap& series_map,
                         const std::string& path_stem,
                         const std::vector<std::string>& formats);

} // namespace Benchkit

#endif // BENCHKIT_SRC_REPORT_PLOT_RENDERER_H_
