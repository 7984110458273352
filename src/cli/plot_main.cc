#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "common/errors.h"
#include "metrics/aggregator.h"
#include "metrics/collector.h"
#include "report/plot_renderer.h"

using namespace Benchkit;

namespace {

std::string JoinKeys(const std::vector<std::string>& keys) {
    std::string out;
    for (const auto& k : keys) {
        if (!out.empty()) out += ",";
        out += k;
    }
    return out;
}

std::vector<std::string> MetricKeys() {
    std::vector<std::string> keys;
    for (const auto& info : SupportedMetrics()) keys.push_back(info.key);
    return keys;
}

std::optional<std::string> OptionalString(const cxxopts::ParseResult& result, const char* name) {
    if (!result.count(name)) return std::nullopt;
    return result[name].as<std::string>();
}

AxisScale RequireScale(const cxxopts::ParseResult& result, const char* name) {
    const std::string value = result[name].as<std::string>();
    auto scale = ParseAxisScale(value);
    if (!scale) {
        throw ConfigError(std::string("--") + name + " must be one of linear,log,symlog,logit (got '" +
                          value + "')");
    }
    return *scale;
}

void RequireOneOf(const std::string& value, const std::vector<std::string>& allowed,
                  const char* option) {
    if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
        throw ConfigError(std::string("--") + option + " must be one of " + JoinKeys(allowed) +
                          " (got '" + value + "')");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("benchkit_plot", "Plot aggregated benchmark metrics");
    options.add_options()
        ("k,kind", "Plot kind: line, scatter", cxxopts::value<std::string>()->default_value("line"))
        ("r,root", "Output root of one or more sessions", cxxopts::value<std::string>())
        ("xscale", "X axis scale: linear, log, symlog, logit",
            cxxopts::value<std::string>()->default_value("linear"))
        ("yscale", "Y axis scale: linear, log, symlog, logit",
            cxxopts::value<std::string>()->default_value("linear"))
        ("xlabel", "X axis label override", cxxopts::value<std::string>())
        ("ylabel", "Y axis label override", cxxopts::value<std::string>())
        ("t,title", "Plot title override", cxxopts::value<std::string>())
        ("show", "Display the plot")
        ("save", "Save series data and images")
        ("f,format", "Image format to save: png, pdf (repeatable)",
            cxxopts::value<std::vector<std::string>>())
        ("l,label", "Series label template, e.g. 'bs={{ bs }}'", cxxopts::value<std::string>())
        ("x,xkey", "Context key on the x axis: " + JoinKeys(SupportedXKeys()),
            cxxopts::value<std::string>()->default_value("iodepth"))
        ("m,metric", "Metric to plot: " + JoinKeys(MetricKeys()),
            cxxopts::value<std::string>()->default_value("iops"))
        ("n,name", "Plot name, default <metric>_vs_<xkey>", cxxopts::value<std::string>())
        ("c,config", "Configuration file", cxxopts::value<std::string>())
        ("v,verbose", "Increase verbosity (repeatable)")
        ("h,help", "Print usage");

    Configuration& configuration = Configuration::getInstance();
    PlotConfig plot_config;
    std::string root;
    std::string name;
    std::vector<std::string> formats;
    std::optional<std::string> label_template;
    bool show = false;
    bool save = false;

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        FLAGS_v = static_cast<int>(result.count("verbose"));

        if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
            throw ConfigError("invalid configuration file " + result["config"].as<std::string>());
        }
        // BENCHKIT_* overrides apply even without a file.
        configuration.ensureValid();
        const BenchkitConfig& cfg = GetConfig();

        if (!result.count("root")) {
            throw ConfigError("--root is required");
        }
        root = result["root"].as<std::string>();
        if (!std::filesystem::is_directory(root)) {
            throw ConfigError("output root is not a directory: " + root);
        }

        const std::string kind = result["kind"].as<std::string>();
        auto parsed_kind = ParsePlotKind(kind);
        if (!parsed_kind) {
            throw ConfigError("--kind must be one of line,scatter (got '" + kind + "')");
        }

        plot_config.kind = *parsed_kind;
        plot_config.metric = result["metric"].as<std::string>();
        plot_config.x_key = result["xkey"].as<std::string>();
        RequireOneOf(plot_config.metric, MetricKeys(), "metric");
        RequireOneOf(plot_config.x_key, SupportedXKeys(), "xkey");
        plot_config.xscale = RequireScale(result, "xscale");
        plot_config.yscale = RequireScale(result, "yscale");
        plot_config.title = OptionalString(result, "title");
        plot_config.xlabel = OptionalString(result, "xlabel");
        plot_config.ylabel = OptionalString(result, "ylabel");
        plot_config.width = cfg.reporting.width.get();
        plot_config.height = cfg.reporting.height.get();
        plot_config.gnuplot = cfg.reporting.gnuplot.get();

        label_template = OptionalString(result, "label");
        show = result.count("show") > 0;
        save = result.count("save") > 0;
        name = result.count("name") ? result["name"].as<std::string>()
                                    : plot_config.metric + "_vs_" + plot_config.x_key;

        if (result.count("format")) {
            formats = result["format"].as<std::vector<std::string>>();
        } else {
            formats = {"png"};
        }
        for (const auto& format : formats) {
            RequireOneOf(format, {"png", "pdf"}, "format");
        }
    } catch (const Benchkit::Error& e) {
        LOG(ERROR) << e.what();
        return 1;
    } catch (const std::exception& e) {
        // cxxopts parse and conversion errors
        LOG(ERROR) << "Invalid arguments: " << e.what();
        std::cerr << options.help() << std::endl;
        return 1;
    }

    const BenchkitConfig& cfg = GetConfig();
    MetricsCollector collector(cfg.reporting.testcase_suffix.get(), cfg.reporting.artifact.get());

    SeriesMap series_map;
    try {
        CollectionResult collected = collector.Collect(root);
        SortBySource(collected.records);
        series_map = Aggregate(collected.records, plot_config.metric, plot_config.x_key,
                               label_template);
    } catch (const Benchkit::Error& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    if (series_map.empty()) {
        LOG(WARNING) << "No records found under " << root << "; nothing to plot";
    }

    Figure figure = RenderPlot(series_map, plot_config);
    int exit_code = 0;

    if (save) {
        const std::string stem = (std::filesystem::path(root) / name).string();
        SaveResult saved = SaveArtifacts(figure, series_map, stem, formats);
        if (!saved.ok()) {
            LOG(ERROR) << saved.failed.size() << " artifact(s) could not be written";
            exit_code = 1;
        }
    }

    if (show) {
        try {
            figure.Show();
        } catch (const IOFailure& e) {
            LOG(ERROR) << e.what();
            exit_code = 1;
        }
    }

    return exit_code;
}
