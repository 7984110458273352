#include "run_config.h"

#include <cstdio>
#include <filesystem>
#include <random>

#include <glog/logging.h>

#include "common/errors.h"

namespace fs = std::filesystem;

namespace Benchkit {

namespace {

void RequireExisting(const std::string& path, const char* what) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        throw ConfigError(std::string(what) + " does not exist: '" + path + "'");
    }
}

} // namespace

std::string RandomOutputDir(const std::string& output_root) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<unsigned> dist(0, 0xffffff);

    for (;;) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "%06x", dist(gen));
        fs::path candidate = fs::path(output_root) / (std::string("benchkit-") + suffix);
        std::error_code ec;
        if (!fs::exists(candidate, ec)) return candidate.string();
    }
}

RunConfig ResolveRunConfig(const RunRequest& request, const std::string& output_root) {
    if (request.testplans.empty()) {
        throw ConfigError("at least one testplan is required");
    }
    for (const auto& plan : request.testplans) {
        RequireExisting(plan, "testplan");
    }
    RequireExisting(request.environment, "environment");

    RunConfig config;
    config.testplans = request.testplans;
    config.environment = request.environment;
    config.filter = request.filter;
    config.verbosity = request.verbosity;
    config.output_dir = request.output_dir.empty() ? RandomOutputDir(output_root)
                                                   : request.output_dir;

    std::error_code ec;
    if (fs::exists(config.output_dir, ec)) {
        if (!fs::is_directory(config.output_dir, ec)) {
            throw ConfigError("output path is not a directory: '" + config.output_dir + "'");
        }
    } else {
        fs::create_directories(config.output_dir, ec);
        if (ec) {
            throw ConfigError("cannot create output directory '" + config.output_dir +
                              "': " + ec.message());
        }
        VLOG(1) << "Created output directory " << config.output_dir;
    }

    LOG(INFO) << "Session output directory: " << config.output_dir;
    return config;
}

} // namespace Benchkit
