#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "common/errors.h"
#include "session/run_config.h"
#include "session/session_lock.h"
#include "session/session_runner.h"

using namespace Benchkit;

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("benchkit_run", "Run testplans against an environment under a session lock");
    options.add_options()
        ("p,testplan", "Testplan to run (repeatable, at least one)",
            cxxopts::value<std::vector<std::string>>())
        ("e,environment", "Environment definition", cxxopts::value<std::string>())
        ("o,output", "Output directory, default a new directory under the output root",
            cxxopts::value<std::string>())
        ("f,filter", "Only run testcases matching this name", cxxopts::value<std::string>())
        ("c,config", "Configuration file", cxxopts::value<std::string>())
        ("clear-lock", "Remove a stale lock for --environment after verifying the target, then exit")
        ("v,verbose", "Increase verbosity (repeatable)")
        ("h,help", "Print usage");

    Configuration& configuration = Configuration::getInstance();
    RunRequest request;
    bool clear_lock = false;

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        request.verbosity = static_cast<int>(result.count("verbose"));
        FLAGS_v = request.verbosity;

        if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
            throw ConfigError("invalid configuration file " + result["config"].as<std::string>());
        }
        // BENCHKIT_* overrides apply even without a file.
        configuration.ensureValid();
        if (!result.count("environment")) {
            throw ConfigError("--environment is required");
        }
        request.environment = result["environment"].as<std::string>();
        clear_lock = result.count("clear-lock") > 0;

        if (!clear_lock) {
            if (!result.count("testplan")) {
                throw ConfigError("at least one --testplan is required");
            }
            request.testplans = result["testplan"].as<std::vector<std::string>>();
        }
        if (result.count("output")) {
            request.output_dir = result["output"].as<std::string>();
        }
        if (result.count("filter")) {
            request.filter = result["filter"].as<std::string>();
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

    if (clear_lock) {
        try {
            if (SessionLock::Clear(request.environment, cfg.session.lock_dir.get())) {
                std::cout << "Removed " << LockPathFor(request.environment, cfg.session.lock_dir.get())
                          << std::endl;
            } else {
                std::cout << "No lock held for " << request.environment << std::endl;
            }
            return 0;
        } catch (const Benchkit::Error& e) {
            LOG(ERROR) << e.what();
            return 1;
        }
    }

    RunConfig run_config;
    try {
        run_config = ResolveRunConfig(request, cfg.session.output_root.get());
    } catch (const ConfigError& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    SessionRunner runner(std::make_unique<CommandExecutor>(cfg.session.executor.get()),
                         cfg.session.lock_dir.get());
    try {
        runner.Run(run_config);
    } catch (const SessionLocked& e) {
        std::cerr << LockedBanner(e, request.environment);
        return 1;
    } catch (const Benchkit::Error& e) {
        LOG(ERROR) << "Session failed: " << e.what();
        LOG(ERROR) << "Any lock taken by this session was kept; verify the target before "
                   << "clearing it with --clear-lock.";
        return 1;
    }
    return 0;
}
