#include "session_runner.h"

#include <glog/logging.h>

#include "common/errors.h"
#include "common/process.h"
#include "session_lock.h"

namespace Benchkit {

CommandExecutor::CommandExecutor(std::string program) : program_(std::move(program)) {}

std::vector<std::string> CommandExecutor::BuildArgv(const RunConfig& config) const {
    std::vector<std::string> argv = {program_};
    for (const auto& plan : config.testplans) {
        argv.push_back("--testplan");
        argv.push_back(plan);
    }
    argv.push_back("--environment");
    argv.push_back(config.environment);
    argv.push_back("--output");
    argv.push_back(config.output_dir);
    if (config.filter) {
        argv.push_back("--filter");
        argv.push_back(*config.filter);
    }
    if (config.verbosity > 0) {
        argv.push_back("-" + std::string(config.verbosity, 'v'));
    }
    return argv;
}

void CommandExecutor::Execute(const RunConfig& config) {
    const auto argv = BuildArgv(config);
    LOG(INFO) << "Running " << program_ << " with " << config.testplans.size()
              << " testplan(s) against " << config.environment;
    const int rc = SpawnAndWait(argv);
    if (rc != 0) {
        throw ExecutionError(program_ + " exited with status " + std::to_string(rc));
    }
}

SessionRunner::SessionRunner(std::unique_ptr<ITestExecutor> executor, std::string lock_dir)
    : executor_(std::move(executor)), lock_dir_(std::move(lock_dir)) {}

void SessionRunner::Run(const RunConfig& config) {
    SessionLock lock(config.environment, lock_dir_);
    lock.Acquire(config.testplans);

    // No try/catch: a failure below must keep the lock in place.
    executor_->Execute(config);

    lock.Release();
    LOG(INFO) << "Session finished; results in " << config.output_dir;
}

} // namespace Benchkit
