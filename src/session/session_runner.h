#ifndef BENCHKIT_SRC_SESSION_SESSION_RUNNER_H_
#define BENCHKIT_SRC_SESSION_SESSION_RUNNER_H_

#include <memory>
#include <string>
#include <vector>

#include "run_config.h"

namespace Benchkit {

/**
 * Interface to the engine that executes testcases against the target and
 * writes result artifacts into the output directory.
 */
class ITestExecutor {
public:
    virtual ~ITestExecutor() = default;

    /**
     * @throws ExecutionError (or any Error) when the run fails
     */
    virtual void Execute(const RunConfig& config) = 0;
};

/**
 * Runs an external engine program:
 *   <program> --testplan P... --environment E --output O [--filter F] [-v...]
 * A non-zero exit status is an ExecutionError.
 */
class CommandExecutor : public ITestExecutor {
public:
    explicit CommandExecutor(std::string program);

    void Execute(const RunConfig& config) override;

    std::vector<std::string> BuildArgv(const RunConfig& config) const;

private:
    std::string program_;
};

/**
 * Wraps one execution in the session lock.
 *
 * The lock is taken after the configuration is resolved and released only
 * when the executor returns normally. Any exception from the executor
 * propagates with the lock still held.
 */
class SessionRunner {
public:
    SessionRunner(std::unique_ptr<ITestExecutor> executor, std::string lock_dir);

    /**
     * @throws SessionLocked if another session holds the environment's lock
     */
    void Run(const RunConfig& config);

private:
    std::unique_ptr<ITestExecutor> executor_;
    std::string lock_dir_;
};

} // namespace Benchkit

#endif // BENCHKIT_SRC_SESSION_SESSION_RUNNER_H_
