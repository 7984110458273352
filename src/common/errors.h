#ifndef BENCHKIT_SRC_COMMON_ERRORS_H_
#define BENCHKIT_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Benchkit {

/**
 * Base class of every error raised by benchkit.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Invalid path or option. Raised before any lock is taken or file written.
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

/**
 * Another session holds the lock for the same environment.
 */
class SessionLocked : public Error {
public:
    SessionLocked(const std::string& lock_path, const std::string& holder)
        : Error("session lock already held: " + lock_path),
          lock_path_(lock_path), holder_(holder) {}

    const std::string& lock_path() const { return lock_path_; }
    // Content of the lock file at the time of the failed attempt, may be empty.
    const std::string& holder() const { return holder_; }

private:
    std::string lock_path_;
    std::string holder_;
};

/**
 * A record lacks the metric being aggregated.
 */
class MissingMetric : public Error {
public:
    MissingMetric(const std::string& metric, const std::string& source)
        : Error("metric '" + metric + "' missing in record from " + source),
          metric_(metric) {}

    const std::string& metric() const { return metric_; }

private:
    std::string metric_;
};

/**
 * A record context cannot provide an integer x value.
 */
class MalformedContext : public Error {
public:
    explicit MalformedContext(const std::string& what) : Error(what) {}
};

class TemplateError : public Error {
public:
    explicit TemplateError(const std::string& what) : Error(what) {}
};

/**
 * Writing one output artifact failed. Other artifacts are unaffected.
 */
class IOFailure : public Error {
public:
    IOFailure(const std::string& path, const std::string& reason)
        : Error("failed to write " + path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * The external execution engine reported a failure.
 */
class ExecutionError : public Error {
public:
    explicit ExecutionError(const std::string& what) : Error(what) {}
};

} // namespace Benchkit

#endif // BENCHKIT_SRC_COMMON_ERRORS_H_
