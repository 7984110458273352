#ifndef BENCHKIT_SRC_SESSION_SESSION_LOCK_H_
#define BENCHKIT_SRC_SESSION_SESSION_LOCK_H_

#include <string>
#include <vector>

namespace Benchkit {

class SessionLocked;

/**
 * Lock file path for an environment definition:
 *   <lock_dir>/<basename of environment_path, '.' replaced by '_'>_lock
 * e.g. envs/lab.yml -> <lock_dir>/lab_yml_lock
 */
std::string LockPathFor(const std::string& environment_path, const std::string& lock_dir);

/**
 * Single-host mutual exclusion for benchmark sessions.
 *
 * The lock is the existence of a file, created with O_CREAT|O_EXCL so that
 * two near-simultaneous launches cannot both succeed. The destructor never
 * removes the file: a session that ends in a crash, a signal or an error
 * leaves it behind and the target is considered tainted until an operator
 * clears it. Only Release() after a clean run removes the lock.
 *
 * States: unlocked -> Acquire() -> held -> Release() -> unlocked.
 *         held -> process dies or object destroyed -> stale (file remains).
 */
class SessionLock {
public:
    SessionLock(std::string environment_path, std::string lock_dir);
    ~SessionLock();

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

    /**
     * Atomically creates the lock file and records diagnostics in it.
     * @param testplans Recorded in the lock file for the operator
     * @throws SessionLocked if the lock file already exists
     * @throws Error for any other failure creating the file
     */
    void Acquire(const std::vector<std::string>& testplans = {});

    /**
     * Removes the lock file. Only call after the session completed cleanly.
     * @throws Error if the file cannot be removed
     */
    void Release();

    bool held() const { return held_; }
    const std::string& path() const { return path_; }

    /**
     * Operator action: removes a stale lock for an environment.
     * @return true if a lock file was removed, false if none existed
     * @throws Error if the file exists but cannot be removed
     */
    static bool Clear(const std::string& environment_path, const std::string& lock_dir);

    // Contents of an existing lock file, empty if absent or unreadable.
    static std::string ReadHolder(const std::string& lock_path);

private:
    std::string environment_path_;
    std::string path_;
    bool held_ = false;
};

/**
 * Operator-facing message for a refused launch: the lock path, what the
 * holder recorded, and how to clear a stale lock for environment_path.
 */
std::string LockedBanner(const SessionLocked& locked, const std::string& environment_path);

} // namespace Benchkit

#endif // BENCHKIT_SRC_SESSION_SESSION_LOCK_H_
