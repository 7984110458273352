#include "session_lock.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/scoped_fd.h"

namespace fs = std::filesystem;

namespace Benchkit {

namespace {

std::string Diagnostics(const std::string& environment_path,
                        const std::vector<std::string>& testplans) {
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) != 0) {
        std::strcpy(host, "unknown");
    }

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    ::localtime_r(&time_t_now, &tm_now);

    std::ostringstream ss;
    ss << "pid: " << ::getpid() << "\n"
       << "host: " << host << "\n"
       << "started: " << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S") << "\n"
       << "environment: " << environment_path << "\n";
    for (const auto& plan : testplans) {
        ss << "testplan: " << plan << "\n";
    }
    return ss.str();
}

} // namespace

std::string LockPathFor(const std::string& environment_path, const std::string& lock_dir) {
    std::string name = fs::path(environment_path).filename().string();
    std::replace(name.begin(), name.end(), '.', '_');
    return (fs::path(lock_dir) / (name + "_lock")).string();
}

SessionLock::SessionLock(std::string environment_path, std::string lock_dir)
    : environment_path_(std::move(environment_path)),
      path_(LockPathFor(environment_path_, lock_dir)) {}

SessionLock::~SessionLock() {
    if (held_) {
        LOG(WARNING) << "Session ended without a clean release; leaving " << path_
                     << " in place. The target is tainted until an operator clears it.";
    }
}

void SessionLock::Acquire(const std::vector<std::string>& testplans) {
    if (held_) return;

    // O_EXCL makes creation fail if the file exists; no check-then-create race.
    ScopedFd fd(::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        const int err = errno;
        if (err == EEXIST) {
            throw SessionLocked(path_, ReadHolder(path_));
        }
        throw Error("cannot create lock file " + path_ + ": " + strerror(err));
    }
    held_ = true;

    // Content is informational only; a failed write does not undo the lock.
    const std::string info = Diagnostics(environment_path_, testplans);
    ssize_t written = ::write(fd.get(), info.data(), info.size());
    if (written != static_cast<ssize_t>(info.size())) {
        LOG(WARNING) << "Could not record diagnostics in " << path_ << ": " << strerror(errno);
    }

    LOG(INFO) << "Acquired session lock " << path_;
}

void SessionLock::Release() {
    if (!held_) return;
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        throw Error("cannot remove lock file " + path_ + ": " + strerror(errno));
    }
    held_ = false;
    LOG(INFO) << "Released session lock " << path_;
}

bool SessionLock::Clear(const std::string& environment_path, const std::string& lock_dir) {
    const std::string path = LockPathFor(environment_path, lock_dir);
    if (::unlink(path.c_str()) == 0) {
        LOG(WARNING) << "Operator cleared session lock " << path;
        return true;
    }
    if (errno == ENOENT) {
        return false;
    }
    throw Error("cannot remove lock file " + path + ": " + strerror(errno));
}

std::string SessionLock::ReadHolder(const std::string& lock_path) {
    std::ifstream in(lock_path);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string LockedBanner(const SessionLocked& locked, const std::string& environment_path) {
    std::ostringstream ss;
    ss << "\n"
       << "############################################################\n"
       << "#                 BENCHKIT SESSION LOCKED                  #\n"
       << "############################################################\n"
       << "\n"
       << "Another session holds the lock for this environment:\n"
       << "  lock file: " << locked.lock_path() << "\n";
    if (!locked.holder().empty()) {
        ss << "\n" << locked.holder();
    }
    ss << "\n"
       << "If that session is still running, wait for it to finish.\n"
       << "If it crashed or was interrupted, the target may be in an\n"
       << "unknown state. Verify or reprovision the target, then clear\n"
       << "the lock with:\n"
       << "  benchkit_run --clear-lock --environment " << environment_path << "\n"
       << "\n";
    return ss.str();
}

} // namespace Benchkit
