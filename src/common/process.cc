#include "process.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

#include "scoped_fd.h"

extern char** environ;

namespace Benchkit {

std::string FindExecutable(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos) {
        return ::access(command.c_str(), X_OK) == 0 ? command : "";
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::stringstream ss{std::string(path_env)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int SpawnAndWait(const std::vector<std::string>& argv, const std::string& stderr_path) {
    if (argv.empty()) return -1;

    const std::string executable = FindExecutable(argv[0]);
    if (executable.empty()) {
        LOG(ERROR) << "Executable not found: " << argv[0];
        return -1;
    }

    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        return -1;
    }

    ScopedFd err_fd;
    if (!stderr_path.empty()) {
        err_fd = ScopedFd(::open(stderr_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644));
        if (!err_fd.valid()) {
            LOG(ERROR) << "Cannot open " << stderr_path << ": " << strerror(errno);
            ::posix_spawn_file_actions_destroy(&actions);
            return -1;
        }
        if (::posix_spawn_file_actions_adddup2(&actions, err_fd.get(), STDERR_FILENO) != 0) {
            ::posix_spawn_file_actions_destroy(&actions);
            return -1;
        }
    }

    std::vector<char*> raw_argv;
    raw_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        raw_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    raw_argv.push_back(nullptr);

    pid_t pid = -1;
    const int spawn_rc = ::posix_spawn(&pid, executable.c_str(), &actions, nullptr,
                                       raw_argv.data(), environ);
    ::posix_spawn_file_actions_destroy(&actions);
    err_fd.reset();

    if (spawn_rc != 0 || pid <= 0) {
        LOG(ERROR) << "Failed to spawn " << executable << ": " << strerror(spawn_rc);
        return -1;
    }
    VLOG(1) << "Spawned " << executable << " as pid " << pid;

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace Benchkit
