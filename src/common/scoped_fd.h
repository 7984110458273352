// Owns a file descriptor (lock files, redirected child stderr).
// Closed on scope exit, including early return and exceptions.
#ifndef BENCHKIT_SRC_COMMON_SCOPED_FD_H_
#define BENCHKIT_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Benchkit {

struct ScopedFd {
    int fd = -1;

    ScopedFd() = default;
    explicit ScopedFd(int f) : fd(f) {}

    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
    ScopedFd& operator=(ScopedFd&& o) noexcept {
        if (this != &o) {
            reset();
            fd = o.fd;
            o.fd = -1;
        }
        return *this;
    }

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }

    // Closes now; returns the close() result, 0 when nothing was held.
    int reset() {
        int rc = 0;
        if (fd >= 0) {
            rc = ::close(fd);
            fd = -1;
        }
        return rc;
    }
};

} // namespace Benchkit

#endif  // BENCHKIT_SRC_COMMON_SCOPED_FD_H_
