#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include "common/errors.h"
#include "session/session_lock.h"
#include "temp_dir.h"

using namespace Benchkit;
using Benchkit::testing_util::TempDir;

class SessionLockTest : public ::testing::Test {
protected:
    std::string LockDir() const { return dir_.path().string(); }

    TempDir dir_;
    const std::string env_ = "/etc/benchkit/envs/lab.rack1.yml";
};

TEST_F(SessionLockTest, PathIsDerivedFromEnvironmentBasename) {
    EXPECT_EQ(LockPathFor("/etc/benchkit/envs/lab.rack1.yml", "/tmp"), "/tmp/lab_rack1_yml_lock");
    EXPECT_EQ(LockPathFor("relative/env", "/var/lock"), "/var/lock/env_lock");
    // Only the basename matters.
    EXPECT_EQ(LockPathFor("a/lab.yml", "/tmp"), LockPathFor("b/lab.yml", "/tmp"));
}

TEST_F(SessionLockTest, SecondAcquireFailsUntilRelease) {
    SessionLock first(env_, LockDir());
    first.Acquire({"plan.yml"});
    EXPECT_TRUE(first.held());
    EXPECT_TRUE(std::filesystem::exists(first.path()));

    SessionLock second(env_, LockDir());
    try {
        second.Acquire();
        FAIL() << "expected SessionLocked";
    } catch (const SessionLocked& e) {
        EXPECT_EQ(e.lock_path(), first.path());
        EXPECT_NE(e.holder().find("testplan: plan.yml"), std::string::npos);
    }
    EXPECT_FALSE(second.held());
    EXPECT_TRUE(std::filesystem::exists(first.path()));

    first.Release();
    EXPECT_FALSE(first.held());
    EXPECT_FALSE(std::filesystem::exists(first.path()));

    second.Acquire();
    EXPECT_TRUE(second.held());
    second.Release();
}

TEST_F(SessionLockTest, DifferentEnvironmentsDoNotCollide) {
    SessionLock a("envs/a.yml", LockDir());
    SessionLock b("envs/b.yml", LockDir());
    a.Acquire();
    EXPECT_NO_THROW(b.Acquire());
    a.Release();
    b.Release();
}

TEST_F(SessionLockTest, DestructionWithoutReleaseLeavesLock) {
    std::string path;
    {
        SessionLock lock(env_, LockDir());
        lock.Acquire();
        path = lock.path();
    }
    EXPECT_TRUE(std::filesystem::exists(path));

    SessionLock again(env_, LockDir());
    EXPECT_THROW(again.Acquire(), SessionLocked);
}

TEST_F(SessionLockTest, CrashedProcessLeavesStaleLockUntilCleared) {
    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        // Simulated crash: take the lock and die without releasing it.
        try {
            SessionLock lock(env_, LockDir());
            lock.Acquire();
        } catch (...) {
            ::_exit(2);
        }
        ::_exit(0);
    }
    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    ASSERT_EQ(WEXITSTATUS(status), 0);

    const std::string path = LockPathFor(env_, LockDir());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_NE(SessionLock::ReadHolder(path).find("pid: " + std::to_string(pid)), std::string::npos);

    SessionLock relaunch(env_, LockDir());
    EXPECT_THROW(relaunch.Acquire(), SessionLocked);
    EXPECT_THROW(relaunch.Acquire(), SessionLocked);

    EXPECT_TRUE(SessionLock::Clear(env_, LockDir()));
    EXPECT_FALSE(SessionLock::Clear(env_, LockDir()));

    relaunch.Acquire();
    EXPECT_TRUE(relaunch.held());
    relaunch.Release();
}

TEST_F(SessionLockTest, ConcurrentAcquireHasSingleWinner) {
    constexpr int kContenders = 8;
    std::atomic<int> winners{0};
    std::atomic<int> locked{0};
    std::atomic<bool> go{false};
    std::vector<std::unique_ptr<SessionLock>> locks;
    for (int i = 0; i < kContenders; ++i) {
        locks.push_back(std::make_unique<SessionLock>(env_, LockDir()));
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < kContenders; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            try {
                locks[i]->Acquire();
                winners++;
            } catch (const SessionLocked&) {
                locked++;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(locked.load(), kContenders - 1);
    for (auto& lock : locks) {
        if (lock->held()) lock->Release();
    }
}

TEST_F(SessionLockTest, UnwritableLockDirIsNotReportedAsLocked) {
    SessionLock lock(env_, (dir_.path() / "does-not-exist").string());
    try {
        lock.Acquire();
        FAIL() << "expected Error";
    } catch (const SessionLocked&) {
        FAIL() << "missing directory must not look like a held lock";
    } catch (const Error&) {
        SUCCEED();
    }
    EXPECT_FALSE(lock.held());
}

TEST_F(SessionLockTest, LockedBannerCarriesHolderAndRemediation) {
    SessionLock holder(env_, LockDir());
    holder.Acquire({"nightly.yml"});

    SessionLock contender(env_, LockDir());
    try {
        contender.Acquire();
        FAIL() << "expected SessionLocked";
    } catch (const SessionLocked& e) {
        const std::string banner = LockedBanner(e, env_);
        EXPECT_NE(banner.find("BENCHKIT SESSION LOCKED"), std::string::npos);
        EXPECT_NE(banner.find("lock file: " + holder.path()), std::string::npos);
        EXPECT_NE(banner.find("testplan: nightly.yml"), std::string::npos);
        EXPECT_NE(banner.find("benchkit_run --clear-lock --environment " + env_), std::string::npos);
    }
    // Reporting the conflict leaves the holder's lock alone.
    EXPECT_TRUE(std::filesystem::exists(holder.path()));
    holder.Release();
}

TEST_F(SessionLockTest, AcquireAndReleaseDoNotLeakDescriptors) {
    auto open_fds = [] {
        size_t n = 0;
        for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd")) {
            (void)entry;
            ++n;
        }
        return n;
    };
    const size_t before = open_fds();
    for (int i = 0; i < 32; ++i) {
        SessionLock lock(env_, LockDir());
        lock.Acquire({"plan.yml"});
        SessionLock other(env_, LockDir());
        EXPECT_THROW(other.Acquire(), SessionLocked);
        lock.Release();
    }
    EXPECT_EQ(open_fds(), before);
}
