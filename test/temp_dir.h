#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace Benchkit {
namespace testing_util {

// Fresh directory under gtest's temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = ::testing::TempDir() + "benchkit_test_XXXXXX";
        char* made = ::mkdtemp(tmpl.data());
        EXPECT_NE(made, nullptr);
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path Write(const std::string& relative, const std::string& content) const {
        std::filesystem::path p = path_ / relative;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p);
        out << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

} // namespace testing_util
} // namespace Benchkit
