// tests/temp_dir.hpp: scratch directory that cleans up after itself.
#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

namespace meshz_test {

struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static int n = 0;
        path = std::filesystem::temp_directory_path()
             / ("meshz-test-" + std::to_string(::getpid()) + "-" + std::to_string(n++));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace meshz_test
