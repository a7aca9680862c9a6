#pragma once

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace bgs_test {
    inline int g_failures = 0;

    inline void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    // Fresh empty directory under the system temp dir.
    inline std::filesystem::path make_temp_dir(const std::string& prefix) {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path dir = fs::temp_directory_path() / (prefix + "_" + std::to_string(stamp));
        fs::create_directories(dir);
        return dir;
    }

    inline int finish(const char* suite) {
        if (g_failures != 0) {
            std::cerr << "[FAIL] " << suite << ": total failures: " << g_failures << "\n";
            return 1;
        }
        std::cout << "[OK] all " << suite << " tests passed\n";
        return 0;
    }
}
