#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace loadsense {
namespace testutil {

inline std::string SanitizeForPath(std::string s) {
    for (auto& ch : s) {
        if (ch == '/' || ch == '\\' || ch == ' ' || ch == ':' || ch == '\t' || ch == '\n' || ch == '\r') {
            ch = '_';
        }
    }
    return s;
}

// Unique per-test directory under the system temp directory, so parallel
// ctest processes never share input files.
inline std::filesystem::path MakeUniqueTestDir(const std::string& prefix) {
    std::string name = prefix;

    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        name += "_" + std::string(info->test_suite_name()) + "_" + std::string(info->name());
    }

#if defined(__unix__) || defined(__APPLE__)
    name += "_pid" + std::to_string(static_cast<long long>(::getpid()));
#endif

    name += "_t" + std::to_string(
        static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count()));

    return std::filesystem::temp_directory_path() / SanitizeForPath(name);
}

inline std::filesystem::path WriteTextFile(const std::filesystem::path& dir,
                                           const std::string& name,
                                           const std::string& contents) {
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out << contents;
    return path;
}

} // namespace testutil
} // namespace loadsense
