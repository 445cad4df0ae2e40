/// @file scratch_dir.hpp
/// @brief Per-test temporary directory for tests that touch the filesystem

#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace stockpile_test {

/// Creates a uniquely named directory under the system temp path and removes it
/// on destruction. Every instance gets its own name, so parallel test processes
/// never share files.
class ScratchDir {
public:
    ScratchDir() : m_dir(unique_path()) {
        std::filesystem::create_directories(m_dir);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return m_dir; }

    /// Path of `name` inside the directory; the file is not created
    std::filesystem::path file(const std::string& name) const { return m_dir / name; }

    /// Write `content` to `name` and return its path
    std::string write(const std::string& name, const std::string& content) const {
        std::filesystem::path target = file(name);
        std::ofstream out(target);
        out << content;
        return target.string();
    }

private:
    static std::filesystem::path unique_path() {
        std::random_device device;
        std::mt19937_64 engine(device());
        std::uniform_int_distribution<unsigned long long> dist;
        for (;;) {
            auto candidate = std::filesystem::temp_directory_path() /
                ("stockpile_test_" + std::to_string(dist(engine)));
            if (!std::filesystem::exists(candidate)) {
                return candidate;
            }
        }
    }

    std::filesystem::path m_dir;
};

} // namespace stockpile_test
