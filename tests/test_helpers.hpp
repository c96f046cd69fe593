/**
 * @file test_helpers.hpp
 * @brief RAII helpers for temporary files and environment variables
 */

#ifndef PATCHER_TEST_HELPERS_HPP
#define PATCHER_TEST_HELPERS_HPP

#include "patcher/Loader.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace fixtures {

namespace fs = std::filesystem;

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    explicit TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("patcher_test_" + std::to_string(next_id()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    static unsigned long next_id() {
        static std::atomic<unsigned long> counter{0};
        return ++counter;
    }

    fs::path path_;
};

/**
 * @brief RAII helper for environment variables.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value)
        : name_(name), original_(patcher::get_env_var(name)) {
        patcher::set_env_var(name, value, true);
    }

    ~ScopedEnvVar() {
        if (original_.has_value()) {
            patcher::set_env_var(name_, *original_, true);
        } else {
            patcher::unset_env_var(name_);
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    std::string name_;
    std::optional<std::string> original_;
};

} // namespace fixtures

#endif // PATCHER_TEST_HELPERS_HPP
