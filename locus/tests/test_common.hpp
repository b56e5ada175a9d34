#pragma once

// Shared helpers for the locus test executables

#include "locus/error.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

// Test helper macros
#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::cerr << "  FAILED: " << #a << " != " << #b << " (" << __FILE__ << ":" << __LINE__ << ")" << std::endl; \
        std::cerr << "    Got: '" << (a) << "' vs '" << (b) << "'" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "  FAILED: " << #cond << " is false (" << __FILE__ << ":" << __LINE__ << ")" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_FALSE(cond) do { \
    if (cond) { \
        std::cerr << "  FAILED: " << #cond << " is true (" << __FILE__ << ":" << __LINE__ << ")" << std::endl; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_THROWS(expr, exception_type) do { \
    bool caught = false; \
    try { expr; } catch (const exception_type&) { caught = true; } \
    if (!caught) { \
        std::cerr << "  FAILED: " << #expr << " did not throw " << #exception_type << std::endl; \
        std::exit(1); \
    } \
} while(0)

// Expect a locus::LocusError with the given ErrorCode
#define ASSERT_THROWS_CODE(expr, error_code) do { \
    bool caught = false; \
    try { expr; } catch (const locus::LocusError& e) { \
        if (e.code() != (error_code)) { \
            std::cerr << "  FAILED: " << #expr << " threw " << e.what() << ", expected " \
                      << locus::error_code_to_string(error_code) << std::endl; \
            std::exit(1); \
        } \
        caught = true; \
    } \
    if (!caught) { \
        std::cerr << "  FAILED: " << #expr << " did not throw " << locus::error_code_to_string(error_code) << std::endl; \
        std::exit(1); \
    } \
} while(0)

// Scratch directory removed on scope exit
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("locus_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    // Write a file below the directory, creating parents
    fs::path write(const std::string& relative, const std::string& content) const {
        fs::path file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

// Switch the working directory for the lifetime of the object
class ScopedCurrentPath {
public:
    explicit ScopedCurrentPath(const fs::path& path) : previous_(fs::current_path()) {
        fs::current_path(path);
    }
    ~ScopedCurrentPath() {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

    ScopedCurrentPath(const ScopedCurrentPath&) = delete;
    ScopedCurrentPath& operator=(const ScopedCurrentPath&) = delete;

private:
    fs::path previous_;
};

inline std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
