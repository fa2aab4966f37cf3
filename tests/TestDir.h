#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include "tlsmint/core/util/Logger.h"

// Scratch directory removed on scope exit.
struct TestDir {
    std::filesystem::path path;
    explicit TestDir(const std::string& base) {
        static std::atomic<int> counter { 0 };
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path() /
               (base + "_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" + std::to_string(++counter));
        std::filesystem::create_directories(path);
    }
    ~TestDir() { std::error_code ec; std::filesystem::remove_all(path, ec); }
    TestDir(const TestDir&) = delete;
    TestDir& operator=(const TestDir&) = delete;
};

inline std::string slurp(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline void spit(const std::filesystem::path& p, const std::string& data) {
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << data;
}

// Sends log lines to a scratch file for the lifetime of the object.
struct LogCapture {
    std::FILE* file { std::tmpfile() };
    LogCapture() { tlsmint::core::util::Logger::instance().set_output(file); }
    ~LogCapture() {
        tlsmint::core::util::Logger::instance().set_output(stderr);
        if (file) std::fclose(file);
    }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string text() const {
        std::string out;
        if (!file) return out;
        std::fflush(file);
        std::rewind(file);
        char buf[512];
        std::size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) out.append(buf, n);
        return out;
    }
};
