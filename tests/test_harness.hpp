/**
 * @file test_harness.hpp
 * @brief Minimal assertion macros shared by the standalone test executables.
 *
 * Each test is a void function; a failed assertion reports and returns early.
 * main() prints a summary and returns non-zero if anything failed.
 */

#pragma once
#include "core/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <sys/stat.h>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void name()
#define ASSERT_TRUE(expr, msg) \
    if (!(expr)) { \
        std::cerr << "  FAIL: " << msg << " (expected true)" << std::endl; \
        tests_failed++; \
        return; \
    }
#define ASSERT_FALSE(expr, msg) \
    if ((expr)) { \
        std::cerr << "  FAIL: " << msg << " (expected false)" << std::endl; \
        tests_failed++; \
        return; \
    }
#define ASSERT_THROWS_KIND(stmt, expected_kind, msg) \
    { \
        bool threw_expected_ = false; \
        try { stmt; } \
        catch (const tabvisor::core::EngineError& e_) { threw_expected_ = (e_.kind() == expected_kind); } \
        if (!threw_expected_) { \
            std::cerr << "  FAIL: " << msg << " (expected EngineError of the given kind)" << std::endl; \
            tests_failed++; \
            return; \
        } \
    }
#define PASS(msg) \
    std::cout << "  PASS: " << msg << std::endl; \
    tests_passed++;

inline int report_results(const char* suite) {
    std::cout << "\n==========================================" << std::endl;
    std::cout << " " << suite << ": " << tests_passed << " passed, " << tests_failed << " failed" << std::endl;
    std::cout << "==========================================" << std::endl;
    return tests_failed > 0 ? 1 : 0;
}

/** @brief Fresh directory under the system temp dir, canonicalized. */
inline std::filesystem::path make_temp_dir(const std::string& tag) {
    std::string tmpl = (std::filesystem::temp_directory_path() / ("tabvisor_" + tag + "_XXXXXX")).string();
    char* dir = mkdtemp(tmpl.data());
    if (!dir) {
        std::cerr << "mkdtemp failed for " << tmpl << std::endl;
        std::exit(2);
    }
    return std::filesystem::canonical(dir);
}

/** @brief Writes an executable shell script. */
inline std::string write_script(const std::filesystem::path& path, const std::string& body) {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body;
    out.close();
    chmod(path.c_str(), 0755);
    return path.string();
}
