/**
 * @file log.cpp
 * @brief Implementation of the thread-safe console logger.
 */

#include "core/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace tabvisor::core::log {

    namespace {
        std::mutex log_mutex;
        std::atomic<bool> verbose_enabled{false};

        void write_tagged(std::ostream& out, const std::string& color, std::string_view msg) {
            std::lock_guard<std::mutex> lock(log_mutex);
            out << "[" << color << "-" << Theme::RESET << "] " << msg << "\n" << std::flush;
        }
    }

    void set_verbose(bool enabled) { verbose_enabled = enabled; }
    bool verbose() { return verbose_enabled; }

    void notice(std::string_view msg)  { write_tagged(std::cout, Theme::NOTICE, msg); }
    void success(std::string_view msg) { write_tagged(std::cout, Theme::SUCCESS, msg); }
    void warn(std::string_view msg)    { write_tagged(std::cerr, Theme::WARNING, msg); }
    void error(std::string_view msg)   { write_tagged(std::cerr, Theme::ERROR, msg); }

    void debug(std::string_view msg) {
        if (!verbose_enabled) return;
        write_tagged(std::cerr, Theme::STRUCTURE, msg);
    }

    void raw(std::string_view text) {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cout << text << std::flush;
    }
}
