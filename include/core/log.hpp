/**
 * @file log.hpp
 * @brief Console logging with themed "[-]" tags.
 *
 * Every component (including background stream workers) logs through these
 * helpers so that lines from concurrent threads never interleave.
 */

#pragma once
#include <string>
#include <string_view>

namespace tabvisor::core {

    /**
     * @brief ANSI colour roles used for log tags and console event rendering.
     * Values are overridable from the THEME dict in config.py.
     */
    struct Theme {
        static inline std::string RESET     = "\x1b[0m";
        static inline std::string STRUCTURE = "\x1b[90m";
        static inline std::string VALUE     = "\x1b[97m";
        static inline std::string SUCCESS   = "\x1b[92m";
        static inline std::string WARNING   = "\x1b[93m";
        static inline std::string ERROR     = "\x1b[91m";
        static inline std::string NOTICE    = "\x1b[94m";
    };

    namespace log {
        void set_verbose(bool enabled);
        [[nodiscard]] bool verbose();

        void notice(std::string_view msg);
        void success(std::string_view msg);
        void warn(std::string_view msg);
        void error(std::string_view msg);

        // Only printed when verbose logging is enabled.
        void debug(std::string_view msg);

        // Writes a raw, already formatted block to stdout under the log lock.
        void raw(std::string_view text);
    }
}
