/**
 * @file marker_protocol.hpp
 * @brief Sentinel-line protocol used to read a remote shell's working directory
 * through a plain line-oriented pipe.
 *
 * A probe makes the remote shell print:
 *
 *     <MARKER>
 *     /remote/working/dir
 *     <MARKER>
 *
 * MarkerParser consumes those three lines from the stdout stream and reports the
 * value; every other line passes through untouched.
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace tabvisor::core {

    inline constexpr const char* kRemoteCdMarkerPrefix = "__REMOTE_CD_PWD_MARKER_";
    inline constexpr const char* kInitialPwdMarkerPrefix = "__INITIAL_REMOTE_PWD_MARKER_";

    /**
     * @brief Builds a marker: prefix + nanosecond timestamp + random suffix + "__".
     * Uniqueness is best effort; it only has to differ from real output.
     */
    std::string make_marker(std::string_view prefix);

    /** @brief Wraps a remote `cd` so the shell reports its new directory between markers. */
    std::string build_remote_cd_probe(std::string_view cd_command, const std::string& marker);

    /** @brief Command sent right after connecting to learn the initial remote directory. */
    std::string build_initial_pwd_probe(const std::string& marker);

    class MarkerParser {
    public:
        enum class State { Idle, AwaitingValue, AwaitingEndMarker };

        enum class Action {
            Forward,         ///< ordinary output, pass the raw line to the caller
            Consume,         ///< protocol line, drop it
            DirectoryUpdate  ///< value line, `value` holds the probed directory
        };

        struct Result {
            Action action;
            std::string value;
        };

        MarkerParser();
        explicit MarkerParser(std::vector<std::string> prefixes);

        /**
         * @brief Feeds one line (with or without its trailing newline).
         * Lines are compared after trimming surrounding whitespace.
         */
        Result feed(std::string_view line);

        [[nodiscard]] State state() const { return state_; }

    private:
        [[nodiscard]] bool is_marker_start(const std::string& trimmed) const;

        std::vector<std::string> prefixes_;
        State state_ = State::Idle;
        std::string marker_;
    };
}
