/**
 * @file marker_protocol.cpp
 * @brief Marker generation, probe commands and the stdout line state machine.
 */

#include "core/marker_protocol.hpp"
#include <chrono>
#include <format>
#include <random>

namespace tabvisor::core {

    namespace {
        std::string_view trim(std::string_view s) {
            const char* ws = " \t\r\n";
            size_t start = s.find_first_not_of(ws);
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(ws);
            return s.substr(start, end - start + 1);
        }
    }

    std::string make_marker(std::string_view prefix) {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();

        // Timestamps alone collide when two probes are built in the same tick
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        return std::format("{}{}_{:016x}__", prefix, nanos, rng());
    }

    std::string build_remote_cd_probe(std::string_view cd_command, const std::string& marker) {
        return std::format("{} && printf '%s\\n' '{}' && pwd && printf '%s\\n' '{}'\n",
                           trim(cd_command), marker, marker);
    }

    std::string build_initial_pwd_probe(const std::string& marker) {
        return std::format("echo '{}'; pwd; echo '{}'\n", marker, marker);
    }

    // ==================================================================================
    // PARSER
    // ==================================================================================

    MarkerParser::MarkerParser()
        : MarkerParser(std::vector<std::string>{kRemoteCdMarkerPrefix, kInitialPwdMarkerPrefix}) {}

    MarkerParser::MarkerParser(std::vector<std::string> prefixes) : prefixes_(std::move(prefixes)) {}

    bool MarkerParser::is_marker_start(const std::string& trimmed) const {
        for (const auto& prefix : prefixes_) {
            if (trimmed.starts_with(prefix)) return true;
        }
        return false;
    }

    MarkerParser::Result MarkerParser::feed(std::string_view line) {
        std::string trimmed(trim(line));

        // Blank lines only reach the caller outside of a probe
        if (trimmed.empty()) {
            if (state_ == State::Idle) return {Action::Forward, {}};
            return {Action::Consume, {}};
        }

        switch (state_) {
            case State::AwaitingValue:
                state_ = State::AwaitingEndMarker;
                return {Action::DirectoryUpdate, trimmed};

            case State::AwaitingEndMarker:
                if (trimmed == marker_) {
                    state_ = State::Idle;
                    marker_.clear();
                    return {Action::Consume, {}};
                }
                // Closing marker never arrived; re-evaluate this line from Idle
                state_ = State::Idle;
                marker_.clear();
                [[fallthrough]];

            case State::Idle:
                if (is_marker_start(trimmed)) {
                    state_ = State::AwaitingValue;
                    marker_ = trimmed;
                    return {Action::Consume, {}};
                }
                return {Action::Forward, {}};
        }
        return {Action::Forward, {}};
    }
}
