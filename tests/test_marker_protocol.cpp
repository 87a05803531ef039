/**
 * @file test_marker_protocol.cpp
 * @brief Tests for the remote working-directory sentinel protocol.
 */

#include "test_harness.hpp"
#include "core/marker_protocol.hpp"
#include <string>
#include <vector>

using namespace tabvisor::core;
using Action = MarkerParser::Action;
using State = MarkerParser::State;

namespace {
    struct Tally {
        std::vector<std::string> updates;
        std::vector<std::string> forwarded;
        int consumed = 0;
    };

    Tally run(MarkerParser& parser, const std::vector<std::string>& lines) {
        Tally t;
        for (const auto& line : lines) {
            auto r = parser.feed(line);
            if (r.action == Action::DirectoryUpdate) t.updates.push_back(r.value);
            else if (r.action == Action::Forward) t.forwarded.push_back(line);
            else t.consumed++;
        }
        return t;
    }
}

TEST(test_probe_block_yields_single_update) {
    MarkerParser parser({"MARKER_"});
    Tally t = run(parser, {"MARKER_X", "/home/u", "MARKER_X", "hello"});

    ASSERT_TRUE(t.updates.size() == 1, "Exactly one directory update");
    ASSERT_TRUE(t.updates[0] == "/home/u", "Update carries the probed directory");
    ASSERT_TRUE(t.forwarded.size() == 1 && t.forwarded[0] == "hello", "Only the trailing line is forwarded");
    ASSERT_TRUE(parser.state() == State::Idle, "Parser is idle after the closing marker");
    PASS("Probe block yields one update and forwards ordinary output");
}

TEST(test_lines_are_trimmed) {
    MarkerParser parser({"MARKER_"});
    Tally t = run(parser, {"  MARKER_7\r\n", "\t/srv/app  \n", "MARKER_7\n"});

    ASSERT_TRUE(t.updates.size() == 1 && t.updates[0] == "/srv/app", "Value is trimmed");
    ASSERT_TRUE(t.forwarded.empty(), "Nothing forwarded");
    ASSERT_TRUE(parser.state() == State::Idle, "Trimmed end marker closes the probe");
    PASS("Markers and values are compared after trimming");
}

TEST(test_default_prefixes_consume_generated_markers) {
    MarkerParser parser;
    std::string cd_marker = make_marker(kRemoteCdMarkerPrefix);
    std::string init_marker = make_marker(kInitialPwdMarkerPrefix);

    Tally t = run(parser, {init_marker, "/home/admin", init_marker,
                           "total 0",
                           cd_marker, "/var/log", cd_marker});

    ASSERT_TRUE(t.updates.size() == 2, "Both probes produce an update");
    ASSERT_TRUE(t.updates[0] == "/home/admin" && t.updates[1] == "/var/log", "Updates in order");
    ASSERT_TRUE(t.forwarded.size() == 1 && t.forwarded[0] == "total 0", "Ordinary output forwarded");
    PASS("Generated markers of both kinds are recognized");
}

TEST(test_missing_end_marker_reevaluates_line) {
    MarkerParser parser({"MARKER_"});
    auto a = parser.feed("MARKER_1");
    auto b = parser.feed("/tmp");
    auto c = parser.feed("unrelated output");

    ASSERT_TRUE(a.action == Action::Consume, "Start marker consumed");
    ASSERT_TRUE(b.action == Action::DirectoryUpdate, "Value reported");
    ASSERT_TRUE(c.action == Action::Forward, "Mismatched line forwarded");
    ASSERT_TRUE(parser.state() == State::Idle, "Parser back to idle");
    PASS("A line that is not the end marker resets and is forwarded");
}

TEST(test_mismatched_line_can_open_new_probe) {
    MarkerParser parser({"MARKER_"});
    parser.feed("MARKER_1");
    parser.feed("/first");
    auto r = parser.feed("MARKER_2");

    ASSERT_TRUE(r.action == Action::Consume, "New start marker consumed");
    ASSERT_TRUE(parser.state() == State::AwaitingValue, "Parser waits for the new value");

    auto v = parser.feed("/second");
    ASSERT_TRUE(v.action == Action::DirectoryUpdate && v.value == "/second", "Second probe value reported");
    ASSERT_TRUE(parser.feed("MARKER_2").action == Action::Consume, "Second end marker consumed");
    PASS("Re-evaluated line can start a fresh probe");
}

TEST(test_blank_lines) {
    MarkerParser parser({"MARKER_"});
    ASSERT_TRUE(parser.feed("\n").action == Action::Forward, "Blank line forwarded when idle");

    parser.feed("MARKER_9");
    ASSERT_TRUE(parser.feed("   \n").action == Action::Consume, "Blank line swallowed inside a probe");
    ASSERT_TRUE(parser.state() == State::AwaitingValue, "Blank line does not advance the probe");
    PASS("Blank lines pass through only outside of a probe");
}

TEST(test_unknown_prefix_is_forwarded) {
    MarkerParser parser;
    ASSERT_TRUE(parser.feed("__SOME_OTHER_MARKER_1__").action == Action::Forward, "Foreign marker forwarded");
    ASSERT_TRUE(parser.state() == State::Idle, "Still idle");
    PASS("Lines with unknown prefixes are ordinary output");
}

TEST(test_marker_format) {
    std::string m1 = make_marker(kRemoteCdMarkerPrefix);
    std::string m2 = make_marker(kRemoteCdMarkerPrefix);

    ASSERT_TRUE(m1.starts_with(kRemoteCdMarkerPrefix), "Marker starts with its prefix");
    ASSERT_TRUE(m1.ends_with("__"), "Marker ends with a double underscore");
    ASSERT_FALSE(m1 == m2, "Consecutive markers differ");
    ASSERT_TRUE(m1.find_first_of(" \t'\"") == std::string::npos, "Marker needs no shell quoting");
    PASS("Markers are unique and shell safe");
}

TEST(test_probe_commands) {
    std::string cd = build_remote_cd_probe("  cd /etc ", "M1");
    ASSERT_TRUE(cd == "cd /etc && printf '%s\\n' 'M1' && pwd && printf '%s\\n' 'M1'\n", "cd probe format");

    std::string init = build_initial_pwd_probe("M2");
    ASSERT_TRUE(init == "echo 'M2'; pwd; echo 'M2'\n", "Initial probe format");
    PASS("Probe commands print marker, pwd, marker");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << "     Marker Protocol Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    test_probe_block_yields_single_update();
    test_lines_are_trimmed();
    test_default_prefixes_consume_generated_markers();
    test_missing_end_marker_reevaluates_line();
    test_mismatched_line_can_open_new_probe();
    test_blank_lines();
    test_unknown_prefix_is_forwarded();
    test_marker_format();
    test_probe_commands();

    return report_results("Marker protocol");
}
