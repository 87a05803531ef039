/**
 * @file test_pty_manager.cpp
 * @brief Tests for embedded PTY shells: lifecycle, I/O, resizing and exit.
 */

#include "test_harness.hpp"
#include "recording_sink.hpp"
#include "core/pty_manager.hpp"
#include <algorithm>
#include <filesystem>

using namespace tabvisor::core;
using Kind = RecordingSink::EventKind;

namespace {
    Config pty_config() {
        Config c;
        if (!std::filesystem::exists(c.pty_preferred_shell)) c.pty_preferred_shell = "/bin/sh";
        return c;
    }

    bool has(const std::vector<std::string>& v, const std::string& item) {
        return std::find(v.begin(), v.end(), item) != v.end();
    }
}

TEST(test_shell_command_for_bash) {
    Config c;
    c.pty_preferred_shell = "/bin/bash";
    if (!std::filesystem::exists(c.pty_preferred_shell)) {
        PASS("bash not installed, skipped");
        return;
    }
    PtyShellCommand cmd = build_pty_shell_command(c);
    ASSERT_TRUE(cmd.path == "/bin/bash", "Preferred shell chosen");
    ASSERT_TRUE(has(cmd.argv, "--noprofile") && has(cmd.argv, "--norc"), "Startup files skipped");
    ASSERT_TRUE(cmd.argv.back() == "-i", "Interactive");

    bool term = false;
    for (const auto& [k, v] : cmd.env) {
        if (k == "TERM" && v == "xterm-256color") term = true;
    }
    ASSERT_TRUE(term, "TERM set");
    PASS("bash runs without startup files and with a fixed TERM");
}

TEST(test_shell_command_fallback) {
    Config c;
    c.pty_preferred_shell = "/nonexistent/shell";
    PtyShellCommand cmd = build_pty_shell_command(c);
    const char* env_shell = std::getenv("SHELL");
    std::string expected = (env_shell && *env_shell) ? env_shell : c.pty_fallback_shell;
    ASSERT_TRUE(cmd.path == expected, "Falls back to $SHELL, then the configured fallback");
    PASS("Missing preferred shell falls back");
}

TEST(test_pty_roundtrip) {
    auto sink = std::make_shared<RecordingSink>();
    PtyManager ptys(sink, pty_config());

    ptys.create("t1", 80, 24);
    ASSERT_TRUE(ptys.contains("t1"), "Session registered");
    ASSERT_THROWS_KIND(ptys.create("t1", 80, 24), ErrorKind::AlreadyExists, "Duplicate id rejected");

    ptys.write("t1", "echo pty_$((40+2))\n");
    ASSERT_TRUE(sink->wait_for_text(Kind::PtyOutput, "t1", "pty_42"), "Command output read back");

    ptys.resize("t1", 100, 30);
    ptys.write("t1", "stty size\n");
    ASSERT_TRUE(sink->wait_for_text(Kind::PtyOutput, "t1", "30 100"), "Shell sees the new size");

    ptys.write("t1", "exit 0\n");
    ASSERT_TRUE(sink->wait_for(Kind::PtyExit, "t1"), "Exit reported");
    auto exits = sink->of(Kind::PtyExit, "t1");
    ASSERT_TRUE(exits.size() == 1 && exits[0].success, "Clean exit");
    ASSERT_FALSE(ptys.contains("t1"), "Session removed after exit");
    PASS("PTY shell executes input, follows resizes and exits");
}

TEST(test_unknown_session) {
    auto sink = std::make_shared<RecordingSink>();
    PtyManager ptys(sink, pty_config());

    ASSERT_THROWS_KIND(ptys.write("nope", "ls\n"), ErrorKind::NotFound, "Write to unknown id");
    ASSERT_THROWS_KIND(ptys.resize("nope", 80, 24), ErrorKind::NotFound, "Resize of unknown id");
    ptys.close("nope");
    ASSERT_FALSE(ptys.contains("nope"), "Close of unknown id is a no-op");
    PASS("Unknown sessions are reported, close is idempotent");
}

TEST(test_close_kills_shell) {
    auto sink = std::make_shared<RecordingSink>();
    PtyManager ptys(sink, pty_config());

    ptys.create("t2", 80, 24);
    ptys.close("t2");
    ASSERT_FALSE(ptys.contains("t2"), "Removed immediately");
    ptys.close("t2");

    ASSERT_TRUE(sink->wait_for(Kind::PtyExit, "t2"), "Killed shell still reports its exit");
    ASSERT_FALSE(sink->of(Kind::PtyExit, "t2")[0].success, "Killed shell did not succeed");
    ASSERT_THROWS_KIND(ptys.write("t2", "ls\n"), ErrorKind::NotFound, "Closed session rejects input");
    PASS("close() kills the shell and forgets the session");
}

TEST(test_sessions_are_independent) {
    auto sink = std::make_shared<RecordingSink>();
    PtyManager ptys(sink, pty_config());

    ptys.create("a", 80, 24);
    ptys.create("b", 80, 24);
    ptys.write("b", "echo only_$((1+1))_b\n");
    ASSERT_TRUE(sink->wait_for_text(Kind::PtyOutput, "b", "only_2_b"), "Output on b");
    ASSERT_TRUE(sink->text_of(Kind::PtyOutput, "a").find("only_2_b") == std::string::npos, "Nothing leaks to a");

    ptys.close("a");
    ptys.close("b");
    PASS("Each PTY session has its own shell and stream");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << "     PTY Manager Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    test_shell_command_for_bash();
    test_shell_command_fallback();
    test_pty_roundtrip();
    test_unknown_session();
    test_close_kills_shell();
    test_sessions_are_independent();

    return report_results("PTY manager");
}
