/**
 * @file repl.cpp
 * @brief Implementation of the host REPL.
 *
 * Plain lines go to the current session through CommandEngine::execute_command.
 * Lines starting with ':' are internal commands:
 *
 *     :session <id>                switch session
 *     :sudo <command>              privileged execution (prompts for password)
 *     :kill                        terminate the session's foreground process
 *     :pwd                         show the tracked directory
 *     :pty open <id> <cols> <rows> | write <id> <text> | resize <id> <cols> <rows> | close <id>
 *     :q / :exit                   quit
 */

#include "host/repl.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <format>
#include <iostream>
#include <sstream>
#include <termios.h>
#include <unistd.h>

namespace tabvisor::host {

    using core::Theme;

    void Repl::run(std::istream& in) {
        in_ = &in;
        std::string line;

        print_prompt();
        while (std::getline(in, line)) {
            if (!handle_line(line)) break;
            print_prompt();
        }
    }

    void Repl::print_prompt() {
        auto state = engine_.registry()->get_or_create(session_);
        std::string where = state.remote_current_dir.value_or(state.current_dir);
        core::log::raw(std::format("{}[{}]{} {}{}{} $ ", Theme::STRUCTURE, session_, Theme::RESET,
                                   Theme::VALUE, where, Theme::RESET));
    }

    bool Repl::handle_line(const std::string& line) {
        if (line.empty()) return true;
        if (line == ":q" || line == ":exit") return false;

        try {
            if (line.starts_with(':')) {
                handle_internal(line);
            } else {
                run_command(line);
            }
        } catch (const core::EngineError& e) {
            core::log::error(e.what());
        }
        return true;
    }

    void Repl::run_command(const std::string& command) {
        core::ExecOutcome outcome = engine_.execute_command(command, session_);

        if (outcome.status == core::ExecStatus::NeedsPassword) {
            std::string password = read_secret("SSH password: ");
            outcome = engine_.execute_command(command, session_, password);
        }
        if (outcome.status == core::ExecStatus::DirectoryChanged) {
            core::log::debug(outcome.message);
        }
    }

    void Repl::handle_internal(const std::string& line) {
        std::istringstream ss(line.substr(1));
        std::string cmd;
        ss >> cmd;
        std::string rest;
        std::getline(ss >> std::ws, rest);

        if (cmd == "session") {
            if (rest.empty()) {
                core::log::notice(std::format("Current session: {}", session_));
                return;
            }
            session_ = rest;
        } else if (cmd == "sudo") {
            std::string password = read_secret("[sudo] password: ");
            engine_.execute_privileged_command("sudo " + rest, session_, password);
        } else if (cmd == "kill") {
            engine_.terminate_command(session_);
        } else if (cmd == "pwd") {
            core::log::notice(engine_.current_directory(session_));
        } else if (cmd == "pty") {
            handle_pty(rest);
        } else {
            core::log::warn(std::format("Unknown command ':{}'", cmd));
        }
    }

    void Repl::handle_pty(const std::string& args) {
        std::istringstream ss(args);
        std::string action, id;
        ss >> action >> id;

        if (id.empty()) {
            core::log::warn("Usage: :pty open|write|resize|close <id> ...");
            return;
        }

        if (action == "open" || action == "resize") {
            unsigned short cols = 80, rows = 24;
            ss >> cols >> rows;
            if (action == "open") {
                ptys_.create(id, cols, rows);
                core::log::success(std::format("PTY session '{}' opened ({}x{})", id, cols, rows));
            } else {
                ptys_.resize(id, cols, rows);
            }
        } else if (action == "write") {
            std::string text;
            std::getline(ss >> std::ws, text);
            ptys_.write(id, text + "\n");
        } else if (action == "close") {
            ptys_.close(id);
        } else {
            core::log::warn(std::format("Unknown PTY action '{}'", action));
        }
    }

    std::string Repl::read_secret(const std::string& prompt) {
        core::log::raw(prompt);

        struct termios orig{};
        bool is_tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &orig) == 0;
        if (is_tty) {
            struct termios silent = orig;
            silent.c_lflag &= ~ECHO;
            tcsetattr(STDIN_FILENO, TCSANOW, &silent);
        }

        std::string secret;
        std::getline(*in_, secret);

        if (is_tty) {
            tcsetattr(STDIN_FILENO, TCSANOW, &orig);
            core::log::raw("\n");
        }
        return secret;
    }
}
