/**
 * @file repl.hpp
 * @brief Line-oriented front end driving the command engine and PTY manager.
 */

#pragma once
#include "core/command_engine.hpp"
#include "core/pty_manager.hpp"
#include <istream>
#include <string>

namespace tabvisor::host {

    class Repl {
    public:
        Repl(core::CommandEngine& engine, core::PtyManager& ptys)
            : engine_(engine), ptys_(ptys) {}

        /** @brief Reads lines from `in` until EOF or :q / :exit. */
        void run(std::istream& in);

    private:
        /** @return false when the loop should stop. */
        bool handle_line(const std::string& line);

        void handle_internal(const std::string& line);
        void handle_pty(const std::string& args);
        void run_command(const std::string& command);

        /** @brief Reads a line from the terminal with echo disabled. */
        std::string read_secret(const std::string& prompt);

        void print_prompt();

        core::CommandEngine& engine_;
        core::PtyManager& ptys_;
        std::istream* in_ = nullptr;
        std::string session_ = "1";
    };
}
