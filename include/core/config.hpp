/**
 * @file config.hpp
 * @brief Runtime configuration shared by the command engine and PTY manager.
 *
 * Defaults are compiled in; the host overrides them from config.py
 * (see host::ConfigLoader).
 */

#pragma once
#include <string>
#include <vector>

namespace tabvisor::core {

    struct Config {
        // --- Command execution ---
        std::string exec_shell = "sh";
        std::string fallback_path = "/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin";

        // --- Remote shell (SSH) ---
        std::string ssh_program = "ssh";
        std::string sshpass_program = "sshpass";
        std::vector<std::string> ssh_options = {"-t", "-t", "-o", "StrictHostKeyChecking=accept-new"};
        bool ssh_require_password = true;

        // --- Privileged execution ---
        std::string sudo_program = "sudo";
        std::string sudo_shell = "bash";

        // stderr chunks containing any of these are treated as prompts, not errors
        std::vector<std::string> password_prompt_patterns = {"[sudo] password", "'s password:"};

        // --- PTY sessions ---
        std::string pty_preferred_shell = "/bin/bash";
        std::string pty_fallback_shell = "/bin/zsh";
        std::string pty_term = "xterm-256color";

        bool verbose = false;
    };
}
