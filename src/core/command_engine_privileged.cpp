/**
 * @file command_engine_privileged.cpp
 * @brief One-shot `sudo` execution with the password supplied over stdin.
 *
 * The command (minus its leading `sudo`) runs as `sudo -S <shell> -c "<cmd>"`.
 * The password is written once and stdin is closed. Output uses the same
 * workers as ordinary commands, without marker parsing or remote flagging.
 * Refused while the session forwards to an SSH client.
 */

#include "core/command_engine.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/stream_workers.hpp"
#include <format>
#include <sstream>
#include <system_error>
#include <thread>

namespace tabvisor::core {

    namespace {
        // "sudo apt update" -> "apt update"; commands without the keyword are kept whole
        std::string strip_escalation_keyword(const std::string& command) {
            std::istringstream ss(command);
            std::string token;
            std::string rest;
            bool first = true;
            while (ss >> token) {
                if (first) {
                    first = false;
                    if (token == "sudo") continue;
                }
                if (!rest.empty()) rest += ' ';
                rest += token;
            }
            return rest;
        }
    }

    ExecOutcome CommandEngine::execute_privileged_command(const std::string& command,
                                                          const std::string& session_id,
                                                          const std::string& password) {
        try {
            SessionState state = registry_->get_or_create(session_id);
            // The ssh client keeps the session; sudo would only replace its pid
            if (state.is_remote_session_active) {
                throw EngineError(ErrorKind::SessionConflict,
                    "An SSH session is active in this tab. Run sudo through it or exit it first.");
            }
            std::string current_dir = state.current_dir;

            SpawnOptions opts;
            opts.argv = {config_.sudo_program, "-S", config_.sudo_shell, "-c", strip_escalation_keyword(command)};
            opts.cwd = current_dir;
            opts.env = inherited_environment(config_.fallback_path);

            SpawnedProcess spawned = spawn_piped(opts);
            const pid_t pid = spawned.child->pid();

            registry_->with_session(session_id, [&](SessionState& s) {
                s.pid = pid;
                s.process = spawned.child;
            });

            log::debug(std::format("Session {} spawned privileged pid {}", session_id, pid));

            auto writer = std::make_shared<PipeWriter>(std::move(spawned.stdin_fd));
            auto sink = sink_;
            std::thread([writer, sink, session_id, pid, password]() {
                // sudo -S reads a full line
                std::string line = password;
                if (!line.ends_with('\n')) line += '\n';
                try {
                    writer->write_all(line);
                } catch (const std::system_error&) {
                    Event event{EventKind::ErrorChunk, session_id, pid, "Failed to send password to sudo"};
                    sink->emit(event);
                }
                writer->close();
            }).detach();

            WorkerContext ctx;
            ctx.registry = registry_;
            ctx.sink = sink_;
            ctx.session_id = session_id;
            ctx.pid = pid;
            ctx.password_prompt_patterns = config_.password_prompt_patterns;

            launch_stream_workers(ctx, spawned.child, std::move(spawned.stdout_fd), std::move(spawned.stderr_fd), false);
            return {ExecStatus::Started, kStartedMessage};
        } catch (const std::system_error& e) {
            throw EngineError(ErrorKind::LockFailure, e.what());
        }
    }
}
