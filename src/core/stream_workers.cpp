/**
 * @file stream_workers.cpp
 * @brief Implementation of the stdout / stderr / waiter threads.
 */

#include "core/stream_workers.hpp"
#include "core/log.hpp"
#include "core/marker_protocol.hpp"
#include <array>
#include <format>
#include <system_error>
#include <thread>

namespace tabvisor::core {

    void WorkerContext::emit(EventKind kind, std::string text, bool success) const {
        Event event;
        event.kind = kind;
        event.session_id = session_id;
        event.pid = pid;
        event.text = std::move(text);
        event.success = success;
        sink->emit(event);
    }

    bool looks_like_password_prompt(const std::string& chunk, const std::vector<std::string>& patterns) {
        for (const auto& p : patterns) {
            if (!p.empty() && chunk.find(p) != std::string::npos) return true;
        }
        return false;
    }

    // ==================================================================================
    // STDOUT
    // ==================================================================================

    void run_stdout_worker(WorkerContext ctx, FileDescriptor stdout_fd, bool parse_markers) {
        std::array<char, kStreamBufferSize> buffer;
        std::string line_buffer;
        MarkerParser parser;

        auto handle_line = [&](std::string line) {
            if (!parse_markers) {
                ctx.emit(EventKind::OutputChunk, std::move(line));
                return;
            }

            MarkerParser::Result result = parser.feed(line);
            switch (result.action) {
                case MarkerParser::Action::Forward:
                    ctx.emit(EventKind::OutputChunk, std::move(line));
                    break;
                case MarkerParser::Action::Consume:
                    break;
                case MarkerParser::Action::DirectoryUpdate: {
                    bool updated = false;
                    try {
                        ctx.registry->with_existing(ctx.session_id, [&](SessionState& s) {
                            if (ctx.remote_writer && s.is_remote_session_active &&
                                s.stdin_writer == ctx.remote_writer) {
                                s.remote_current_dir = result.value;
                                updated = true;
                            }
                        });
                    } catch (const std::system_error& e) {
                        log::warn(std::format("Remote directory update skipped (registry lock): {}", e.what()));
                    }
                    if (updated) ctx.emit(EventKind::RemoteDirectoryUpdated, result.value);
                    break;
                }
            }
        };

        while (true) {
            size_t n = 0;
            try {
                n = read_some(stdout_fd.get(), buffer.data(), buffer.size());
            } catch (const std::system_error& e) {
                log::debug(std::format("stdout of pid {} failed: {}", ctx.pid, e.what()));
                break;
            }
            if (n == 0) break;

            line_buffer.append(buffer.data(), n);

            size_t pos;
            while ((pos = line_buffer.find('\n')) != std::string::npos) {
                std::string line = line_buffer.substr(0, pos + 1);
                line_buffer.erase(0, pos + 1);
                handle_line(std::move(line));
            }
        }

        // Partial trailing line
        if (!line_buffer.empty()) {
            ctx.emit(EventKind::OutputChunk, std::move(line_buffer));
        }
        log::debug(std::format("stdout of pid {} closed", ctx.pid));
    }

    // ==================================================================================
    // STDERR
    // ==================================================================================

    void run_stderr_worker(WorkerContext ctx, FileDescriptor stderr_fd) {
        std::array<char, kStreamBufferSize> buffer;

        while (true) {
            size_t n = 0;
            try {
                n = read_some(stderr_fd.get(), buffer.data(), buffer.size());
            } catch (const std::system_error& e) {
                ctx.emit(EventKind::ErrorChunk, std::format("Error reading stderr: {}", e.what()));
                break;
            }
            if (n == 0) break;

            std::string chunk(buffer.data(), n);
            if (looks_like_password_prompt(chunk, ctx.password_prompt_patterns)) continue;
            ctx.emit(EventKind::ErrorChunk, std::move(chunk));
        }
    }

    // ==================================================================================
    // WAITER
    // ==================================================================================

    void run_waiter(WorkerContext ctx, std::shared_ptr<ChildProcess> child) {
        int status = 0;
        std::string wait_error;
        try {
            status = child->wait();
        } catch (const std::system_error& e) {
            wait_error = e.what();
        }

        bool remote_ended = false;
        try {
            ctx.registry->with_existing(ctx.session_id, [&](SessionState& s) {
                // A newer command owns the session now; leave its process alone
                if (s.pid == ctx.pid) {
                    s.clear_process();
                } else {
                    log::debug(std::format("Waiter for pid {} skipped process cleanup (session now pid {})",
                                           ctx.pid, s.pid.value_or(0)));
                }

                if (ctx.remote_writer && s.is_remote_session_active && s.stdin_writer == ctx.remote_writer) {
                    s.end_remote();
                    remote_ended = true;
                }
            });
        } catch (const std::system_error& e) {
            log::warn(std::format("Cleanup for pid {} skipped (registry lock): {}", ctx.pid, e.what()));
        }

        if (remote_ended) {
            ctx.emit(EventKind::RemoteSessionEnded, "SSH session ended normally.");
        }

        if (!wait_error.empty()) {
            ctx.emit(EventKind::ErrorChunk, std::format("Error waiting for command: {}", wait_error));
            ctx.emit(EventKind::CommandEnded, "Command failed due to wait error.", false);
            return;
        }

        bool success = ChildProcess::exited_successfully(status);
        ctx.emit(EventKind::CommandEnded, success ? "Command completed successfully." : "Command failed.", success);
    }

    bool end_remote_if_owned(SessionRegistry& registry, const std::string& session_id,
                             const std::shared_ptr<PipeWriter>& writer) {
        bool ended = false;
        try {
            registry.with_existing(session_id, [&](SessionState& s) {
                if (s.is_remote_session_active && s.stdin_writer == writer) {
                    s.end_remote();
                    ended = true;
                }
            });
        } catch (const std::system_error& e) {
            log::warn(std::format("Could not clear remote state of session {}: {}", session_id, e.what()));
        }
        return ended;
    }

    void launch_stream_workers(const WorkerContext& ctx, std::shared_ptr<ChildProcess> child,
                               FileDescriptor stdout_fd, FileDescriptor stderr_fd, bool parse_markers) {
        std::thread(run_stdout_worker, ctx, std::move(stdout_fd), parse_markers).detach();
        std::thread(run_stderr_worker, ctx, std::move(stderr_fd)).detach();
        std::thread(run_waiter, ctx, std::move(child)).detach();
    }
}
