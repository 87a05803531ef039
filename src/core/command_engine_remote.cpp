/**
 * @file command_engine_remote.cpp
 * @brief Forwarding of commands into an active SSH session.
 *
 * While a session's foreground process is an interactive ssh client, later
 * commands are not spawned; they are written to the client's stdin. Remote `cd`
 * commands are wrapped in the marker protocol so the stdout worker can learn the
 * new remote directory from the ordinary output stream.
 *
 * Remote state belongs to the client's stdin handle, not to the session's pid:
 * teardown only happens while the session still holds that same handle.
 */

#include "core/command_engine.hpp"
#include "core/errors.hpp"
#include "core/marker_protocol.hpp"
#include "core/path_resolver.hpp"
#include "core/stream_workers.hpp"
#include <format>
#include <system_error>

namespace tabvisor::core {

    std::optional<ExecOutcome> CommandEngine::try_forward_to_remote(const std::string& command,
                                                                    const std::string& session_id) {
        std::shared_ptr<PipeWriter> writer;
        pid_t active_pid = 0;
        bool inconsistent = false;

        registry_->with_session(session_id, [&](SessionState& s) {
            if (!s.is_remote_session_active) return;
            active_pid = s.pid.value_or(0);

            if (s.stdin_writer) {
                writer = s.stdin_writer;
                return;
            }
            // Active without a stdin handle: the session can't be trusted any more
            s.end_remote();
            s.clear_process();
            inconsistent = true;
        });

        if (inconsistent) {
            emit(EventKind::RemoteSessionEnded, session_id, active_pid, "SSH session inconsistency: active but no stdin.");
            throw EngineError(ErrorKind::SessionConflict, "SSH session conflict: active but no stdin. Please retry.");
        }
        if (!writer) return std::nullopt;

        emit(EventKind::CommandForwarded, session_id, active_pid, command);

        std::string payload;
        if (is_cd_command(command)) {
            payload = build_remote_cd_probe(command, make_marker(kRemoteCdMarkerPrefix));
        } else {
            payload = command + "\n";
        }

        // Queued on the client's own writer so forwarded commands keep their order
        auto registry = registry_;
        auto sink = sink_;
        std::weak_ptr<PipeWriter> weak_writer = writer;
        writer->post(std::move(payload), [registry, sink, weak_writer, session_id, active_pid, command](const std::system_error& e) {
            auto send = [&](EventKind kind, std::string text, bool success = false) {
                Event event{kind, session_id, active_pid, std::move(text), success};
                sink->emit(event);
            };

            auto failed_writer = weak_writer.lock();
            if (failed_writer && end_remote_if_owned(*registry, session_id, failed_writer)) {
                send(EventKind::RemoteSessionEnded,
                     std::format("SSH session ended (stdin write/flush error): {}", e.what()));
            }
            send(EventKind::ErrorChunk, std::format("Failed to send to SSH (stdin write/flush '{}'): {}", command, e.what()));
            send(EventKind::CommandEnded, "Command failed.");
        });

        return ExecOutcome{ExecStatus::Forwarded, kForwardedMarker};
    }

    void CommandEngine::send_initial_pwd_probe(const std::string& session_id, pid_t pid,
                                               std::shared_ptr<PipeWriter> writer) {
        auto registry = registry_;
        auto sink = sink_;
        std::weak_ptr<PipeWriter> weak_writer = writer;
        writer->post(build_initial_pwd_probe(make_marker(kInitialPwdMarkerPrefix)),
                     [registry, sink, weak_writer, session_id, pid](const std::system_error& e) {
            auto failed_writer = weak_writer.lock();
            if (failed_writer && end_remote_if_owned(*registry, session_id, failed_writer)) {
                Event event{EventKind::RemoteSessionEnded, session_id, pid,
                            std::format("SSH session error (initial PWD send for pid {}): {}", pid, e.what())};
                sink->emit(event);
            }
        });
    }
}
