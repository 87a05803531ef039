/**
 * @file stream_workers.hpp
 * @brief The three per-process background activities: stdout streaming,
 * stderr streaming and exit waiting.
 *
 * Workers run on detached threads and own everything they touch through
 * shared pointers, so they may outlive the CommandEngine that started them.
 * They never throw; failures become events.
 */

#pragma once
#include "core/events.hpp"
#include "core/process.hpp"
#include "core/session_registry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tabvisor::core {

    struct WorkerContext {
        std::shared_ptr<SessionRegistry> registry;
        std::shared_ptr<EventSink> sink;
        std::string session_id;
        pid_t pid = 0;
        // Set only for an interactive ssh client: the stdin handle that
        // identifies its remote session in the registry
        std::shared_ptr<PipeWriter> remote_writer;
        std::vector<std::string> password_prompt_patterns;

        void emit(EventKind kind, std::string text = {}, bool success = false) const;
    };

    constexpr size_t kStreamBufferSize = 2048;

    /**
     * @brief Line-buffers stdout into output events.
     * With parse_markers, probe lines are consumed and the probed value is
     * stored as the session's remote directory (if this client still owns it).
     */
    void run_stdout_worker(WorkerContext ctx, FileDescriptor stdout_fd, bool parse_markers);

    /** @brief Emits each stderr read as an error event, dropping password prompts. */
    void run_stderr_worker(WorkerContext ctx, FileDescriptor stderr_fd);

    /**
     * @brief Blocks on the child, then clears pid/process only if the session
     * still records this pid. For an ssh client, the remote state is cleared
     * if the session still holds this client's stdin handle, whatever the pid.
     * Emits remote-session-ended where applicable, then command-ended.
     */
    void run_waiter(WorkerContext ctx, std::shared_ptr<ChildProcess> child);

    /** @brief Starts all three workers on detached threads. */
    void launch_stream_workers(const WorkerContext& ctx, std::shared_ptr<ChildProcess> child,
                               FileDescriptor stdout_fd, FileDescriptor stderr_fd, bool parse_markers);

    /**
     * @brief Ends the session's remote state if it still belongs to writer.
     * @return true if this call ended it.
     */
    bool end_remote_if_owned(SessionRegistry& registry, const std::string& session_id,
                             const std::shared_ptr<PipeWriter>& writer);

    [[nodiscard]] bool looks_like_password_prompt(const std::string& chunk, const std::vector<std::string>& patterns);
}
