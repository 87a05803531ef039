/**
 * @file command_engine.hpp
 * @brief Per-session command execution: local cd, SSH forwarding and process spawning.
 */

#pragma once
#include "core/config.hpp"
#include "core/events.hpp"
#include "core/session_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabvisor::core {

    inline constexpr const char* kForwardedMarker = "COMMAND_FORWARDED_TO_ACTIVE_SSH";
    inline constexpr const char* kNeedsPasswordMarker = "SSH_INTERACTIVE_PASSWORD_PROMPT_REQUESTED";
    inline constexpr const char* kStartedMessage = "Command started. Output will stream in real-time.";
    inline constexpr const char* kRemoteDirPlaceholder = "remote:~";

    enum class ExecStatus {
        Started,          ///< a process was spawned; output follows as events
        Forwarded,        ///< written to the active SSH session's stdin
        NeedsPassword,    ///< nothing spawned; re-invoke with a password
        DirectoryChanged  ///< local cd applied; message holds the new path
    };

    struct ExecOutcome {
        ExecStatus status;
        std::string message;
    };

    /**
     * @brief Result of scanning a command line for a remote-shell client call.
     *
     * Only a leading `ssh` (or `.../ssh`) token counts; `sudo ssh ...` does not.
     * interactive means the host is the last token (`ssh [opts] host`), as
     * opposed to `ssh host command`.
     */
    struct SshInvocation {
        bool is_ssh = false;
        bool interactive = false;
        std::vector<std::string> args; ///< tokens after the ssh keyword
    };

    [[nodiscard]] SshInvocation parse_ssh_invocation(std::string_view command);

    /**
     * @class CommandEngine
     * @brief Executes commands on behalf of sessions and reports progress as events.
     *
     * Public calls return as soon as the process is spawned (or the command is
     * forwarded); all further I/O happens on detached worker threads that share
     * the registry and sink. Synchronous failures throw EngineError.
     */
    class CommandEngine {
    public:
        CommandEngine(std::shared_ptr<SessionRegistry> registry,
                      std::shared_ptr<EventSink> sink,
                      Config config = {});

        ExecOutcome execute_command(const std::string& command,
                                    const std::string& session_id,
                                    const std::optional<std::string>& password = std::nullopt);

        ExecOutcome execute_privileged_command(const std::string& command,
                                               const std::string& session_id,
                                               const std::string& password);

        /** @brief SIGTERM to the session's foreground process (group). Throws NotFound. */
        void terminate_command(const std::string& session_id);

        /** @brief The session's tracked local directory. */
        std::string current_directory(const std::string& session_id);

        [[nodiscard]] const std::shared_ptr<SessionRegistry>& registry() const { return registry_; }
        [[nodiscard]] const Config& config() const { return config_; }

    private:
        ExecOutcome dispatch(const std::string& command, const std::string& session_id,
                             const std::optional<std::string>& password);

        // --- command_engine_remote.cpp ---
        std::optional<ExecOutcome> try_forward_to_remote(const std::string& command, const std::string& session_id);
        void send_initial_pwd_probe(const std::string& session_id, pid_t pid, std::shared_ptr<PipeWriter> writer);

        // --- command_engine.cpp ---
        ExecOutcome change_directory(const std::string& command, const std::string& session_id);
        ExecOutcome spawn_command(const std::string& command, const std::string& session_id,
                                  const std::optional<std::string>& password);

        void emit(EventKind kind, const std::string& session_id, pid_t pid = 0,
                  std::string text = {}, bool success = false);

        std::shared_ptr<SessionRegistry> registry_;
        std::shared_ptr<EventSink> sink_;
        Config config_;
    };
}
