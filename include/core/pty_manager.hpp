/**
 * @file pty_manager.hpp
 * @brief Interactive shells attached to pseudoterminals, keyed by session id.
 */

#pragma once
#include "core/config.hpp"
#include "core/events.hpp"
#include "core/process.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabvisor::core {

    /** @brief Shell executable, argv and extra environment for an embedded PTY shell. */
    struct PtyShellCommand {
        std::string path;
        std::vector<std::string> argv;
        std::vector<std::pair<std::string, std::string>> env;
    };

    /**
     * @brief Picks the shell and a clean, script-free interactive setup for it.
     * Prefers config.pty_preferred_shell when it exists, then $SHELL, then
     * config.pty_fallback_shell.
     */
    [[nodiscard]] PtyShellCommand build_pty_shell_command(const Config& config);

    /** @brief One live PTY shell. The reader thread holds its own dup of the master. */
    struct PtySession {
        FileDescriptor master;
        std::shared_ptr<PipeWriter> writer;
        std::shared_ptr<ChildProcess> child;
    };

    /**
     * @class PtyManager
     * @brief Creates, feeds, resizes and closes PTY sessions.
     *
     * Every session gets a reader thread (UTF-8 safe pty-output events) and an
     * exit watcher (removes the session, emits pty-exit). Both threads share the
     * session map through shared ownership, so they may outlive the manager.
     */
    class PtyManager {
    public:
        explicit PtyManager(std::shared_ptr<EventSink> sink, Config config = {});
        ~PtyManager();

        PtyManager(const PtyManager&) = delete;
        PtyManager& operator=(const PtyManager&) = delete;

        /** @brief Throws EngineError{AlreadyExists | PtyFailure}. */
        void create(const std::string& session_id, unsigned short cols, unsigned short rows);

        /** @brief Throws EngineError{NotFound | StreamFailure}. */
        void write(const std::string& session_id, std::string_view data);

        /** @brief Throws EngineError{NotFound | PtyFailure}. */
        void resize(const std::string& session_id, unsigned short cols, unsigned short rows);

        /** @brief Drops the session and kills its shell without waiting. Unknown ids are ignored. */
        void close(const std::string& session_id);

        [[nodiscard]] bool contains(const std::string& session_id);

    private:
        struct SessionMap {
            std::mutex mutex;
            std::unordered_map<std::string, PtySession> sessions;
        };

        static void run_reader(std::shared_ptr<EventSink> sink, std::string session_id, FileDescriptor fd);
        static void run_exit_watcher(std::shared_ptr<SessionMap> map, std::shared_ptr<EventSink> sink,
                                     std::string session_id, std::shared_ptr<ChildProcess> child);

        std::shared_ptr<SessionMap> map_;
        std::shared_ptr<EventSink> sink_;
        Config config_;
    };
}
