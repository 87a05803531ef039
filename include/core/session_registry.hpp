/**
 * @file session_registry.hpp
 * @brief Process-wide map from session id to per-tab execution state.
 *
 * The registry is the only shared mutable state of the command engine. A single
 * mutex guards the whole map; callers only copy fields or swap pointers while
 * holding it, never perform I/O.
 */

#pragma once
#include "core/process.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace tabvisor::core {

    /**
     * @brief State of one logical terminal tab.
     *
     * Invariants:
     * - is_remote_session_active implies stdin_writer != nullptr.
     * - pid and process are set and cleared together.
     */
    struct SessionState {
        std::string current_dir;
        std::optional<pid_t> pid;
        std::shared_ptr<ChildProcess> process;
        std::shared_ptr<PipeWriter> stdin_writer;
        bool is_remote_session_active = false;
        std::optional<std::string> remote_current_dir;

        /** @brief Clears the remote flag, stdin handle and remote directory together. */
        void end_remote() {
            is_remote_session_active = false;
            stdin_writer.reset();
            remote_current_dir.reset();
        }

        void clear_process() {
            pid.reset();
            process.reset();
        }
    };

    class SessionRegistry {
    public:
        /**
         * @param initial_dir Working directory given to sessions on first reference.
         *        Defaults to the process's current directory.
         */
        explicit SessionRegistry(std::string initial_dir = std::filesystem::current_path().string())
            : initial_dir_(std::move(initial_dir)) {}

        /** @brief Returns a copy of the session's state, creating it on first access. */
        SessionState get_or_create(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            return entry(id);
        }

        /**
         * @brief Runs fn(SessionState&) under the registry lock, creating the
         * session on first access. fn must not block.
         */
        template <typename Fn>
        decltype(auto) with_session(const std::string& id, Fn&& fn) {
            std::lock_guard<std::mutex> lock(mutex_);
            return std::forward<Fn>(fn)(entry(id));
        }

        /**
         * @brief Runs fn(SessionState&) under the lock only if the session exists.
         * @return false if the session was unknown.
         */
        template <typename Fn>
        bool with_existing(const std::string& id, Fn&& fn) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) return false;
            std::forward<Fn>(fn)(it->second);
            return true;
        }

        [[nodiscard]] bool contains(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            return sessions_.count(id) > 0;
        }

        [[nodiscard]] const std::string& initial_dir() const { return initial_dir_; }

    private:
        SessionState& entry(const std::string& id) {
            auto [it, inserted] = sessions_.try_emplace(id);
            if (inserted) it->second.current_dir = initial_dir_;
            return it->second;
        }

        const std::string initial_dir_;
        std::mutex mutex_;
        std::unordered_map<std::string, SessionState> sessions_;
    };
}
