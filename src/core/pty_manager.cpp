/**
 * @file pty_manager.cpp
 * @brief Implementation of the PTY session manager.
 *
 * This file handles the low-level operating system interactions required to:
 * 1. Create a pseudoterminal pair sized to the caller's grid and fork a shell on it.
 * 2. Configure that shell for a clean, predictable interactive session.
 * 3. Stream raw output without splitting multi-byte UTF-8 characters.
 * 4. Reap the shell and retire its session.
 */

#include "core/pty_manager.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/utf8_chunker.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

// Platform-specific headers for PTY management
#if defined(__APPLE__) || defined(__FreeBSD__)
#include <util.h>
#else
#include <pty.h>
#endif

extern char** environ;

namespace tabvisor::core {

    constexpr size_t kPtyBufferSize = 4096;

    namespace {
        bool ends_with_name(const std::string& path, std::string_view name) {
            return std::filesystem::path(path).filename() == name;
        }

        // Process environment with the given overrides applied
        std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& overrides) {
            std::vector<std::string> env;
            for (char** e = environ; e && *e; ++e) {
                std::string entry(*e);
                bool overridden = false;
                for (const auto& [key, value] : overrides) {
                    if (entry.size() > key.size() && entry.compare(0, key.size(), key) == 0 && entry[key.size()] == '=') {
                        overridden = true;
                        break;
                    }
                }
                if (!overridden) env.push_back(std::move(entry));
            }
            for (const auto& [key, value] : overrides) env.push_back(key + "=" + value);
            return env;
        }
    }

    PtyShellCommand build_pty_shell_command(const Config& config) {
        PtyShellCommand cmd;

        std::error_code ec;
        if (!config.pty_preferred_shell.empty() && std::filesystem::exists(config.pty_preferred_shell, ec)) {
            cmd.path = config.pty_preferred_shell;
        } else if (const char* shell = std::getenv("SHELL"); shell && *shell) {
            cmd.path = shell;
        } else {
            cmd.path = config.pty_fallback_shell;
        }

        cmd.argv.push_back(cmd.path);

        // No rc files, no prompt hooks: keeps the byte stream free of theme artifacts
        if (ends_with_name(cmd.path, "bash")) {
            cmd.argv.push_back("--noprofile");
            cmd.argv.push_back("--norc");
            cmd.env.emplace_back("BASH_SILENCE_DEPRECATION_WARNING", "1");
            cmd.env.emplace_back("PROMPT_COMMAND", "");
            cmd.env.emplace_back("PS1", "\\[\\033[1;34m\\]\\w\\[\\033[0m\\] $ ");
        } else if (ends_with_name(cmd.path, "zsh")) {
            cmd.argv.push_back("-f");
            cmd.env.emplace_back("PROMPT", "%n@%m %1~ %# ");
            cmd.env.emplace_back("RPROMPT", "");
            cmd.env.emplace_back("PROMPT_EOL_MARK", "");
            cmd.env.emplace_back("PS1", "%n@%m %1~ %# ");
        }
        cmd.argv.push_back("-i");

        cmd.env.emplace_back("TERM", config.pty_term);
        cmd.env.emplace_back("COLORTERM", "truecolor");
        // Apple's session-restore hooks hang non-Terminal.app shells on exit
        cmd.env.emplace_back("SHELL_SESSION_HISTORY", "0");
        return cmd;
    }

    PtyManager::PtyManager(std::shared_ptr<EventSink> sink, Config config)
        : map_(std::make_shared<SessionMap>()), sink_(std::move(sink)), config_(std::move(config)) {}

    // Shells must not outlive the host
    PtyManager::~PtyManager() {
        std::unordered_map<std::string, PtySession> remaining;
        {
            std::lock_guard<std::mutex> lock(map_->mutex);
            remaining.swap(map_->sessions);
        }
        for (auto& [id, session] : remaining) session.child->signal(SIGKILL);
    }

    // ==================================================================================
    // CREATE
    // ==================================================================================

    /**
     * @brief Opens a PTY, forks the shell onto it and starts the worker threads.
     *
     * The startup sequence is order-sensitive:
     * 1. Reject duplicate ids before any OS resource is created.
     * 2. Prepare argv/envp/cwd up front (only async-signal-safe calls after fork).
     * 3. forkpty() with the requested window size; the child execs the shell.
     * 4. Exec failures come back over a close-on-exec report pipe.
     * 5. Register the session, then start reader and exit watcher.
     */
    void PtyManager::create(const std::string& session_id, unsigned short cols, unsigned short rows) {
        if (contains(session_id)) {
            throw EngineError(ErrorKind::AlreadyExists, std::format("PTY session '{}' already exists", session_id));
        }

        PtyShellCommand shell = build_pty_shell_command(config_);

        std::string cwd;
        try {
            cwd = std::filesystem::current_path().string();
        } catch (const std::filesystem::filesystem_error& e) {
            throw EngineError(ErrorKind::PtyFailure, std::format("Failed to get cwd: {}", e.what()));
        }

        std::vector<std::string> argv_storage = shell.argv;
        std::vector<std::string> env_storage = build_environment(shell.env);
        std::vector<char*> argv = to_c_array(argv_storage);
        std::vector<char*> envp = to_c_array(env_storage);

        int report[2];
        if (pipe2(report, O_CLOEXEC) == -1) {
            throw EngineError(ErrorKind::PtyFailure, std::format("Failed to open PTY: {}", std::strerror(errno)));
        }
        FileDescriptor report_read(report[0]);
        FileDescriptor report_write(report[1]);

        struct winsize ws{};
        ws.ws_col = cols;
        ws.ws_row = rows;

        int master_fd = -1;
        pid_t pid = forkpty(&master_fd, nullptr, nullptr, &ws);
        if (pid < 0) {
            throw EngineError(ErrorKind::PtyFailure, std::format("Failed to open PTY: {}", std::strerror(errno)));
        }

        // --- CHILD PROCESS EXECUTION BLOCK ---
        if (pid == 0) {
            ::signal(SIGPIPE, SIG_DFL);
            if (chdir(cwd.c_str()) == 0) {
                execve(shell.path.c_str(), argv.data(), envp.data());
            }
            int err = errno;
            (void)!::write(report_write.get(), &err, sizeof(err));
            _exit(127);
        }

        // --- PARENT ---
        FileDescriptor master(master_fd);
        report_write.reset();
        fcntl(master.get(), F_SETFD, FD_CLOEXEC);

        int child_errno = 0;
        ssize_t n;
        do {
            n = ::read(report_read.get(), &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);

        if (n > 0) {
            int status = 0;
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
            throw EngineError(ErrorKind::PtyFailure,
                std::format("Failed to spawn shell in PTY ({}): {}", shell.path, std::strerror(child_errno)));
        }

        auto child = std::make_shared<ChildProcess>(pid, false);

        int writer_fd = fcntl(master.get(), F_DUPFD_CLOEXEC, 0);
        int reader_fd = fcntl(master.get(), F_DUPFD_CLOEXEC, 0);
        if (writer_fd < 0 || reader_fd < 0) {
            int err = errno;
            if (writer_fd >= 0) ::close(writer_fd);
            if (reader_fd >= 0) ::close(reader_fd);
            child->signal(SIGKILL);
            try {
                child->wait();
            } catch (const std::system_error& e) {
                log::warn(std::format("Could not reap PTY shell {}: {}", pid, e.what()));
            }
            throw EngineError(ErrorKind::PtyFailure, std::format("Failed to take PTY writer: {}", std::strerror(err)));
        }
        auto writer = std::make_shared<PipeWriter>(FileDescriptor(writer_fd));
        FileDescriptor reader(reader_fd);

        {
            std::lock_guard<std::mutex> lock(map_->mutex);
            auto [it, inserted] = map_->sessions.try_emplace(session_id, PtySession{std::move(master), writer, child});
            if (!inserted) {
                // Lost a race against a concurrent create() for the same id
                child->signal(SIGKILL);
                std::thread([child] {
                    try {
                        child->wait();
                    } catch (const std::system_error& e) {
                        log::warn(std::format("Could not reap PTY shell {}: {}", child->pid(), e.what()));
                    }
                }).detach();
                throw EngineError(ErrorKind::AlreadyExists, std::format("PTY session '{}' already exists", session_id));
            }
        }

        log::debug(std::format("PTY session {} started {} (pid {}, {}x{})", session_id, shell.path, pid, cols, rows));

        std::thread(run_reader, sink_, session_id, std::move(reader)).detach();
        std::thread(run_exit_watcher, map_, sink_, session_id, child).detach();
    }

    // ==================================================================================
    // WRITE / RESIZE / CLOSE
    // ==================================================================================

    void PtyManager::write(const std::string& session_id, std::string_view data) {
        std::shared_ptr<PipeWriter> writer;
        {
            std::lock_guard<std::mutex> lock(map_->mutex);
            auto it = map_->sessions.find(session_id);
            if (it == map_->sessions.end()) {
                throw EngineError(ErrorKind::NotFound, std::format("PTY session '{}' not found", session_id));
            }
            writer = it->second.writer;
        }

        try {
            writer->write_all(data);
        } catch (const std::system_error& e) {
            throw EngineError(ErrorKind::StreamFailure, std::format("Failed to write PTY input: {}", e.what()));
        }
    }

    void PtyManager::resize(const std::string& session_id, unsigned short cols, unsigned short rows) {
        std::lock_guard<std::mutex> lock(map_->mutex);
        auto it = map_->sessions.find(session_id);
        if (it == map_->sessions.end()) {
            throw EngineError(ErrorKind::NotFound, std::format("PTY session '{}' not found", session_id));
        }

        struct winsize ws{};
        ws.ws_col = cols;
        ws.ws_row = rows;
        if (ioctl(it->second.master.get(), TIOCSWINSZ, &ws) == -1) {
            throw EngineError(ErrorKind::PtyFailure, std::format("Failed to resize PTY: {}", std::strerror(errno)));
        }
    }

    void PtyManager::close(const std::string& session_id) {
        std::optional<PtySession> session;
        {
            std::lock_guard<std::mutex> lock(map_->mutex);
            auto it = map_->sessions.find(session_id);
            if (it == map_->sessions.end()) return;
            session = std::move(it->second);
            map_->sessions.erase(it);
        }

        // The exit watcher may be blocked in wait(); signal() does not need its lock
        if (!session->child->signal(SIGKILL)) {
            log::debug(std::format("PTY session {} already exited", session_id));
        }
    }

    bool PtyManager::contains(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(map_->mutex);
        return map_->sessions.count(session_id) > 0;
    }

    // ==================================================================================
    // WORKERS
    // ==================================================================================

    void PtyManager::run_reader(std::shared_ptr<EventSink> sink, std::string session_id, FileDescriptor fd) {
        std::array<char, kPtyBufferSize> buffer;
        Utf8Chunker chunker;

        auto emit_output = [&](std::string data) {
            if (data.empty()) return;
            Event event;
            event.kind = EventKind::PtyOutput;
            event.session_id = session_id;
            event.text = std::move(data);
            sink->emit(event);
        };

        while (true) {
            size_t n = 0;
            try {
                n = read_some(fd.get(), buffer.data(), buffer.size());
            } catch (const std::system_error& e) {
                log::debug(std::format("PTY session {} read failed: {}", session_id, e.what()));
                break;
            }
            if (n == 0) break;

            for (auto& chunk : chunker.feed(std::string_view(buffer.data(), n))) {
                emit_output(std::move(chunk));
            }
        }

        if (auto rest = chunker.finish()) emit_output(std::move(*rest));
    }

    void PtyManager::run_exit_watcher(std::shared_ptr<SessionMap> map, std::shared_ptr<EventSink> sink,
                                      std::string session_id, std::shared_ptr<ChildProcess> child) {
        bool success = false;
        try {
            success = ChildProcess::exited_successfully(child->wait());
        } catch (const std::system_error& e) {
            log::warn(std::format("PTY session {} wait failed: {}", session_id, e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(map->mutex);
            auto it = map->sessions.find(session_id);
            // Only retire our own session; the id may have been reused after close()
            if (it != map->sessions.end() && it->second.child == child) {
                map->sessions.erase(it);
            }
        }

        Event event;
        event.kind = EventKind::PtyExit;
        event.session_id = session_id;
        event.pid = child->pid();
        event.success = success;
        sink->emit(event);
    }
}
