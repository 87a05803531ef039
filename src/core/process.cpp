/**
 * @file process.cpp
 * @brief fork/exec, pipe and waitpid plumbing for spawned commands.
 */

#include "core/process.hpp"
#include "core/errors.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <format>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace tabvisor::core {

    namespace {

        std::system_error last_error(const char* what) {
            return std::system_error(errno, std::generic_category(), what);
        }

        /** @brief pipe2(O_CLOEXEC) wrapped in two owning descriptors {read, write}. */
        std::pair<FileDescriptor, FileDescriptor> make_pipe() {
            int fds[2];
            if (pipe2(fds, O_CLOEXEC) == -1) throw last_error("pipe2");
            return {FileDescriptor(fds[0]), FileDescriptor(fds[1])};
        }

        std::string env_lookup(const std::vector<std::string>& env, std::string_view key) {
            for (const auto& entry : env) {
                if (entry.size() > key.size() && entry.compare(0, key.size(), key) == 0 && entry[key.size()] == '=') {
                    return entry.substr(key.size() + 1);
                }
            }
            return {};
        }

        bool is_executable_file(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
        }

        // Child side of spawn_piped(). Only async-signal-safe calls from here on.
        [[noreturn]] void exec_child(const char* path, char** argv, char** envp, const char* cwd,
                                     bool new_session, int in_fd, int out_fd, int err_fd, int report_fd) {
            if (new_session) setsid();

            if (dup2(in_fd, STDIN_FILENO) == -1 ||
                dup2(out_fd, STDOUT_FILENO) == -1 ||
                dup2(err_fd, STDERR_FILENO) == -1) {
                int err = errno;
                (void)!::write(report_fd, &err, sizeof(err));
                _exit(127);
            }

            if (cwd[0] != '\0' && chdir(cwd) == -1) {
                int err = errno;
                (void)!::write(report_fd, &err, sizeof(err));
                _exit(127);
            }

            // Restore default signal dispositions inherited from the host
            ::signal(SIGPIPE, SIG_DFL);
            ::signal(SIGINT, SIG_DFL);

            execve(path, argv, envp);

            int err = errno;
            (void)!::write(report_fd, &err, sizeof(err));
            _exit(127);
        }
    }

    // ==================================================================================
    // DESCRIPTORS & PIPES
    // ==================================================================================

    void FileDescriptor::reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void PipeWriter::write_all(std::string_view data) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fd_.valid()) {
            throw std::system_error(EBADF, std::generic_category(), "write to closed handle");
        }

        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = ::write(fd_.get(), data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw last_error("write");
            }
            written += static_cast<size_t>(n);
        }
    }

    void PipeWriter::post(std::string data, ErrorHandler on_error) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.emplace_back(std::move(data), std::move(on_error));
            // The running drainer picks this up after the writes queued before it
            if (draining_) return;
            draining_ = true;
        }

        try {
            std::thread([self = shared_from_this()] { self->drain(); }).detach();
        } catch (const std::system_error&) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            draining_ = false;
            queue_.pop_back();
            throw;
        }
    }

    void PipeWriter::drain() {
        while (true) {
            std::pair<std::string, ErrorHandler> job;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (queue_.empty()) {
                    draining_ = false;
                    return;
                }
                job = std::move(queue_.front());
                queue_.pop_front();
            }

            try {
                write_all(job.first);
            } catch (const std::system_error& e) {
                if (job.second) job.second(e);
            }
        }
    }

    void PipeWriter::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        fd_.reset();
    }

    size_t read_some(int fd, char* buffer, size_t len) {
        while (true) {
            ssize_t n = ::read(fd, buffer, len);
            if (n >= 0) return static_cast<size_t>(n);
            if (errno == EINTR) continue;
            // Linux reports a hung-up PTY master as EIO rather than EOF
            if (errno == EIO) return 0;
            throw last_error("read");
        }
    }

    // ==================================================================================
    // CHILD PROCESS
    // ==================================================================================

    int ChildProcess::wait() {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (status_) return *status_;

        int status = 0;
        while (waitpid(pid_, &status, 0) == -1) {
            if (errno == EINTR) continue;
            throw last_error("waitpid");
        }
        status_ = status;
        reaped_ = true;
        return status;
    }

    bool ChildProcess::signal(int sig) {
        if (reaped_) return false;
        pid_t target = group_leader_ ? -pid_ : pid_;
        return ::kill(target, sig) == 0;
    }

    bool ChildProcess::exited_successfully(int status) {
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }

    // ==================================================================================
    // SPAWNING
    // ==================================================================================

    std::optional<std::string> find_executable(const std::string& name, const std::vector<std::string>& env) {
        if (name.empty()) return std::nullopt;
        if (name.find('/') != std::string::npos) {
            if (is_executable_file(name)) return name;
            return std::nullopt;
        }

        std::string path = env_lookup(env, "PATH");
        if (path.empty()) {
            const char* own = std::getenv("PATH");
            if (own) path = own;
        }

        size_t start = 0;
        while (start <= path.size()) {
            size_t end = path.find(':', start);
            if (end == std::string::npos) end = path.size();
            std::string dir = path.substr(start, end - start);
            if (dir.empty()) dir = ".";
            std::string candidate = dir + "/" + name;
            if (is_executable_file(candidate)) return candidate;
            start = end + 1;
        }
        return std::nullopt;
    }

    std::vector<std::string> inherited_environment(const std::string& fallback_path) {
        std::vector<std::string> env;
        bool has_path = false;
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            if (entry.starts_with("PATH=")) has_path = true;
            env.push_back(std::move(entry));
        }
        if (!has_path && !fallback_path.empty()) {
            env.push_back("PATH=" + fallback_path);
        }
        return env;
    }

    std::vector<char*> to_c_array(std::vector<std::string>& strings) {
        std::vector<char*> out;
        out.reserve(strings.size() + 1);
        for (auto& s : strings) out.push_back(s.data());
        out.push_back(nullptr);
        return out;
    }

    SpawnedProcess spawn_piped(const SpawnOptions& options) {
        if (options.argv.empty()) {
            throw EngineError(ErrorKind::SpawnFailure, "Failed to start command: empty argument list");
        }

        auto resolved = find_executable(options.argv[0], options.env);
        if (!resolved) {
            throw EngineError(ErrorKind::SpawnFailure,
                std::format("Failed to start command ({}): No such file or directory", options.argv[0]));
        }

        // Everything the child touches is prepared before fork()
        std::vector<std::string> argv_storage = options.argv;
        std::vector<std::string> env_storage = options.env;
        std::vector<char*> argv = to_c_array(argv_storage);
        std::vector<char*> envp = to_c_array(env_storage);

        try {
            auto [in_read, in_write] = make_pipe();
            auto [out_read, out_write] = make_pipe();
            auto [err_read, err_write] = make_pipe();
            auto [report_read, report_write] = make_pipe();

            pid_t pid = fork();
            if (pid < 0) throw last_error("fork");

            if (pid == 0) {
                exec_child(resolved->c_str(), argv.data(), envp.data(), options.cwd.c_str(),
                           options.new_session, in_read.get(), out_write.get(), err_write.get(),
                           report_write.get());
            }

            // --- PARENT ---
            in_read.reset();
            out_write.reset();
            err_write.reset();
            report_write.reset();

            int child_errno = 0;
            ssize_t n;
            do {
                n = ::read(report_read.get(), &child_errno, sizeof(child_errno));
            } while (n < 0 && errno == EINTR);

            if (n > 0) {
                // exec (or chdir) failed; reap the child before reporting
                int status = 0;
                while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
                throw EngineError(ErrorKind::SpawnFailure,
                    std::format("Failed to start command ({}): {}", options.argv[0], std::strerror(child_errno)));
            }

            SpawnedProcess spawned;
            spawned.child = std::make_shared<ChildProcess>(pid, options.new_session);
            spawned.stdin_fd = std::move(in_write);
            spawned.stdout_fd = std::move(out_read);
            spawned.stderr_fd = std::move(err_read);
            return spawned;
        } catch (const std::system_error& e) {
            throw EngineError(ErrorKind::SpawnFailure,
                std::format("Failed to start command ({}): {}", options.argv[0], e.what()));
        }
    }
}
