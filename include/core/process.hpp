/**
 * @file process.hpp
 * @brief Low-level child process and pipe handles.
 *
 * Thin RAII wrappers around fork/exec, pipes and waitpid. The command engine
 * and PTY manager share these handles across worker threads through
 * std::shared_ptr; each handle carries its own mutex so a blocking wait on the
 * child never blocks a writer on its stdin.
 */

#pragma once
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace tabvisor::core {

    /** @brief Owning file descriptor; closes on destruction. Move-only. */
    class FileDescriptor {
    public:
        FileDescriptor() = default;
        explicit FileDescriptor(int fd) : fd_(fd) {}
        ~FileDescriptor() { reset(); }

        FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
        FileDescriptor& operator=(FileDescriptor&& other) noexcept {
            if (this != &other) {
                reset();
                fd_ = other.release();
            }
            return *this;
        }
        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        [[nodiscard]] int get() const { return fd_; }
        [[nodiscard]] bool valid() const { return fd_ >= 0; }

        int release() {
            int fd = fd_;
            fd_ = -1;
            return fd;
        }

        void reset();

    private:
        int fd_ = -1;
    };

    /**
     * @brief Lock-guarded writer for a child's stdin or a PTY master.
     * write_all() retries on EINTR and short writes and throws
     * std::system_error on failure.
     *
     * post() queues a write for a background thread. Posted writes reach the
     * descriptor in posting order. Must be owned by a std::shared_ptr.
     */
    class PipeWriter : public std::enable_shared_from_this<PipeWriter> {
    public:
        using ErrorHandler = std::function<void(const std::system_error&)>;

        explicit PipeWriter(FileDescriptor fd) : fd_(std::move(fd)) {}

        void write_all(std::string_view data);

        /** @brief Queues data; on_error runs on the writer thread if that write fails. */
        void post(std::string data, ErrorHandler on_error);

        // Closes the descriptor so the reader sees EOF.
        void close();

    private:
        void drain();

        std::mutex mutex_;
        FileDescriptor fd_;

        std::mutex queue_mutex_;
        std::deque<std::pair<std::string, ErrorHandler>> queue_;
        bool draining_ = false;
    };

    /**
     * @brief Reads up to len bytes, retrying on EINTR.
     * @return Bytes read, 0 on EOF. Throws std::system_error on error
     *         (EIO on a PTY master is reported as EOF).
     */
    size_t read_some(int fd, char* buffer, size_t len);

    /**
     * @brief A spawned child process.
     *
     * wait() is serialized by an internal mutex and may block for the child's
     * whole lifetime. signal() never takes that mutex, so it can be called from
     * another thread while a waiter is blocked.
     */
    class ChildProcess {
    public:
        ChildProcess(pid_t pid, bool group_leader) : pid_(pid), group_leader_(group_leader) {}
        ~ChildProcess() = default;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        [[nodiscard]] pid_t pid() const { return pid_; }
        [[nodiscard]] bool reaped() const { return reaped_; }

        /**
         * @brief Blocks until the child exits and reaps it.
         * @return Raw wait status. Throws std::system_error if waitpid fails.
         */
        int wait();

        /**
         * @brief Sends a signal (to the whole process group for group leaders).
         * @return false if the child was already reaped or kill() failed.
         */
        bool signal(int sig);

        [[nodiscard]] static bool exited_successfully(int status);

    private:
        pid_t pid_;
        bool group_leader_;
        std::mutex wait_mutex_;
        std::atomic<bool> reaped_{false};
        std::optional<int> status_;
    };

    struct SpawnOptions {
        std::vector<std::string> argv;   ///< argv[0] is resolved through PATH
        std::string cwd;
        std::vector<std::string> env;    ///< "KEY=VALUE" entries
        bool new_session = false;        ///< setsid() in the child (detached group)
    };

    /** @brief Result of spawn_piped(): the child plus the parent ends of its stdio pipes. */
    struct SpawnedProcess {
        std::shared_ptr<ChildProcess> child;
        FileDescriptor stdin_fd;
        FileDescriptor stdout_fd;
        FileDescriptor stderr_fd;
    };

    /**
     * @brief Spawns argv with stdin/stdout/stderr connected to pipes.
     *
     * Exec failures in the child are reported back over a close-on-exec pipe,
     * so a missing executable or unusable cwd is a synchronous error.
     * Throws EngineError{SpawnFailure}.
     */
    SpawnedProcess spawn_piped(const SpawnOptions& options);

    /**
     * @brief Searches PATH (taken from env, else the process environment)
     * for an executable. Names containing '/' are checked as given.
     */
    std::optional<std::string> find_executable(const std::string& name, const std::vector<std::string>& env);

    /**
     * @brief Snapshot of the process environment, with PATH set to
     * fallback_path when it is absent.
     */
    std::vector<std::string> inherited_environment(const std::string& fallback_path);

    /** @brief Builds a NULL-terminated char* array over the strings (for exec*). */
    std::vector<char*> to_c_array(std::vector<std::string>& strings);
}
