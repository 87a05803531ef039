/**
 * @file errors.hpp
 * @brief Error type for synchronous engine and PTY failures.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace tabvisor::core {

    enum class ErrorKind {
        SpawnFailure,    ///< Executable not found or the OS refused to start it
        LockFailure,     ///< A registry or handle mutex could not be acquired
        StreamFailure,   ///< Pipe / terminal read, write or flush error
        PathResolution,  ///< cd target missing, or '..' past the filesystem root
        SessionConflict, ///< Session state found inconsistent on entry
        PtyFailure,      ///< Pseudo-terminal could not be opened, spawned or resized
        NotFound,        ///< Unknown session id (PTY) or no running process
        AlreadyExists    ///< PTY session id already in use
    };

    /**
     * @brief Thrown by public operations; what() is the caller-facing message.
     * Background workers never throw, they report through the event sink.
     */
    class EngineError : public std::runtime_error {
    public:
        EngineError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };
}
