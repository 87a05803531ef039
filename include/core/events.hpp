/**
 * @file events.hpp
 * @brief Asynchronous notifications emitted by the engine and PTY manager.
 */

#pragma once
#include <string>
#include <string_view>
#include <sys/types.h>

namespace tabvisor::core {

    enum class EventKind {
        OutputChunk,
        ErrorChunk,
        CommandEnded,
        RemoteSessionStarted,
        RemoteSessionEnded,
        RemoteDirectoryUpdated,
        PasswordNeeded,
        CommandForwarded,
        PtyOutput,
        PtyExit
    };

    /**
     * @brief A single session-tagged notification.
     * Fields not meaningful for a kind are left at their defaults
     * (pid 0, empty text, success false).
     */
    struct Event {
        EventKind kind;
        std::string session_id;
        pid_t pid = 0;
        std::string text;
        bool success = false;
    };

    /** @brief Stable wire name for an event kind (used for plugin hooks). */
    [[nodiscard]] std::string_view event_name(EventKind kind);

    /**
     * @class EventSink
     * @brief Receiver for engine notifications.
     *
     * emit() is called concurrently from stdout, stderr, waiter, forwarder and
     * PTY worker threads. Implementations must be thread safe and must not
     * throw.
     */
    class EventSink {
    public:
        virtual ~EventSink() = default;
        virtual void emit(const Event& event) = 0;
    };
}
