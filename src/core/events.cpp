#include "core/events.hpp"

namespace tabvisor::core {

    std::string_view event_name(EventKind kind) {
        switch (kind) {
            case EventKind::OutputChunk:            return "command_output";
            case EventKind::ErrorChunk:             return "command_error";
            case EventKind::CommandEnded:           return "command_end";
            case EventKind::RemoteSessionStarted:   return "ssh_session_started";
            case EventKind::RemoteSessionEnded:     return "ssh_session_ended";
            case EventKind::RemoteDirectoryUpdated: return "remote_directory_updated";
            case EventKind::PasswordNeeded:         return "ssh_pre_exec_password_request";
            case EventKind::CommandForwarded:       return "command_forwarded_to_ssh";
            case EventKind::PtyOutput:              return "pty_output";
            case EventKind::PtyExit:                return "pty_exit";
        }
        return "unknown";
    }
}
