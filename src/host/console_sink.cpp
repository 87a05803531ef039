/**
 * @file console_sink.cpp
 * @brief Console rendering of engine and PTY events.
 */

#include "host/console_sink.hpp"
#include "host/plugin_host.hpp"
#include "core/log.hpp"
#include <format>

namespace tabvisor::host {

    using core::EventKind;
    using core::Theme;

    void ConsoleEventSink::attach_plugins(PluginHost* plugins) {
        std::lock_guard<std::mutex> lock(plugins_mutex_);
        plugins_ = plugins;
    }

    void ConsoleEventSink::detach_plugins() {
        std::lock_guard<std::mutex> lock(plugins_mutex_);
        plugins_ = nullptr;
    }

    void ConsoleEventSink::emit(const core::Event& event) {
        render(event);

        std::lock_guard<std::mutex> lock(plugins_mutex_);
        if (plugins_) plugins_->dispatch(event);
    }

    void ConsoleEventSink::render(const core::Event& event) {
        switch (event.kind) {
            case EventKind::OutputChunk:
            case EventKind::PtyOutput:
                core::log::raw(event.text);
                break;
            case EventKind::ErrorChunk:
                core::log::raw(Theme::ERROR + event.text + Theme::RESET);
                break;
            case EventKind::CommandEnded:
                if (!event.success) core::log::error(event.text);
                break;
            case EventKind::RemoteSessionStarted:
                core::log::success(std::format("SSH session started (pid {})", event.pid));
                break;
            case EventKind::RemoteSessionEnded:
                core::log::notice(std::format("SSH session {} ended: {}", event.pid, event.text));
                break;
            case EventKind::RemoteDirectoryUpdated:
                core::log::debug(std::format("Remote directory: {}", event.text));
                break;
            case EventKind::PasswordNeeded:
                core::log::notice(std::format("Password required for: {}", event.text));
                break;
            case EventKind::CommandForwarded:
                core::log::debug(std::format("Forwarded to SSH: {}", event.text));
                break;
            case EventKind::PtyExit:
                core::log::notice(std::format("PTY session '{}' exited ({})", event.session_id,
                                              event.success ? "success" : "failure"));
                break;
        }
    }
}
