/**
 * @file console_sink.hpp
 * @brief EventSink that renders events on the console and feeds Python plugins.
 */

#pragma once
#include "core/events.hpp"
#include <mutex>

namespace tabvisor::host {

    class PluginHost;

    class ConsoleEventSink : public core::EventSink {
    public:
        void emit(const core::Event& event) override;

        /**
         * @brief Starts forwarding events to the plugin host. The host must
         * outlive the attachment; call detach_plugins() before destroying it.
         */
        void attach_plugins(PluginHost* plugins);
        void detach_plugins();

    private:
        void render(const core::Event& event);

        std::mutex plugins_mutex_;
        PluginHost* plugins_ = nullptr;
    };
}
