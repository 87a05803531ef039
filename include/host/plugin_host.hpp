/**
 * @file plugin_host.hpp
 * @brief Embedded Python interpreter hosting configuration and event plugins.
 */

#pragma once
#include "core/events.hpp"
#include <memory>
#include <string>
#include <vector>
#include <pybind11/embed.h>

namespace py = pybind11;

namespace tabvisor::host {

    /**
     * @class PluginHost
     * @brief Owns the interpreter and the imported extension modules.
     *
     * Lifecycle: construct on the main thread, load configuration and
     * extensions, then call release_gil() so that worker threads can
     * dispatch() events. Destroy on the main thread.
     */
    class PluginHost {
    public:
        PluginHost() = default;
        ~PluginHost() = default;

        PluginHost(const PluginHost&) = delete;
        PluginHost& operator=(const PluginHost&) = delete;

        /**
         * @brief Imports every .py file in path (except __init__ and config).
         * Updates sys.path so imports work correctly within the plugins.
         */
        void load_extensions(const std::string& path);

        /** @brief Hands the GIL to background threads until destruction. */
        void release_gil();

        /**
         * @brief Calls `on_<event_name>(payload)` in every plugin defining it.
         * Safe from any thread after release_gil(). Plugin errors are logged.
         */
        void dispatch(const core::Event& event);

    private:
        // Declaration order matters: release_ is destroyed first (re-taking the
        // GIL) so module references can be dropped before finalization.
        py::scoped_interpreter guard_{};
        std::vector<py::module_> loaded_plugins_;
        std::unique_ptr<py::gil_scoped_release> release_;
    };
}
