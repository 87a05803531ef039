/**
 * @file plugin_host.cpp
 * @brief Python extension loading and event hook dispatch.
 */

#include "host/plugin_host.hpp"
#include "core/log.hpp"
#include "core/utf8_chunker.hpp"
#include <filesystem>
#include <format>

// ==================================================================================
// EMBEDDED MODULE DEFINITION
// ==================================================================================
/**
 * @brief Defines the 'tabvisor' Python module available to scripts.
 * Allows Python extensions to communicate back to the C++ core.
 */
PYBIND11_EMBEDDED_MODULE(tabvisor, m) {
    // Expose a print function so Python can write tagged logs to the console
    m.def("log", [](const std::string& msg) {
        tabvisor::core::log::success(msg);
    });
}

namespace tabvisor::host {

    void PluginHost::load_extensions(const std::string& path) {
        namespace fs = std::filesystem;
        fs::path p(path);

        // Validation
        if (path.empty() || !fs::exists(p) || !fs::is_directory(p)) {
            core::log::warn(std::format("Warning: Plugin path '{}' invalid. Skipping Python extensions.", path));
            return;
        }

        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("append")(path);

            for (const auto& entry : fs::directory_iterator(path)) {
                if (entry.path().extension() == ".py") {
                    std::string module_name = entry.path().stem().string();

                    // Skip internal python files
                    if (module_name == "__init__" || module_name == "config") continue;

                    py::module_ plugin = py::module_::import(module_name.c_str());
                    loaded_plugins_.push_back(plugin);

                    core::log::notice(std::format("Loaded .py extension: {}", module_name));
                }
            }
        } catch (const std::exception& e) {
            core::log::error(std::format("Error, failed to load extensions: {}", e.what()));
        }
    }

    void PluginHost::release_gil() {
        if (!release_) release_ = std::make_unique<py::gil_scoped_release>();
    }

    void PluginHost::dispatch(const core::Event& event) {
        if (loaded_plugins_.empty()) return;

        std::string hook_name = std::format("on_{}", core::event_name(event.kind));

        py::gil_scoped_acquire gil;
        try {
            py::dict payload;
            payload["session_id"] = event.session_id;
            payload["pid"] = static_cast<long>(event.pid);
            // Process output is arbitrary bytes; Python strings must be valid UTF-8
            payload["text"] = core::utf8_lossy(event.text);
            payload["success"] = event.success;

            for (auto& plugin : loaded_plugins_) {
                if (py::hasattr(plugin, hook_name.c_str())) {
                    try {
                        plugin.attr(hook_name.c_str())(payload);
                    } catch (const std::exception& e) {
                        core::log::error(std::format("Error in plugin: {}", e.what()));
                    }
                }
            }
        } catch (const py::error_already_set& e) {
            core::log::error(std::format("Error building plugin payload: {}", e.what()));
        }
    }
}
