/**
 * @file config_loader.cpp
 * @brief Implementation of the ConfigLoader with DRY property loading.
 */

#include "host/config_loader.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include <pybind11/embed.h>
#include <pybind11/stl.h> // For casting vector/map
#include <filesystem>
#include <format>

namespace py = pybind11;

namespace tabvisor::host {

    using core::Theme;

    namespace {
        // --- DRY Helper Templates ---

        /**
         * @brief Safely loads a simple property (int, bool, string, list) from a python module.
         */
        template <typename T>
        void load_prop(const py::module_& m, const char* name, T& target) {
            if (py::hasattr(m, name)) {
                try {
                    target = m.attr(name).cast<T>();
                } catch (const std::exception& e) {
                    core::log::warn(std::format("Config Type Mismatch for '{}': {}", name, e.what()));
                }
            }
        }

        /**
         * @brief Loads a dictionary item into a specific target reference.
         */
        template <typename T>
        void load_dict_item(const py::dict& d, const char* key, T& target) {
            if (d.contains(key)) {
                try {
                    target = d[key].cast<T>();
                } catch (const py::cast_error& e) {
                    core::log::warn(std::format("Config Type Mismatch for THEME['{}']: {}", key, e.what()));
                }
            }
        }
    }

    void ConfigLoader::load(core::Config& config, const std::string& path) {
        namespace fs = std::filesystem;
        fs::path p(path);

        if (!fs::exists(p / "config.py")) {
            core::log::notice("No config.py found. Using defaults.");
            return;
        }

        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("append")(fs::absolute(p).string());

            py::module_ conf_module = py::module_::import("config");

            // 1. Command execution
            load_prop(conf_module, "EXEC_SHELL", config.exec_shell);
            load_prop(conf_module, "FALLBACK_PATH", config.fallback_path);

            // 2. Remote shell
            load_prop(conf_module, "SSH_PROGRAM", config.ssh_program);
            load_prop(conf_module, "SSHPASS_PROGRAM", config.sshpass_program);
            load_prop(conf_module, "SSH_OPTIONS", config.ssh_options);
            load_prop(conf_module, "SSH_REQUIRE_PASSWORD", config.ssh_require_password);

            // 3. Privileged execution
            load_prop(conf_module, "SUDO_PROGRAM", config.sudo_program);
            load_prop(conf_module, "SUDO_SHELL", config.sudo_shell);
            load_prop(conf_module, "PASSWORD_PROMPT_PATTERNS", config.password_prompt_patterns);

            // 4. PTY
            load_prop(conf_module, "PTY_PREFERRED_SHELL", config.pty_preferred_shell);
            load_prop(conf_module, "PTY_FALLBACK_SHELL", config.pty_fallback_shell);
            load_prop(conf_module, "PTY_TERM", config.pty_term);

            load_prop(conf_module, "VERBOSE", config.verbose);

            // 5. Theme
            if (py::hasattr(conf_module, "THEME")) {
                py::dict theme = conf_module.attr("THEME").cast<py::dict>();
                load_dict_item(theme, "RESET", Theme::RESET);
                load_dict_item(theme, "STRUCTURE", Theme::STRUCTURE);
                load_dict_item(theme, "VALUE", Theme::VALUE);
                load_dict_item(theme, "SUCCESS", Theme::SUCCESS);
                load_dict_item(theme, "WARNING", Theme::WARNING);
                load_dict_item(theme, "ERROR", Theme::ERROR);
                load_dict_item(theme, "NOTICE", Theme::NOTICE);
            }

            core::log::notice("Config loaded successfully.");

        } catch (const std::exception& e) {
            core::log::error(std::format("Error reading config.py ({}). Using defaults.", e.what()));
        }
    }

} // namespace tabvisor::host
