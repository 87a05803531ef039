#include "core/command_engine.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/pty_manager.hpp"
#include "core/session_registry.hpp"
#include "host/config_loader.hpp"
#include "host/console_sink.hpp"
#include "host/plugin_host.hpp"
#include "host/repl.hpp"
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;
using namespace tabvisor;

int main() {
    // 1. Path Setup
    // Get the baked-in absolute path to the project root
#ifdef TABVISOR_ROOT
    fs::path project_root = TABVISOR_ROOT;
#else
    fs::path project_root = fs::current_path().parent_path();
#endif
    fs::path scripts_path = project_root / "src" / "py_scripts";
    fs::path config_path = project_root / "config";

    if (!fs::exists(scripts_path)) {
        core::log::warn(std::format("Warning: Could not find Python scripts at: {}", scripts_path.string()));
    }

    // 2. Configuration & Extensions (main thread holds the GIL here)
    host::PluginHost plugins;
    core::Config config;
    host::ConfigLoader::load(config, config_path.string());
    core::log::set_verbose(config.verbose);
    plugins.load_extensions(scripts_path.string());
    plugins.release_gil();

    // 3. Core components, shared with every worker thread
    auto sink = std::make_shared<host::ConsoleEventSink>();
    sink->attach_plugins(&plugins);

    auto registry = std::make_shared<core::SessionRegistry>();
    {
        core::CommandEngine engine(registry, sink, config);
        core::PtyManager ptys(sink, config);

        core::log::success("tabvisor has been started. Type ':q' or ':exit' to exit.");

        host::Repl repl(engine, ptys);
        repl.run(std::cin);
    }

    // Workers still running may emit after this point; they only reach the console
    sink->detach_plugins();

    core::log::notice("Session ended.");
    return 0;
}
