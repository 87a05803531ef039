/**
 * @file config_loader.hpp
 * @brief Definition of the ConfigLoader class.
 *
 * Provides a static mechanism to load user configuration from a standard
 * Python file (`config.py`). This design allows for rich, scriptable configuration
 * without needing a complex parser in C++.
 */

#pragma once
#include <string>

namespace tabvisor::core {
    struct Config; // Forward declaration
}

namespace tabvisor::host {

    /**
     * @class ConfigLoader
     * @brief Static helper to bridge C++ configuration with Python scripts.
     */
    class ConfigLoader {
    public:
        /**
         * @brief Loads runtime configuration from a config.py file into the Config struct.
         *
         * Requires the embedded interpreter to be running (see PluginHost).
         * Adds the target directory to sys.path, imports the `config` module and
         * reflects its upper-case variables into the C++ Config struct and Theme.
         *
         * @param config The configuration object to populate.
         * @param path Absolute path to the directory containing config.py.
         */
        static void load(core::Config& config, const std::string& path);
    };
}
