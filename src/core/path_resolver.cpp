/**
 * @file path_resolver.cpp
 * @brief Local `cd` handling. Never spawns a process.
 */

#include "core/path_resolver.hpp"
#include "core/errors.hpp"
#include <cstdlib>
#include <format>
#include <pwd.h>
#include <unistd.h>

namespace tabvisor::core {

    namespace fs = std::filesystem;

    namespace {
        std::string_view trim(std::string_view s) {
            size_t start = s.find_first_not_of(" \t");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        // Normalized, without a trailing separator (except for "/" itself)
        fs::path clean(const fs::path& p) {
            fs::path n = p.lexically_normal();
            std::string s = n.string();
            while (s.size() > 1 && s.back() == '/') s.pop_back();
            return fs::path(s);
        }
    }

    std::optional<fs::path> home_directory() {
        const char* home = std::getenv("HOME");
        if (home && *home) return fs::path(home);

        struct passwd* pw = getpwuid(getuid());
        if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
        return std::nullopt;
    }

    bool is_cd_command(std::string_view command) {
        std::string_view t = trim(command);
        return t == "cd" || t.starts_with("cd ") || t.starts_with("cd\t");
    }

    std::string cd_argument(std::string_view command) {
        std::string_view t = trim(command);
        if (t.starts_with("cd")) t.remove_prefix(2);
        return std::string(trim(t));
    }

    fs::path resolve_cd_target(std::string_view arg, const fs::path& current, const std::optional<fs::path>& home) {
        fs::path target;

        if (arg.empty() || arg == "~" || arg == "~/") {
            if (!home) throw EngineError(ErrorKind::PathResolution, "Could not determine home directory");
            target = *home;
        } else if (arg.starts_with('~')) {
            if (!home) throw EngineError(ErrorKind::PathResolution, "Could not determine home directory");
            std::string_view rel = arg.substr(1);
            while (rel.starts_with('/')) rel.remove_prefix(1);
            target = rel.empty() ? *home : *home / rel;
        } else if (arg.starts_with('/')) {
            target = fs::path(arg);
        } else {
            target = current;
            size_t start = 0;
            while (start <= arg.size()) {
                size_t end = arg.find('/', start);
                if (end == std::string_view::npos) end = arg.size();
                std::string_view component = arg.substr(start, end - start);

                if (component == "..") {
                    fs::path normal = clean(target);
                    if (normal == normal.root_path()) {
                        throw EngineError(ErrorKind::PathResolution, "Already at root directory");
                    }
                    target = normal.parent_path();
                } else if (component != "." && !component.empty()) {
                    target /= component;
                }
                start = end + 1;
            }
        }

        target = clean(target);

        std::error_code ec;
        if (!fs::exists(target, ec)) {
            throw EngineError(ErrorKind::PathResolution, std::format("Directory not found: {}", arg));
        }
        if (!fs::is_directory(target, ec)) {
            throw EngineError(ErrorKind::PathResolution, std::format("Not a directory: {}", arg));
        }
        return target;
    }
}
