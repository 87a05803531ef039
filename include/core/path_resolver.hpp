/**
 * @file path_resolver.hpp
 * @brief Resolution of local `cd` targets against a session's tracked directory.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tabvisor::core {

    /** @brief $HOME, falling back to the password database. */
    std::optional<std::filesystem::path> home_directory();

    /**
     * @brief Resolves the argument of a `cd` command.
     *
     * - empty, "~" or "~/"  -> home directory
     * - "~/rel"            -> home / rel
     * - "/abs"             -> as given (normalized)
     * - anything else      -> walked component by component from `current`;
     *                         ".." past the filesystem root is an error.
     *
     * The target must exist and be a directory.
     * Throws EngineError{PathResolution}.
     */
    std::filesystem::path resolve_cd_target(std::string_view arg,
                                            const std::filesystem::path& current,
                                            const std::optional<std::filesystem::path>& home);

    /** @brief True for "cd" and "cd <args>". */
    [[nodiscard]] bool is_cd_command(std::string_view command);

    /** @brief The argument part of a cd command, trimmed. */
    [[nodiscard]] std::string cd_argument(std::string_view command);
}
