/**
 * @file utf8_chunker.hpp
 * @brief Splits a raw byte stream into chunks that never cut a UTF-8 sequence.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabvisor::core {

    /**
     * @brief Outcome of validating a byte buffer as UTF-8.
     *
     * valid_up_to is the length of the longest valid prefix. If the rest is
     * invalid, error_len is the size of the offending sequence; it is empty
     * when the buffer merely ends in the middle of a possibly valid sequence.
     */
    struct Utf8Check {
        size_t valid_up_to = 0;
        std::optional<size_t> error_len;
        [[nodiscard]] bool complete(size_t total) const { return valid_up_to == total; }
    };

    [[nodiscard]] Utf8Check check_utf8(std::string_view bytes);

    /** @brief Decodes bytes, replacing every invalid or truncated sequence with U+FFFD. */
    [[nodiscard]] std::string utf8_lossy(std::string_view bytes);

    class Utf8Chunker {
    public:
        /**
         * @brief Appends raw bytes and returns the text that is safe to emit.
         * An incomplete trailing sequence is kept for the next call; invalid
         * sequences are emitted as U+FFFD so they never block the stream.
         */
        std::vector<std::string> feed(std::string_view bytes);

        /** @brief Flushes whatever is pending (lossily). Used on EOF / read error. */
        std::optional<std::string> finish();

        [[nodiscard]] size_t pending() const { return pending_.size(); }

    private:
        std::string pending_;
    };
}
