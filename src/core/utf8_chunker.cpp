/**
 * @file utf8_chunker.cpp
 * @brief UTF-8 validation and boundary-safe chunking for PTY output.
 */

#include "core/utf8_chunker.hpp"
#include <algorithm>
#include <utility>

namespace tabvisor::core {

    namespace {
        constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

        bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

        /**
         * @brief Validates the sequence starting at s[i].
         * @return {length, ok}. When !ok, length is the number of bytes forming
         *         the invalid prefix (0 means "truncated at end of buffer").
         */
        std::pair<size_t, bool> sequence_at(std::string_view s, size_t i) {
            auto c = static_cast<unsigned char>(s[i]);
            if (c < 0x80) return {1, true};

            size_t need;
            unsigned char lo = 0x80, hi = 0xBF; // allowed range for the 2nd byte
            if (c >= 0xC2 && c <= 0xDF) {
                need = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                need = 3;
                if (c == 0xE0) lo = 0xA0;       // overlong
                else if (c == 0xED) hi = 0x9F;  // surrogates
            } else if (c >= 0xF0 && c <= 0xF4) {
                need = 4;
                if (c == 0xF0) lo = 0x90;       // overlong
                else if (c == 0xF4) hi = 0x8F;  // > U+10FFFF
            } else {
                return {1, false};
            }

            for (size_t k = 1; k < need; ++k) {
                if (i + k >= s.size()) return {0, false};
                auto b = static_cast<unsigned char>(s[i + k]);
                bool ok = (k == 1) ? (b >= lo && b <= hi) : is_cont(b);
                if (!ok) return {k, false};
            }
            return {need, true};
        }
    }

    Utf8Check check_utf8(std::string_view bytes) {
        size_t i = 0;
        while (i < bytes.size()) {
            auto [len, ok] = sequence_at(bytes, i);
            if (!ok) {
                Utf8Check check{i, std::nullopt};
                if (len > 0) check.error_len = len;
                return check;
            }
            i += len;
        }
        return {bytes.size(), std::nullopt};
    }

    std::string utf8_lossy(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size());
        while (!bytes.empty()) {
            Utf8Check check = check_utf8(bytes);
            out.append(bytes.substr(0, check.valid_up_to));
            if (check.complete(bytes.size())) break;

            out.append(kReplacement);
            size_t skip = check.error_len.value_or(bytes.size() - check.valid_up_to);
            bytes.remove_prefix(check.valid_up_to + skip);
        }
        return out;
    }

    std::vector<std::string> Utf8Chunker::feed(std::string_view bytes) {
        std::vector<std::string> chunks;
        pending_.append(bytes);

        while (!pending_.empty()) {
            Utf8Check check = check_utf8(pending_);
            if (check.complete(pending_.size())) {
                chunks.push_back(std::move(pending_));
                pending_.clear();
                break;
            }

            if (check.valid_up_to > 0) {
                chunks.push_back(pending_.substr(0, check.valid_up_to));
                pending_.erase(0, check.valid_up_to);
            }

            // Truncated tail: wait for the rest of the sequence
            if (!check.error_len) break;

            size_t invalid_len = std::min(*check.error_len, pending_.size());
            chunks.push_back(utf8_lossy(std::string_view(pending_).substr(0, invalid_len)));
            pending_.erase(0, invalid_len);
        }
        return chunks;
    }

    std::optional<std::string> Utf8Chunker::finish() {
        if (pending_.empty()) return std::nullopt;
        std::string out = utf8_lossy(pending_);
        pending_.clear();
        return out;
    }
}
