/**
 * @file test_utf8_chunker.cpp
 * @brief Tests for UTF-8 validation and boundary-safe chunking of PTY output.
 */

#include "test_harness.hpp"
#include "core/utf8_chunker.hpp"
#include <string>
#include <vector>

using namespace tabvisor::core;

static const std::string kReplacement = "\xEF\xBF\xBD";

TEST(test_ascii_passes_through) {
    Utf8Chunker chunker;
    auto out = chunker.feed("ls -la\r\n");
    ASSERT_TRUE(out.size() == 1 && out[0] == "ls -la\r\n", "ASCII emitted as one chunk");
    ASSERT_TRUE(chunker.pending() == 0, "Nothing pending");
    PASS("ASCII input is emitted unchanged");
}

TEST(test_split_three_byte_character) {
    Utf8Chunker chunker;
    // U+20AC EURO SIGN = E2 82 AC
    auto first = chunker.feed("\xE2\x82");
    ASSERT_TRUE(first.empty(), "Incomplete prefix is held back");
    ASSERT_TRUE(chunker.pending() == 2, "Two bytes pending");

    auto second = chunker.feed("\xAC");
    ASSERT_TRUE(second.size() == 1, "Exactly one chunk once complete");
    ASSERT_TRUE(second[0] == "\xE2\x82\xAC", "Chunk holds the whole character");
    PASS("Character split across reads is emitted once, intact");
}

TEST(test_split_four_byte_character_over_three_reads) {
    Utf8Chunker chunker;
    // U+1F600 = F0 9F 98 80
    ASSERT_TRUE(chunker.feed("ab\xF0").size() == 1, "Valid prefix emitted");
    ASSERT_TRUE(chunker.feed("\x9F\x98").empty(), "Still incomplete");
    auto out = chunker.feed("\x80z");
    ASSERT_TRUE(out.size() == 1 && out[0] == "\xF0\x9F\x98\x80z", "Completed character plus tail");
    PASS("Four-byte character survives three reads");
}

TEST(test_invalid_byte_becomes_replacement) {
    Utf8Chunker chunker;
    auto out = chunker.feed("ok\xFFgo");
    ASSERT_TRUE(out.size() == 3, "Valid, replacement, valid");
    ASSERT_TRUE(out[0] == "ok", "Leading text");
    ASSERT_TRUE(out[1] == kReplacement, "Invalid byte replaced");
    ASSERT_TRUE(out[2] == "go", "Trailing text");
    ASSERT_TRUE(chunker.pending() == 0, "Invalid bytes never block the stream");
    PASS("Invalid bytes are emitted as U+FFFD");
}

TEST(test_broken_sequence_followed_by_ascii) {
    Utf8Chunker chunker;
    auto out = chunker.feed("\xE2\x82" "A");
    ASSERT_TRUE(out.size() == 2, "Replacement then text");
    ASSERT_TRUE(out[0] == kReplacement, "Broken sequence replaced once");
    ASSERT_TRUE(out[1] == "A", "Following byte kept");
    PASS("A truncated sequence interrupted by ASCII is replaced");
}

TEST(test_finish_flushes_lossily) {
    Utf8Chunker chunker;
    auto out = chunker.feed("x\xF0\x9F");
    ASSERT_TRUE(out.size() == 1 && out[0] == "x", "Complete prefix emitted");

    auto rest = chunker.finish();
    ASSERT_TRUE(rest.has_value() && *rest == kReplacement, "Dangling bytes flushed as U+FFFD");
    ASSERT_FALSE(chunker.finish().has_value(), "Second finish has nothing left");
    PASS("finish() flushes pending bytes");
}

TEST(test_check_utf8) {
    auto ok = check_utf8("h\xC3\xA9llo");
    ASSERT_TRUE(ok.complete(6) && !ok.error_len, "Valid text");

    auto truncated = check_utf8("a\xE2\x82");
    ASSERT_TRUE(truncated.valid_up_to == 1 && !truncated.error_len, "Truncated tail is not an error");

    auto overlong = check_utf8("\xC0\xAF");
    ASSERT_TRUE(overlong.valid_up_to == 0 && overlong.error_len == 1u, "Overlong lead byte rejected");

    auto surrogate = check_utf8("\xED\xA0\x80");
    ASSERT_TRUE(surrogate.valid_up_to == 0 && surrogate.error_len == 1u, "Encoded surrogate rejected");

    auto stray = check_utf8("ab\x80");
    ASSERT_TRUE(stray.valid_up_to == 2 && stray.error_len == 1u, "Stray continuation byte rejected");
    PASS("check_utf8 distinguishes truncation from invalid input");
}

TEST(test_utf8_lossy) {
    ASSERT_TRUE(utf8_lossy("plain") == "plain", "Valid input unchanged");
    ASSERT_TRUE(utf8_lossy("a\xFF" "b") == "a" + kReplacement + "b", "Invalid byte replaced");
    ASSERT_TRUE(utf8_lossy("") .empty(), "Empty input");
    PASS("utf8_lossy replaces invalid sequences");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << "     UTF-8 Chunker Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    test_ascii_passes_through();
    test_split_three_byte_character();
    test_split_four_byte_character_over_three_reads();
    test_invalid_byte_becomes_replacement();
    test_broken_sequence_followed_by_ascii();
    test_finish_flushes_lossily();
    test_check_utf8();
    test_utf8_lossy();

    return report_results("UTF-8 chunker");
}
