#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace counselscript::text {

struct TokenSpan {
    size_t offset;
    size_t size;
};

/**
 * Vocabulary-free approximation of a byte-pair tokenizer.
 *
 * Spans are contiguous and cover the whole input, so joining the text of
 * any consecutive run of spans reproduces that slice exactly.
 *   - ASCII letters: pieces of at most kMaxLetterPiece, one leading space folded in
 *   - digits: groups of at most three
 *   - newline runs: one token
 *   - other whitespace runs, ASCII punctuation: one token each
 *   - any non-ASCII codepoint (kana, kanji, emoji, ...): one token
 */
class Tokenizer {
public:
    static constexpr size_t kMaxLetterPiece = 6;
    static constexpr size_t kMaxDigitGroup = 3;

    std::vector<TokenSpan> tokenize(std::string_view text) const;

    int count_tokens(std::string_view text) const {
        return static_cast<int>(tokenize(text).size());
    }
};

} // namespace counselscript::text
