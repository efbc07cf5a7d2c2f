#include "counselscript/text/tokenizer.hpp"
#include "counselscript/util/utf8.hpp"

namespace counselscript::text {

namespace {

enum class Kind { Letter, Digit, Newline, Space, Other };

Kind classify(uint32_t cp) {
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) return Kind::Letter;
    if (cp >= '0' && cp <= '9') return Kind::Digit;
    if (cp == '\n' || cp == '\r') return Kind::Newline;
    if (cp == ' ' || cp == '\t' || cp == '\f' || cp == '\v') return Kind::Space;
    return Kind::Other;
}

} // namespace

std::vector<TokenSpan> Tokenizer::tokenize(std::string_view text) const {
    std::vector<TokenSpan> spans;
    if (text.empty()) return spans;

    const auto cps = util::decode_utf8(text);
    const size_t n = cps.size();
    spans.reserve(n / 2 + 1);

    auto span_of = [&](size_t first, size_t last) {
        // [first, last) in codepoint indices
        size_t begin = cps[first].offset;
        size_t end = cps[last - 1].offset + cps[last - 1].size;
        spans.push_back({begin, end - begin});
    };

    size_t i = 0;
    while (i < n) {
        Kind kind = classify(cps[i].value);

        if (kind == Kind::Space) {
            size_t j = i;
            while (j < n && classify(cps[j].value) == Kind::Space) ++j;
            // A single space directly before a word belongs to that word
            bool fold = j < n && classify(cps[j].value) == Kind::Letter && cps[j - 1].value == ' ';
            size_t run_end = fold ? j - 1 : j;
            if (run_end > i) span_of(i, run_end);
            i = run_end;
            if (fold) {
                size_t k = j;
                while (k < n && k - j < kMaxLetterPiece && classify(cps[k].value) == Kind::Letter) ++k;
                span_of(i, k);
                i = k;
            }
            continue;
        }

        size_t j = i + 1;
        switch (kind) {
            case Kind::Letter:
                while (j < n && j - i < kMaxLetterPiece && classify(cps[j].value) == Kind::Letter) ++j;
                break;
            case Kind::Digit:
                while (j < n && j - i < kMaxDigitGroup && classify(cps[j].value) == Kind::Digit) ++j;
                break;
            case Kind::Newline:
                while (j < n && classify(cps[j].value) == Kind::Newline) ++j;
                break;
            default:
                break;
        }
        span_of(i, j);
        i = j;
    }

    return spans;
}

} // namespace counselscript::text
