#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace counselscript {

struct KeywordHint {
    std::string keyword;
    std::string advice;
};

// Domain vocabulary used by the heuristics; every list is configurable
struct KeywordLexicon {
    std::vector<std::string> important;
    std::vector<std::string> positive;
    std::vector<std::string> negative;
    std::vector<std::string> tone_positive;       // key-difference tone comparison
    std::vector<KeywordHint> hints;               // ordered keyword -> advice
    std::string default_hint;
    size_t max_hints = 3;
    std::vector<std::string> stopwords;
    std::vector<std::string> action_indicators;
    std::vector<std::string> expertise_terms;
    std::vector<std::string> innovation_keywords;

    // Beauty-counseling vocabulary the heuristics were tuned on
    static KeywordLexicon defaults();
};

namespace text {

// Number of keywords that occur at least once
size_t count_present(std::string_view text, const std::vector<std::string>& keywords);

// Total non-overlapping occurrences of needle
size_t count_occurrences(std::string_view text, std::string_view needle);

size_t count_occurrences(std::string_view text, const std::vector<std::string>& needles);

// Kana/kanji runs of two or more codepoints and lowercase ASCII words of
// three or more letters, in text order, stopwords removed
std::vector<std::string> extract_keywords(std::string_view text,
                                          const std::vector<std::string>& stopwords);

// Most frequent keywords; ties keep first-seen order
std::vector<std::pair<std::string, size_t>> top_keywords(const std::vector<std::string>& texts,
                                                         const std::vector<std::string>& stopwords,
                                                         size_t limit);

} // namespace text
} // namespace counselscript
