#include "counselscript/matching/similarity_matcher.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/utf8.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace counselscript {

MatchOptions MatchOptions::from_settings(const MatchingSettings& settings) {
    MatchOptions options;
    options.top_k = static_cast<size_t>(std::max(1, settings.top_k));
    options.similarity_threshold = settings.similarity_threshold;
    return options;
}

SimilarityMatcher::SimilarityMatcher(EmbeddingEngine& embedding, const VectorStore& store, KeywordLexicon lexicon)
    : embedding_(embedding), store_(store), lexicon_(std::move(lexicon)) {}

MatchResult SimilarityMatcher::match_failure_to_success(const std::string& failure_text,
                                                        const MatchOptions& options) {
    MatchResult result;
    if (util::trim(failure_text).empty()) {
        LOG_WARN("Failure text is blank; nothing to match");
        result.failure_analysis.text = failure_text;
        result.failure_analysis.token_count = embedding_.count_tokens(failure_text);
        result.failure_analysis.total_chunks = 0;
        return result;
    }

    auto query = embedding_.embed_for_search(failure_text);
    result.failure_analysis.text = failure_text;
    result.failure_analysis.embedding = query.vector;
    result.failure_analysis.token_count = embedding_.count_tokens(failure_text);
    result.failure_analysis.total_chunks = query.total_chunks;
    if (query.total_chunks > 1) {
        LOG_DEBUG("Failure text spans ", query.total_chunks, " chunks; searching with the first only");
    }

    auto neighbors = store_.nearest_neighbors(query.vector, options.top_k, options.similarity_threshold,
                                              options.filter);
    for (auto& n : neighbors) {
        SuccessMatch m;
        m.record = std::move(n.record);
        m.similarity_score = n.similarity_score;
        result.similar_successes.push_back(std::move(m));
    }
    LOG_INFO("Failure-to-success search found ", result.similar_successes.size(), " matches above ",
             options.similarity_threshold);

    if (options.include_analysis && !result.similar_successes.empty()) {
        for (auto& m : result.similar_successes) {
            m.improvement_hints = improvement_hints(failure_text, m.record.chunk_text);
            m.key_differences = key_differences(failure_text, m.record.chunk_text);
        }
        result.analysis_summary = summarize(failure_text, result.similar_successes);
    }
    return result;
}

std::vector<std::string> SimilarityMatcher::improvement_hints(const std::string& failure_text,
                                                              const std::string& success_text) const {
    std::vector<std::string> hints;
    for (const auto& hint : lexicon_.hints) {
        if (hints.size() >= lexicon_.max_hints) break;
        if (hint.keyword.empty()) continue;
        if (success_text.find(hint.keyword) != std::string::npos &&
            failure_text.find(hint.keyword) == std::string::npos) {
            hints.push_back(hint.advice);
        }
    }
    if (hints.empty() && !lexicon_.default_hint.empty()) {
        hints.push_back(lexicon_.default_hint);
    }
    return hints;
}

std::vector<std::string> SimilarityMatcher::key_differences(const std::string& failure_text,
                                                            const std::string& success_text) const {
    std::vector<std::string> differences;

    const double failure_length = static_cast<double>(util::codepoint_length(failure_text));
    const double success_length = static_cast<double>(util::codepoint_length(success_text));
    if (success_length > failure_length * 1.5) {
        differences.push_back("The success example explains things in more detail");
    } else if (success_length < failure_length * 0.7) {
        differences.push_back("The success example is more concise and focused");
    }

    if (text::count_present(success_text, lexicon_.tone_positive) >
        text::count_present(failure_text, lexicon_.tone_positive)) {
        differences.push_back("The success example uses a more positive tone");
    }
    return differences;
}

MatchSummary SimilarityMatcher::summarize(const std::string& failure_text,
                                          const std::vector<SuccessMatch>& matches) const {
    MatchSummary summary;
    summary.total_found = matches.size();
    if (matches.empty()) return summary;

    std::vector<double> similarities;
    similarities.reserve(matches.size());
    for (const auto& m : matches) similarities.push_back(m.similarity_score);

    double sum = 0.0;
    for (double s : similarities) sum += s;
    summary.avg_similarity = sum / static_cast<double>(similarities.size());

    std::sort(similarities.begin(), similarities.end());
    summary.distribution.min = similarities.front();
    summary.distribution.max = similarities.back();
    summary.distribution.median = similarities[similarities.size() / 2];

    const auto failure_keywords = text::extract_keywords(failure_text, lexicon_.stopwords);
    const std::set<std::string> failure_set(failure_keywords.begin(), failure_keywords.end());

    std::map<std::string, size_t> missing;
    for (const auto& m : matches) {
        const auto success_keywords = text::extract_keywords(m.record.chunk_text, lexicon_.stopwords);
        const std::set<std::string> success_set(success_keywords.begin(), success_keywords.end());
        for (const auto& kw : success_set) {
            if (!failure_set.count(kw)) ++missing[kw];
        }
    }

    std::vector<std::pair<std::string, size_t>> ranked(missing.begin(), missing.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    for (size_t i = 0; i < ranked.size() && i < 5; ++i) {
        summary.top_improvement_areas.push_back(ranked[i].first);
    }
    return summary;
}

} // namespace counselscript
