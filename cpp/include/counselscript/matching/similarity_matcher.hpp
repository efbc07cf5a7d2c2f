#pragma once

#include <optional>
#include <string>
#include <vector>

#include "counselscript/config.hpp"
#include "counselscript/embedding/embedding_engine.hpp"
#include "counselscript/store/vector_store.hpp"
#include "counselscript/text/keywords.hpp"

namespace counselscript {

struct MatchOptions {
    size_t top_k = 5;
    double similarity_threshold = 0.7;
    bool include_analysis = true;
    VectorFilter filter;

    static MatchOptions from_settings(const MatchingSettings& settings);
};

struct FailureAnalysis {
    std::string text;
    Vector embedding;           // first chunk only
    int token_count = 0;        // whole text
    int total_chunks = 1;
};

struct SuccessMatch {
    SuccessVectorRecord record;
    double similarity_score = 0.0;
    std::vector<std::string> improvement_hints;
    std::vector<std::string> key_differences;
};

struct SimilarityDistribution {
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;        // upper median
};

struct MatchSummary {
    size_t total_found = 0;
    double avg_similarity = 0.0;
    SimilarityDistribution distribution;
    std::vector<std::string> top_improvement_areas;     // most frequent missing keywords
};

struct MatchResult {
    FailureAnalysis failure_analysis;
    std::vector<SuccessMatch> similar_successes;        // descending similarity
    std::optional<MatchSummary> analysis_summary;
};

/**
 * Maps a failed conversation to the closest successful exemplars.
 *
 * Only the first chunk of a long failure text is embedded; the rest is
 * not used for the search. Hints and differences are keyword heuristics
 * driven by the lexicon.
 */
class SimilarityMatcher {
public:
    SimilarityMatcher(EmbeddingEngine& embedding, const VectorStore& store,
                      KeywordLexicon lexicon = KeywordLexicon::defaults());

    // Blank failure text yields no matches and no provider call
    MatchResult match_failure_to_success(const std::string& failure_text, const MatchOptions& options = {});

    // Hint-table advice for keywords the success text has and the failure text lacks
    std::vector<std::string> improvement_hints(const std::string& failure_text,
                                               const std::string& success_text) const;

    std::vector<std::string> key_differences(const std::string& failure_text,
                                             const std::string& success_text) const;

    MatchSummary summarize(const std::string& failure_text, const std::vector<SuccessMatch>& matches) const;

private:
    EmbeddingEngine& embedding_;
    const VectorStore& store_;
    KeywordLexicon lexicon_;
};

} // namespace counselscript
