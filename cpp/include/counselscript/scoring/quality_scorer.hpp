#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "counselscript/generation/script_parser.hpp"
#include "counselscript/text/keywords.hpp"
#include "counselscript/types.hpp"

namespace counselscript {

// ============================================================================
// Inputs
// ============================================================================

struct SuccessPattern {
    std::string name;
    std::vector<std::string> keywords;
    std::vector<std::string> improvement_suggestions;
};

struct SuccessElement {
    std::string name;
    std::vector<std::string> keywords;
    std::vector<std::string> patterns;          // ECMAScript regex, matched case-insensitively
    std::vector<std::string> improvement_suggestions;
};

// Statistics about the data the script was generated from; unset fields take defaults
struct SourceQuality {
    std::optional<double> completeness;
    std::optional<double> consistency;
    std::optional<double> accuracy;
    size_t sample_size = 0;
    std::optional<double> success_rate_variance;
    std::optional<double> confidence_interval_width;
    std::optional<double> data_recency_days;
    size_t counselor_diversity = 0;
};

struct ScoringBaseData {
    std::vector<SuccessPattern> success_patterns;
    std::vector<GeneratedScript> historical_scripts;
    std::vector<SuccessElement> success_elements;
    SourceQuality source_quality;
};

// ============================================================================
// Sub-reports
// ============================================================================

struct PatternCoverage {
    bool covered = false;
    double coverage_score = 0.0;                // fraction of keywords present
    std::vector<std::string> matching_elements;
};

struct CoveredPattern {
    std::string name;
    double coverage_score = 0.0;
    std::vector<std::string> key_elements;      // first three keywords
};

struct MissingPattern {
    std::string name;
    std::vector<std::string> missing_elements;
    std::vector<std::string> suggestions;
};

struct CoverageReport {
    double coverage_percentage = 0.0;           // 0..100
    std::vector<CoveredPattern> covered_patterns;
    std::vector<MissingPattern> missing_patterns;
    std::map<std::string, PatternCoverage> coverage_details;
    size_t total_patterns_analyzed = 0;

    double score() const { return coverage_percentage / 100.0; }
};

struct NoveltyReport {
    double novelty_score = 1.0;
    double max_similarity = 0.0;
    double similarity_to_past = 0.0;            // mean Jaccard over the history
    std::vector<std::string> unique_elements;
    std::vector<std::string> innovation_areas;
    size_t comparison_count = 0;
};

struct MatchedElement {
    std::string name;
    double strength = 0.0;
    size_t keyword_matches = 0;
    size_t pattern_matches = 0;
};

struct MissingElement {
    std::string name;
    double strength = 0.0;
    std::vector<std::string> recommendations;
};

struct SuccessMatchingReport {
    double matching_rate = 0.0;
    std::vector<MatchedElement> matched_elements;
    std::vector<MissingElement> missing_elements;
    std::map<std::string, double> element_strength;
    size_t total_elements_analyzed = 0;
};

enum class RecommendationStrength { High, Medium, Conditional, Caution };

const char* recommendation_strength_name(RecommendationStrength strength);

struct ReliabilityReport {
    double confidence_score = 0.0;
    double data_quality_score = 0.0;
    double sample_size_adequacy = 0.0;
    double statistical_reliability = 0.0;
    RecommendationStrength recommendation_strength = RecommendationStrength::Caution;
    std::vector<std::string> reliability_factors;
};

struct ContentMetrics {
    size_t word_count = 0;
    size_t sentence_count = 0;
    double avg_sentence_length = 0.0;
    size_t character_count = 0;
    size_t paragraph_count = 0;
};

struct ContentQualityReport {
    double overall_score = 0.0;
    double readability_score = 0.0;
    double actionability_score = 0.0;
    double structure_score = 0.0;
    double expertise_score = 0.0;
    ContentMetrics content_metrics;
    std::vector<std::string> missing_phases;
    std::vector<std::string> improvement_suggestions;
};

struct ImprovementPriority {
    std::string area;
    double current_score = 0.0;
    double improvement_potential = 0.0;
    double impact_weight = 0.0;
    double priority_score = 0.0;
};

struct DetailedAnalysis {
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    std::vector<std::string> recommendations;
    std::vector<std::string> key_insights;
    std::vector<ImprovementPriority> improvement_priority;   // highest priority first
};

struct ScriptQualityReport {
    CoverageReport coverage;
    NoveltyReport novelty;
    SuccessMatchingReport success_matching;
    ReliabilityReport reliability;
    ContentQualityReport content_quality;
    double overall_quality = 0.0;
    DetailedAnalysis detailed_analysis;
    TimePoint analyzed_at{};
    double analysis_duration_ms = 0.0;
};

/**
 * Heuristic quality assessment of a generated improvement script.
 *
 * Overall quality weights: coverage 0.25, success-element matching 0.30,
 * content 0.25, novelty 0.15, reliability 0.05. Every sub-score is in
 * [0, 1]; coverage is additionally reported as a percentage.
 */
class QualityScorer {
public:
    explicit QualityScorer(KeywordLexicon lexicon = KeywordLexicon::defaults());

    ScriptQualityReport score(const GeneratedScript& script, const ScoringBaseData& base_data) const;

    CoverageReport analyze_coverage(const GeneratedScript& script,
                                    const std::vector<SuccessPattern>& patterns) const;

    NoveltyReport calculate_novelty(const GeneratedScript& script,
                                    const std::vector<GeneratedScript>& history) const;

    SuccessMatchingReport match_success_elements(const GeneratedScript& script,
                                                 const std::vector<SuccessElement>& elements) const;

    static ReliabilityReport calculate_reliability(const SourceQuality& source);

    ContentQualityReport analyze_content_quality(const GeneratedScript& script) const;

    // Jaccard index of lower-cased whitespace token sets; 0 when either side is empty
    static double text_similarity(const std::string& a, const std::string& b);

    static double readability_score(const std::string& text);
    double actionability_score(const std::string& text) const;
    static double structure_score(const GeneratedScript& script, std::vector<std::string>* missing_phases = nullptr);
    double expertise_score(const std::string& text) const;

private:
    DetailedAnalysis build_detailed_analysis(const ScriptQualityReport& report) const;

    KeywordLexicon lexicon_;
};

} // namespace counselscript
