#include "counselscript/scoring/quality_scorer.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/utf8.hpp"

#include <algorithm>
#include <chrono>
#include <regex>
#include <set>

namespace counselscript {

namespace {

constexpr double kCoverageWeight = 0.25;
constexpr double kMatchingWeight = 0.30;
constexpr double kContentWeight = 0.25;
constexpr double kNoveltyWeight = 0.15;
constexpr double kReliabilityWeight = 0.05;

constexpr double kPatternCoverageThreshold = 0.5;
constexpr double kElementMatchThreshold = 0.3;

bool contains_ci(const std::string& lowered_text, const std::string& keyword) {
    if (keyword.empty()) return false;
    return lowered_text.find(util::to_lower_ascii(keyword)) != std::string::npos;
}

std::set<std::string> word_set(const std::string& text) {
    auto words = util::split_whitespace(util::to_lower_ascii(text));
    return {words.begin(), words.end()};
}

bool is_sentence_terminator(uint32_t cp) {
    return cp == 0x3002 || cp == '.' || cp == '!' || cp == '?' || cp == 0xFF01 || cp == 0xFF1F;
}

size_t count_sentences(const std::string& text) {
    size_t sentences = 0;
    bool has_content = false;
    for (const auto& c : util::decode_utf8(text)) {
        const uint32_t cp = c.value;
        if (is_sentence_terminator(cp)) {
            if (has_content) ++sentences;
            has_content = false;
        } else if (cp != ' ' && cp != '\t' && cp != '\n' && cp != '\r' && cp != 0x3000) {
            has_content = true;
        }
    }
    if (has_content) ++sentences;
    return sentences;
}

size_t trimmed_length(const std::string& text) {
    return util::codepoint_length(util::trim(text));
}

} // namespace

const char* recommendation_strength_name(RecommendationStrength strength) {
    switch (strength) {
        case RecommendationStrength::High:        return "high";
        case RecommendationStrength::Medium:      return "medium";
        case RecommendationStrength::Conditional: return "conditional";
        case RecommendationStrength::Caution:     return "caution";
    }
    return "caution";
}

QualityScorer::QualityScorer(KeywordLexicon lexicon) : lexicon_(std::move(lexicon)) {}

// ============================================================================
// Coverage
// ============================================================================

CoverageReport QualityScorer::analyze_coverage(const GeneratedScript& script,
                                               const std::vector<SuccessPattern>& patterns) const {
    CoverageReport report;
    report.total_patterns_analyzed = patterns.size();
    if (patterns.empty()) return report;

    const std::string text = util::to_lower_ascii(script.all_text());

    for (const auto& pattern : patterns) {
        PatternCoverage detail;
        std::vector<std::string> missing;
        for (const auto& kw : pattern.keywords) {
            if (contains_ci(text, kw)) {
                detail.matching_elements.push_back(kw);
            } else {
                missing.push_back(kw);
            }
        }
        if (!pattern.keywords.empty()) {
            detail.coverage_score = static_cast<double>(detail.matching_elements.size()) /
                                    static_cast<double>(pattern.keywords.size());
            detail.covered = detail.coverage_score >= kPatternCoverageThreshold;
        }

        if (detail.covered) {
            CoveredPattern c;
            c.name = pattern.name;
            c.coverage_score = detail.coverage_score;
            c.key_elements.assign(pattern.keywords.begin(),
                                  pattern.keywords.begin() + static_cast<std::ptrdiff_t>(
                                      std::min<size_t>(3, pattern.keywords.size())));
            report.covered_patterns.push_back(std::move(c));
        } else {
            report.missing_patterns.push_back({pattern.name, std::move(missing), pattern.improvement_suggestions});
        }
        report.coverage_details[pattern.name] = std::move(detail);
    }

    report.coverage_percentage = 100.0 * static_cast<double>(report.covered_patterns.size()) /
                                 static_cast<double>(patterns.size());
    return report;
}

// ============================================================================
// Novelty
// ============================================================================

double QualityScorer::text_similarity(const std::string& a, const std::string& b) {
    const auto wa = word_set(a);
    const auto wb = word_set(b);
    if (wa.empty() || wb.empty()) return 0.0;

    size_t common = 0;
    for (const auto& w : wa) {
        if (wb.count(w)) ++common;
    }
    const size_t total = wa.size() + wb.size() - common;
    return static_cast<double>(common) / static_cast<double>(total);
}

NoveltyReport QualityScorer::calculate_novelty(const GeneratedScript& script,
                                               const std::vector<GeneratedScript>& history) const {
    NoveltyReport report;
    report.comparison_count = history.size();
    if (history.empty()) return report;

    const std::string current = script.all_text();
    double sum = 0.0;
    std::set<std::string> historical_words;
    for (const auto& past : history) {
        const std::string past_text = past.all_text();
        const double sim = text_similarity(current, past_text);
        report.max_similarity = std::max(report.max_similarity, sim);
        sum += sim;
        auto words = word_set(past_text);
        historical_words.insert(words.begin(), words.end());
    }
    report.similarity_to_past = sum / static_cast<double>(history.size());
    report.novelty_score = 1.0 - report.max_similarity;

    std::set<std::string> seen;
    for (const auto& w : util::split_whitespace(util::to_lower_ascii(current))) {
        if (report.unique_elements.size() >= 10) break;
        if (util::codepoint_length(w) < 3 || historical_words.count(w) || !seen.insert(w).second) continue;
        report.unique_elements.push_back(w);
    }

    for (const auto& kw : lexicon_.innovation_keywords) {
        if (!kw.empty() && current.find(kw) != std::string::npos) {
            report.innovation_areas.push_back(kw);
        }
    }
    return report;
}

// ============================================================================
// Success elements
// ============================================================================

SuccessMatchingReport QualityScorer::match_success_elements(const GeneratedScript& script,
                                                            const std::vector<SuccessElement>& elements) const {
    SuccessMatchingReport report;
    report.total_elements_analyzed = elements.size();
    if (elements.empty()) return report;

    const std::string text = script.combined_text();
    const std::string lowered = util::to_lower_ascii(text);

    for (const auto& element : elements) {
        size_t keyword_matches = 0;
        for (const auto& kw : element.keywords) {
            if (contains_ci(lowered, kw)) ++keyword_matches;
        }

        size_t pattern_matches = 0;
        for (const auto& pattern : element.patterns) {
            try {
                const std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
                if (std::regex_search(text, re)) ++pattern_matches;
            } catch (const std::regex_error& e) {
                LOG_WARN("Ignoring invalid pattern '", pattern, "' for element ", element.name, ": ", e.what());
            }
        }

        const double keyword_rate = element.keywords.empty()
            ? 0.0 : static_cast<double>(keyword_matches) / static_cast<double>(element.keywords.size());
        const double pattern_rate = element.patterns.empty()
            ? 0.0 : static_cast<double>(pattern_matches) / static_cast<double>(element.patterns.size());
        const double strength = (keyword_rate + pattern_rate) / 2.0;
        report.element_strength[element.name] = strength;

        if (strength >= kElementMatchThreshold) {
            report.matched_elements.push_back({element.name, strength, keyword_matches, pattern_matches});
        } else {
            report.missing_elements.push_back({element.name, strength, element.improvement_suggestions});
        }
    }

    report.matching_rate = static_cast<double>(report.matched_elements.size()) /
                           static_cast<double>(elements.size());
    return report;
}

// ============================================================================
// Reliability
// ============================================================================

ReliabilityReport QualityScorer::calculate_reliability(const SourceQuality& source) {
    ReliabilityReport report;

    report.data_quality_score = (source.completeness.value_or(0.8) +
                                 source.consistency.value_or(0.8) +
                                 source.accuracy.value_or(0.8)) / 3.0;

    if (source.sample_size >= 100) report.sample_size_adequacy = 1.0;
    else if (source.sample_size >= 50) report.sample_size_adequacy = 0.8;
    else if (source.sample_size >= 20) report.sample_size_adequacy = 0.6;
    else if (source.sample_size >= 10) report.sample_size_adequacy = 0.4;
    else report.sample_size_adequacy = 0.2;

    const double variance_score = std::max(0.0, 1.0 - source.success_rate_variance.value_or(0.1) * 2.0);
    const double interval_score = std::max(0.0, 1.0 - source.confidence_interval_width.value_or(0.2));
    report.statistical_reliability = (variance_score + interval_score) / 2.0;

    report.confidence_score = report.data_quality_score * 0.4 +
                              report.sample_size_adequacy * 0.3 +
                              report.statistical_reliability * 0.3;

    if (report.confidence_score >= 0.8) report.recommendation_strength = RecommendationStrength::High;
    else if (report.confidence_score >= 0.6) report.recommendation_strength = RecommendationStrength::Medium;
    else if (report.confidence_score >= 0.4) report.recommendation_strength = RecommendationStrength::Conditional;
    else report.recommendation_strength = RecommendationStrength::Caution;

    if (source.sample_size >= 50) {
        report.reliability_factors.push_back("Sufficient sample size");
    }
    if (source.data_recency_days && *source.data_recency_days <= 30.0) {
        report.reliability_factors.push_back("Based on recent data");
    }
    if (source.success_rate_variance && *source.success_rate_variance < 0.1) {
        report.reliability_factors.push_back("Stable success-rate pattern");
    }
    if (source.counselor_diversity >= 3) {
        report.reliability_factors.push_back("Data from multiple counselors");
    }
    return report;
}

// ============================================================================
// Content quality
// ============================================================================

double QualityScorer::readability_score(const std::string& text) {
    const size_t words = util::split_whitespace(text).size();
    const size_t sentences = count_sentences(text);
    if (words == 0 || sentences == 0) return 0.0;

    const double avg = static_cast<double>(words) / static_cast<double>(sentences);
    if (avg >= 10.0 && avg <= 20.0) return 1.0;
    if (avg < 10.0) return avg / 10.0;
    return std::max(0.3, 20.0 / avg);
}

double QualityScorer::actionability_score(const std::string& text) const {
    const size_t words = util::split_whitespace(text).size();
    if (words == 0) return 0.0;

    const double density = static_cast<double>(text::count_occurrences(text, lexicon_.action_indicators)) /
                           static_cast<double>(words) * 100.0;
    if (density >= 2.0 && density <= 5.0) return 1.0;
    if (density < 2.0) return density / 2.0;
    return std::max(0.5, 5.0 / density);
}

double QualityScorer::structure_score(const GeneratedScript& script, std::vector<std::string>* missing_phases) {
    const std::string* sections[] = {
        &script.success_factors_analysis,
        &script.improvement_points,
        &script.counseling_script,
        &script.practical_improvements,
    };
    size_t present_sections = 0;
    for (const auto* s : sections) {
        if (trimmed_length(*s) > 30) ++present_sections;
    }

    const std::pair<const char*, const std::string*> phases[] = {
        {"opening", &script.phases.opening},
        {"needs assessment", &script.phases.needs_assessment},
        {"solution proposal", &script.phases.solution_proposal},
        {"closing", &script.phases.closing},
    };
    size_t present_phases = 0;
    for (const auto& [name, body] : phases) {
        if (trimmed_length(*body) > 20) {
            ++present_phases;
        } else if (missing_phases) {
            missing_phases->push_back(name);
        }
    }

    return (present_sections / 4.0 + present_phases / 4.0) / 2.0;
}

double QualityScorer::expertise_score(const std::string& text) const {
    const size_t words = util::split_whitespace(text).size();
    if (words == 0) return 0.0;

    const double density = static_cast<double>(text::count_occurrences(text, lexicon_.expertise_terms)) /
                           static_cast<double>(words) * 100.0;
    if (density >= 1.0 && density <= 3.0) return 1.0;
    if (density < 1.0) return density;
    return std::max(0.6, 3.0 / density);
}

ContentQualityReport QualityScorer::analyze_content_quality(const GeneratedScript& script) const {
    ContentQualityReport report;
    const std::string text = script.all_text();

    report.readability_score = readability_score(text);
    report.actionability_score = actionability_score(text);
    report.structure_score = structure_score(script, &report.missing_phases);
    report.expertise_score = expertise_score(text);
    report.overall_score = report.readability_score * 0.25 +
                           report.actionability_score * 0.30 +
                           report.structure_score * 0.25 +
                           report.expertise_score * 0.20;

    auto& m = report.content_metrics;
    m.word_count = util::split_whitespace(text).size();
    m.sentence_count = count_sentences(text);
    m.avg_sentence_length = m.sentence_count ? static_cast<double>(m.word_count) / m.sentence_count : 0.0;
    m.character_count = util::codepoint_length(text);
    m.paragraph_count = text::count_occurrences(text, "\n\n") + 1;

    if (report.readability_score < 0.7) {
        report.improvement_suggestions.push_back("Make the text more concise and readable");
    }
    if (report.actionability_score < 0.7) {
        report.improvement_suggestions.push_back("Add concrete practical methods and techniques");
    }
    if (report.structure_score < 0.7) {
        report.improvement_suggestions.push_back("Reorganize the structure and fill in the missing sections");
    }
    if (report.expertise_score < 0.7) {
        report.improvement_suggestions.push_back("Use domain terminology appropriately to show expertise");
    }
    return report;
}

// ============================================================================
// Report
// ============================================================================

DetailedAnalysis QualityScorer::build_detailed_analysis(const ScriptQualityReport& report) const {
    DetailedAnalysis d;

    if (report.coverage.coverage_percentage > 75.0) {
        d.strengths.push_back("Covers the success patterns thoroughly");
    } else {
        d.weaknesses.push_back("Success pattern coverage is insufficient");
        d.recommendations.push_back("Add the elements of the missing success patterns");
    }

    if (report.novelty.novelty_score > 0.6) {
        d.strengths.push_back("Clearly differentiated from existing scripts");
    } else if (report.novelty.novelty_score < 0.3) {
        d.weaknesses.push_back("Too similar to existing scripts");
        d.recommendations.push_back("Consider a more original approach");
    }

    if (report.success_matching.matching_rate > 0.7) {
        d.strengths.push_back("Key success elements are included");
    } else {
        d.weaknesses.push_back("Key success elements are under-represented");
        const auto& missing = report.success_matching.missing_elements;
        for (size_t i = 0; i < missing.size() && i < 3; ++i) {
            d.recommendations.push_back("Strengthen the " + missing[i].name + " element");
        }
    }

    const auto& content = report.content_quality;
    if (content.readability_score > 0.7) {
        d.strengths.push_back("Readable and easy to follow");
    }
    if (content.actionability_score > 0.7) {
        d.strengths.push_back("Practical and concrete content");
    } else {
        d.weaknesses.push_back("Concreteness and practicality can be improved");
        d.recommendations.push_back("Add more concrete examples and techniques");
    }

    if (!content.missing_phases.empty()) {
        std::string phases;
        for (const auto& p : content.missing_phases) {
            if (!phases.empty()) phases += ", ";
            phases += p;
        }
        d.weaknesses.push_back("Counseling phases are missing: " + phases);
        d.recommendations.push_back("Add the missing counseling phases: " + phases);
    }

    if (report.overall_quality > 0.8) {
        d.key_insights.push_back("High-quality script that is ready for immediate use");
    } else if (report.overall_quality > 0.6) {
        d.key_insights.push_back("Good quality script with some room for improvement");
    } else {
        d.key_insights.push_back("Further improvement is needed to raise quality");
    }
    if (report.coverage.coverage_percentage > 80.0) {
        d.key_insights.push_back("Broad success-pattern coverage can serve diverse customer needs");
    }
    if (report.novelty.novelty_score > 0.7) {
        d.key_insights.push_back("Highly novel; expected to stand out from competitors");
    }

    auto priority = [](std::string area, double current, double weight) {
        return ImprovementPriority{std::move(area), current, 1.0 - current, weight, (1.0 - current) * weight};
    };
    d.improvement_priority = {
        priority("coverage", report.coverage.score(), 0.30),
        priority("success_elements", report.success_matching.matching_rate, 0.35),
        priority("content_quality", content.overall_score, 0.25),
        priority("novelty", report.novelty.novelty_score, 0.10),
    };
    std::stable_sort(d.improvement_priority.begin(), d.improvement_priority.end(),
                     [](const ImprovementPriority& a, const ImprovementPriority& b) {
                         return a.priority_score > b.priority_score;
                     });
    return d;
}

ScriptQualityReport QualityScorer::score(const GeneratedScript& script, const ScoringBaseData& base_data) const {
    const auto start = std::chrono::steady_clock::now();

    ScriptQualityReport report;
    report.coverage = analyze_coverage(script, base_data.success_patterns);
    report.novelty = calculate_novelty(script, base_data.historical_scripts);
    report.success_matching = match_success_elements(script, base_data.success_elements);
    report.reliability = calculate_reliability(base_data.source_quality);
    report.content_quality = analyze_content_quality(script);

    const double weighted = report.coverage.score() * kCoverageWeight +
                            report.success_matching.matching_rate * kMatchingWeight +
                            report.content_quality.overall_score * kContentWeight +
                            report.novelty.novelty_score * kNoveltyWeight +
                            report.reliability.confidence_score * kReliabilityWeight;
    const double total_weight = kCoverageWeight + kMatchingWeight + kContentWeight + kNoveltyWeight + kReliabilityWeight;
    report.overall_quality = weighted / total_weight;

    report.detailed_analysis = build_detailed_analysis(report);
    report.analyzed_at = std::chrono::system_clock::now();
    report.analysis_duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    LOG_INFO("Script quality: overall ", report.overall_quality, " (coverage ", report.coverage.coverage_percentage,
             "%, novelty ", report.novelty.novelty_score, ", matching ", report.success_matching.matching_rate,
             ", content ", report.content_quality.overall_score, ")");
    return report;
}

} // namespace counselscript
