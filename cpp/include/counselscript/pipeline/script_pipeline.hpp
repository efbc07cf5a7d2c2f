#pragma once

#include <functional>
#include <future>
#include <string>
#include <vector>

#include "counselscript/analysis/representative_extractor.hpp"
#include "counselscript/clustering/clustering_service.hpp"
#include "counselscript/generation/script_parser.hpp"
#include "counselscript/generation/text_generator.hpp"
#include "counselscript/matching/similarity_matcher.hpp"
#include "counselscript/scoring/quality_scorer.hpp"
#include "counselscript/thread_pool.hpp"

namespace counselscript {

struct FailureConversation {
    std::string session_id;
    std::string text;
};

struct GenerationRequest {
    std::string cluster_result_id;
    std::vector<FailureConversation> failures;
    size_t max_representatives = 8;
    MatchOptions failure_matching{3, 0.7, true, VectorFilter{}};
    // Success patterns default to one per represented cluster, keyed by its common keywords
    ScoringBaseData base_data;
};

struct GenerationContext {
    std::string cluster_result_id;
    std::vector<GenerationRepresentative> representatives;
    std::vector<MatchResult> failure_mappings;      // one per failure, same order
    std::vector<FailureConversation> failures;
};

using PromptComposer = std::function<std::string(const GenerationContext&)>;

// Markdown prompt asking for the section and phase headings ScriptLayout::defaults() recognises
std::string compose_default_prompt(const GenerationContext& context);

struct PipelineResult {
    std::string generation_id;
    GeneratedScript script;
    ScriptQualityReport quality;
    GenerationResult generation;
    double processing_seconds = 0.0;
    TimePoint created_at{};
};

/**
 * End-to-end script generation.
 *
 * Clustering runs on the worker pool; everything else runs on the calling
 * thread. Unknown cluster results come back as errors, provider outages
 * propagate as GenerationError / EmbeddingError after retries.
 */
class ScriptPipeline {
public:
    ScriptPipeline(ThreadPool& pool,
                   ClusteringService& clustering,
                   RepresentativeExtractor& representatives,
                   SimilarityMatcher& matcher,
                   TextGenerator& generator,
                   const QualityScorer& scorer,
                   ScriptParser parser,
                   GenerationSettings settings,
                   PromptComposer composer = compose_default_prompt,
                   SleepFunction sleep = default_sleep);

    std::future<Outcome<ClusterRunSummary>> cluster_async(ClusteringRequest request,
                                                          VectorFilter filter = VectorFilter{});

    // Scores on the pool; waiting on it from one of the pool's own tasks can deadlock
    std::future<ScriptQualityReport> score_async(GeneratedScript script, ScoringBaseData base_data);

    Outcome<GenerationContext> build_context(const GenerationRequest& request);

    Outcome<PipelineResult> generate_script(const GenerationRequest& request);

private:
    ThreadPool& pool_;
    ClusteringService& clustering_;
    RepresentativeExtractor& representatives_;
    SimilarityMatcher& matcher_;
    TextGenerator& generator_;
    const QualityScorer& scorer_;
    ScriptParser parser_;
    GenerationSettings settings_;
    PromptComposer composer_;
    SleepFunction sleep_;
};

} // namespace counselscript
