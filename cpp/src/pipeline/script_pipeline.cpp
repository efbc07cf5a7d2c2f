#include "counselscript/pipeline/script_pipeline.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/ids.hpp"
#include "counselscript/util/utf8.hpp"

#include <chrono>
#include <set>
#include <sstream>

namespace counselscript {

namespace {

constexpr size_t kPromptExcerptLength = 500;

std::string excerpt(const std::string& text) {
    if (util::codepoint_length(text) <= kPromptExcerptLength) return text;
    return util::utf8_prefix(text, kPromptExcerptLength) + "...";
}

std::vector<SuccessPattern> patterns_from_representatives(const std::vector<GenerationRepresentative>& reps) {
    std::vector<SuccessPattern> patterns;
    std::set<int> seen;
    for (const auto& rep : reps) {
        if (!seen.insert(rep.cluster_label).second) continue;
        if (rep.characteristics.common_keywords.empty()) continue;
        patterns.push_back({"cluster " + std::to_string(rep.cluster_label),
                            rep.characteristics.common_keywords, {}});
    }
    return patterns;
}

} // namespace

std::string compose_default_prompt(const GenerationContext& context) {
    std::ostringstream out;
    out << "## Success patterns\n\n";
    if (context.representatives.empty()) {
        out << "No successful conversations are available for analysis.\n\n";
    }
    for (size_t i = 0; i < context.representatives.size(); ++i) {
        const auto& rep = context.representatives[i];
        out << "### Success pattern " << i + 1 << " (cluster " << rep.cluster_label << ")\n"
            << "- Quality score: " << rep.quality_score << "\n"
            << "- " << rep.characteristics.description << "\n\n"
            << excerpt(rep.text) << "\n\n";
    }

    if (!context.failure_mappings.empty()) {
        out << "## Failure to success mappings\n\n";
        for (size_t i = 0; i < context.failure_mappings.size(); ++i) {
            const auto& mapping = context.failure_mappings[i];
            out << "### Mapping " << i + 1 << "\n"
                << "Failure excerpt:\n" << excerpt(mapping.failure_analysis.text) << "\n\n";
            for (const auto& match : mapping.similar_successes) {
                out << "- Similar success (" << match.similarity_score << "): "
                    << excerpt(match.record.chunk_text) << "\n";
                for (const auto& hint : match.improvement_hints) {
                    out << "  - Hint: " << hint << "\n";
                }
            }
            out << "\n";
        }
    }

    out << "## Output requirements\n\n"
        << "Answer in markdown with these sections:\n\n"
        << "### 1. Success Factor Analysis\n"
        << "### 2. Improvement Points\n"
        << "### 3. Counseling Script\n"
        << "#### A. Opening\n#### B. Needs Assessment\n#### C. Solution Proposal\n#### D. Closing\n"
        << "### 4. Practical Improvements\n"
        << "### 5. Expected Effects\n";
    return out.str();
}

ScriptPipeline::ScriptPipeline(ThreadPool& pool,
                               ClusteringService& clustering,
                               RepresentativeExtractor& representatives,
                               SimilarityMatcher& matcher,
                               TextGenerator& generator,
                               const QualityScorer& scorer,
                               ScriptParser parser,
                               GenerationSettings settings,
                               PromptComposer composer,
                               SleepFunction sleep)
    : pool_(pool)
    , clustering_(clustering)
    , representatives_(representatives)
    , matcher_(matcher)
    , generator_(generator)
    , scorer_(scorer)
    , parser_(std::move(parser))
    , settings_(std::move(settings))
    , composer_(std::move(composer))
    , sleep_(std::move(sleep)) {
    COUNSELSCRIPT_CHECK_ARGUMENT(composer_, "ScriptPipeline requires a prompt composer");
}

std::future<Outcome<ClusterRunSummary>> ScriptPipeline::cluster_async(ClusteringRequest request,
                                                                      VectorFilter filter) {
    return pool_.submit([this, request = std::move(request), filter = std::move(filter)]() {
        return clustering_.perform_clustering(request, filter);
    });
}

std::future<ScriptQualityReport> ScriptPipeline::score_async(GeneratedScript script, ScoringBaseData base_data) {
    return pool_.submit([this, script = std::move(script), base_data = std::move(base_data)]() {
        return scorer_.score(script, base_data);
    });
}

Outcome<GenerationContext> ScriptPipeline::build_context(const GenerationRequest& request) {
    auto reps = representatives_.get_representatives_for_script_generation(request.cluster_result_id,
                                                                           request.max_representatives);
    if (!reps) return reps.error();

    GenerationContext context;
    context.cluster_result_id = request.cluster_result_id;
    context.representatives = std::move(reps).value();
    context.failures = request.failures;
    for (const auto& failure : request.failures) {
        context.failure_mappings.push_back(matcher_.match_failure_to_success(failure.text, request.failure_matching));
    }
    LOG_INFO("Generation context: ", context.representatives.size(), " representatives, ",
             context.failure_mappings.size(), " failure mappings");
    return context;
}

Outcome<PipelineResult> ScriptPipeline::generate_script(const GenerationRequest& request) {
    const auto start = std::chrono::steady_clock::now();

    PipelineResult result;
    result.generation_id = util::generate_id();
    LOG_INFO("Script generation ", result.generation_id, " started for ", request.cluster_result_id);

    auto context = build_context(request);
    if (!context) return context.error();

    const std::string prompt = composer_(context.value());
    result.generation = generate_with_retry(generator_, prompt, GenerationParams::from_settings(settings_),
                                            settings_.retry, sleep_);
    result.script = parser_.parse(result.generation.text);

    ScoringBaseData base_data = request.base_data;
    if (base_data.success_patterns.empty()) {
        base_data.success_patterns = patterns_from_representatives(context.value().representatives);
    }
    result.quality = scorer_.score(result.script, base_data);

    result.created_at = std::chrono::system_clock::now();
    result.processing_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    LOG_INFO("Script generation ", result.generation_id, " finished in ", result.processing_seconds, " s (",
             result.generation.total_tokens(), " tokens, quality ", result.quality.overall_quality, ")");
    return result;
}

} // namespace counselscript
