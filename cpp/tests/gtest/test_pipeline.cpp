// =============================================================================
// Script Generation Pipeline Tests
// =============================================================================

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "counselscript/pipeline/script_pipeline.hpp"
#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/store/vector_store.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace counselscript;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockEmbeddingProvider : public EmbeddingProvider {
public:
    MOCK_METHOD(std::vector<Vector>, embed, (const std::vector<std::string>& texts), (override));
};

class MockTextGenerator : public TextGenerator {
public:
    MOCK_METHOD(GenerationResult, generate, (const std::string& prompt, const GenerationParams& params),
                (override));
};

const char* kGeneratedScript =
    "### 1. Success Factor Analysis\n"
    "Successful counselors explain the price early and offer a free trial before any objection.\n\n"
    "### 2. Improvement Points\n"
    "Address the price concern directly and propose the trial while the customer is still interested.\n\n"
    "### 3. Counseling Script\n"
    "#### A. Opening\n"
    "Thank the customer for coming today and ask how they heard about the clinic.\n"
    "#### B. Needs Assessment\n"
    "Ask which results matter most to them and what budget they have in mind.\n"
    "#### C. Solution Proposal\n"
    "Present the treatment plan with a clear price and offer the free trial session.\n"
    "#### D. Closing\n"
    "Summarize what was agreed and book the trial appointment before they leave.\n\n"
    "### 4. Practical Improvements\n"
    "Practice the price explanation and keep trial slots open every afternoon.\n\n"
    "### 5. Expected Effects\n"
    "More customers book the trial and fewer leave over the price.\n";

} // namespace

class ScriptPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 5; ++i) {
            float d = 0.05f * static_cast<float>(i);
            add("p" + std::to_string(i), {1.0f, d, 0.0f},
                "customer asked about price and the counselor offered a free trial session");
            add("c" + std::to_string(i), {0.0f, 1.0f, d},
                "customer worried about comfort so the counselor explained the gentle procedure");
        }

        embedding_settings.dimension = 3;
        embedding_settings.retry.max_attempts = 1;
        provider = std::make_shared<::testing::NiceMock<MockEmbeddingProvider>>();
        ON_CALL(*provider, embed(_)).WillByDefault(Return(std::vector<Vector>{{1.0f, 0.0f, 0.0f}}));
        embedding = std::make_unique<EmbeddingEngine>(provider, embedding_settings,
                                                      [](std::chrono::milliseconds) {});
        matcher = std::make_unique<SimilarityMatcher>(*embedding, store);

        generation_settings.retry.max_attempts = 2;
        generation_settings.retry.base_delay_ms = 10;
    }

    void add(const std::string& id, Vector v, const std::string& text) {
        SuccessVectorRecord r;
        r.id = id;
        r.session_id = "s-" + id;
        r.chunk_text = text;
        r.vector = std::move(v);
        store.insert(std::move(r));
    }

    ScriptPipeline make_pipeline() {
        return ScriptPipeline(pool, clustering, extractor, *matcher, generator, scorer, ScriptParser{},
                              generation_settings, compose_default_prompt,
                              [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    std::string cluster_and_extract(ScriptPipeline& pipeline) {
        ClusteringRequest request;
        request.k_min = 2;
        request.k_max = 3;
        auto summary = pipeline.cluster_async(request).get();
        EXPECT_TRUE(summary.ok());
        const std::string id = summary.value().cluster_result_id;
        EXPECT_TRUE(extractor.extract_representatives(id, 3, 0.0).ok());
        return id;
    }

    static GenerationResult completion() {
        GenerationResult r;
        r.text = kGeneratedScript;
        r.prompt_tokens = 800;
        r.completion_tokens = 400;
        return r;
    }

    ThreadPool pool{2};
    InMemoryVectorStore store{3};
    InMemoryClusterRepository repo;
    ClusteringEngine engine{3};
    ClusteringService clustering{store, repo, engine};
    RepresentativeExtractor extractor{store, repo};
    EmbeddingSettings embedding_settings;
    std::shared_ptr<::testing::NiceMock<MockEmbeddingProvider>> provider;
    std::unique_ptr<EmbeddingEngine> embedding;
    std::unique_ptr<SimilarityMatcher> matcher;
    MockTextGenerator generator;
    QualityScorer scorer;
    GenerationSettings generation_settings;
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(ScriptPipelineTest, ClusterAsyncPersistsRun) {
    auto pipeline = make_pipeline();
    ClusteringRequest request;
    request.k_min = 2;
    request.k_max = 3;

    auto summary = pipeline.cluster_async(request).get();
    ASSERT_TRUE(summary.ok()) << summary.error().message;
    EXPECT_EQ(summary.value().output.cluster_count, 2);
    EXPECT_TRUE(repo.find_cluster_result(summary.value().cluster_result_id).has_value());
}

TEST_F(ScriptPipelineTest, GeneratesParsesAndScores) {
    auto pipeline = make_pipeline();
    const std::string run_id = cluster_and_extract(pipeline);

    std::string prompt;
    EXPECT_CALL(generator, generate(_, _))
        .WillOnce(Invoke([&](const std::string& p, const GenerationParams&) {
            prompt = p;
            return completion();
        }));

    GenerationRequest request;
    request.cluster_result_id = run_id;
    request.failures = {{"f1", "the customer said the price was too high and left"}};

    auto result = pipeline.generate_script(request);
    ASSERT_TRUE(result.ok()) << result.error().message;
    const auto& r = result.value();

    EXPECT_FALSE(r.generation_id.empty());
    EXPECT_EQ(r.generation.total_tokens(), 1200);
    EXPECT_NE(r.script.phases.opening.find("Thank the customer"), std::string::npos);
    EXPECT_NE(r.script.phases.closing.find("book the trial"), std::string::npos);
    EXPECT_FALSE(r.script.expected_effects.empty());

    // One derived success pattern per represented cluster
    EXPECT_EQ(r.quality.coverage.total_patterns_analyzed, 2u);
    EXPECT_TRUE(r.quality.content_quality.missing_phases.empty());
    EXPECT_GT(r.quality.overall_quality, 0.0);
    EXPECT_LE(r.quality.overall_quality, 1.0);
    EXPECT_GE(r.processing_seconds, 0.0);

    EXPECT_NE(prompt.find("Success pattern 1"), std::string::npos);
    EXPECT_NE(prompt.find("Mapping 1"), std::string::npos);
    EXPECT_NE(prompt.find("#### A. Opening"), std::string::npos);
}

TEST_F(ScriptPipelineTest, ScoreAsyncMatchesDirectScoring) {
    auto pipeline = make_pipeline();
    const auto script = ScriptParser{}.parse(kGeneratedScript);
    ScoringBaseData base_data;
    base_data.success_patterns = {{"trial", {"trial", "book"}, {}}};

    auto pooled = pipeline.score_async(script, base_data).get();
    auto direct = scorer.score(script, base_data);
    EXPECT_DOUBLE_EQ(pooled.overall_quality, direct.overall_quality);
    EXPECT_DOUBLE_EQ(pooled.coverage.coverage_percentage, direct.coverage.coverage_percentage);
    EXPECT_EQ(pooled.coverage.total_patterns_analyzed, 1u);
    EXPECT_EQ(pooled.content_quality.missing_phases, direct.content_quality.missing_phases);
}

TEST_F(ScriptPipelineTest, ContextHasOneMappingPerFailure) {
    auto pipeline = make_pipeline();
    const std::string run_id = cluster_and_extract(pipeline);

    GenerationRequest request;
    request.cluster_result_id = run_id;
    request.max_representatives = 2;
    request.failures = {{"f1", "too expensive"}, {"f2", "did not trust the procedure"}};

    auto context = pipeline.build_context(request);
    ASSERT_TRUE(context.ok());
    EXPECT_EQ(context.value().representatives.size(), 2u);
    ASSERT_EQ(context.value().failure_mappings.size(), 2u);
    EXPECT_EQ(context.value().failure_mappings[1].failure_analysis.text, "did not trust the procedure");
}

TEST_F(ScriptPipelineTest, CallerPatternsAreKept) {
    auto pipeline = make_pipeline();
    const std::string run_id = cluster_and_extract(pipeline);
    EXPECT_CALL(generator, generate(_, _)).WillOnce(Return(completion()));

    GenerationRequest request;
    request.cluster_result_id = run_id;
    request.base_data.success_patterns = {{"guarantee", {"refund", "guarantee"}, {}}};

    auto result = pipeline.generate_script(request);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().quality.coverage.total_patterns_analyzed, 1u);
    EXPECT_DOUBLE_EQ(result.value().quality.coverage.coverage_percentage, 0.0);
}

TEST_F(ScriptPipelineTest, UnknownClusterRunIsNotFound) {
    auto pipeline = make_pipeline();
    EXPECT_CALL(generator, generate(_, _)).Times(0);

    GenerationRequest request;
    request.cluster_result_id = "missing";
    auto result = pipeline.generate_script(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
}

TEST_F(ScriptPipelineTest, GeneratorRetriesThenGivesUp) {
    auto pipeline = make_pipeline();
    const std::string run_id = cluster_and_extract(pipeline);
    EXPECT_CALL(generator, generate(_, _))
        .Times(2)
        .WillRepeatedly(Throw(GenerationError("service unavailable")));

    GenerationRequest request;
    request.cluster_result_id = run_id;
    EXPECT_THROW(pipeline.generate_script(request), GenerationError);
    EXPECT_EQ(sleeps.size(), 1u);
}

TEST(PromptTest, EmptyContextStillAsksForEverySection) {
    auto prompt = compose_default_prompt(GenerationContext{});
    EXPECT_NE(prompt.find("No successful conversations"), std::string::npos);
    EXPECT_EQ(prompt.find("Failure to success mappings"), std::string::npos);
    EXPECT_NE(prompt.find("### 5. Expected Effects"), std::string::npos);
}
