// =============================================================================
// Failure-to-Success Matching Tests
// =============================================================================

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "counselscript/embedding/embedding_engine.hpp"
#include "counselscript/matching/similarity_matcher.hpp"
#include "counselscript/store/vector_store.hpp"
#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace counselscript;
using ::testing::_;
using ::testing::Return;

namespace {

class MockEmbeddingProvider : public EmbeddingProvider {
public:
    MOCK_METHOD(std::vector<Vector>, embed, (const std::vector<std::string>& texts), (override));
};

Vector at_similarity(double s) {
    return {static_cast<float>(s), static_cast<float>(std::sqrt(1.0 - s * s)), 0.0f};
}

} // namespace

class SimilarityMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.dimension = 3;
        settings.max_tokens = 64;
        settings.retry.max_attempts = 1;
        provider = std::make_shared<::testing::NiceMock<MockEmbeddingProvider>>();
        ON_CALL(*provider, embed(_)).WillByDefault(Return(std::vector<Vector>{{1.0f, 0.0f, 0.0f}}));
        engine = std::make_unique<EmbeddingEngine>(provider, settings, [](std::chrono::milliseconds) {});

        add("best", at_similarity(0.95), "効果と料金を丁寧に説明し、安心して体験していただけます。");
        add("good", at_similarity(0.85), "料金の説明のあと、無料体験をご案内しました。");
        add("weak", at_similarity(0.40), "unrelated text");
    }

    void add(const std::string& id, Vector v, const std::string& text) {
        SuccessVectorRecord r;
        r.id = id;
        r.session_id = "s-" + id;
        r.chunk_text = text;
        r.vector = std::move(v);
        store.insert(std::move(r));
    }

    EmbeddingSettings settings;
    std::shared_ptr<::testing::NiceMock<MockEmbeddingProvider>> provider;
    std::unique_ptr<EmbeddingEngine> engine;
    InMemoryVectorStore store{3};
    const std::string failure = "料金が高いと言われて、そのまま終わりました。";
};

TEST_F(SimilarityMatcherTest, TopOneMatch) {
    SimilarityMatcher matcher(*engine, store);
    MatchOptions options;
    options.top_k = 1;
    options.similarity_threshold = 0.7;

    auto result = matcher.match_failure_to_success(failure, options);
    ASSERT_EQ(result.similar_successes.size(), 1u);
    EXPECT_EQ(result.similar_successes[0].record.id, "best");
    EXPECT_NEAR(result.similar_successes[0].similarity_score, 0.95, 1e-5);
    EXPECT_EQ(result.failure_analysis.text, failure);
    EXPECT_EQ(result.failure_analysis.total_chunks, 1);
    ASSERT_TRUE(result.analysis_summary.has_value());
    EXPECT_EQ(result.analysis_summary->total_found, 1u);
}

TEST_F(SimilarityMatcherTest, ThresholdAboveBestReturnsNothing) {
    SimilarityMatcher matcher(*engine, store);
    MatchOptions options;
    options.top_k = 1;
    options.similarity_threshold = 0.96;

    auto result = matcher.match_failure_to_success(failure, options);
    EXPECT_TRUE(result.similar_successes.empty());
    EXPECT_FALSE(result.analysis_summary.has_value());
}

TEST_F(SimilarityMatcherTest, ResultsDescendBySimilarity) {
    SimilarityMatcher matcher(*engine, store);
    MatchOptions options;
    options.top_k = 5;
    options.similarity_threshold = 0.0;

    auto result = matcher.match_failure_to_success(failure, options);
    ASSERT_EQ(result.similar_successes.size(), 3u);
    for (size_t i = 1; i < result.similar_successes.size(); ++i) {
        EXPECT_GE(result.similar_successes[i - 1].similarity_score, result.similar_successes[i].similarity_score);
    }
    const auto& dist = result.analysis_summary->distribution;
    EXPECT_NEAR(dist.max, 0.95, 1e-5);
    EXPECT_NEAR(dist.min, 0.40, 1e-5);
    EXPECT_NEAR(dist.median, 0.85, 1e-5);
}

TEST_F(SimilarityMatcherTest, AnalysisCanBeSkipped) {
    SimilarityMatcher matcher(*engine, store);
    MatchOptions options;
    options.include_analysis = false;
    options.similarity_threshold = 0.0;

    auto result = matcher.match_failure_to_success(failure, options);
    ASSERT_FALSE(result.similar_successes.empty());
    EXPECT_FALSE(result.analysis_summary.has_value());
    EXPECT_TRUE(result.similar_successes[0].improvement_hints.empty());
}

TEST_F(SimilarityMatcherTest, HintsForKeywordsTheFailureLacks) {
    SimilarityMatcher matcher(*engine, store);
    auto hints = matcher.improvement_hints("料金が高いです", "効果と料金を説明し、安心していただけます");

    const auto lexicon = KeywordLexicon::defaults();
    ASSERT_FALSE(hints.empty());
    EXPECT_LE(hints.size(), lexicon.max_hints);
    // 効果 and 安心 appear only in the success text; 料金 appears in both
    EXPECT_EQ(hints[0], lexicon.hints[0].advice);
    for (const auto& h : hints) EXPECT_NE(h, lexicon.hints[1].advice);
}

TEST_F(SimilarityMatcherTest, DefaultHintWhenNothingApplies) {
    SimilarityMatcher matcher(*engine, store);
    auto hints = matcher.improvement_hints("same", "same");
    ASSERT_EQ(hints.size(), 1u);
    EXPECT_EQ(hints[0], KeywordLexicon::defaults().default_hint);
}

TEST_F(SimilarityMatcherTest, KeyDifferencesCompareLengthAndTone) {
    SimilarityMatcher matcher(*engine, store);

    auto longer = matcher.key_differences("短い", "とても長くて詳しい説明です");
    ASSERT_FALSE(longer.empty());
    EXPECT_EQ(longer[0], "The success example explains things in more detail");

    auto shorter = matcher.key_differences("とても長くて詳しい説明です", "短い");
    ASSERT_FALSE(shorter.empty());
    EXPECT_EQ(shorter[0], "The success example is more concise and focused");

    auto tone = matcher.key_differences("説明します", "安心です");
    ASSERT_EQ(tone.size(), 1u);
    EXPECT_EQ(tone[0], "The success example uses a more positive tone");
}

TEST_F(SimilarityMatcherTest, SummaryRanksMissingKeywords) {
    SimilarityMatcher matcher(*engine, store);
    SuccessMatch a, b;
    a.record.chunk_text = "pricing guarantee comfort";
    a.similarity_score = 0.9;
    b.record.chunk_text = "pricing guarantee";
    b.similarity_score = 0.8;

    auto summary = matcher.summarize("comfort only", {a, b});
    EXPECT_EQ(summary.total_found, 2u);
    EXPECT_NEAR(summary.avg_similarity, 0.85, 1e-12);
    ASSERT_EQ(summary.top_improvement_areas.size(), 2u);
    EXPECT_EQ(summary.top_improvement_areas[0], "guarantee");
    EXPECT_EQ(summary.top_improvement_areas[1], "pricing");
}

// Long failures are searched with their first chunk only
TEST_F(SimilarityMatcherTest, LongFailureUsesFirstChunk) {
    std::string long_failure;
    for (int i = 0; i < 10; ++i) long_failure += "顧客: 料金が高いので検討します\n";

    SimilarityMatcher matcher(*engine, store);
    auto result = matcher.match_failure_to_success(long_failure, MatchOptions{});
    EXPECT_GT(result.failure_analysis.total_chunks, 1);
    EXPECT_EQ(result.failure_analysis.token_count, engine->count_tokens(long_failure));
}

TEST_F(SimilarityMatcherTest, BlankFailureHasNoMatches) {
    EXPECT_CALL(*provider, embed(_)).Times(0);
    std::string padding;
    for (int i = 0; i < 600; ++i) padding += "\n ";

    SimilarityMatcher matcher(*engine, store);
    auto result = matcher.match_failure_to_success(padding, MatchOptions{});
    EXPECT_TRUE(result.similar_successes.empty());
    EXPECT_FALSE(result.analysis_summary.has_value());
    EXPECT_EQ(result.failure_analysis.total_chunks, 0);
    EXPECT_TRUE(result.failure_analysis.embedding.empty());
}

TEST(MatchOptionsTest, FromSettings) {
    MatchingSettings settings;
    settings.top_k = 7;
    settings.similarity_threshold = 0.6;
    auto options = MatchOptions::from_settings(settings);
    EXPECT_EQ(options.top_k, 7u);
    EXPECT_DOUBLE_EQ(options.similarity_threshold, 0.6);
    EXPECT_TRUE(options.include_analysis);
}
