// =============================================================================
// Embedding Engine Tests
// =============================================================================

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "counselscript/embedding/embedding_engine.hpp"
#include "counselscript/error.hpp"
#include <chrono>
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

// Deterministic vector whose first component encodes the text length
std::vector<Vector> length_vectors(const std::vector<std::string>& texts) {
    std::vector<Vector> out;
    for (const auto& t : texts) out.push_back({static_cast<float>(t.size()), 1.0f, 0.0f, 0.0f});
    return out;
}

} // namespace

class EmbeddingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.dimension = 4;
        settings.max_tokens = 20;
        settings.smart_chunk_overlap = 5;
        settings.batch_size = 3;
        settings.retry.max_attempts = 2;
        settings.retry.base_delay_ms = 10;
        provider = std::make_shared<::testing::NiceMock<MockEmbeddingProvider>>();
    }

    EmbeddingEngine make_engine() {
        return EmbeddingEngine(provider, settings, [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    EmbeddingSettings settings;
    std::shared_ptr<::testing::NiceMock<MockEmbeddingProvider>> provider;
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(EmbeddingEngineTest, MissingProviderRejected) {
    try {
        EmbeddingEngine engine(nullptr, settings);
        FAIL() << "engine built without a provider";
    } catch (const InvalidArgumentError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
        EXPECT_FALSE(e.context().empty());
    }
}

TEST_F(EmbeddingEngineTest, EmptyTextHasNoChunks) {
    auto engine = make_engine();
    EXPECT_TRUE(engine.chunk("").empty());
    EXPECT_TRUE(engine.chunk("   \n  ").empty());
}

TEST_F(EmbeddingEngineTest, ShortTextIsOneChunk) {
    auto engine = make_engine();
    auto chunks = engine.chunk("short text");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, "short text");
    EXPECT_FALSE(chunks[0].oversized);
}

// Every chunk respects the cap unless it is a single over-long line
TEST_F(EmbeddingEngineTest, ChunksRespectTokenCap) {
    auto engine = make_engine();
    std::string transcript;
    for (int i = 0; i < 12; ++i) {
        transcript += "顧客: 料金について教えてください\n";
    }
    auto chunks = engine.chunk(transcript);
    ASSERT_GT(chunks.size(), 1u);
    for (const auto& c : chunks) {
        EXPECT_EQ(c.token_count, engine.count_tokens(c.text));
        if (!c.oversized) {
            EXPECT_LE(c.token_count, settings.max_tokens) << c.text;
        }
    }
}

TEST_F(EmbeddingEngineTest, OversizedLineIsKeptWhole) {
    auto engine = make_engine();
    // 90 digits are 30 tokens, above the cap of 20
    auto chunks = engine.chunk("a\n" + std::string(90, '1') + "\nb");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_FALSE(chunks[0].oversized);
    EXPECT_TRUE(chunks[1].oversized);
    EXPECT_EQ(chunks[1].token_count, 30);
    EXPECT_FALSE(chunks[2].oversized);

    // No turn boundaries: raw split never exceeds the cap
    auto raw = engine.chunk(std::string(200, '9'));
    ASSERT_GT(raw.size(), 1u);
    for (const auto& c : raw) EXPECT_LE(c.token_count, settings.max_tokens);
}

TEST_F(EmbeddingEngineTest, SmartChunkSplitsOnSentences) {
    auto engine = make_engine();
    std::string text;
    for (int i = 0; i < 8; ++i) text += "効果を説明します。";
    auto chunks = engine.smart_chunk(text);
    ASSERT_GT(chunks.size(), 1u);
    for (const auto& c : chunks) {
        EXPECT_LE(c.token_count, settings.max_tokens);
    }
}

TEST_F(EmbeddingEngineTest, EmbedBatchKeepsInputOrder) {
    EXPECT_CALL(*provider, embed(_)).WillRepeatedly(Invoke(length_vectors));
    auto engine = make_engine();

    std::vector<std::string> texts = {"a", "bb", "ccc", "dddd", "eeeee", "ffffff", "g"};
    auto vectors = engine.embed_batch(texts);

    ASSERT_EQ(vectors.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_FLOAT_EQ(vectors[i][0], static_cast<float>(texts[i].size()));
    }
    // Two pauses between three batches
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(EmbeddingEngineTest, EmbedRetriesThenSucceeds) {
    EXPECT_CALL(*provider, embed(_))
        .WillOnce(Throw(EmbeddingError("rate limited")))
        .WillOnce(Invoke(length_vectors));
    auto engine = make_engine();

    auto v = engine.embed("hello");
    EXPECT_EQ(v.size(), 4u);
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(10));
}

TEST_F(EmbeddingEngineTest, EmbedThrowsWhenRetriesExhausted) {
    EXPECT_CALL(*provider, embed(_)).WillRepeatedly(Throw(EmbeddingError("down")));
    auto engine = make_engine();
    EXPECT_THROW(engine.embed("hello"), EmbeddingError);
}

// A failing batch degrades item by item; unrecoverable items become zero vectors
TEST_F(EmbeddingEngineTest, BatchFailureFallsBackToZeroVectors) {
    EXPECT_CALL(*provider, embed(_)).WillRepeatedly(Invoke([](const std::vector<std::string>& texts) {
        for (const auto& t : texts) {
            if (t == "bad") throw EmbeddingError("rejected");
        }
        return length_vectors(texts);
    }));
    auto engine = make_engine();

    auto vectors = engine.embed_batch({"ok", "bad", "fine"});
    ASSERT_EQ(vectors.size(), 3u);
    EXPECT_FLOAT_EQ(vectors[0][0], 2.0f);
    EXPECT_EQ(vectors[1], Vector(4, 0.0f));
    EXPECT_FLOAT_EQ(vectors[2][0], 4.0f);
    EXPECT_EQ(engine.zero_vector_substitutions(), 1u);
}

TEST_F(EmbeddingEngineTest, WrongDimensionIsConformed) {
    EXPECT_CALL(*provider, embed(_)).WillOnce(Return(std::vector<Vector>{{1.0f, 2.0f}}));
    auto engine = make_engine();
    auto v = engine.embed("x");
    EXPECT_EQ(v, (Vector{1.0f, 2.0f, 0.0f, 0.0f}));
}

TEST_F(EmbeddingEngineTest, ChunkingCarriesMetadata) {
    EXPECT_CALL(*provider, embed(_)).WillRepeatedly(Invoke(length_vectors));
    auto engine = make_engine();

    std::string long_text;
    for (int i = 0; i < 10; ++i) long_text += "顧客: 痛みが心配です\n";
    auto results = engine.embed_with_chunking({"short", long_text});

    ASSERT_GT(results.size(), 2u);
    ASSERT_TRUE(results[0].metadata.has_value());
    EXPECT_EQ(results[0].metadata->original_index, 0u);
    EXPECT_EQ(results[0].metadata->total_chunks, 1);
    for (size_t i = 1; i < results.size(); ++i) {
        ASSERT_TRUE(results[i].metadata.has_value());
        EXPECT_EQ(results[i].metadata->original_index, 1u);
        EXPECT_EQ(results[i].metadata->chunk_index, static_cast<int>(i - 1));
        EXPECT_EQ(results[i].metadata->total_chunks, static_cast<int>(results.size() - 1));
    }
}

TEST_F(EmbeddingEngineTest, SearchEmbedsFirstChunkOnly) {
    std::vector<std::string> seen;
    EXPECT_CALL(*provider, embed(_)).WillRepeatedly(Invoke([&](const std::vector<std::string>& texts) {
        seen.insert(seen.end(), texts.begin(), texts.end());
        return length_vectors(texts);
    }));
    auto engine = make_engine();

    std::string long_text;
    for (int i = 0; i < 10; ++i) long_text += "顧客: 料金が高いです\n";
    auto result = engine.embed_for_search(long_text);

    EXPECT_GT(result.total_chunks, 1);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], result.source_text);
    EXPECT_LE(result.token_count, settings.max_tokens);
}

TEST_F(EmbeddingEngineTest, BlankSearchTextIsRejected) {
    EXPECT_CALL(*provider, embed(_)).Times(0);
    auto engine = make_engine();

    std::string padding;
    for (int i = 0; i < 600; ++i) padding += "\n ";
    ASSERT_GT(engine.count_tokens(padding), settings.max_tokens);

    EXPECT_THROW(engine.embed_for_search(padding), InvalidArgumentError);
    EXPECT_THROW(engine.embed_for_search("   "), InvalidArgumentError);
}

TEST_F(EmbeddingEngineTest, LongBlankTextIsSkippedWhenChunking) {
    EXPECT_CALL(*provider, embed(_)).WillRepeatedly(Invoke(length_vectors));
    auto engine = make_engine();

    std::string padding;
    for (int i = 0; i < 600; ++i) padding += "\n ";
    auto results = engine.embed_with_chunking({padding, "short"});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].text, "short");
    ASSERT_TRUE(results[0].metadata.has_value());
    EXPECT_EQ(results[0].metadata->original_index, 1u);
}
