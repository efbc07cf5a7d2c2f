#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "counselscript/config.hpp"
#include "counselscript/embedding/embedding_provider.hpp"
#include "counselscript/retry.hpp"
#include "counselscript/text/tokenizer.hpp"
#include "counselscript/types.hpp"

namespace counselscript {

struct ChunkMetadata {
    size_t original_index = 0;
    int chunk_index = 0;
    int total_chunks = 1;
    int token_count = 0;
    bool oversized = false;
};

struct EmbeddedText {
    std::string text;
    Vector vector;
    std::optional<ChunkMetadata> metadata;
};

/**
 * Turns transcript text into token-bounded chunks and fixed-dimension vectors.
 *
 * Chunking never fails. Provider failures are retried with exponential
 * backoff; embed() throws EmbeddingError once retries are exhausted while
 * embed_batch() degrades failed items to zero vectors.
 */
class EmbeddingEngine {
public:
    EmbeddingEngine(std::shared_ptr<EmbeddingProvider> provider,
                    EmbeddingSettings settings,
                    SleepFunction sleep = default_sleep);

    int count_tokens(std::string_view text) const;

    // Speaker-turn chunking; max_tokens <= 0 uses the configured limit
    std::vector<TextChunk> chunk(std::string_view text, int max_tokens = 0) const;

    // Sentence-aware chunking with a trailing-sentence overlap window
    std::vector<TextChunk> smart_chunk(std::string_view text, int max_tokens = 0, int overlap_tokens = -1) const;

    Vector embed(const std::string& text);

    // Output has one vector per input, in input order
    std::vector<Vector> embed_batch(const std::vector<std::string>& texts);

    // Long texts without content produce no entries
    std::vector<EmbeddedText> embed_with_chunking(const std::vector<std::string>& texts,
                                                  bool include_metadata = true);

    // Embeds the first chunk only; later chunks are not used for search.
    // Blank text throws InvalidArgumentError.
    EmbeddedChunk embed_for_search(const std::string& text);

    size_t zero_vector_substitutions() const { return zero_vectors_.load(); }

    const EmbeddingSettings& settings() const { return settings_; }

private:
    std::vector<TextChunk> split_raw(std::string_view text, int max_tokens) const;
    std::vector<Vector> embed_batch_once(const std::vector<std::string>& batch);
    Vector conform(Vector v) const;

    std::shared_ptr<EmbeddingProvider> provider_;
    EmbeddingSettings settings_;
    SleepFunction sleep_;
    text::Tokenizer tokenizer_;
    std::atomic<size_t> zero_vectors_{0};
};

} // namespace counselscript
