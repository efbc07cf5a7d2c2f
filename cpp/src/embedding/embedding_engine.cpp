#include "counselscript/embedding/embedding_engine.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/utf8.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

namespace counselscript {

namespace {

std::vector<std::string> split_turn_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string line = util::trim(text.substr(start, end - start));
        if (!line.empty()) lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

// Sentences end at 。！？ (kept) or a newline (dropped)
std::vector<std::string> split_sentences(std::string_view text) {
    std::vector<std::string> sentences;
    std::string current;

    auto flush = [&]() {
        std::string s = util::trim(current);
        if (!s.empty()) sentences.push_back(std::move(s));
        current.clear();
    };

    for (const auto& cp : util::decode_utf8(text)) {
        if (cp.value == '\n' || cp.value == '\r') {
            flush();
            continue;
        }
        current.append(text.substr(cp.offset, cp.size));
        if (cp.value == 0x3002 || cp.value == 0xFF01 || cp.value == 0xFF1F) {   // 。！？
            flush();
        }
    }
    flush();
    return sentences;
}

std::string join(const std::vector<std::string>& parts, size_t first, size_t last, const char* sep) {
    std::string out;
    for (size_t i = first; i < last; ++i) {
        if (i > first) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

EmbeddingEngine::EmbeddingEngine(std::shared_ptr<EmbeddingProvider> provider,
                                 EmbeddingSettings settings,
                                 SleepFunction sleep)
    : provider_(std::move(provider)), settings_(std::move(settings)), sleep_(std::move(sleep)) {
    COUNSELSCRIPT_CHECK_ARGUMENT(provider_, "EmbeddingEngine requires a provider");
    if (settings_.dimension <= 0 || settings_.batch_size <= 0 || settings_.max_tokens <= 0) {
        throw ConfigError("Embedding dimension, batch size and max tokens must be positive");
    }
    if (!sleep_) sleep_ = default_sleep;
}

int EmbeddingEngine::count_tokens(std::string_view text) const {
    return tokenizer_.count_tokens(text);
}

std::vector<TextChunk> EmbeddingEngine::split_raw(std::string_view text, int max_tokens) const {
    std::vector<TextChunk> chunks;
    const auto spans = tokenizer_.tokenize(text);
    const size_t step = static_cast<size_t>(max_tokens);

    for (size_t i = 0; i < spans.size(); i += step) {
        size_t last = std::min(i + step, spans.size()) - 1;
        size_t begin = spans[i].offset;
        size_t end = spans[last].offset + spans[last].size;
        chunks.push_back({std::string(text.substr(begin, end - begin)),
                          static_cast<int>(last - i + 1), false});
    }
    return chunks;
}

std::vector<TextChunk> EmbeddingEngine::chunk(std::string_view text, int max_tokens) const {
    if (max_tokens <= 0) max_tokens = settings_.max_tokens;

    const int total = count_tokens(text);
    if (total == 0 || util::trim(text).empty()) return {};
    if (total <= max_tokens) {
        return {TextChunk{std::string(text), total, false}};
    }

    const auto lines = split_turn_lines(text);
    if (lines.size() <= 1) {
        // No turn boundaries to respect
        return split_raw(text, max_tokens);
    }

    std::vector<TextChunk> chunks;
    size_t first = 0;
    int running = 0;

    auto emit = [&](size_t last) {
        std::string joined = join(lines, first, last, "\n");
        int tokens = count_tokens(joined);
        bool oversized = tokens > max_tokens;
        if (oversized) {
            LOG_WARN("Turn line of ", tokens, " tokens exceeds chunk limit ", max_tokens, "; kept whole");
        }
        chunks.push_back({std::move(joined), tokens, oversized});
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        int line_tokens = count_tokens(lines[i]);
        // Lines are joined with one newline token
        int cost = (i > first) ? line_tokens + 1 : line_tokens;

        if (i > first && running + cost > max_tokens) {
            emit(i);
            first = i;
            running = line_tokens;
        } else {
            running += cost;
        }
    }
    emit(lines.size());

    return chunks;
}

std::vector<TextChunk> EmbeddingEngine::smart_chunk(std::string_view text, int max_tokens, int overlap_tokens) const {
    if (max_tokens <= 0) max_tokens = settings_.max_tokens;
    if (overlap_tokens < 0) overlap_tokens = settings_.smart_chunk_overlap;

    const auto sentences = split_sentences(text);
    std::vector<TextChunk> chunks;
    std::vector<std::string> current;

    auto current_text = [&]() { return join(current, 0, current.size(), " "); };

    for (const auto& sentence : sentences) {
        current.push_back(sentence);
        if (current.size() == 1 || count_tokens(current_text()) <= max_tokens) continue;

        current.pop_back();
        std::string done = current_text();
        chunks.push_back({done, count_tokens(done), count_tokens(done) > max_tokens});

        // Carry trailing sentences that fit in the overlap window
        std::vector<std::string> carried;
        int carried_tokens = 0;
        for (auto it = current.rbegin(); it != current.rend(); ++it) {
            int t = count_tokens(*it) + (carried.empty() ? 0 : 1);
            if (carried_tokens + t > overlap_tokens) break;
            carried.insert(carried.begin(), *it);
            carried_tokens += t;
        }

        current = std::move(carried);
        current.push_back(sentence);
        while (current.size() > 1 && count_tokens(current_text()) > max_tokens) {
            current.erase(current.begin());
        }
    }

    if (!current.empty()) {
        std::string done = current_text();
        int tokens = count_tokens(done);
        chunks.push_back({done, tokens, tokens > max_tokens});
    }

    for (const auto& c : chunks) {
        if (c.oversized) {
            LOG_WARN("Sentence of ", c.token_count, " tokens exceeds smart chunk limit ", max_tokens);
        }
    }
    return chunks;
}

Vector EmbeddingEngine::conform(Vector v) const {
    const auto dimension = static_cast<size_t>(settings_.dimension);
    if (v.size() != dimension) {
        LOG_WARN("Provider returned ", v.size(), "-dim vector; conforming to ", dimension);
        v.resize(dimension, 0.0f);
    }
    return v;
}

Vector EmbeddingEngine::embed(const std::string& text) {
    return retry_with_backoff(settings_.retry, "embedding request",
        [&]() {
            auto vectors = provider_->embed({text});
            if (vectors.size() != 1) {
                throw EmbeddingError("Provider returned " + std::to_string(vectors.size()) +
                                     " vectors for one text");
            }
            return conform(std::move(vectors.front()));
        },
        [](const std::string& message) { return EmbeddingError(message); },
        sleep_);
}

std::vector<Vector> EmbeddingEngine::embed_batch_once(const std::vector<std::string>& batch) {
    return retry_with_backoff(settings_.retry, "batch embedding request",
        [&]() {
            auto vectors = provider_->embed(batch);
            if (vectors.size() != batch.size()) {
                throw EmbeddingError("Provider returned " + std::to_string(vectors.size()) +
                                     " vectors for " + std::to_string(batch.size()) + " texts");
            }
            for (auto& v : vectors) v = conform(std::move(v));
            return vectors;
        },
        [](const std::string& message) { return EmbeddingError(message); },
        sleep_);
}

std::vector<Vector> EmbeddingEngine::embed_batch(const std::vector<std::string>& texts) {
    std::vector<Vector> all_embeddings;
    all_embeddings.reserve(texts.size());

    const auto batch_size = static_cast<size_t>(settings_.batch_size);
    const size_t batch_count = (texts.size() + batch_size - 1) / batch_size;

    for (size_t start = 0; start < texts.size(); start += batch_size) {
        const size_t end = std::min(start + batch_size, texts.size());
        std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
        const size_t batch_number = start / batch_size + 1;

        try {
            auto vectors = embed_batch_once(batch);
            std::move(vectors.begin(), vectors.end(), std::back_inserter(all_embeddings));
        } catch (const EmbeddingError& e) {
            LOG_ERROR("Batch ", batch_number, "/", batch_count, " failed, embedding items one by one: ", e.what());

            for (size_t i = 0; i < batch.size(); ++i) {
                try {
                    all_embeddings.push_back(embed(batch[i]));
                } catch (const EmbeddingError& item_error) {
                    // Lossy fallback keeps the batch available
                    ++zero_vectors_;
                    LOG_WARN("Substituting zero vector for item ", start + i, ": ", item_error.what());
                    all_embeddings.emplace_back(static_cast<size_t>(settings_.dimension), 0.0f);
                }
                sleep_(std::chrono::milliseconds(settings_.item_pause_ms));
            }
        }

        // Pace requests to stay under provider rate limits
        if (end < texts.size()) {
            sleep_(std::chrono::milliseconds(settings_.batch_pause_ms));
        }
    }

    return all_embeddings;
}

std::vector<EmbeddedText> EmbeddingEngine::embed_with_chunking(const std::vector<std::string>& texts,
                                                               bool include_metadata) {
    std::vector<std::string> all_chunks;
    std::vector<ChunkMetadata> metadata;

    for (size_t text_idx = 0; text_idx < texts.size(); ++text_idx) {
        const auto& text = texts[text_idx];
        const int token_count = count_tokens(text);

        if (token_count <= settings_.max_tokens) {
            all_chunks.push_back(text);
            metadata.push_back({text_idx, 0, 1, token_count, false});
            continue;
        }

        auto chunks = chunk(text);
        if (chunks.empty()) {
            LOG_WARN("Text ", text_idx, " has ", token_count, " tokens but no content; skipped");
            continue;
        }
        const int total = static_cast<int>(chunks.size());
        for (int chunk_idx = 0; chunk_idx < total; ++chunk_idx) {
            auto& c = chunks[static_cast<size_t>(chunk_idx)];
            metadata.push_back({text_idx, chunk_idx, total, c.token_count, c.oversized});
            all_chunks.push_back(std::move(c.text));
        }
    }

    auto embeddings = embed_batch(all_chunks);

    std::vector<EmbeddedText> results;
    results.reserve(all_chunks.size());
    for (size_t i = 0; i < all_chunks.size(); ++i) {
        EmbeddedText item{std::move(all_chunks[i]), std::move(embeddings[i]), std::nullopt};
        if (include_metadata) item.metadata = metadata[i];
        results.push_back(std::move(item));
    }

    LOG_INFO("Embedded ", texts.size(), " texts as ", results.size(), " chunks");
    return results;
}

EmbeddedChunk EmbeddingEngine::embed_for_search(const std::string& text) {
    COUNSELSCRIPT_CHECK_ARGUMENT(!util::trim(text).empty(), "Search text is blank");

    EmbeddedChunk result;
    result.total_chunks = 1;

    if (count_tokens(text) > settings_.max_tokens) {
        auto chunks = chunk(text);
        result.total_chunks = static_cast<int>(chunks.size());
        result.source_text = chunks.front().text;
        result.token_count = chunks.front().token_count;
    } else {
        result.source_text = text;
        result.token_count = count_tokens(text);
    }

    result.vector = embed(result.source_text);
    LOG_INFO("Search embedding ready: ", result.vector.size(), " dims, chunk 1/", result.total_chunks);
    return result;
}

} // namespace counselscript
