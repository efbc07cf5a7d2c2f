#pragma once

#include <memory>
#include <string>

#include "counselscript/config.hpp"
#include "counselscript/net/http_client.hpp"
#include "counselscript/retry.hpp"

namespace counselscript {

struct GenerationParams {
    int max_tokens = 4000;
    double temperature = 0.7;
    std::string system_prompt =
        "You are an expert counseling advisor. Generate practical, effective improvement "
        "scripts grounded in the data provided.";

    static GenerationParams from_settings(const GenerationSettings& settings);
};

struct GenerationResult {
    std::string text;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    std::string model;
    std::string finish_reason;

    int total_tokens() const { return prompt_tokens + completion_tokens; }
};

// Remote text-generation model
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    // Throws GenerationError on any provider or protocol failure
    virtual GenerationResult generate(const std::string& prompt, const GenerationParams& params) = 0;
};

// OpenAI-compatible /v1/chat/completions client
class HttpTextGenerator : public TextGenerator {
public:
    HttpTextGenerator(std::shared_ptr<net::HttpClient> http_client, std::string model);

    GenerationResult generate(const std::string& prompt, const GenerationParams& params) override;

    static std::string build_request(const std::string& prompt, const GenerationParams& params,
                                     const std::string& model);
    static GenerationResult parse_response(const std::string& response);

private:
    std::shared_ptr<net::HttpClient> http_client_;
    std::string model_;
};

// Bounded retries with exponential backoff; GenerationError once they run out
GenerationResult generate_with_retry(TextGenerator& generator, const std::string& prompt,
                                     const GenerationParams& params, const RetrySettings& retry,
                                     const SleepFunction& sleep = default_sleep);

} // namespace counselscript
