#include "counselscript/generation/text_generator.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

#include <boost/json.hpp>

namespace counselscript {

GenerationParams GenerationParams::from_settings(const GenerationSettings& settings) {
    GenerationParams params;
    params.max_tokens = settings.max_tokens;
    params.temperature = settings.temperature;
    return params;
}

HttpTextGenerator::HttpTextGenerator(std::shared_ptr<net::HttpClient> http_client, std::string model)
    : http_client_(std::move(http_client)), model_(std::move(model)) {
    COUNSELSCRIPT_CHECK_ARGUMENT(http_client_, "HttpTextGenerator requires an HTTP client");
}

std::string HttpTextGenerator::build_request(const std::string& prompt, const GenerationParams& params,
                                             const std::string& model) {
    boost::json::array messages;
    if (!params.system_prompt.empty()) {
        messages.push_back(boost::json::object{{"role", "system"}, {"content", params.system_prompt}});
    }
    messages.push_back(boost::json::object{{"role", "user"}, {"content", prompt}});

    boost::json::object root;
    root["model"] = model;
    root["messages"] = std::move(messages);
    root["max_tokens"] = params.max_tokens;
    root["temperature"] = params.temperature;
    root["top_p"] = 0.9;
    root["frequency_penalty"] = 0.1;
    root["presence_penalty"] = 0.1;
    return boost::json::serialize(root);
}

GenerationResult HttpTextGenerator::parse_response(const std::string& response) {
    GenerationResult result;
    try {
        boost::json::value val = boost::json::parse(response);
        const auto& root = val.as_object();

        const auto& choices = root.at("choices").as_array();
        if (choices.empty()) {
            throw GenerationError("Generation response has no choices");
        }
        const auto& choice = choices.front().as_object();
        const auto& content = choice.at("message").as_object().at("content");
        if (!content.is_string() || content.as_string().empty()) {
            throw GenerationError("Generation response has no content");
        }
        result.text = std::string(content.as_string());

        if (auto it = choice.find("finish_reason"); it != choice.end() && it->value().is_string()) {
            result.finish_reason = std::string(it->value().as_string());
        }
        if (auto it = root.find("model"); it != root.end() && it->value().is_string()) {
            result.model = std::string(it->value().as_string());
        }
        if (auto it = root.find("usage"); it != root.end() && it->value().is_object()) {
            const auto& usage = it->value().as_object();
            result.prompt_tokens = static_cast<int>(usage.at("prompt_tokens").to_number<int64_t>());
            result.completion_tokens = static_cast<int>(usage.at("completion_tokens").to_number<int64_t>());
        }
    } catch (const GenerationError&) {
        throw;
    } catch (const std::exception& e) {
        throw GenerationError(std::string("Invalid generation response: ") + e.what());
    }
    return result;
}

GenerationResult HttpTextGenerator::generate(const std::string& prompt, const GenerationParams& params) {
    LOG_DEBUG("Requesting generation from ", http_client_->endpoint().host, " (", prompt.size(), " bytes)");

    std::string response;
    bool success = http_client_->send_request("POST", http_client_->endpoint().path,
                                              build_request(prompt, params, model_), response);
    if (!success) {
        throw GenerationError("Generation request failed with status " +
                              std::to_string(http_client_->last_status()),
                              response.substr(0, 200));
    }
    return parse_response(response);
}

GenerationResult generate_with_retry(TextGenerator& generator, const std::string& prompt,
                                     const GenerationParams& params, const RetrySettings& retry,
                                     const SleepFunction& sleep) {
    return retry_with_backoff(
        retry, "Text generation",
        [&] { return generator.generate(prompt, params); },
        [](const std::string& message) { return GenerationError(message); },
        sleep);
}

} // namespace counselscript
