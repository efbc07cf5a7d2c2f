#include "counselscript/embedding/embedding_provider.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

#include <boost/json.hpp>

namespace counselscript {

HttpEmbeddingProvider::HttpEmbeddingProvider(std::shared_ptr<net::HttpClient> http_client, std::string model)
    : http_client_(std::move(http_client)), model_(std::move(model)) {
    COUNSELSCRIPT_CHECK_ARGUMENT(http_client_, "HttpEmbeddingProvider requires an HTTP client");
}

std::string HttpEmbeddingProvider::build_request(const std::vector<std::string>& texts, const std::string& model) {
    boost::json::object root;

    boost::json::array input_array;
    for (const auto& text : texts) {
        input_array.push_back(boost::json::string(text));
    }
    root["input"] = std::move(input_array);
    root["model"] = model;
    root["encoding_format"] = "float";

    return boost::json::serialize(root);
}

std::vector<Vector> HttpEmbeddingProvider::parse_response(const std::string& response, size_t expected) {
    std::vector<Vector> results(expected);
    std::vector<bool> filled(expected, false);

    try {
        boost::json::value val = boost::json::parse(response);
        const auto& data = val.as_object().at("data").as_array();

        for (size_t pos = 0; pos < data.size(); ++pos) {
            const auto& item = data[pos].as_object();
            // "index" ties each embedding back to its input; fall back to array position
            size_t index = pos;
            if (auto it = item.find("index"); it != item.end()) {
                index = static_cast<size_t>(it->value().to_number<int64_t>());
            }
            if (index >= expected) {
                throw EmbeddingError("Embedding index " + std::to_string(index) + " out of range");
            }

            const auto& embedding = item.at("embedding").as_array();
            Vector vec;
            vec.reserve(embedding.size());
            for (const auto& component : embedding) {
                vec.push_back(static_cast<float>(component.to_number<double>()));
            }
            results[index] = std::move(vec);
            filled[index] = true;
        }
    } catch (const EmbeddingError&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingError(std::string("Invalid embedding response: ") + e.what());
    }

    for (size_t i = 0; i < expected; ++i) {
        if (!filled[i]) {
            throw EmbeddingError("Embedding response is missing item " + std::to_string(i));
        }
    }
    return results;
}

std::vector<Vector> HttpEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    LOG_DEBUG("Requesting ", texts.size(), " embeddings from ", http_client_->endpoint().host);

    std::string response;
    bool success = http_client_->send_request("POST", http_client_->endpoint().path,
                                              build_request(texts, model_), response);
    if (!success) {
        throw EmbeddingError("Embedding request failed with status " +
                             std::to_string(http_client_->last_status()),
                             response.substr(0, 200));
    }
    return parse_response(response, texts.size());
}

} // namespace counselscript
