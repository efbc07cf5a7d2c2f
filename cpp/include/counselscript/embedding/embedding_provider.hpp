#pragma once

#include <memory>
#include <string>
#include <vector>

#include "counselscript/net/http_client.hpp"
#include "counselscript/types.hpp"

namespace counselscript {

// Remote embedding model; one output vector per input text, in input order
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // Throws EmbeddingError on any provider or protocol failure
    virtual std::vector<Vector> embed(const std::vector<std::string>& texts) = 0;
};

// OpenAI-compatible /v1/embeddings client
class HttpEmbeddingProvider : public EmbeddingProvider {
public:
    HttpEmbeddingProvider(std::shared_ptr<net::HttpClient> http_client, std::string model);

    std::vector<Vector> embed(const std::vector<std::string>& texts) override;

    static std::string build_request(const std::vector<std::string>& texts, const std::string& model);
    static std::vector<Vector> parse_response(const std::string& response, size_t expected);

private:
    std::shared_ptr<net::HttpClient> http_client_;
    std::string model_;
};

} // namespace counselscript
