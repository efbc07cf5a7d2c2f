#pragma once

#include <cstdint>
#include <string>

#include "counselscript/generation/script_parser.hpp"
#include "counselscript/text/keywords.hpp"

namespace counselscript {

struct LogSettings {
    std::string level = "info";
    std::string file;
};

struct EndpointSettings {
    std::string host = "localhost";
    uint16_t port = 443;
    std::string path;
    bool use_tls = true;
    std::string api_key;
    int timeout_seconds = 30;
};

struct RetrySettings {
    int max_attempts = 3;
    int base_delay_ms = 1000;
    double multiplier = 2.0;
};

struct EmbeddingSettings {
    EndpointSettings endpoint{"api.openai.com", 443, "/v1/embeddings", true, "", 30};
    std::string model = "text-embedding-3-small";
    int dimension = 1536;
    int max_tokens = 512;
    int smart_chunk_overlap = 50;
    int batch_size = 20;
    int batch_pause_ms = 100;
    int item_pause_ms = 50;
    RetrySettings retry;
};

struct GenerationSettings {
    EndpointSettings endpoint{"api.openai.com", 443, "/v1/chat/completions", true, "", 120};
    std::string model = "gpt-4";
    int max_tokens = 4000;
    double temperature = 0.7;
    RetrySettings retry;
};

struct DatabaseSettings {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "counselscript";
    std::string user = "postgres";
    std::string password;
    int pool_size = 4;
};

struct ClusteringSettings {
    int k_min = 2;
    int k_max = 15;
    int n_init = 10;
    int max_iter = 300;
    uint64_t seed = 42;
    int hdbscan_min_samples = 3;
};

struct AnomalySettings {
    double contamination = 0.1;
    int n_estimators = 100;
    uint64_t seed = 42;
};

struct MatchingSettings {
    int top_k = 5;
    double similarity_threshold = 0.7;
    int cache_ttl_seconds = 3600;
    size_t cache_capacity = 1024;
};

struct Config {
    LogSettings log;
    EmbeddingSettings embedding;
    GenerationSettings generation;
    DatabaseSettings database;
    ClusteringSettings clustering;
    AnomalySettings anomaly;
    MatchingSettings matching;
    KeywordLexicon lexicon = KeywordLexicon::defaults();
    ScriptLayout script_layout = ScriptLayout::defaults();

    // Throws ConfigError on inconsistent values
    void validate() const;

    std::string database_conninfo() const;
};

// Defaults, then the YAML file (if non-empty), then CS_* environment overrides
Config load_config(const std::string& config_file = "");

Config load_config_from_string(const std::string& yaml_text);

void apply_env_overrides(Config& config);

} // namespace counselscript
