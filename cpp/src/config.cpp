#include "counselscript/config.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <type_traits>

namespace counselscript {

namespace {

template<typename T>
void read(const YAML::Node& node, const char* key, T& target) {
    if (node && node[key]) target = node[key].as<T>();
}

void read_list(const YAML::Node& node, const char* key, std::vector<std::string>& target) {
    if (node && node[key]) target = node[key].as<std::vector<std::string>>();
}

void read_endpoint(const YAML::Node& node, EndpointSettings& endpoint) {
    if (!node) return;
    read(node, "host", endpoint.host);
    read(node, "port", endpoint.port);
    read(node, "path", endpoint.path);
    read(node, "use_tls", endpoint.use_tls);
    read(node, "api_key", endpoint.api_key);
    read(node, "timeout_seconds", endpoint.timeout_seconds);
}

void read_retry(const YAML::Node& node, RetrySettings& retry) {
    if (!node) return;
    read(node, "max_attempts", retry.max_attempts);
    read(node, "base_delay_ms", retry.base_delay_ms);
    read(node, "multiplier", retry.multiplier);
}

void apply_yaml(const YAML::Node& yaml, Config& config) {
    if (const auto log = yaml["log"]) {
        read(log, "level", config.log.level);
        read(log, "file", config.log.file);
    }

    if (const auto emb = yaml["embedding"]) {
        read_endpoint(emb["endpoint"], config.embedding.endpoint);
        read_retry(emb["retry"], config.embedding.retry);
        read(emb, "model", config.embedding.model);
        read(emb, "dimension", config.embedding.dimension);
        read(emb, "max_tokens", config.embedding.max_tokens);
        read(emb, "smart_chunk_overlap", config.embedding.smart_chunk_overlap);
        read(emb, "batch_size", config.embedding.batch_size);
        read(emb, "batch_pause_ms", config.embedding.batch_pause_ms);
        read(emb, "item_pause_ms", config.embedding.item_pause_ms);
    }

    if (const auto gen = yaml["generation"]) {
        read_endpoint(gen["endpoint"], config.generation.endpoint);
        read_retry(gen["retry"], config.generation.retry);
        read(gen, "model", config.generation.model);
        read(gen, "max_tokens", config.generation.max_tokens);
        read(gen, "temperature", config.generation.temperature);
    }

    if (const auto db = yaml["database"]) {
        read(db, "host", config.database.host);
        read(db, "port", config.database.port);
        read(db, "dbname", config.database.dbname);
        read(db, "user", config.database.user);
        read(db, "password", config.database.password);
        read(db, "pool_size", config.database.pool_size);
    }

    if (const auto cl = yaml["clustering"]) {
        read(cl, "k_min", config.clustering.k_min);
        read(cl, "k_max", config.clustering.k_max);
        read(cl, "n_init", config.clustering.n_init);
        read(cl, "max_iter", config.clustering.max_iter);
        read(cl, "seed", config.clustering.seed);
        read(cl, "hdbscan_min_samples", config.clustering.hdbscan_min_samples);
    }

    if (const auto an = yaml["anomaly"]) {
        read(an, "contamination", config.anomaly.contamination);
        read(an, "n_estimators", config.anomaly.n_estimators);
        read(an, "seed", config.anomaly.seed);
    }

    if (const auto m = yaml["matching"]) {
        read(m, "top_k", config.matching.top_k);
        read(m, "similarity_threshold", config.matching.similarity_threshold);
        read(m, "cache_ttl_seconds", config.matching.cache_ttl_seconds);
        read(m, "cache_capacity", config.matching.cache_capacity);
    }

    if (const auto lex = yaml["lexicon"]) {
        auto& l = config.lexicon;
        read_list(lex, "important", l.important);
        read_list(lex, "positive", l.positive);
        read_list(lex, "negative", l.negative);
        read_list(lex, "tone_positive", l.tone_positive);
        read_list(lex, "stopwords", l.stopwords);
        read_list(lex, "action_indicators", l.action_indicators);
        read_list(lex, "expertise_terms", l.expertise_terms);
        read_list(lex, "innovation_keywords", l.innovation_keywords);
        read(lex, "default_hint", l.default_hint);
        read(lex, "max_hints", l.max_hints);
        if (const auto hints = lex["hints"]) {
            // Sequence keeps the table order
            l.hints.clear();
            for (const auto& entry : hints) {
                l.hints.push_back({entry["keyword"].as<std::string>(), entry["advice"].as<std::string>()});
            }
        }
    }

    if (const auto layout = yaml["script_layout"]) {
        auto& s = config.script_layout;
        read_list(layout, "success_factors_analysis", s.success_factors_analysis);
        read_list(layout, "improvement_points", s.improvement_points);
        read_list(layout, "counseling_script", s.counseling_script);
        read_list(layout, "practical_improvements", s.practical_improvements);
        read_list(layout, "expected_effects", s.expected_effects);
        read_list(layout, "detailed_analysis", s.detailed_analysis);
        read_list(layout, "opening", s.opening);
        read_list(layout, "needs_assessment", s.needs_assessment);
        read_list(layout, "solution_proposal", s.solution_proposal);
        read_list(layout, "closing", s.closing);
    }
}

void set_if_env(const char* env_var, std::string& target) {
    const char* value = std::getenv(env_var);
    if (value && *value) target = value;
}

template<typename T>
void set_if_env_number(const char* env_var, T& target) {
    const char* value = std::getenv(env_var);
    if (!value || !*value) return;
    try {
        if constexpr (std::is_floating_point_v<T>) {
            target = static_cast<T>(std::stod(value));
        } else {
            target = static_cast<T>(std::stoll(value));
        }
    } catch (const std::exception&) {
        LOG_WARN("Ignoring non-numeric value for ", env_var, ": ", value);
    }
}

} // namespace

void apply_env_overrides(Config& config) {
    set_if_env("CS_LOG_LEVEL", config.log.level);
    set_if_env("CS_LOG_FILE", config.log.file);

    set_if_env("CS_EMBEDDING_HOST", config.embedding.endpoint.host);
    set_if_env_number("CS_EMBEDDING_PORT", config.embedding.endpoint.port);
    set_if_env("CS_EMBEDDING_API_KEY", config.embedding.endpoint.api_key);
    set_if_env("CS_EMBEDDING_MODEL", config.embedding.model);
    set_if_env_number("CS_VECTOR_DIMENSION", config.embedding.dimension);

    set_if_env("CS_GENERATION_HOST", config.generation.endpoint.host);
    set_if_env_number("CS_GENERATION_PORT", config.generation.endpoint.port);
    set_if_env("CS_GENERATION_API_KEY", config.generation.endpoint.api_key);
    set_if_env("CS_GENERATION_MODEL", config.generation.model);

    set_if_env("CS_DB_HOST", config.database.host);
    set_if_env("CS_DB_PORT", config.database.port);
    set_if_env("CS_DB_NAME", config.database.dbname);
    set_if_env("CS_DB_USER", config.database.user);
    set_if_env("CS_DB_PASS", config.database.password);
}

void Config::validate() const {
    auto require = [](bool condition, const std::string& message) {
        if (!condition) throw ConfigError(message, "Config::validate");
    };

    require(embedding.dimension > 0, "embedding.dimension must be positive");
    require(embedding.max_tokens > 0, "embedding.max_tokens must be positive");
    require(embedding.batch_size > 0, "embedding.batch_size must be positive");
    require(embedding.smart_chunk_overlap >= 0 && embedding.smart_chunk_overlap < embedding.max_tokens,
            "embedding.smart_chunk_overlap must be in [0, max_tokens)");
    require(embedding.retry.max_attempts > 0, "embedding.retry.max_attempts must be positive");
    require(generation.retry.max_attempts > 0, "generation.retry.max_attempts must be positive");
    require(clustering.k_min >= 2, "clustering.k_min must be at least 2");
    require(clustering.k_min <= clustering.k_max, "clustering.k_min must not exceed k_max");
    require(clustering.n_init > 0 && clustering.max_iter > 0, "clustering iterations must be positive");
    require(anomaly.contamination > 0.0 && anomaly.contamination <= 0.5,
            "anomaly.contamination must be in (0, 0.5]");
    require(anomaly.n_estimators > 0, "anomaly.n_estimators must be positive");
    require(matching.top_k > 0, "matching.top_k must be positive");
    require(matching.similarity_threshold >= -1.0 && matching.similarity_threshold <= 1.0,
            "matching.similarity_threshold must be in [-1, 1]");
}

std::string Config::database_conninfo() const {
    std::string conninfo = "dbname=" + database.dbname;
    if (!database.host.empty()) conninfo += " host=" + database.host;
    if (!database.port.empty()) conninfo += " port=" + database.port;
    if (!database.user.empty()) conninfo += " user=" + database.user;
    if (!database.password.empty()) conninfo += " password=" + database.password;
    conninfo += " connect_timeout=5";
    return conninfo;
}

Config load_config(const std::string& config_file) {
    Config config;

    if (!config_file.empty()) {
        if (!std::filesystem::exists(config_file)) {
            throw ConfigError("Config file not found: " + config_file, "load_config");
        }
        try {
            apply_yaml(YAML::LoadFile(config_file), config);
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("Failed to parse config: ") + e.what(), config_file);
        }
    }

    apply_env_overrides(config);
    config.validate();

    LOG_INFO("Configuration loaded", config_file.empty() ? "" : " from ", config_file);
    return config;
}

Config load_config_from_string(const std::string& yaml_text) {
    Config config;
    try {
        apply_yaml(YAML::Load(yaml_text), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse config: ") + e.what(), "load_config_from_string");
    }
    config.validate();
    return config;
}

} // namespace counselscript
