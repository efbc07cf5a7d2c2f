#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace counselscript {

using Vector = std::vector<float>;
using TimePoint = std::chrono::system_clock::time_point;

// Open extra-attributes map (string -> scalar)
using AttributeValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using Attributes = std::map<std::string, AttributeValue>;

std::optional<double> attribute_as_double(const Attributes& attrs, const std::string& key);
std::optional<std::string> attribute_as_string(const Attributes& attrs, const std::string& key);
std::string attribute_to_string(const AttributeValue& value);

struct TextChunk {
    std::string text;
    int token_count = 0;
    bool oversized = false;   // single atomic line above the token cap
};

struct EmbeddedChunk {
    std::string source_text;
    int chunk_index = 0;
    int total_chunks = 0;
    Vector vector;
    int token_count = 0;
};

struct SuccessVectorRecord {
    std::string id;
    std::string session_id;
    std::string chunk_text;
    Vector vector;
    bool is_success = true;
    std::string counselor_name;
    int chunk_index = 0;
    TimePoint created_at{};
    Attributes metadata;
};

struct ScoredRecord {
    SuccessVectorRecord record;
    double similarity_score = 0.0;
};

struct ClusterResult {
    std::string id;
    std::string algorithm;
    int cluster_count = 0;
    Attributes parameters;
    std::optional<double> silhouette_score;
    TimePoint created_at{};
};

struct ClusterAssignment {
    std::string vector_id;
    std::string cluster_result_id;
    int cluster_label = -1;                      // -1 = noise
    std::optional<double> distance_to_centroid;
};

struct ClusterRepresentative {
    std::string cluster_result_id;
    std::string vector_id;
    int cluster_label = 0;
    double quality_score = 0.0;
    double distance_to_centroid = 0.0;
    bool is_primary = false;
};

struct AnomalyResult {
    std::string vector_id;
    std::string algorithm;
    double anomaly_score = 0.0;
    bool is_anomaly = false;
    Attributes parameters;
};

} // namespace counselscript
