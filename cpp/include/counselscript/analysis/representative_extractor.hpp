#pragma once

/**
 * Per-cluster representative selection.
 *
 * Each member of a cluster gets a composite quality score:
 *
 *   0.25 centroid proximity   max(0, 1 - distance / 2), 0.5 when unknown
 *   0.30 success label        1 for successful records, else 0
 *   0.15 text length          1 inside [100, 500] characters
 *   0.15 novelty              1 - max cosine to primaries of other runs
 *   0.15 content quality      domain keyword density per 100 characters
 *
 * Candidates under min_quality_score are dropped, the rest sorted by score
 * (ties by vector id) and the top max_per_cluster kept; the first is
 * primary. The stored set for the cluster result is replaced as a whole.
 */

#include <optional>
#include <string>
#include <vector>

#include "counselscript/error.hpp"
#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/store/vector_store.hpp"
#include "counselscript/text/keywords.hpp"

namespace counselscript {

struct QualityComponents {
    double centroid_proximity = 0.0;
    double success = 0.0;
    double text_length = 0.0;
    double novelty = 0.0;
    double content_quality = 0.0;

    // Weighted sum clamped to [0, 1]
    double total() const;
};

struct SelectedRepresentative {
    std::string vector_id;
    double quality_score = 0.0;
    double distance_to_centroid = 0.0;
    bool is_primary = false;
    QualityComponents components;
    std::string text;
    std::string session_id;
    std::string counselor_name;
    TimePoint created_at{};
    bool is_success = true;
};

struct ClusterRepresentatives {
    int cluster_label = 0;
    std::vector<SelectedRepresentative> representatives;
};

struct ExtractionSummary {
    size_t total_clusters = 0;
    size_t total_representatives = 0;
    double avg_quality_score = 0.0;
};

struct ExtractionResult {
    std::string cluster_result_id;
    std::vector<ClusterRepresentatives> clusters;   // ascending cluster label
    ExtractionSummary summary;
};

struct ClusterCharacteristics {
    size_t cluster_size = 0;
    double avg_text_length = 0.0;
    std::vector<std::string> common_keywords;       // at most 10, most frequent first
    std::string description;
};

struct GenerationRepresentative {
    int cluster_label = 0;
    std::string vector_id;
    std::string text;
    double quality_score = 0.0;
    bool is_primary = false;
    std::string counselor_name;
    TimePoint created_at{};
    ClusterCharacteristics characteristics;
};

class RepresentativeExtractor {
public:
    RepresentativeExtractor(const VectorStore& store, ClusterRepository& repository,
                            KeywordLexicon lexicon = KeywordLexicon::defaults());

    Outcome<ExtractionResult> extract_representatives(const std::string& cluster_result_id,
                                                      size_t max_per_cluster = 3,
                                                      double min_quality_score = 0.5);

    // One primary per cluster (best first), then the best non-primaries
    // until max_total is reached
    Outcome<std::vector<GenerationRepresentative>> get_representatives_for_script_generation(
        const std::string& cluster_result_id, size_t max_total = 8) const;

    ClusterCharacteristics analyze_cluster(const std::string& cluster_result_id, int cluster_label) const;

    static double centroid_score(std::optional<double> distance_to_centroid);
    static double length_score(size_t length);
    double content_quality_score(const std::string& text) const;

private:
    const VectorStore& store_;
    ClusterRepository& repository_;
    KeywordLexicon lexicon_;
};

} // namespace counselscript
