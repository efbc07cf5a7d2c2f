#include "counselscript/analysis/representative_extractor.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/utf8.hpp"
#include "counselscript/vector_ops.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace counselscript {

namespace {

constexpr double kCentroidWeight = 0.25;
constexpr double kSuccessWeight = 0.30;
constexpr double kLengthWeight = 0.15;
constexpr double kNoveltyWeight = 0.15;
constexpr double kContentWeight = 0.15;

constexpr size_t kIdealMinLength = 100;
constexpr size_t kIdealMaxLength = 500;

struct PrimaryVector {
    std::string vector_id;
    Vector vector;
};

double novelty_against(const std::string& vector_id, const Vector& vector,
                       const std::vector<PrimaryVector>& primaries) {
    bool any = false;
    double max_similarity = -1.0;
    for (const auto& p : primaries) {
        if (p.vector_id == vector_id || p.vector.size() != vector.size()) continue;
        any = true;
        max_similarity = std::max(max_similarity, vecops::cosine_similarity(vector, p.vector));
    }
    if (!any) return 1.0;
    return std::max(0.0, 1.0 - max_similarity);
}

} // namespace

double QualityComponents::total() const {
    double score = centroid_proximity * kCentroidWeight +
                   success * kSuccessWeight +
                   text_length * kLengthWeight +
                   novelty * kNoveltyWeight +
                   content_quality * kContentWeight;
    return std::clamp(score, 0.0, 1.0);
}

RepresentativeExtractor::RepresentativeExtractor(const VectorStore& store, ClusterRepository& repository,
                                                 KeywordLexicon lexicon)
    : store_(store), repository_(repository), lexicon_(std::move(lexicon)) {}

double RepresentativeExtractor::centroid_score(std::optional<double> distance_to_centroid) {
    if (!distance_to_centroid) return 0.5;
    return std::max(0.0, 1.0 - *distance_to_centroid / 2.0);
}

double RepresentativeExtractor::length_score(size_t length) {
    if (length >= kIdealMinLength && length <= kIdealMaxLength) return 1.0;
    if (length < kIdealMinLength) {
        return std::max(0.3, static_cast<double>(length) / kIdealMinLength);
    }
    double excess = std::min(0.7, static_cast<double>(length - kIdealMaxLength) / kIdealMaxLength);
    return std::max(0.3, 1.0 - excess);
}

double RepresentativeExtractor::content_quality_score(const std::string& text) const {
    const double per_hundred = std::max(1.0, static_cast<double>(util::codepoint_length(text)) / 100.0);
    const double important = text::count_present(text, lexicon_.important) / per_hundred;
    const double positive = text::count_present(text, lexicon_.positive) / per_hundred;
    const double negative = text::count_present(text, lexicon_.negative) / per_hundred;
    return std::clamp(important * 0.5 + positive * 0.4 - negative * 0.1, 0.0, 1.0);
}

Outcome<ExtractionResult> RepresentativeExtractor::extract_representatives(const std::string& cluster_result_id,
                                                                           size_t max_per_cluster,
                                                                           double min_quality_score) {
    if (!repository_.find_cluster_result(cluster_result_id)) {
        return Outcome<ExtractionResult>::failure(ErrorCode::NOT_FOUND,
                                                  "Cluster result not found: " + cluster_result_id);
    }

    // Novelty reference: primaries stored by other runs, so re-running is stable
    std::vector<PrimaryVector> primaries;
    for (const auto& rep : repository_.list_primary_representatives(cluster_result_id)) {
        if (auto record = store_.get_vector(rep.vector_id)) {
            primaries.push_back({rep.vector_id, std::move(record->vector)});
        }
    }

    std::map<int, std::vector<ClusterAssignment>> by_label;
    for (auto& a : repository_.list_assignments(cluster_result_id)) {
        if (a.cluster_label >= 0) by_label[a.cluster_label].push_back(std::move(a));
    }

    ExtractionResult result;
    result.cluster_result_id = cluster_result_id;
    double quality_sum = 0.0;

    for (const auto& [label, members] : by_label) {
        std::vector<SelectedRepresentative> candidates;
        for (const auto& a : members) {
            auto record = store_.get_vector(a.vector_id);
            if (!record) {
                LOG_WARN("Assigned vector ", a.vector_id, " missing from store; skipped");
                continue;
            }

            SelectedRepresentative c;
            c.components.centroid_proximity = centroid_score(a.distance_to_centroid);
            c.components.success = record->is_success ? 1.0 : 0.0;
            c.components.text_length = length_score(util::codepoint_length(record->chunk_text));
            c.components.novelty = novelty_against(record->id, record->vector, primaries);
            c.components.content_quality = content_quality_score(record->chunk_text);
            c.quality_score = c.components.total();
            if (c.quality_score < min_quality_score) continue;

            c.vector_id = record->id;
            c.distance_to_centroid = a.distance_to_centroid.value_or(0.0);
            c.text = record->chunk_text;
            c.session_id = record->session_id;
            c.counselor_name = record->counselor_name;
            c.created_at = record->created_at;
            c.is_success = record->is_success;
            candidates.push_back(std::move(c));
        }

        std::sort(candidates.begin(), candidates.end(),
                  [](const SelectedRepresentative& x, const SelectedRepresentative& y) {
                      if (x.quality_score != y.quality_score) return x.quality_score > y.quality_score;
                      return x.vector_id < y.vector_id;
                  });
        if (candidates.size() > max_per_cluster) candidates.resize(max_per_cluster);
        if (candidates.empty()) continue;

        for (size_t i = 0; i < candidates.size(); ++i) {
            candidates[i].is_primary = i == 0;
            quality_sum += candidates[i].quality_score;
        }
        result.summary.total_representatives += candidates.size();
        result.clusters.push_back({label, std::move(candidates)});
    }

    result.summary.total_clusters = result.clusters.size();
    if (result.summary.total_representatives > 0) {
        result.summary.avg_quality_score = quality_sum / result.summary.total_representatives;
    }

    std::vector<ClusterRepresentative> rows;
    for (const auto& cluster : result.clusters) {
        for (const auto& rep : cluster.representatives) {
            rows.push_back({cluster_result_id, rep.vector_id, cluster.cluster_label, rep.quality_score,
                            rep.distance_to_centroid, rep.is_primary});
        }
    }
    repository_.replace_representatives(cluster_result_id, rows);

    LOG_INFO("Representatives for ", cluster_result_id, ": ", result.summary.total_clusters, " clusters, ",
             result.summary.total_representatives, " representatives, avg quality ",
             result.summary.avg_quality_score);
    return result;
}

ClusterCharacteristics RepresentativeExtractor::analyze_cluster(const std::string& cluster_result_id,
                                                                int cluster_label) const {
    ClusterCharacteristics out;
    std::vector<std::string> texts;
    size_t total_length = 0;
    for (const auto& a : repository_.list_assignments(cluster_result_id)) {
        if (a.cluster_label != cluster_label) continue;
        if (auto record = store_.get_vector(a.vector_id)) {
            total_length += util::codepoint_length(record->chunk_text);
            texts.push_back(std::move(record->chunk_text));
        }
    }
    if (texts.empty()) return out;

    out.cluster_size = texts.size();
    out.avg_text_length = static_cast<double>(total_length) / texts.size();
    for (auto& [word, count] : text::top_keywords(texts, lexicon_.stopwords, 10)) {
        out.common_keywords.push_back(word);
    }

    if (out.common_keywords.empty()) {
        out.description = "No characteristic keywords found";
    } else {
        out.description = "Key keywords: ";
        for (size_t i = 0; i < std::min<size_t>(5, out.common_keywords.size()); ++i) {
            if (i) out.description += ", ";
            out.description += out.common_keywords[i];
        }
    }
    return out;
}

Outcome<std::vector<GenerationRepresentative>> RepresentativeExtractor::get_representatives_for_script_generation(
    const std::string& cluster_result_id, size_t max_total) const {
    if (!repository_.find_cluster_result(cluster_result_id)) {
        return Outcome<std::vector<GenerationRepresentative>>::failure(
            ErrorCode::NOT_FOUND, "Cluster result not found: " + cluster_result_id);
    }

    auto reps = repository_.list_representatives(cluster_result_id);
    std::stable_sort(reps.begin(), reps.end(), [](const ClusterRepresentative& x, const ClusterRepresentative& y) {
        return x.quality_score > y.quality_score;
    });

    std::vector<const ClusterRepresentative*> chosen;
    std::set<int> covered;
    for (const auto& rep : reps) {
        if (rep.is_primary && covered.insert(rep.cluster_label).second) {
            chosen.push_back(&rep);
        }
    }
    for (const auto& rep : reps) {
        if (chosen.size() >= max_total) break;
        if (!rep.is_primary) chosen.push_back(&rep);
    }

    std::map<int, ClusterCharacteristics> characteristics;
    std::vector<GenerationRepresentative> out;
    for (const auto* rep : chosen) {
        auto record = store_.get_vector(rep->vector_id);
        if (!record) {
            LOG_WARN("Representative vector ", rep->vector_id, " missing from store; skipped");
            continue;
        }
        if (!characteristics.count(rep->cluster_label)) {
            characteristics[rep->cluster_label] = analyze_cluster(cluster_result_id, rep->cluster_label);
        }

        GenerationRepresentative g;
        g.cluster_label = rep->cluster_label;
        g.vector_id = rep->vector_id;
        g.text = record->chunk_text;
        g.quality_score = rep->quality_score;
        g.is_primary = rep->is_primary;
        g.counselor_name = record->counselor_name;
        g.created_at = record->created_at;
        g.characteristics = characteristics[rep->cluster_label];
        out.push_back(std::move(g));
    }
    return out;
}

} // namespace counselscript
