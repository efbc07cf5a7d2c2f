#include "counselscript/scoring/report_json.hpp"
#include "counselscript/error.hpp"

#include <chrono>

namespace counselscript {

namespace json = boost::json;

namespace {

json::array to_array(const std::vector<std::string>& items) {
    json::array out;
    for (const auto& s : items) out.emplace_back(json::string(s));
    return out;
}

std::vector<std::string> string_list(const json::object& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end()) return out;
    for (const auto& v : it->value().as_array()) {
        out.emplace_back(v.as_string());
    }
    return out;
}

std::optional<double> optional_number(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return std::nullopt;
    return it->value().to_number<double>();
}

const json::array* array_at(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->value().as_array();
}

json::object coverage_json(const CoverageReport& c) {
    json::array covered;
    for (const auto& p : c.covered_patterns) {
        covered.push_back(json::object{{"name", p.name},
                                       {"coverage_score", p.coverage_score},
                                       {"key_elements", to_array(p.key_elements)}});
    }
    json::array missing;
    for (const auto& p : c.missing_patterns) {
        missing.push_back(json::object{{"name", p.name},
                                       {"missing_elements", to_array(p.missing_elements)},
                                       {"suggestions", to_array(p.suggestions)}});
    }
    json::object details;
    for (const auto& [name, d] : c.coverage_details) {
        details[name] = json::object{{"covered", d.covered},
                                     {"coverage_score", d.coverage_score},
                                     {"matching_elements", to_array(d.matching_elements)}};
    }
    return {{"coverage_percentage", c.coverage_percentage},
            {"covered_patterns", std::move(covered)},
            {"missing_patterns", std::move(missing)},
            {"coverage_details", std::move(details)},
            {"total_patterns_analyzed", c.total_patterns_analyzed}};
}

json::object matching_json(const SuccessMatchingReport& m) {
    json::array matched;
    for (const auto& e : m.matched_elements) {
        matched.push_back(json::object{{"name", e.name},
                                       {"strength", e.strength},
                                       {"keyword_matches", e.keyword_matches},
                                       {"pattern_matches", e.pattern_matches}});
    }
    json::array missing;
    for (const auto& e : m.missing_elements) {
        missing.push_back(json::object{{"name", e.name},
                                       {"strength", e.strength},
                                       {"recommendations", to_array(e.recommendations)}});
    }
    json::object strength;
    for (const auto& [name, s] : m.element_strength) strength[name] = s;
    return {{"matching_rate", m.matching_rate},
            {"matched_elements", std::move(matched)},
            {"missing_elements", std::move(missing)},
            {"element_strength", std::move(strength)},
            {"total_elements_analyzed", m.total_elements_analyzed}};
}

} // namespace

json::object to_json(const ScriptQualityReport& report) {
    const auto& n = report.novelty;
    const auto& r = report.reliability;
    const auto& c = report.content_quality;
    const auto& d = report.detailed_analysis;

    json::array priorities;
    for (const auto& p : d.improvement_priority) {
        priorities.push_back(json::object{{"area", p.area},
                                          {"current_score", p.current_score},
                                          {"improvement_potential", p.improvement_potential},
                                          {"impact_weight", p.impact_weight},
                                          {"priority_score", p.priority_score}});
    }

    const auto analyzed_at = std::chrono::duration_cast<std::chrono::seconds>(
        report.analyzed_at.time_since_epoch()).count();

    return {
        {"coverage", coverage_json(report.coverage)},
        {"novelty", json::object{{"novelty_score", n.novelty_score},
                                 {"max_similarity", n.max_similarity},
                                 {"similarity_to_past", n.similarity_to_past},
                                 {"unique_elements", to_array(n.unique_elements)},
                                 {"innovation_areas", to_array(n.innovation_areas)},
                                 {"comparison_count", n.comparison_count}}},
        {"success_matching", matching_json(report.success_matching)},
        {"reliability", json::object{{"confidence_score", r.confidence_score},
                                     {"data_quality_score", r.data_quality_score},
                                     {"sample_size_adequacy", r.sample_size_adequacy},
                                     {"statistical_reliability", r.statistical_reliability},
                                     {"recommendation_strength", recommendation_strength_name(r.recommendation_strength)},
                                     {"reliability_factors", to_array(r.reliability_factors)}}},
        {"content_quality", json::object{{"overall_score", c.overall_score},
                                         {"readability_score", c.readability_score},
                                         {"actionability_score", c.actionability_score},
                                         {"structure_score", c.structure_score},
                                         {"expertise_score", c.expertise_score},
                                         {"content_metrics", json::object{
                                             {"word_count", c.content_metrics.word_count},
                                             {"sentence_count", c.content_metrics.sentence_count},
                                             {"avg_sentence_length", c.content_metrics.avg_sentence_length},
                                             {"character_count", c.content_metrics.character_count},
                                             {"paragraph_count", c.content_metrics.paragraph_count}}},
                                         {"missing_phases", to_array(c.missing_phases)},
                                         {"improvement_suggestions", to_array(c.improvement_suggestions)}}},
        {"overall_quality", report.overall_quality},
        {"detailed_analysis", json::object{{"strengths", to_array(d.strengths)},
                                           {"weaknesses", to_array(d.weaknesses)},
                                           {"recommendations", to_array(d.recommendations)},
                                           {"key_insights", to_array(d.key_insights)},
                                           {"improvement_priority", std::move(priorities)}}},
        {"analysis_metadata", json::object{{"analyzed_at", analyzed_at},
                                           {"analysis_duration_ms", report.analysis_duration_ms}}},
    };
}

ScoringBaseData parse_base_data(const std::string& json_text, const ScriptParser& parser) {
    ScoringBaseData data;
    if (json_text.empty()) return data;

    boost::system::error_code ec;
    json::value root = json::parse(json_text, ec);
    if (ec || !root.is_object()) {
        throw InvalidArgumentError("Malformed scoring base data", ec ? ec.message() : "not an object");
    }

    try {
        const auto& obj = root.as_object();

        if (const auto* patterns = array_at(obj, "success_patterns")) {
            for (const auto& v : *patterns) {
                const auto& p = v.as_object();
                data.success_patterns.push_back({std::string(p.at("name").as_string()),
                                                 string_list(p, "keywords"),
                                                 string_list(p, "improvement_suggestions")});
            }
        }

        if (const auto* elements = array_at(obj, "success_elements")) {
            for (const auto& v : *elements) {
                const auto& e = v.as_object();
                data.success_elements.push_back({std::string(e.at("name").as_string()),
                                                 string_list(e, "keywords"),
                                                 string_list(e, "patterns"),
                                                 string_list(e, "improvement_suggestions")});
            }
        }

        if (const auto* history = array_at(obj, "historical_scripts")) {
            for (const auto& v : *history) {
                data.historical_scripts.push_back(parser.parse(std::string(v.as_string())));
            }
        }

        if (auto it = obj.find("source_quality"); it != obj.end()) {
            const auto& q = it->value().as_object();
            auto& s = data.source_quality;
            s.completeness = optional_number(q, "completeness");
            s.consistency = optional_number(q, "consistency");
            s.accuracy = optional_number(q, "accuracy");
            s.success_rate_variance = optional_number(q, "success_rate_variance");
            s.confidence_interval_width = optional_number(q, "confidence_interval_width");
            s.data_recency_days = optional_number(q, "data_recency");
            s.sample_size = static_cast<size_t>(optional_number(q, "sample_size").value_or(0.0));
            s.counselor_diversity = static_cast<size_t>(optional_number(q, "counselor_diversity").value_or(0.0));
        }
    } catch (const std::exception& e) {
        throw InvalidArgumentError(std::string("Malformed scoring base data: ") + e.what());
    }
    return data;
}

} // namespace counselscript
