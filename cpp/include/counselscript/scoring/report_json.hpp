#pragma once

#include <string>

#include <boost/json.hpp>

#include "counselscript/generation/script_parser.hpp"
#include "counselscript/scoring/quality_scorer.hpp"

namespace counselscript {

boost::json::object to_json(const ScriptQualityReport& report);

/**
 * Scoring inputs from JSON:
 *
 *   {
 *     "success_patterns":   [{"name", "keywords": [], "improvement_suggestions": []}],
 *     "success_elements":   [{"name", "keywords": [], "patterns": [], "improvement_suggestions": []}],
 *     "historical_scripts": ["<markdown>", ...],
 *     "source_quality":     {"completeness", "consistency", "accuracy", "sample_size",
 *                            "success_rate_variance", "confidence_interval_width",
 *                            "data_recency", "counselor_diversity"}
 *   }
 *
 * Every key is optional. Historical scripts go through parser. Throws
 * InvalidArgumentError on malformed input.
 */
ScoringBaseData parse_base_data(const std::string& json_text, const ScriptParser& parser);

} // namespace counselscript
