#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace counselscript {

struct CounselingPhases {
    std::string opening;
    std::string needs_assessment;
    std::string solution_proposal;
    std::string closing;
};

// Improvement script as produced by the text-generation collaborator
struct GeneratedScript {
    std::string success_factors_analysis;
    std::string improvement_points;
    std::string counseling_script;        // body of the script section, phases included
    CounselingPhases phases;
    std::string practical_improvements;
    std::string expected_effects;
    std::string detailed_analysis;
    std::string raw_content;

    // Narrative sections and phases joined by spaces
    std::string combined_text() const;

    // Every text field except raw_content
    std::string all_text() const;

    static GeneratedScript from_text(std::string text);
};

// Heading aliases; a heading matches when it contains any alias
struct ScriptLayout {
    std::vector<std::string> success_factors_analysis;
    std::vector<std::string> improvement_points;
    std::vector<std::string> counseling_script;
    std::vector<std::string> practical_improvements;
    std::vector<std::string> expected_effects;
    std::vector<std::string> detailed_analysis;

    std::vector<std::string> opening;
    std::vector<std::string> needs_assessment;
    std::vector<std::string> solution_proposal;
    std::vector<std::string> closing;

    static ScriptLayout defaults();
};

class ScriptParser {
public:
    explicit ScriptParser(ScriptLayout layout = ScriptLayout::defaults())
        : layout_(std::move(layout)) {}

    GeneratedScript parse(std::string_view markdown) const;

    // "## Title" / "### Title" sections in document order
    static std::vector<std::pair<std::string, std::string>> split_sections(std::string_view markdown);

    // Lines after a "####" or "**" line naming the subsection, up to the next such line
    static std::string extract_subsection(std::string_view body, std::string_view name);

private:
    std::string find_section(const std::vector<std::pair<std::string, std::string>>& sections,
                             const std::vector<std::string>& aliases) const;
    std::string find_phase(std::string_view script_body, const std::vector<std::string>& aliases) const;

    ScriptLayout layout_;
};

} // namespace counselscript
