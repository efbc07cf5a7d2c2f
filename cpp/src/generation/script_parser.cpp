#include "counselscript/generation/script_parser.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/utf8.hpp"

#include <sstream>

namespace counselscript {

namespace {

void append_text(std::string& out, const std::string& piece) {
    if (piece.empty()) return;
    if (!out.empty()) out += ' ';
    out += piece;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

std::string GeneratedScript::combined_text() const {
    std::string out;
    append_text(out, success_factors_analysis);
    append_text(out, improvement_points);
    append_text(out, practical_improvements);
    append_text(out, expected_effects);
    append_text(out, phases.opening);
    append_text(out, phases.needs_assessment);
    append_text(out, phases.solution_proposal);
    append_text(out, phases.closing);
    return out;
}

std::string GeneratedScript::all_text() const {
    std::string out;
    append_text(out, success_factors_analysis);
    append_text(out, improvement_points);
    append_text(out, counseling_script);
    append_text(out, practical_improvements);
    append_text(out, expected_effects);
    append_text(out, detailed_analysis);
    append_text(out, phases.opening);
    append_text(out, phases.needs_assessment);
    append_text(out, phases.solution_proposal);
    append_text(out, phases.closing);
    return out;
}

GeneratedScript GeneratedScript::from_text(std::string text) {
    GeneratedScript script;
    script.success_factors_analysis = text;
    script.raw_content = std::move(text);
    return script;
}

ScriptLayout ScriptLayout::defaults() {
    ScriptLayout layout;
    layout.success_factors_analysis = {"成功パターン別共通要因分析", "Success Factor Analysis"};
    layout.improvement_points = {"失敗→成功への具体的改善ポイント", "Improvement Points"};
    layout.counseling_script = {"改善カウンセリングスクリプト", "Counseling Script"};
    layout.practical_improvements = {"実用的な改善ポイント", "Practical Improvements"};
    layout.expected_effects = {"期待される効果", "Expected Effects"};
    layout.detailed_analysis = {"詳細分析レポート", "Detailed Analysis"};

    layout.opening = {"オープニング", "Opening"};
    layout.needs_assessment = {"ニーズ確認", "Needs Assessment"};
    layout.solution_proposal = {"ソリューション提案", "Solution Proposal"};
    layout.closing = {"クロージング", "Closing"};
    return layout;
}

std::vector<std::pair<std::string, std::string>> ScriptParser::split_sections(std::string_view markdown) {
    std::vector<std::pair<std::string, std::string>> sections;
    std::string current;
    std::ostringstream body;
    bool in_section = false;
    bool has_body = false;

    auto flush = [&]() {
        if (in_section && has_body) {
            sections.emplace_back(current, util::trim(body.str()));
        }
        body.str("");
        body.clear();
        has_body = false;
    };

    for (std::string_view raw : split_lines(markdown)) {
        std::string line = util::trim(raw);

        // Two or three hashes followed by whitespace
        size_t hashes = 0;
        while (hashes < line.size() && line[hashes] == '#') ++hashes;
        bool header = (hashes == 2 || hashes == 3) && hashes < line.size() &&
                      (line[hashes] == ' ' || line[hashes] == '\t') &&
                      !util::trim(std::string_view(line).substr(hashes)).empty();

        if (header) {
            flush();
            current = util::trim(std::string_view(line).substr(hashes));
            in_section = true;
        } else if (in_section) {
            if (has_body) body << '\n';
            body << raw;
            has_body = true;
        }
    }
    flush();

    return sections;
}

std::string ScriptParser::extract_subsection(std::string_view body, std::string_view name) {
    std::ostringstream content;
    bool in_target = false;
    bool first = true;

    for (std::string_view line : split_lines(body)) {
        bool marker = line.find("####") != std::string_view::npos;
        if (!in_target) {
            if (line.find(name) != std::string_view::npos &&
                (marker || line.find("**") != std::string_view::npos)) {
                in_target = true;
            }
            continue;
        }
        if (marker || (starts_with(line, "**") && ends_with(line, "**"))) {
            break;
        }
        if (!first) content << '\n';
        content << line;
        first = false;
    }

    return util::trim(content.str());
}

std::string ScriptParser::find_section(const std::vector<std::pair<std::string, std::string>>& sections,
                                       const std::vector<std::string>& aliases) const {
    for (const auto& alias : aliases) {
        for (const auto& [title, body] : sections) {
            if (title.find(alias) != std::string::npos) return body;
        }
    }
    return "";
}

std::string ScriptParser::find_phase(std::string_view script_body, const std::vector<std::string>& aliases) const {
    for (const auto& alias : aliases) {
        std::string content = extract_subsection(script_body, alias);
        if (!content.empty()) return content;
    }
    return "";
}

GeneratedScript ScriptParser::parse(std::string_view markdown) const {
    auto sections = split_sections(markdown);

    GeneratedScript script;
    script.raw_content = std::string(markdown);
    script.success_factors_analysis = find_section(sections, layout_.success_factors_analysis);
    script.improvement_points = find_section(sections, layout_.improvement_points);
    script.counseling_script = find_section(sections, layout_.counseling_script);
    script.practical_improvements = find_section(sections, layout_.practical_improvements);
    script.expected_effects = find_section(sections, layout_.expected_effects);
    script.detailed_analysis = find_section(sections, layout_.detailed_analysis);

    script.phases.opening = find_phase(script.counseling_script, layout_.opening);
    script.phases.needs_assessment = find_phase(script.counseling_script, layout_.needs_assessment);
    script.phases.solution_proposal = find_phase(script.counseling_script, layout_.solution_proposal);
    script.phases.closing = find_phase(script.counseling_script, layout_.closing);

    LOG_DEBUG("Parsed script: ", sections.size(), " sections, script body ",
              script.counseling_script.size(), " bytes");
    return script;
}

} // namespace counselscript
