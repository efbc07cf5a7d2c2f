// =============================================================================
// Text Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include "counselscript/generation/script_parser.hpp"
#include "counselscript/text/keywords.hpp"
#include "counselscript/text/tokenizer.hpp"
#include "counselscript/util/ids.hpp"
#include "counselscript/util/utf8.hpp"
#include <string>
#include <vector>

using namespace counselscript;

class TokenizerTest : public ::testing::Test {
protected:
    text::Tokenizer tokenizer;
};

TEST_F(TokenizerTest, EmptyTextHasNoTokens) {
    EXPECT_EQ(tokenizer.count_tokens(""), 0);
}

// Spans must tile the input exactly
TEST_F(TokenizerTest, SpansCoverInput) {
    const std::string text = "Hello world, 12345!\nこんにちは\n\nfinal";
    auto spans = tokenizer.tokenize(text);
    ASSERT_FALSE(spans.empty());

    size_t expected_offset = 0;
    for (const auto& span : spans) {
        EXPECT_EQ(span.offset, expected_offset);
        EXPECT_GT(span.size, 0u);
        expected_offset += span.size;
    }
    EXPECT_EQ(expected_offset, text.size());
}

TEST_F(TokenizerTest, EachJapaneseCodepointIsOneToken) {
    EXPECT_EQ(tokenizer.count_tokens("脱毛"), 2);
    EXPECT_EQ(tokenizer.count_tokens("こんにちは"), 5);
}

TEST_F(TokenizerTest, DigitsGroupInThrees) {
    EXPECT_EQ(tokenizer.count_tokens("123456"), 2);
    EXPECT_EQ(tokenizer.count_tokens("1234567"), 3);
}

// =============================================================================
// UTF-8
// =============================================================================

TEST(Utf8Test, CodepointLengthCountsCharacters) {
    EXPECT_EQ(util::codepoint_length("abc"), 3u);
    EXPECT_EQ(util::codepoint_length("安心です"), 4u);
}

TEST(Utf8Test, PrefixNeverSplitsSequences) {
    EXPECT_EQ(util::utf8_prefix("安心です", 2), "安心");
    EXPECT_EQ(util::utf8_prefix("ab", 10), "ab");
}

TEST(Utf8Test, InvalidBytesDecodeAsReplacement) {
    const std::string bad = std::string("a") + '\xFF' + "b";
    auto cps = util::decode_utf8(bad);
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1].value, 0xFFFDu);
    EXPECT_EQ(cps[1].size, 1u);
}

TEST(Utf8Test, ScriptClassification) {
    EXPECT_TRUE(util::is_hiragana(U'あ'));
    EXPECT_TRUE(util::is_katakana(U'カ'));
    EXPECT_TRUE(util::is_kanji(U'安'));
    EXPECT_FALSE(util::is_cjk(U'a'));
}

TEST(IdTest, GeneratedIdsAreValidAndDistinct) {
    auto a = util::generate_id();
    auto b = util::generate_id();
    EXPECT_TRUE(util::is_valid_id(a));
    EXPECT_TRUE(util::is_valid_id(b));
    EXPECT_NE(a, b);
    EXPECT_FALSE(util::is_valid_id("not-an-id"));
}

// =============================================================================
// Keywords
// =============================================================================

class KeywordTest : public ::testing::Test {
protected:
    KeywordLexicon lexicon = KeywordLexicon::defaults();
};

TEST_F(KeywordTest, CountPresentCountsDistinctKeywords) {
    EXPECT_EQ(text::count_present("効果と効果と料金", {"効果", "料金", "安心"}), 2u);
}

TEST_F(KeywordTest, CountOccurrencesIsNonOverlapping) {
    EXPECT_EQ(text::count_occurrences("aaaa", "aa"), 2u);
    EXPECT_EQ(text::count_occurrences("効果は効果的", std::vector<std::string>{"効果", "的"}), 3u);
}

TEST_F(KeywordTest, ExtractKeywordsDropsStopwords) {
    auto words = text::extract_keywords("The treatment and the results", lexicon.stopwords);
    EXPECT_EQ(words, (std::vector<std::string>{"treatment", "results"}));
}

TEST_F(KeywordTest, TopKeywordsOrdersByFrequency) {
    auto top = text::top_keywords({"price price safety", "price comfort"}, lexicon.stopwords, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].first, "price");
    EXPECT_EQ(top[0].second, 3u);
    EXPECT_EQ(top[1].first, "safety");
}

TEST_F(KeywordTest, DefaultLexiconHasHintTable) {
    EXPECT_FALSE(lexicon.hints.empty());
    EXPECT_FALSE(lexicon.default_hint.empty());
    EXPECT_EQ(lexicon.max_hints, 3u);
}

// =============================================================================
// Script Parser
// =============================================================================

class ScriptParserTest : public ::testing::Test {
protected:
    ScriptParser parser;

    static std::string full_script() {
        return "# Improvement Script\n\n"
               "### 1. Success Factor Analysis\n"
               "Clear pricing and reassurance drive conversions.\n\n"
               "### 2. Improvement Points\n"
               "Explain the treatment period up front.\n\n"
               "### 3. Counseling Script\n"
               "#### A. Opening\n"
               "Thank you for coming in today, let us start.\n"
               "#### B. Needs Assessment\n"
               "What results are you hoping for?\n"
               "#### C. Solution Proposal\n"
               "This course fits your schedule well.\n"
               "#### D. Closing\n"
               "Shall we book your first session?\n\n"
               "### 4. Practical Improvements\n"
               "Use a price sheet.\n\n"
               "### 5. Expected Effects\n"
               "Higher conversion.\n";
    }
};

TEST_F(ScriptParserTest, ParsesSectionsAndPhases) {
    auto script = parser.parse(full_script());

    EXPECT_EQ(script.success_factors_analysis, "Clear pricing and reassurance drive conversions.");
    EXPECT_EQ(script.improvement_points, "Explain the treatment period up front.");
    EXPECT_EQ(script.practical_improvements, "Use a price sheet.");
    EXPECT_EQ(script.expected_effects, "Higher conversion.");
    EXPECT_EQ(script.phases.opening, "Thank you for coming in today, let us start.");
    EXPECT_EQ(script.phases.needs_assessment, "What results are you hoping for?");
    EXPECT_EQ(script.phases.solution_proposal, "This course fits your schedule well.");
    EXPECT_EQ(script.phases.closing, "Shall we book your first session?");
    EXPECT_EQ(script.raw_content, full_script());
}

TEST_F(ScriptParserTest, JapaneseHeadingsMatch) {
    auto script = parser.parse("## 期待される効果\n成約率の向上\n");
    EXPECT_EQ(script.expected_effects, "成約率の向上");
}

TEST_F(ScriptParserTest, MissingSectionsStayEmpty) {
    auto script = parser.parse("plain text without headings");
    EXPECT_TRUE(script.success_factors_analysis.empty());
    EXPECT_TRUE(script.phases.opening.empty());
    EXPECT_EQ(script.raw_content, "plain text without headings");
}

TEST_F(ScriptParserTest, BoldSubsectionMarkers) {
    auto body = ScriptParser::extract_subsection("**Opening**\nHello there\n**Closing**\nBye", "Opening");
    EXPECT_EQ(body, "Hello there");
}

TEST_F(ScriptParserTest, FromTextKeepsRawContent) {
    auto script = GeneratedScript::from_text("free text");
    EXPECT_EQ(script.raw_content, "free text");
}
