#include "counselscript/text/keywords.hpp"
#include "counselscript/util/utf8.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace counselscript {

KeywordLexicon KeywordLexicon::defaults() {
    KeywordLexicon lex;
    lex.important = {"効果", "料金", "安心", "体験", "相談", "無料", "カウンセリング",
                     "脱毛", "痛み", "期間", "回数", "保証", "技術", "安全"};
    lex.positive = {"満足", "安心", "効果的", "快適", "信頼", "安全", "丁寧", "親切",
                    "分かりやすい", "おすすめ"};
    lex.negative = {"痛い", "高い", "不安", "心配", "迷う", "悩む"};
    lex.tone_positive = {"安心", "効果", "満足", "信頼", "安全"};
    lex.hints = {
        {"効果", "より具体的な効果の説明を含める"},
        {"料金", "料金体系の明確な説明を追加"},
        {"安心", "顧客の不安を軽減する表現を使用"},
        {"体験", "体験談や事例を活用"},
        {"相談", "相談しやすい雰囲気作りを重視"},
    };
    lex.default_hint = "成功例のトーンや構成を参考にしてみてください";
    lex.stopwords = {"です", "ます", "ある", "いる", "する", "なる", "れる", "られる",
                     "こと", "もの", "ため", "よう", "から", "まで", "など",
                     "the", "and", "you", "that", "this", "with", "for", "are"};
    lex.action_indicators = {"具体的", "例えば", "ポイント", "コツ", "方法", "テクニック",
                             "言い回し", "表現", "アプローチ", "話し方", "手順", "ステップ"};
    lex.expertise_terms = {"脱毛", "美容", "カウンセリング", "成約", "顧客", "クライアント",
                           "レーザー", "光脱毛", "IPL", "医療", "施術", "契約", "料金プラン",
                           "カウンセラー", "エステ", "サロン", "クリニック"};
    lex.innovation_keywords = {"新しい", "革新的", "独自", "画期的", "効果的", "改善された",
                               "アプローチ", "手法", "テクニック", "戦略"};
    return lex;
}

namespace text {

size_t count_present(std::string_view text, const std::vector<std::string>& keywords) {
    return static_cast<size_t>(std::count_if(keywords.begin(), keywords.end(),
        [&](const std::string& kw) { return !kw.empty() && text.find(kw) != std::string_view::npos; }));
}

size_t count_occurrences(std::string_view text, std::string_view needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = text.find(needle);
    while (pos != std::string_view::npos) {
        ++count;
        pos = text.find(needle, pos + needle.size());
    }
    return count;
}

size_t count_occurrences(std::string_view text, const std::vector<std::string>& needles) {
    size_t total = 0;
    for (const auto& needle : needles) {
        total += count_occurrences(text, needle);
    }
    return total;
}

std::vector<std::string> extract_keywords(std::string_view text,
                                          const std::vector<std::string>& stopwords) {
    const std::unordered_set<std::string> stop(stopwords.begin(), stopwords.end());
    std::vector<std::string> keywords;

    const auto cps = util::decode_utf8(text);
    const size_t n = cps.size();

    auto is_japanese = [](uint32_t cp) {
        return util::is_hiragana(cp) || util::is_katakana(cp) || util::is_kanji(cp);
    };
    auto is_ascii_letter = [](uint32_t cp) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
    };

    auto emit = [&](size_t first, size_t last, size_t min_len, bool lower) {
        if (last - first < min_len) return;
        size_t begin = cps[first].offset;
        size_t end = cps[last - 1].offset + cps[last - 1].size;
        std::string word(text.substr(begin, end - begin));
        if (lower) word = util::to_lower_ascii(word);
        if (!stop.count(word)) keywords.push_back(std::move(word));
    };

    size_t i = 0;
    while (i < n) {
        if (is_japanese(cps[i].value)) {
            size_t j = i;
            while (j < n && is_japanese(cps[j].value)) ++j;
            emit(i, j, 2, false);
            i = j;
        } else if (is_ascii_letter(cps[i].value)) {
            size_t j = i;
            while (j < n && is_ascii_letter(cps[j].value)) ++j;
            emit(i, j, 3, true);
            i = j;
        } else {
            ++i;
        }
    }

    return keywords;
}

std::vector<std::pair<std::string, size_t>> top_keywords(const std::vector<std::string>& texts,
                                                         const std::vector<std::string>& stopwords,
                                                         size_t limit) {
    std::unordered_map<std::string, size_t> counts;
    std::vector<std::string> order;
    for (const auto& t : texts) {
        for (auto& kw : extract_keywords(t, stopwords)) {
            if (counts[kw]++ == 0) order.push_back(kw);
        }
    }

    std::vector<std::pair<std::string, size_t>> ranked;
    ranked.reserve(order.size());
    for (const auto& kw : order) {
        ranked.emplace_back(kw, counts[kw]);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > limit) ranked.resize(limit);
    return ranked;
}

} // namespace text
} // namespace counselscript
