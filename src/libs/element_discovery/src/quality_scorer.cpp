#include <element_discovery/quality_scorer.hpp>
#include <algorithm>
#include <cstdint>
#include <cctype>

namespace element_discovery {

namespace {

constexpr double kMaxScore = 100.0;

bool ieq(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return false;
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), ieq) != haystack.end();
}

bool equals_ci(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), ieq);
}

double text_score(const screen_model::UIElement& e, const ScoringVocabulary& vocabulary) {
    double score = 0;
    const std::string text = trimmed(e.text);
    if (!text.empty()) {
        score += 40;
        const std::size_t len = utf8_length(text);
        if (len >= 2 && len <= 20)
            score += 30;
        else if (len >= 21 && len <= 50)
            score += 20;
        else
            score += 5;
        if (is_meaningful_text(text)) score += 20;
        if (contains_action_word(text, vocabulary)) score += 10;
    }
    if (!trimmed(e.content_desc).empty()) score += 15;
    return std::min(score, kMaxScore);
}

double uniqueness_score(const screen_model::UIElement& e, const ScoringVocabulary& vocabulary) {
    double score = 0;
    if (!e.resource_id.empty()) {
        score += 40;
        const bool meaningful = std::any_of(vocabulary.meaningful_id_patterns.begin(),
            vocabulary.meaningful_id_patterns.end(),
            [&](const std::string& p) { return contains_ci(e.resource_id, p); });
        if (meaningful) score += 20;
    }
    if (!e.class_name.empty()) score += 15;

    const std::string text = trimmed(e.text);
    if (!text.empty()) {
        const std::size_t len = utf8_length(text);
        const bool phrase = std::any_of(vocabulary.unique_phrases.begin(), vocabulary.unique_phrases.end(),
            [&](const std::string& p) { return equals_ci(text, p); });
        if ((len >= 2 && len <= 10) || phrase) score += 25;
    }
    return std::min(score, kMaxScore);
}

double stability_score(const screen_model::UIElement& e, const ScoringVocabulary& vocabulary) {
    double score = 50;
    if (e.clickable) score += 20;
    if (!e.resource_id.empty()) score += 20;
    if (contains_action_word(e.text, vocabulary)) score += 10;
    return std::min(score, kMaxScore);
}

double matchability_score(const screen_model::UIElement& e) {
    double score = 0;
    if (!trimmed(e.text).empty()) score += 20;
    if (!e.resource_id.empty()) score += 20;
    if (!trimmed(e.content_desc).empty()) score += 20;
    if (!e.class_name.empty()) score += 20;
    if (e.clickable || e.scrollable) score += 20;
    if (e.bounds) {
        const auto reasonable = [](std::int64_t side) {
            return side >= defaults::min_reasonable_side_px && side <= defaults::max_reasonable_side_px;
        };
        if (reasonable(e.bounds->width()) && reasonable(e.bounds->height())) score += 20;
    }
    return std::min(score, kMaxScore);
}

} // namespace

std::size_t utf8_length(std::string_view text) {
    std::size_t count = 0;
    for (const char c : text) {
        // Continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string trimmed(std::string_view text) {
    const auto space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), space).base();
    return first < last ? std::string(first, last) : std::string();
}

bool contains_action_word(std::string_view text, const ScoringVocabulary& vocabulary) {
    return std::any_of(vocabulary.action_words.begin(), vocabulary.action_words.end(),
        [&](const std::string& w) { return contains_ci(text, w); });
}

bool is_meaningful_text(std::string_view text) {
    const std::size_t len = utf8_length(text);
    if (len < 1 || len > 100) return false;
    const bool all_digits = std::all_of(text.begin(), text.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    // Non-ASCII bytes count as word characters (CJK text).
    const bool all_symbols = std::all_of(text.begin(), text.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u < 0x80 && !std::isalnum(u);
    });
    return !all_digits && !all_symbols;
}

ElementQuality calculate_quality(const screen_model::UIElement& element,
    const ScoringVocabulary& vocabulary)
{
    ElementQuality q;
    q.text_score = text_score(element, vocabulary);
    q.uniqueness_score = uniqueness_score(element, vocabulary);
    q.stability_score = stability_score(element, vocabulary);
    q.matchability_score = matchability_score(element);
    q.total_score = defaults::text_weight * q.text_score
        + defaults::uniqueness_weight * q.uniqueness_score
        + defaults::stability_weight * q.stability_score
        + defaults::matchability_weight * q.matchability_score;
    return q;
}

} // namespace element_discovery
