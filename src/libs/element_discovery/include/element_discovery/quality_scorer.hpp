#pragma once

#include <element_discovery/discovery_constants.hpp>
#include <screen_model/ui_element.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace element_discovery {

// Word lists the scorer matches against. Matching is case-insensitive for
// ASCII and byte-exact otherwise.
struct ScoringVocabulary {
    std::vector<std::string> action_words{
        defaults::action_words.begin(), defaults::action_words.end()};
    std::vector<std::string> meaningful_id_patterns{
        defaults::meaningful_id_patterns.begin(), defaults::meaningful_id_patterns.end()};
    std::vector<std::string> unique_phrases{
        defaults::unique_phrases.begin(), defaults::unique_phrases.end()};
};

// Sub-scores are 0..100; total is their weighted sum, also 0..100.
struct ElementQuality {
    double text_score = 0;
    double uniqueness_score = 0;
    double stability_score = 0;
    double matchability_score = 0;
    double total_score = 0;
};

ElementQuality calculate_quality(const screen_model::UIElement& element,
    const ScoringVocabulary& vocabulary = {});

// Number of code points; invalid lead bytes count as one each.
std::size_t utf8_length(std::string_view text);

bool contains_action_word(std::string_view text, const ScoringVocabulary& vocabulary);

// Not only digits, not only symbols, 1..100 code points.
bool is_meaningful_text(std::string_view text);

// Copy without leading/trailing ASCII whitespace.
std::string trimmed(std::string_view text);

} // namespace element_discovery
