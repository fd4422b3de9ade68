#include <element_discovery/actionable_children.hpp>
#include <element_discovery/element_report.hpp>
#include <element_discovery/quality_scorer.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace element_discovery {

namespace {

bool has(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

template <std::size_t N>
bool has_any(std::string_view haystack, const std::array<std::string_view, N>& needles) {
    return std::any_of(needles.begin(), needles.end(),
        [&](std::string_view n) { return has(haystack, n); });
}

// Text and description joined and ASCII-lowercased for keyword lookup.
std::string keyword_haystack(const screen_model::UIElement& e) {
    std::string s = e.text + " " + e.content_desc;
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double type_confidence(ActionableType type) {
    switch (type) {
    case ActionableType::Button: return 0.8;
    case ActionableType::TextButton: return 0.85;
    case ActionableType::Input: return 0.7;
    case ActionableType::Checkbox: return 0.75;
    case ActionableType::Switch: return 0.75;
    case ActionableType::ClickableText: return 0.6;
    case ActionableType::ImageButton: return 0.65;
    case ActionableType::ListItem: return 0.5;
    case ActionableType::Tab: return 0.7;
    case ActionableType::Link: return 0.6;
    case ActionableType::OtherClickable: return 0.4;
    }
    return 0.5;
}

int type_priority(ActionableType type) {
    switch (type) {
    case ActionableType::TextButton: return 20;
    case ActionableType::Button: return 18;
    case ActionableType::ClickableText: return 15;
    case ActionableType::Checkbox: return 12;
    case ActionableType::Switch: return 12;
    case ActionableType::Input: return 10;
    case ActionableType::Tab: return 8;
    case ActionableType::ImageButton: return 6;
    case ActionableType::Link: return 5;
    case ActionableType::ListItem: return 3;
    case ActionableType::OtherClickable: return 0;
    }
    return 0;
}

std::string_view default_action(ActionableType type) {
    switch (type) {
    case ActionableType::Button: return "Click button";
    case ActionableType::TextButton: return "Click text button";
    case ActionableType::Input: return "Enter text";
    case ActionableType::Checkbox: return "Toggle checkbox";
    case ActionableType::Switch: return "Flip switch";
    case ActionableType::ClickableText: return "Click text";
    case ActionableType::ImageButton: return "Click image button";
    case ActionableType::ListItem: return "Click list item";
    case ActionableType::Tab: return "Switch tab";
    case ActionableType::Link: return "Open link";
    case ActionableType::OtherClickable: return "Click element";
    }
    return "Click element";
}

void collect(const screen_hierarchy::HierarchyNode& node, int depth, int max_depth,
    std::vector<ActionableChild>& out)
{
    if (depth > max_depth) return;
    for (const screen_hierarchy::HierarchyNode* child : node.children) {
        const screen_model::UIElement& e = *child->element;
        if (is_actionable(e)) {
            ActionableChild c;
            c.node = child;
            c.type = classify_actionable(e);
            c.confidence = actionable_confidence(e, c.type);
            c.action_text = action_text(e, c.type);
            c.key = actionable_key(e);
            c.priority = actionable_priority(e, c.type, depth);
            c.depth = depth;
            out.push_back(std::move(c));
        }
        collect(*child, depth + 1, max_depth, out);
    }
}

} // namespace

std::string_view to_string(ActionableType type) {
    switch (type) {
    case ActionableType::Button: return "button";
    case ActionableType::TextButton: return "text_button";
    case ActionableType::Input: return "input";
    case ActionableType::Checkbox: return "checkbox";
    case ActionableType::Switch: return "switch";
    case ActionableType::ClickableText: return "clickable_text";
    case ActionableType::ImageButton: return "image_button";
    case ActionableType::ListItem: return "list_item";
    case ActionableType::Tab: return "tab";
    case ActionableType::Link: return "link";
    case ActionableType::OtherClickable: return "other_clickable";
    }
    return "other_clickable";
}

bool is_actionable(const screen_model::UIElement& element) {
    return element.clickable || has_any(element.class_name, defaults::interactive_class_markers);
}

ActionableType classify_actionable(const screen_model::UIElement& element) {
    const std::string_view cls = element.class_name;
    const std::string_view rid = element.resource_id;
    const bool labelled = !element.text.empty() || !element.content_desc.empty();

    if (has(cls, "Button") || has(rid, "button") || has(rid, "btn"))
        return labelled ? ActionableType::TextButton : ActionableType::Button;
    if (has(cls, "EditText") || has(cls, "Input") || has(rid, "edit") || has(rid, "input"))
        return ActionableType::Input;
    if (has(cls, "CheckBox") || has(rid, "checkbox")) return ActionableType::Checkbox;
    if (has(cls, "Switch") || has(rid, "switch")) return ActionableType::Switch;
    if ((has(cls, "ImageButton") || has(cls, "ImageView")) && element.clickable)
        return ActionableType::ImageButton;
    if (has(cls, "ListView") || has(cls, "RecyclerView") || has(rid, "list") || has(rid, "item"))
        return ActionableType::ListItem;
    if (has(cls, "Tab") || has(rid, "tab")) return ActionableType::Tab;
    if (has(cls, "TextView")
        && (has(rid, "link") || has(element.text, "http") || has(element.content_desc, "链接")))
        return ActionableType::Link;
    if (has(cls, "TextView") && element.clickable && labelled) return ActionableType::ClickableText;
    return ActionableType::OtherClickable;
}

double actionable_confidence(const screen_model::UIElement& element, ActionableType type) {
    const std::string words = keyword_haystack(element);
    double c = type_confidence(type);
    if (has_any(words, defaults::high_action_keywords)) c += defaults::actionable_high_keyword_bonus;
    if (has_any(words, defaults::medium_action_keywords)) c += defaults::actionable_medium_keyword_bonus;
    if (has_any(words, defaults::low_action_keywords)) c -= defaults::actionable_low_keyword_penalty;

    const std::size_t len = utf8_length(trimmed(element.text));
    if (len > 0 && len <= defaults::actionable_short_text_max) c += defaults::actionable_short_text_bonus;
    if (len >= defaults::actionable_long_text_min) c -= defaults::actionable_long_text_penalty;
    return std::clamp(c, 0.1, 1.0);
}

std::string action_text(const screen_model::UIElement& element, ActionableType type) {
    if (const std::string text = trimmed(element.text); !text.empty()) return "Click \"" + text + "\"";
    if (const std::string desc = trimmed(element.content_desc); !desc.empty()) return "Click " + desc;
    return std::string(default_action(type));
}

int actionable_priority(const screen_model::UIElement& element, ActionableType type, int depth) {
    int priority = defaults::actionable_base_priority - depth * defaults::actionable_depth_penalty;
    priority += type_priority(type);
    if (has_any(keyword_haystack(element), defaults::high_action_keywords))
        priority += defaults::actionable_keyword_priority;
    return std::max(0, priority);
}

std::string actionable_key(const screen_model::UIElement& element) {
    if (!element.resource_id.empty()) return "rid:" + element.resource_id;
    const std::string text = trimmed(element.text);
    if (!text.empty() && utf8_length(text) <= defaults::actionable_key_text_max) return "text:" + text;
    const std::string bounds = element.bounds ? screen_hierarchy::format_bounds(*element.bounds) : "";
    return "class:" + std::string(short_type(element.class_name)) + "@" + bounds;
}

ActionableAnalysis analyze_actionable_children(const screen_hierarchy::HierarchyNode& parent, int max_depth) {
    ActionableAnalysis analysis;
    analysis.parent = &parent;
    collect(parent, 0, max_depth, analysis.children);
    std::stable_sort(analysis.children.begin(), analysis.children.end(),
        [](const ActionableChild& a, const ActionableChild& b) {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.confidence > b.confidence;
        });
    return analysis;
}

} // namespace element_discovery
