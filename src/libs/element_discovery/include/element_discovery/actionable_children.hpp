#pragma once

#include <element_discovery/discovery_constants.hpp>
#include <screen_hierarchy/hierarchy_builder.hpp>
#include <screen_model/ui_element.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace element_discovery {

enum class ActionableType {
    Button,
    TextButton,
    Input,
    Checkbox,
    Switch,
    ClickableText,
    ImageButton,
    ListItem,
    Tab,
    Link,
    OtherClickable
};

std::string_view to_string(ActionableType type);

// Clickable, or one of the interactive widget classes.
bool is_actionable(const screen_model::UIElement& element);

// First matching rule wins: button, input, checkbox, switch, clickable image,
// list item, tab, link, clickable text view, then other.
ActionableType classify_actionable(const screen_model::UIElement& element);

// Per-type base, adjusted by keyword tier and text length; within [0.1, 1].
double actionable_confidence(const screen_model::UIElement& element, ActionableType type);

// "Click \"<text>\"", else "Click <description>", else a per-type default.
std::string action_text(const screen_model::UIElement& element, ActionableType type);

// Higher shows first. `depth` is 0 for a direct child. Never negative.
int actionable_priority(const screen_model::UIElement& element, ActionableType type, int depth);

// "rid:<resource id>", "text:<text>" for short texts, else "class:<ShortType>@<bounds>".
std::string actionable_key(const screen_model::UIElement& element);

struct ActionableChild {
    const screen_hierarchy::HierarchyNode* node = nullptr;
    ActionableType type = ActionableType::OtherClickable;
    double confidence = 0.0;
    std::string action_text;
    std::string key;
    int priority = 0;
    int depth = 0;
};

struct ActionableAnalysis {
    const screen_hierarchy::HierarchyNode* parent = nullptr;
    // Priority descending, then confidence descending, then tree order.
    std::vector<ActionableChild> children;

    const ActionableChild* recommendation() const {
        return children.empty() ? nullptr : &children.front();
    }
};

// Collects the actionable nodes below `parent` (not `parent` itself), walking at
// most `max_depth` levels below its direct children.
ActionableAnalysis analyze_actionable_children(const screen_hierarchy::HierarchyNode& parent,
    int max_depth = defaults::actionable_max_depth);

} // namespace element_discovery
