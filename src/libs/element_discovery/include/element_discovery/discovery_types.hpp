#pragma once

#include <element_discovery/discovery_constants.hpp>
#include <screen_model/ui_element.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace element_discovery {

enum class Relationship {
    Self,
    DirectParent,
    Grandparent,
    Ancestor,     // three or more levels up
    DirectChild,
    Grandchild,
    Descendant,   // three or more levels down
    Sibling
};

// "self", "direct-parent", "grandparent", "ancestor", ...
std::string_view to_string(Relationship relationship);

// Display label for a relationship at `distance` levels: "direct-parent",
// "grandparent", "3-level ancestor", "direct-child", "grandchild",
// "4-level descendant", ...
std::string relationship_label(Relationship relationship, int distance);

struct DiscoveredElement {
    const screen_model::UIElement* element = nullptr;
    Relationship relationship = Relationship::Self;
    double confidence = 0; // [0, 1]
    std::string reason;
    bool has_text = false;
    bool is_clickable = false;
    std::optional<int> depth; // levels away from the effective target
    std::optional<std::string> path; // "target > child > grandchild"
};

struct DiscoveryOptions {
    int max_depth = defaults::max_traversal_depth;
    std::size_t max_descendants = defaults::descendant_cap;
    std::size_t max_siblings = defaults::sibling_cap;
    std::size_t max_recommended = defaults::recommended_cap;
    int promotion_depth = defaults::promotion_depth;
    bool prioritize_text = true;
    bool promote_to_clickable = true;
};

struct DiscoveryResult {
    std::optional<DiscoveredElement> self;
    std::string requested_target;
    std::string effective_target; // differs from requested_target after promotion
    bool promoted = false;
    std::vector<DiscoveredElement> parents;
    std::vector<DiscoveredElement> children;
    std::vector<DiscoveredElement> siblings;
    std::vector<DiscoveredElement> recommended;
    std::string error; // empty on success

    bool ok() const { return error.empty(); }
};

} // namespace element_discovery
