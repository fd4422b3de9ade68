#pragma once

#include <screen_hierarchy/hierarchy_observer.hpp>
#include <screen_hierarchy/hierarchy_options.hpp>
#include <screen_model/ui_element.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace screen_hierarchy {

struct SemanticMatch {
    std::size_t parent_index = 0;
    SemanticRule rule = SemanticRule::NamespaceContainer;
};

// "com.app:id/tab_label" -> "com.app"; "" when the id has no namespace.
std::string_view resource_namespace(std::string_view resource_id);
// "com.app:id/tab_label" -> "tab_label".
std::string_view resource_name(std::string_view resource_id);

bool is_container_type(std::string_view class_name, const HierarchyOptions& options);

// True when a child named `child_name` conventionally sits inside `parent_name`
// (a configured pair matches, or parent_name is a proper substring of child_name).
bool identifier_affinity(std::string_view child_name, std::string_view parent_name,
    const HierarchyOptions& options);

// Picks a semantic parent for the hidden element at `hidden_index`. `parent_of`
// holds the links made so far and is used to refuse candidates that would close
// a cycle. Rules are tried in order; within a rule, identifier affinity wins,
// then closeness in dump order (preceding elements first).
std::optional<SemanticMatch> resolve_hidden_parent(
    const std::vector<screen_model::UIElement>& elements,
    std::size_t hidden_index,
    const std::vector<std::optional<std::size_t>>& parent_of,
    const HierarchyOptions& options);

} // namespace screen_hierarchy
