#pragma once

#include <element_discovery/discovery_types.hpp>
#include <screen_hierarchy/hierarchy_builder.hpp>
#include <string>

namespace element_discovery {

// Relationship kind a base confidence is computed for.
enum class CandidateKind {
    Self,
    Parent,
    Child,
    Sibling
};

// Confidence of `element` as a candidate of the given kind, clamped to [0, 1].
// Ancestors are further divided by their distance in discover().
double base_confidence(const screen_model::UIElement& element, CandidateKind kind);

// Parents, children, siblings and recommended matches of `target_id`.
// A non-clickable target is first promoted to its nearest clickable ancestor
// within options.promotion_depth levels. An unknown id yields empty groupings
// and a message in DiscoveryResult::error; nothing is thrown.
DiscoveryResult discover(const screen_hierarchy::HierarchyAnalysisResult& hierarchy,
    const std::string& target_id, const DiscoveryOptions& options = {});

// The node itself when clickable, else the first clickable ancestor; nullptr
// when there is none up to the root or the id is unknown.
const screen_hierarchy::HierarchyNode* find_nearest_clickable_ancestor(
    const screen_hierarchy::HierarchyAnalysisResult& hierarchy, const std::string& id);

enum class RelationKind {
    Self,
    Ancestor,
    Descendant,
    Sibling,
    Unrelated
};

struct RelationClass {
    RelationKind kind = RelationKind::Unrelated;
    int level = 0; // levels apart for Ancestor/Descendant, else 0
};

// How `other_id` relates to `target_id` in the tree, from `other`'s point of
// view: Ancestor means other sits above target. Unknown ids are Unrelated.
RelationClass classify_relationship(const screen_hierarchy::HierarchyAnalysisResult& hierarchy,
    const std::string& target_id, const std::string& other_id);

} // namespace element_discovery
