#include <element_discovery/discovery_engine.hpp>
#include <element_discovery/quality_scorer.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <algorithm>

namespace element_discovery {

namespace {

using screen_hierarchy::HierarchyNode;
using screen_model::UIElement;

bool has_text(const UIElement& e) { return !trimmed(e.text).empty(); }

Relationship ancestor_relationship(int distance) {
    if (distance == 1) return Relationship::DirectParent;
    if (distance == 2) return Relationship::Grandparent;
    return Relationship::Ancestor;
}

Relationship descendant_relationship(int distance) {
    if (distance == 1) return Relationship::DirectChild;
    if (distance == 2) return Relationship::Grandchild;
    return Relationship::Descendant;
}

std::string reason_for(const UIElement& e, Relationship relationship, int distance) {
    std::string reason = relationship_label(relationship, distance);
    const bool hidden = screen_hierarchy::is_hidden(e);
    if (has_text(e))
        reason += hidden ? ", hidden text label \"" + trimmed(e.text) + "\"" : ", text \"" + trimmed(e.text) + "\"";
    if (e.clickable) reason += ", clickable";
    if (!e.resource_id.empty()) reason += ", id " + e.resource_id;
    return reason;
}

DiscoveredElement make_entry(const UIElement& e, Relationship relationship, double confidence, int distance) {
    DiscoveredElement d;
    d.element = &e;
    d.relationship = relationship;
    d.confidence = std::clamp(confidence, 0.0, 1.0);
    d.reason = reason_for(e, relationship, distance);
    d.has_text = has_text(e);
    d.is_clickable = e.clickable;
    if (distance > 0) d.depth = distance;
    return d;
}

// Text first (when enabled), then confidence, then closeness; stable so dump
// order breaks remaining ties.
void rank(std::vector<DiscoveredElement>& items, bool prioritize_text) {
    std::stable_sort(items.begin(), items.end(), [&](const DiscoveredElement& a, const DiscoveredElement& b) {
        if (prioritize_text && a.has_text != b.has_text) return a.has_text;
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        return a.depth.value_or(0) < b.depth.value_or(0);
    });
}

void collect_descendants(const HierarchyNode& node, int distance, const std::string& path,
    const DiscoveryOptions& options, std::vector<DiscoveredElement>& out)
{
    if (distance > options.max_depth) return;
    for (const HierarchyNode* child : node.children) {
        const UIElement& e = *child->element;
        const std::string child_path = path + " > " + e.id;
        DiscoveredElement d = make_entry(e, descendant_relationship(distance),
            base_confidence(e, CandidateKind::Child), distance);
        d.path = child_path;
        out.push_back(std::move(d));
        collect_descendants(*child, distance + 1, child_path, options, out);
    }
}

const HierarchyNode* promote(const HierarchyNode* target, int max_levels) {
    int level = 0;
    for (const HierarchyNode* p = target->parent; p && level < max_levels; p = p->parent, ++level) {
        if (p->synthetic) break;
        if (p->element->clickable) return p;
    }
    return nullptr;
}

} // namespace

std::string_view to_string(Relationship relationship) {
    switch (relationship) {
    case Relationship::Self: return "self";
    case Relationship::DirectParent: return "direct-parent";
    case Relationship::Grandparent: return "grandparent";
    case Relationship::Ancestor: return "ancestor";
    case Relationship::DirectChild: return "direct-child";
    case Relationship::Grandchild: return "grandchild";
    case Relationship::Descendant: return "descendant";
    case Relationship::Sibling: return "sibling";
    }
    return "unknown";
}

std::string relationship_label(Relationship relationship, int distance) {
    if ((relationship == Relationship::Ancestor || relationship == Relationship::Descendant) && distance >= 3)
        return std::to_string(distance) + "-level " + std::string(to_string(relationship));
    return std::string(to_string(relationship));
}

double base_confidence(const UIElement& element, CandidateKind kind) {
    double c = defaults::base_confidence;
    const bool text = has_text(element);
    const bool hidden = screen_hierarchy::is_hidden(element);
    if (text) {
        c += defaults::text_bonus;
        if (hidden) c += defaults::hidden_text_bonus;
    }
    if (element.clickable) c += defaults::clickable_bonus;
    if (!element.resource_id.empty()) c += defaults::resource_id_bonus;
    if (kind == CandidateKind::Parent) c += defaults::parent_bonus;
    if ((kind == CandidateKind::Child || kind == CandidateKind::Sibling) && text) {
        c += defaults::child_text_bonus;
        if (hidden) c += defaults::child_hidden_text_bonus;
    }
    return std::clamp(c, 0.0, 1.0);
}

const HierarchyNode* find_nearest_clickable_ancestor(
    const screen_hierarchy::HierarchyAnalysisResult& hierarchy, const std::string& id)
{
    for (const HierarchyNode* n = hierarchy.find(id); n; n = n->parent) {
        if (n->element->clickable) return n;
    }
    return nullptr;
}

DiscoveryResult discover(const screen_hierarchy::HierarchyAnalysisResult& hierarchy,
    const std::string& target_id, const DiscoveryOptions& options)
{
    DiscoveryResult result;
    result.requested_target = target_id;

    const HierarchyNode* target = hierarchy.find(target_id);
    if (!target) {
        result.error = hierarchy.empty()
            ? "hierarchy is empty; element '" + target_id + "' not found"
            : "element '" + target_id + "' not found in hierarchy";
        return result;
    }

    if (options.promote_to_clickable && !target->element->clickable) {
        if (const HierarchyNode* promoted = promote(target, options.promotion_depth)) {
            target = promoted;
            result.promoted = true;
        }
    }
    result.effective_target = target->id();

    DiscoveredElement self = make_entry(*target->element, Relationship::Self,
        base_confidence(*target->element, CandidateKind::Self), 0);
    if (result.promoted)
        self.reason = "promoted from non-clickable '" + target_id + "' to nearest clickable ancestor";
    self.path = target->id();
    result.self = std::move(self);

    // Ancestors, nearest first; the synthesized screen root is not a real element.
    int distance = 1;
    for (const HierarchyNode* p = target->parent; p && distance <= options.max_depth; p = p->parent, ++distance) {
        if (p->synthetic) break;
        const UIElement& e = *p->element;
        result.parents.push_back(make_entry(e, ancestor_relationship(distance),
            base_confidence(e, CandidateKind::Parent) / distance, distance));
    }

    collect_descendants(*target, 1, target->id(), options, result.children);
    rank(result.children, options.prioritize_text);
    if (result.children.size() > options.max_descendants) result.children.resize(options.max_descendants);

    if (target->parent) {
        for (const HierarchyNode* s : target->parent->children) {
            if (s == target) continue;
            const UIElement& e = *s->element;
            result.siblings.push_back(make_entry(e, Relationship::Sibling,
                base_confidence(e, CandidateKind::Sibling), 0));
        }
        rank(result.siblings, options.prioritize_text);
        if (result.siblings.size() > options.max_siblings) result.siblings.resize(options.max_siblings);
    }

    for (const auto* group : {&result.parents, &result.children}) {
        for (const auto& d : *group) {
            if (d.has_text || d.is_clickable) result.recommended.push_back(d);
        }
    }
    std::stable_sort(result.recommended.begin(), result.recommended.end(),
        [](const DiscoveredElement& a, const DiscoveredElement& b) { return a.confidence > b.confidence; });
    if (result.recommended.size() > options.max_recommended) result.recommended.resize(options.max_recommended);

    return result;
}

RelationClass classify_relationship(const screen_hierarchy::HierarchyAnalysisResult& hierarchy,
    const std::string& target_id, const std::string& other_id)
{
    const HierarchyNode* target = hierarchy.find(target_id);
    const HierarchyNode* other = hierarchy.find(other_id);
    if (!target || !other) return {};
    if (target == other) return {RelationKind::Self, 0};

    int level = 1;
    for (const HierarchyNode* p = target->parent; p; p = p->parent, ++level) {
        if (p == other) return {RelationKind::Ancestor, level};
    }
    level = 1;
    for (const HierarchyNode* p = other->parent; p; p = p->parent, ++level) {
        if (p == target) return {RelationKind::Descendant, level};
    }
    if (target->parent && target->parent == other->parent) return {RelationKind::Sibling, 0};
    return {};
}

} // namespace element_discovery
