#pragma once

#include <screen_hierarchy/hierarchy_observer.hpp>
#include <screen_hierarchy/hierarchy_options.hpp>
#include <screen_model/ui_element.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace screen_hierarchy {

// Node storage lives in the owning HierarchyAnalysisResult; parent and children
// are non-owning links into that storage.
struct HierarchyNode {
    const screen_model::UIElement* element = nullptr;
    HierarchyNode* parent = nullptr;
    std::vector<HierarchyNode*> children; // dump order
    std::size_t index_in_parent = 0;
    int depth = 0;
    bool is_leaf = true;
    Attachment attachment = Attachment::None;
    bool synthetic = false; // screen root made up by the builder, not an input element
    std::size_t input_index = 0;

    const std::string& id() const { return element->id; }
};

class HierarchyAnalysisResult;

// Builds a single-rooted tree from a flat element list. Passes, in order:
//   1. hidden elements resolve a semantic parent (hidden_element_resolver.hpp);
//   2. visible elements attach to the smallest rectangle that contains them,
//      ascending by area, rejecting near-duplicates by area ratio;
//   3. root ladder: single root / largest root adopting non-geometric orphans /
//      relaxed-tolerance retry / largest-element root (or a synthesized one when
//      HierarchyOptions::synthesize_root is set, or nothing is geometric).
// Never fails for messy geometry; throws std::invalid_argument for an empty or
// duplicate element id.
HierarchyAnalysisResult analyze_hierarchy(std::vector<screen_model::UIElement> elements,
    const HierarchyOptions& options = {},
    HierarchyObserver* observer = nullptr);

// Immutable once returned by analyze_hierarchy. Move-only: nodes point into
// the element snapshot and node arena it owns.
class HierarchyAnalysisResult {
public:
    HierarchyAnalysisResult() = default;
    HierarchyAnalysisResult(const HierarchyAnalysisResult&) = delete;
    HierarchyAnalysisResult& operator=(const HierarchyAnalysisResult&) = delete;
    HierarchyAnalysisResult(HierarchyAnalysisResult&&) = default;
    HierarchyAnalysisResult& operator=(HierarchyAnalysisResult&&) = default;

    bool empty() const { return root_ == nullptr; }
    const HierarchyNode* root() const { return root_; }
    const HierarchyNode* find(const std::string& id) const;
    // Nodes keyed by element id, including the synthetic root when one was made.
    std::size_t size() const { return node_map_.size(); }
    const std::vector<const HierarchyNode*>& leaf_nodes() const { return leaf_nodes_; }
    int max_depth() const { return max_depth_; }
    // Input snapshot, in the order it was supplied.
    const std::vector<screen_model::UIElement>& elements() const { return elements_; }
    bool has_synthetic_root() const { return root_ && root_->synthetic; }
    // Tolerance the containment edges were built with (relaxed after a retry).
    int effective_tolerance() const { return effective_tolerance_; }
    bool relaxed_retry() const { return relaxed_retry_; }

private:
    friend HierarchyAnalysisResult analyze_hierarchy(std::vector<screen_model::UIElement> elements,
        const HierarchyOptions& options, HierarchyObserver* observer);

    std::vector<screen_model::UIElement> elements_;
    std::unique_ptr<screen_model::UIElement> synthetic_element_;
    std::vector<std::unique_ptr<HierarchyNode>> nodes_;
    std::unordered_map<std::string, HierarchyNode*> node_map_;
    std::vector<const HierarchyNode*> leaf_nodes_;
    HierarchyNode* root_ = nullptr;
    int max_depth_ = 0;
    int effective_tolerance_ = defaults::containment_tolerance_px;
    bool relaxed_retry_ = false;
};

} // namespace screen_hierarchy
