#pragma once

#include <screen_hierarchy/hierarchy_builder.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace screen_hierarchy {

// Same as result.find(id); nullptr when the id is unknown.
const HierarchyNode* find_node(const HierarchyAnalysisResult& result, const std::string& id);

// Nearest first.
std::vector<const HierarchyNode*> ancestors(const HierarchyNode& node);
// Pre-order.
std::vector<const HierarchyNode*> descendants(const HierarchyNode& node);
std::vector<const HierarchyNode*> siblings(const HierarchyNode& node);

// Ids from the root down to `id`; empty when the id is unknown.
std::vector<std::string> path_to(const HierarchyAnalysisResult& result, const std::string& id);

struct TreeStatistics {
    std::size_t total_nodes = 0;
    int max_depth = 0;
    std::size_t leaf_nodes = 0;
    std::size_t container_nodes = 0;
    std::size_t clickable_nodes = 0;
    std::size_t text_nodes = 0;
    std::size_t hidden_nodes = 0;
    double average_children = 0.0;
};

TreeStatistics compute_tree_statistics(const HierarchyAnalysisResult& result);

struct TreeValidation {
    bool is_valid = true;
    std::vector<std::string> errors;
};

// Checks duplicate ids, parent/child back-links, cycles and reachability of
// every indexed node from the single root.
TreeValidation validate_tree(const HierarchyAnalysisResult& result);

} // namespace screen_hierarchy
