#include <screen_hierarchy/tree_utils.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <screen_hierarchy/hidden_element_resolver.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace screen_hierarchy {

namespace {

bool has_visible_text(const UIElement& e) {
    return std::any_of(e.text.begin(), e.text.end(),
        [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
}

void collect(const HierarchyNode& node, std::vector<const HierarchyNode*>& out) {
    for (const HierarchyNode* child : node.children) {
        out.push_back(child);
        collect(*child, out);
    }
}

} // namespace

const HierarchyNode* find_node(const HierarchyAnalysisResult& result, const std::string& id) {
    return result.find(id);
}

std::vector<const HierarchyNode*> ancestors(const HierarchyNode& node) {
    std::vector<const HierarchyNode*> out;
    for (const HierarchyNode* p = node.parent; p; p = p->parent)
        out.push_back(p);
    return out;
}

std::vector<const HierarchyNode*> descendants(const HierarchyNode& node) {
    std::vector<const HierarchyNode*> out;
    collect(node, out);
    return out;
}

std::vector<const HierarchyNode*> siblings(const HierarchyNode& node) {
    std::vector<const HierarchyNode*> out;
    if (!node.parent) return out;
    for (const HierarchyNode* s : node.parent->children) {
        if (s != &node) out.push_back(s);
    }
    return out;
}

std::vector<std::string> path_to(const HierarchyAnalysisResult& result, const std::string& id) {
    std::vector<std::string> path;
    const HierarchyNode* node = result.find(id);
    for (const HierarchyNode* n = node; n; n = n->parent)
        path.push_back(n->id());
    std::reverse(path.begin(), path.end());
    return path;
}

TreeStatistics compute_tree_statistics(const HierarchyAnalysisResult& result) {
    TreeStatistics stats;
    if (result.empty()) return stats;

    const HierarchyOptions options;
    std::vector<const HierarchyNode*> nodes{result.root()};
    collect(*result.root(), nodes);

    std::size_t parents = 0;
    std::size_t child_links = 0;
    for (const HierarchyNode* n : nodes) {
        const UIElement& e = *n->element;
        ++stats.total_nodes;
        stats.max_depth = std::max(stats.max_depth, n->depth);
        if (n->children.empty()) {
            ++stats.leaf_nodes;
        } else {
            ++parents;
            child_links += n->children.size();
        }
        if (is_container_type(e.class_name, options)) ++stats.container_nodes;
        if (e.clickable) ++stats.clickable_nodes;
        if (has_visible_text(e)) ++stats.text_nodes;
        if (is_hidden(e)) ++stats.hidden_nodes;
    }
    if (parents > 0)
        stats.average_children = static_cast<double>(child_links) / static_cast<double>(parents);
    return stats;
}

TreeValidation validate_tree(const HierarchyAnalysisResult& result) {
    TreeValidation v;
    const auto fail = [&](std::string message) {
        v.is_valid = false;
        v.errors.push_back(std::move(message));
    };

    if (result.empty()) {
        if (result.size() != 0) fail("nodes present without a root");
        return v;
    }
    const HierarchyNode* root = result.root();
    if (root->parent) fail("root " + root->id() + " has a parent");

    std::unordered_set<std::string> ids;
    for (const auto& e : result.elements()) {
        if (!ids.insert(e.id).second) fail("duplicate id " + e.id);
    }

    // Walk from the root; a node reached twice means a cycle or a shared child.
    std::unordered_set<const HierarchyNode*> seen;
    std::vector<const HierarchyNode*> stack{root};
    while (!stack.empty()) {
        const HierarchyNode* n = stack.back();
        stack.pop_back();
        if (!seen.insert(n).second) {
            fail("node " + n->id() + " reached more than once");
            continue;
        }
        for (std::size_t i = 0; i < n->children.size(); ++i) {
            const HierarchyNode* c = n->children[i];
            if (c->parent != n) fail("child " + c->id() + " does not point back to " + n->id());
            if (c->depth != n->depth + 1) fail("depth mismatch at " + c->id());
            if (c->index_in_parent != i) fail("index mismatch at " + c->id());
            stack.push_back(c);
        }
    }

    for (const auto& e : result.elements()) {
        const HierarchyNode* n = result.find(e.id);
        if (!n) {
            fail("element " + e.id + " has no node");
        } else if (!seen.count(n)) {
            fail("node " + e.id + " is not reachable from the root");
        }
    }
    if (seen.size() != result.size())
        fail("reachable node count differs from indexed node count");
    return v;
}

} // namespace screen_hierarchy
