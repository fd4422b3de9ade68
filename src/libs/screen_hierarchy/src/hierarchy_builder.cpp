#include <screen_hierarchy/hierarchy_builder.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <screen_hierarchy/hidden_element_resolver.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace screen_hierarchy {

namespace {

using screen_model::UIElement;

// Links are tracked by input index while the passes run; nodes are wired once
// the root is settled.
struct Links {
    std::vector<std::optional<std::size_t>> parent_of;
    std::vector<Attachment> attachment;

    explicit Links(std::size_t n) : parent_of(n), attachment(n, Attachment::None) {}

    void reset() {
        std::fill(parent_of.begin(), parent_of.end(), std::nullopt);
        std::fill(attachment.begin(), attachment.end(), Attachment::None);
    }
};

void check_ids(const std::vector<UIElement>& elements) {
    std::unordered_set<std::string> seen;
    seen.reserve(elements.size());
    for (const auto& e : elements) {
        if (e.id.empty())
            throw std::invalid_argument("analyze_hierarchy: element with empty id");
        if (!seen.insert(e.id).second)
            throw std::invalid_argument("analyze_hierarchy: duplicate element id '" + e.id + "'");
    }
}

void notify_attached(HierarchyObserver* observer, const std::vector<UIElement>& elements,
    std::size_t child, std::size_t parent, Attachment how)
{
    if (observer) observer->node_attached(elements[child], elements[parent], how);
}

void hidden_pass(const std::vector<UIElement>& elements, Links& links,
    const HierarchyOptions& options, HierarchyObserver* observer)
{
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (!is_hidden(elements[i]) || links.parent_of[i]) continue;
        const auto match = resolve_hidden_parent(elements, i, links.parent_of, options);
        if (!match) continue;
        links.parent_of[i] = match->parent_index;
        links.attachment[i] = Attachment::Semantic;
        if (observer) observer->semantic_parent_resolved(elements[i], elements[match->parent_index], match->rule);
        notify_attached(observer, elements, i, match->parent_index, Attachment::Semantic);
    }
}

void geometric_pass(const std::vector<UIElement>& elements, Links& links, int tolerance,
    const HierarchyOptions& options, HierarchyObserver* observer)
{
    std::vector<std::size_t> order;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (is_geometric(elements[i])) order.push_back(i);
    }
    // Ascending area; stable so that dump order breaks ties.
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return area(*elements[a].bounds) < area(*elements[b].bounds);
    });

    for (const std::size_t child : order) {
        if (links.parent_of[child]) continue;
        const Bounds& cb = *elements[child].bounds;
        const auto child_area = static_cast<double>(area(cb));

        // Candidates come in ascending area order, so the first hit is the
        // smallest enclosing rectangle.
        for (const std::size_t cand : order) {
            if (cand == child) continue;
            const Bounds& pb = *elements[cand].bounds;
            const auto parent_area = static_cast<double>(area(pb));
            if (parent_area <= child_area || parent_area <= 0.0) continue;
            if (!contains(pb, cb, tolerance)) continue;
            if (child_area / parent_area >= options.max_child_area_ratio) continue;

            links.parent_of[child] = cand;
            links.attachment[child] = Attachment::Containment;
            notify_attached(observer, elements, child, cand, Attachment::Containment);
            break;
        }
    }
}

void link_all(const std::vector<UIElement>& elements, Links& links, int tolerance,
    const HierarchyOptions& options, HierarchyObserver* observer)
{
    hidden_pass(elements, links, options, observer);
    geometric_pass(elements, links, tolerance, options, observer);
}

struct RootCandidates {
    std::vector<std::size_t> geometric;     // largest area first
    std::vector<std::size_t> non_geometric; // dump order
};

RootCandidates collect_roots(const std::vector<UIElement>& elements, const Links& links) {
    RootCandidates roots;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (links.parent_of[i]) continue;
        if (is_geometric(elements[i]))
            roots.geometric.push_back(i);
        else
            roots.non_geometric.push_back(i);
    }
    std::stable_sort(roots.geometric.begin(), roots.geometric.end(), [&](std::size_t a, std::size_t b) {
        return area(*elements[a].bounds) > area(*elements[b].bounds);
    });
    return roots;
}

std::string unique_synthetic_id(const std::vector<UIElement>& elements, std::string id) {
    const auto taken = [&](const std::string& candidate) {
        return std::any_of(elements.begin(), elements.end(),
            [&](const UIElement& e) { return e.id == candidate; });
    };
    while (taken(id)) id += "_";
    return id;
}

void assign_depth(HierarchyNode& node, int depth, int& max_depth,
    std::vector<const HierarchyNode*>& leaves)
{
    node.depth = depth;
    max_depth = std::max(max_depth, depth);
    node.is_leaf = node.children.empty();
    if (node.is_leaf) {
        leaves.push_back(&node);
        return;
    }
    for (std::size_t i = 0; i < node.children.size(); ++i) {
        node.children[i]->index_in_parent = i;
        assign_depth(*node.children[i], depth + 1, max_depth, leaves);
    }
}

} // namespace

const HierarchyNode* HierarchyAnalysisResult::find(const std::string& id) const {
    const auto it = node_map_.find(id);
    return it == node_map_.end() ? nullptr : it->second;
}

HierarchyAnalysisResult analyze_hierarchy(std::vector<UIElement> elements,
    const HierarchyOptions& options, HierarchyObserver* observer)
{
    HierarchyAnalysisResult result;
    if (elements.empty()) return result;
    check_ids(elements);

    const std::size_t n = elements.size();
    Links links(n);
    int tolerance = options.containment_tolerance_px;
    link_all(elements, links, tolerance, options, observer);

    // Root ladder.
    RootCandidates roots = collect_roots(elements, links);
    if (roots.geometric.size() > 1 && options.relaxed_tolerance_px != tolerance) {
        if (observer) observer->fallback_triggered(Fallback::RelaxedTolerance, roots.geometric.size());
        links.reset();
        tolerance = options.relaxed_tolerance_px;
        result.relaxed_retry_ = true;
        link_all(elements, links, tolerance, options, observer);
        roots = collect_roots(elements, links);
    }
    result.effective_tolerance_ = tolerance;

    result.elements_ = std::move(elements);
    const auto& snapshot = result.elements_;

    result.nodes_.reserve(n + 1);
    for (std::size_t i = 0; i < n; ++i) {
        auto node = std::make_unique<HierarchyNode>();
        node->element = &snapshot[i];
        node->input_index = i;
        node->attachment = links.attachment[i];
        result.node_map_.emplace(snapshot[i].id, node.get());
        result.nodes_.push_back(std::move(node));
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (!links.parent_of[i]) continue;
        HierarchyNode* child = result.nodes_[i].get();
        HierarchyNode* parent = result.nodes_[*links.parent_of[i]].get();
        child->parent = parent;
        parent->children.push_back(child); // ascending i, i.e. dump order
    }

    const std::size_t root_count = roots.geometric.size() + roots.non_geometric.size();
    HierarchyNode* root = nullptr;
    RootSelection selection = RootSelection::SingleCandidate;
    std::vector<std::size_t> orphans;

    if (root_count == 1) {
        root = result.nodes_[roots.geometric.empty() ? roots.non_geometric.front() : roots.geometric.front()].get();
    } else if (roots.geometric.size() == 1 || (!roots.geometric.empty() && !options.synthesize_root)) {
        // The largest rectangle is the screen container; everything else left
        // over cannot be placed geometrically and hangs directly off it.
        root = result.nodes_[roots.geometric.front()].get();
        selection = RootSelection::LargestCandidate;
        if (roots.geometric.size() > 1 && observer)
            observer->fallback_triggered(Fallback::LargestElementRoot, root_count);
        orphans.assign(roots.geometric.begin() + 1, roots.geometric.end());
        orphans.insert(orphans.end(), roots.non_geometric.begin(), roots.non_geometric.end());
    } else {
        // Disconnected islands (or nothing geometric at all): make up a screen
        // root spanning every island.
        if (observer) observer->fallback_triggered(Fallback::SyntheticRoot, root_count);
        auto synthetic = std::make_unique<UIElement>();
        synthetic->id = unique_synthetic_id(snapshot, options.synthetic_root_id);
        synthetic->class_name = std::string(defaults::synthetic_root_class);
        Bounds span{};
        bool first = true;
        for (const std::size_t i : roots.geometric) {
            span = first ? *snapshot[i].bounds : united(span, *snapshot[i].bounds);
            first = false;
        }
        synthetic->bounds = span;

        auto node = std::make_unique<HierarchyNode>();
        node->element = synthetic.get();
        node->synthetic = true;
        node->input_index = n;
        root = node.get();
        result.node_map_.emplace(synthetic->id, root);
        result.nodes_.push_back(std::move(node));
        result.synthetic_element_ = std::move(synthetic);
        selection = RootSelection::Synthesized;
        orphans = roots.geometric;
        orphans.insert(orphans.end(), roots.non_geometric.begin(), roots.non_geometric.end());
    }

    for (const std::size_t i : orphans) {
        HierarchyNode* orphan = result.nodes_[i].get();
        orphan->parent = root;
        orphan->attachment = Attachment::Adopted;
        root->children.push_back(orphan);
        if (observer) observer->node_attached(*orphan->element, *root->element, Attachment::Adopted);
    }
    if (!root->synthetic) {
        // Keep dump order among the root's children after adoption.
        std::stable_sort(root->children.begin(), root->children.end(),
            [](const HierarchyNode* a, const HierarchyNode* b) { return a->input_index < b->input_index; });
    }

    result.root_ = root;
    root->attachment = Attachment::None;
    assign_depth(*root, 0, result.max_depth_, result.leaf_nodes_);
    if (observer) observer->root_selected(*root->element, selection);
    return result;
}

} // namespace screen_hierarchy
