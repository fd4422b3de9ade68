#include <screen_hierarchy/hidden_element_resolver.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <algorithm>
#include <cctype>

namespace screen_hierarchy {

namespace {

constexpr std::string_view kIdMarker = ":id/";

bool has_text(const UIElement& e) {
    const auto non_space = [](char c) { return !std::isspace(static_cast<unsigned char>(c)); };
    return std::any_of(e.text.begin(), e.text.end(), non_space)
        || std::any_of(e.content_desc.begin(), e.content_desc.end(), non_space);
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return false;
    const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

// True when linking hidden -> candidate would close a cycle, i.e. the candidate
// already hangs somewhere below the hidden element.
bool is_below(std::size_t candidate, std::size_t hidden,
    const std::vector<std::optional<std::size_t>>& parent_of)
{
    std::size_t cur = candidate;
    for (std::size_t steps = 0; steps <= parent_of.size(); ++steps) {
        if (cur == hidden) return true;
        if (!parent_of[cur]) return false;
        cur = *parent_of[cur];
    }
    return true;
}

struct Candidate {
    std::size_t index = 0;
    bool affinity = false;
    std::size_t distance = 0; // preceding elements rank before following ones
};

bool better(const Candidate& a, const Candidate& b) {
    if (a.affinity != b.affinity) return a.affinity;
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.index < b.index;
}

} // namespace

std::string_view resource_namespace(std::string_view resource_id) {
    if (const auto pos = resource_id.find(kIdMarker); pos != std::string_view::npos)
        return resource_id.substr(0, pos);
    if (const auto pos = resource_id.find('/'); pos != std::string_view::npos)
        return resource_id.substr(0, pos);
    return {};
}

std::string_view resource_name(std::string_view resource_id) {
    if (const auto pos = resource_id.find(kIdMarker); pos != std::string_view::npos)
        return resource_id.substr(pos + kIdMarker.size());
    if (const auto pos = resource_id.rfind('/'); pos != std::string_view::npos)
        return resource_id.substr(pos + 1);
    return resource_id;
}

bool is_container_type(std::string_view class_name, const HierarchyOptions& options) {
    return std::any_of(options.container_type_markers.begin(), options.container_type_markers.end(),
        [&](const std::string& marker) { return class_name.find(marker) != std::string_view::npos; });
}

bool identifier_affinity(std::string_view child_name, std::string_view parent_name,
    const HierarchyOptions& options)
{
    if (child_name.empty() || parent_name.empty() || child_name == parent_name) return false;
    for (const auto& [child_part, parent_part] : options.identifier_conventions) {
        if (contains_ci(child_name, child_part) && contains_ci(parent_name, parent_part))
            return true;
    }
    return contains_ci(child_name, parent_name);
}

std::optional<SemanticMatch> resolve_hidden_parent(
    const std::vector<UIElement>& elements,
    std::size_t hidden_index,
    const std::vector<std::optional<std::size_t>>& parent_of,
    const HierarchyOptions& options)
{
    if (hidden_index >= elements.size()) return std::nullopt;
    const UIElement& hidden = elements[hidden_index];
    const std::string_view hidden_ns = resource_namespace(hidden.resource_id);
    const std::string_view hidden_name = resource_name(hidden.resource_id);
    const bool hidden_has_text = has_text(hidden);

    const std::size_t window = options.hidden_search_window;
    const std::size_t first = hidden_index > window ? hidden_index - window : 0;
    const std::size_t last = std::min(elements.size(), hidden_index + window + 1);

    auto pick = [&](SemanticRule rule, auto&& accepts) -> std::optional<SemanticMatch> {
        std::optional<Candidate> best;
        for (std::size_t i = first; i < last; ++i) {
            if (i == hidden_index) continue;
            const UIElement& cand = elements[i];
            if (!accepts(cand)) continue;
            if (is_below(i, hidden_index, parent_of)) continue;

            Candidate c;
            c.index = i;
            c.affinity = identifier_affinity(hidden_name, resource_name(cand.resource_id), options);
            c.distance = i < hidden_index ? hidden_index - i : window + (i - hidden_index);
            if (!best || better(c, *best)) best = c;
        }
        if (!best) return std::nullopt;
        return SemanticMatch{best->index, rule};
    };

    // a) same resource namespace, candidate is interactive or a container
    if (!hidden_ns.empty()) {
        auto match = pick(SemanticRule::NamespaceContainer, [&](const UIElement& cand) {
            if (resource_namespace(cand.resource_id) != hidden_ns) return false;
            return cand.clickable || is_container_type(cand.class_name, options);
        });
        if (match) return match;
    }

    // b) a text label belongs to a layout/container
    if (hidden_has_text) {
        auto match = pick(SemanticRule::TextInContainer, [&](const UIElement& cand) {
            return is_container_type(cand.class_name, options);
        });
        if (match) return match;
    }

    // c) hidden-in-hidden, matched by identifier convention only
    if (!hidden_name.empty()) {
        auto match = pick(SemanticRule::NestedHidden, [&](const UIElement& cand) {
            return is_hidden(cand) && identifier_affinity(hidden_name, resource_name(cand.resource_id), options);
        });
        if (match) return match;
    }

    return std::nullopt;
}

} // namespace screen_hierarchy
