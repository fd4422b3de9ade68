#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

namespace screen_hierarchy {

// Default tuning for hierarchy reconstruction. Values were calibrated against
// Android phone dumps (1080px wide); HierarchyOptions copies them and callers
// may override any of them.

namespace defaults {

// Edge overhang accepted when testing containment.
constexpr int containment_tolerance_px = 2;
// Tolerance used when the first pass leaves several disconnected islands.
constexpr int relaxed_tolerance_px = 8;
// area(child) / area(parent) must stay below this; rejects near-duplicate rectangles.
constexpr double max_child_area_ratio = 0.95;
// Hidden elements look for semantic parents within this many positions of
// themselves in dump order.
constexpr std::size_t hidden_search_window = 20;

constexpr std::string_view synthetic_root_id = "__screen_root__";
constexpr std::string_view synthetic_root_class = "SyntheticRoot";

// Class-name fragments that mark layout/container types.
constexpr std::array<std::string_view, 8> container_type_markers = {
    "Layout", "ViewGroup", "RecyclerView", "ListView",
    "ScrollView", "ViewPager", "CardView", "Container",
};

// Identifier conventions: a hidden child whose resource name contains `first`
// attaches to a container whose resource name contains `second`.
constexpr std::array<std::pair<std::string_view, std::string_view>, 4> identifier_conventions = {{
    {"content", "container"},
    {"text", "container"},
    {"label", "container"},
    {"title", "container"},
}};

} // namespace defaults
} // namespace screen_hierarchy
