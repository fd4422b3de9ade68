#pragma once

#include <screen_hierarchy/hierarchy_constants.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace screen_hierarchy {

struct HierarchyOptions {
    int containment_tolerance_px = defaults::containment_tolerance_px;
    int relaxed_tolerance_px = defaults::relaxed_tolerance_px;
    double max_child_area_ratio = defaults::max_child_area_ratio;
    std::size_t hidden_search_window = defaults::hidden_search_window;
    // When several disconnected islands survive the relaxed retry, the largest
    // element adopts the others. Set to adopt them under a synthesized screen
    // root spanning every island instead. A dump with no geometric element at
    // all always gets a synthesized root.
    bool synthesize_root = false;
    std::string synthetic_root_id{defaults::synthetic_root_id};
    std::vector<std::string> container_type_markers{
        defaults::container_type_markers.begin(), defaults::container_type_markers.end()};
    std::vector<std::pair<std::string, std::string>> identifier_conventions{
        defaults::identifier_conventions.begin(), defaults::identifier_conventions.end()};
};

} // namespace screen_hierarchy
