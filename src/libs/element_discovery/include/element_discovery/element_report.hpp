#pragma once

#include <screen_hierarchy/hierarchy_builder.hpp>
#include <screen_model/ui_element.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace element_discovery {

// "text @short_id (ShortType)" with text cut at 20 code points; "element_<id>"
// when the element has none of the three.
std::string element_label(const screen_model::UIElement& element);

// Resource name after ":id/" (or after the last '/'), class name after the last '.'.
std::string_view short_resource_id(std::string_view resource_id);
std::string_view short_type(std::string_view class_name);

struct ElementReport {
    std::string label;
    std::vector<std::string> features;
    std::string description;
    int importance = 0; // >= 0
};

ElementReport element_report(const screen_hierarchy::HierarchyNode& node);

// Fraction of compared attributes that match: class name and clickability are
// always compared, resource id, text and content description when either side
// has one.
double element_similarity(const screen_model::UIElement& a, const screen_model::UIElement& b);

} // namespace element_discovery
