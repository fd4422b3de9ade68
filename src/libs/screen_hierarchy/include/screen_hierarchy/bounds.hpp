#pragma once

#include <screen_model/ui_element.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace screen_hierarchy {

using screen_model::Bounds;
using screen_model::UIElement;

// Parses the uiautomator form "[l,t][r,b]". Surrounding whitespace is allowed,
// anything else that deviates from the form yields nullopt.
std::optional<Bounds> parse_bounds(std::string_view text);

// Canonical rectangle, or nullopt when an edge is inverted (right < left, bottom < top).
std::optional<Bounds> normalize_bounds(const Bounds& bounds);
std::optional<Bounds> normalize_bounds(const std::optional<Bounds>& bounds);

std::string format_bounds(const Bounds& bounds);

// Hidden iff all four edges are zero.
bool is_hidden(const Bounds& bounds);
bool is_hidden(const UIElement& element);

// True when the element has a canonical, non-hidden rectangle and can take part
// in geometric containment.
bool is_geometric(const UIElement& element);

std::int64_t area(const Bounds& bounds);

// Area used for ordering: +infinity for elements whose bounds cannot be normalized.
double sort_area(const UIElement& element);

// Outer contains inner when every edge of outer is outside or equal to the
// corresponding edge of inner, allowing `tolerance` pixels of overhang.
bool contains(const Bounds& outer, const Bounds& inner, int tolerance);

// Smallest rectangle enclosing both.
Bounds united(const Bounds& a, const Bounds& b);

} // namespace screen_hierarchy
