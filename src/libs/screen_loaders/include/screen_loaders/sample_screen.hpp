#pragma once

#include <screen_model/ui_element.hpp>
#include <vector>

namespace screen_loaders {

// Contacts app bottom navigation: three clickable tabs, each holding a visible
// icon and a zero-bounds container with the tab's text label.
std::vector<screen_model::UIElement> generate_sample_screen();

} // namespace screen_loaders
