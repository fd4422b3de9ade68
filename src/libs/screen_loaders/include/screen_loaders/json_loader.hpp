#pragma once

#include <screen_model/ui_element.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace screen_loaders {

// Element list as a top-level array or as { "elements": [...] }. Field aliases
// used by older dumps (is_clickable, content-desc, resource-id, class, ...)
// are folded into the canonical UIElement here and nowhere else.
std::optional<std::vector<screen_model::UIElement>> load_elements_from_json(std::istream& in);
std::optional<std::vector<screen_model::UIElement>> load_elements_from_json_file(const std::string& path);

} // namespace screen_loaders
