#include <screen_loaders/json_loader.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <limits>

namespace screen_loaders {

namespace {

// First present string among the aliases, "" when none.
std::string string_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
    }
    return "";
}

// Accepts JSON booleans, "true"/"false" strings and 0/1 numbers.
bool bool_field(const nlohmann::json& j, std::initializer_list<const char*> keys, bool fallback) {
    for (const char* k : keys) {
        if (!j.contains(k)) continue;
        const auto& v = j[k];
        if (v.is_boolean()) return v.get<bool>();
        if (v.is_string()) {
            const auto s = v.get<std::string>();
            if (s == "true") return true;
            if (s == "false") return false;
        }
        if (v.is_number_integer()) return v.get<long long>() != 0;
    }
    return fallback;
}

// Integral JSON number inside the int range; floats and wide values are rejected
// so that the object form agrees with the "[l,t][r,b]" string form.
std::optional<int> int_edge(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(u);
    }
    if (!v.is_number_integer()) return std::nullopt;
    const auto s = v.get<std::int64_t>();
    if (s < std::numeric_limits<int>::min() || s > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(s);
}

std::optional<screen_model::Bounds> parse_bounds_field(const nlohmann::json& j) {
    if (!j.contains("bounds")) return std::nullopt;
    const auto& b = j["bounds"];
    if (b.is_string()) return screen_hierarchy::parse_bounds(b.get<std::string>());
    if (!b.is_object()) return std::nullopt;
    int edges[4] = {};
    int* edge = edges;
    for (const char* k : {"left", "top", "right", "bottom"}) {
        if (!b.contains(k)) return std::nullopt;
        const auto value = int_edge(b[k]);
        if (!value) return std::nullopt;
        *edge++ = *value;
    }
    return screen_hierarchy::normalize_bounds(screen_model::Bounds{edges[0], edges[1], edges[2], edges[3]});
}

std::optional<screen_model::UIElement> parse_element(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    screen_model::UIElement e;
    if (j.contains("id") && j["id"].is_string())
        e.id = j["id"].get<std::string>();
    else if (j.contains("id") && j["id"].is_number_integer())
        e.id = std::to_string(j["id"].get<long long>());
    else
        return std::nullopt;

    e.bounds = parse_bounds_field(j);
    e.text = string_field(j, {"text"});
    e.content_desc = string_field(j, {"content_desc", "content-desc", "contentDesc"});
    e.resource_id = string_field(j, {"resource_id", "resource-id", "resourceId"});
    e.class_name = string_field(j, {"class_name", "element_type", "class"});
    e.clickable = bool_field(j, {"clickable", "is_clickable"}, false);
    e.scrollable = bool_field(j, {"scrollable", "is_scrollable"}, false);
    e.enabled = bool_field(j, {"enabled", "is_enabled"}, true);
    e.checkable = bool_field(j, {"checkable", "is_checkable"}, false);
    e.checked = bool_field(j, {"checked", "is_checked"}, false);
    e.selected = bool_field(j, {"selected", "is_selected"}, false);
    return e;
}

std::optional<std::vector<screen_model::UIElement>> parse_json(const nlohmann::json& j) {
    const nlohmann::json* list = nullptr;
    if (j.is_array())
        list = &j;
    else if (j.is_object() && j.contains("elements") && j["elements"].is_array())
        list = &j["elements"];
    if (!list) {
        spdlog::warn("element list: expected an array or an object with \"elements\"");
        return std::nullopt;
    }

    std::vector<screen_model::UIElement> out;
    out.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        auto e = parse_element((*list)[i]);
        if (!e) {
            spdlog::warn("element list: entry {} has no usable id", i);
            return std::nullopt;
        }
        out.push_back(std::move(*e));
    }
    return out;
}

} // namespace

std::optional<std::vector<screen_model::UIElement>> load_elements_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("element list: {}", ex.what());
        return std::nullopt;
    }
}

std::optional<std::vector<screen_model::UIElement>> load_elements_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::warn("element list: cannot open {}", path);
        return std::nullopt;
    }
    return load_elements_from_json(f);
}

} // namespace screen_loaders
