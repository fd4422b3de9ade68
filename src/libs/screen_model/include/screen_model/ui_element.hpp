#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace screen_model {

// Screen-pixel rectangle as reported by the dump: [left,top][right,bottom].
struct Bounds {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    // 64-bit so that edges anywhere in the int range cannot overflow.
    std::int64_t width() const { return static_cast<std::int64_t>(right) - left; }
    std::int64_t height() const { return static_cast<std::int64_t>(bottom) - top; }

    bool operator==(const Bounds&) const = default;
};

struct UIElement {
    std::string id;
    // Empty when the source rectangle could not be parsed.
    std::optional<Bounds> bounds;
    std::string text;
    std::string content_desc;
    std::string resource_id;
    std::string class_name;
    bool clickable = false;
    bool scrollable = false;
    bool enabled = true;
    bool checkable = false;
    bool checked = false;
    bool selected = false;
};

} // namespace screen_model
