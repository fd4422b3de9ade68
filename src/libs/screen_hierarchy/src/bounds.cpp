#include <screen_hierarchy/bounds.hpp>
#include <algorithm>
#include <cctype>
#include <limits>

namespace screen_hierarchy {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Reads an optionally signed integer and advances `pos` past it.
bool read_int(std::string_view text, std::size_t& pos, int& out) {
    bool negative = false;
    if (pos < text.size() && text[pos] == '-') {
        negative = true;
        ++pos;
    }
    const std::size_t digits_start = pos;
    long long value = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        value = value * 10 + (text[pos] - '0');
        if (value > std::numeric_limits<int>::max()) return false;
        ++pos;
    }
    if (pos == digits_start) return false;
    out = static_cast<int>(negative ? -value : value);
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

std::optional<Bounds> parse_bounds(std::string_view text) {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);

    Bounds b;
    std::size_t pos = 0;
    if (!expect(text, pos, '[')) return std::nullopt;
    if (!read_int(text, pos, b.left)) return std::nullopt;
    if (!expect(text, pos, ',')) return std::nullopt;
    if (!read_int(text, pos, b.top)) return std::nullopt;
    if (!expect(text, pos, ']') || !expect(text, pos, '[')) return std::nullopt;
    if (!read_int(text, pos, b.right)) return std::nullopt;
    if (!expect(text, pos, ',')) return std::nullopt;
    if (!read_int(text, pos, b.bottom)) return std::nullopt;
    if (!expect(text, pos, ']') || pos != text.size()) return std::nullopt;
    return normalize_bounds(b);
}

std::optional<Bounds> normalize_bounds(const Bounds& bounds) {
    if (bounds.right < bounds.left || bounds.bottom < bounds.top) return std::nullopt;
    return bounds;
}

std::optional<Bounds> normalize_bounds(const std::optional<Bounds>& bounds) {
    if (!bounds) return std::nullopt;
    return normalize_bounds(*bounds);
}

std::string format_bounds(const Bounds& bounds) {
    return "[" + std::to_string(bounds.left) + "," + std::to_string(bounds.top) + "]["
        + std::to_string(bounds.right) + "," + std::to_string(bounds.bottom) + "]";
}

bool is_hidden(const Bounds& bounds) {
    return bounds.left == 0 && bounds.top == 0 && bounds.right == 0 && bounds.bottom == 0;
}

bool is_hidden(const UIElement& element) {
    return element.bounds && is_hidden(*element.bounds);
}

bool is_geometric(const UIElement& element) {
    const auto b = normalize_bounds(element.bounds);
    return b && !is_hidden(*b);
}

std::int64_t area(const Bounds& bounds) {
    const std::int64_t w = static_cast<std::int64_t>(bounds.right) - bounds.left;
    const std::int64_t h = static_cast<std::int64_t>(bounds.bottom) - bounds.top;
    if (w <= 0 || h <= 0) return 0;
    // Saturates for rectangles spanning most of the int plane.
    if (w > std::numeric_limits<std::int64_t>::max() / h) return std::numeric_limits<std::int64_t>::max();
    return w * h;
}

double sort_area(const UIElement& element) {
    const auto b = normalize_bounds(element.bounds);
    if (!b) return std::numeric_limits<double>::infinity();
    return static_cast<double>(area(*b));
}

bool contains(const Bounds& outer, const Bounds& inner, int tolerance) {
    const std::int64_t t = tolerance;
    return outer.left <= inner.left + t
        && outer.top <= inner.top + t
        && outer.right >= inner.right - t
        && outer.bottom >= inner.bottom - t;
}

Bounds united(const Bounds& a, const Bounds& b) {
    return Bounds{
        std::min(a.left, b.left),
        std::min(a.top, b.top),
        std::max(a.right, b.right),
        std::max(a.bottom, b.bottom),
    };
}

} // namespace screen_hierarchy
