#include <element_discovery/element_report.hpp>
#include <element_discovery/quality_scorer.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <algorithm>

namespace element_discovery {

namespace {

constexpr std::size_t kLabelTextLimit = 20;

// First `limit` code points of a UTF-8 string.
std::string utf8_prefix(const std::string& text, std::size_t limit) {
    std::size_t points = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (points == limit) return text.substr(0, i);
            ++points;
        }
    }
    return text;
}

} // namespace

std::string_view short_resource_id(std::string_view resource_id) {
    if (const auto pos = resource_id.find(":id/"); pos != std::string_view::npos)
        return resource_id.substr(pos + 4);
    if (const auto pos = resource_id.rfind('/'); pos != std::string_view::npos)
        return resource_id.substr(pos + 1);
    return resource_id;
}

std::string_view short_type(std::string_view class_name) {
    if (const auto pos = class_name.rfind('.'); pos != std::string_view::npos)
        return class_name.substr(pos + 1);
    return class_name;
}

std::string element_label(const screen_model::UIElement& element) {
    std::vector<std::string> parts;
    if (const std::string text = trimmed(element.text); !text.empty()) {
        parts.push_back(utf8_length(text) > kLabelTextLimit
            ? utf8_prefix(text, kLabelTextLimit) + "..."
            : text);
    }
    if (!element.resource_id.empty())
        parts.push_back("@" + std::string(short_resource_id(element.resource_id)));
    if (!element.class_name.empty())
        parts.push_back("(" + std::string(short_type(element.class_name)) + ")");

    if (parts.empty()) return "element_" + element.id;
    std::string label = parts.front();
    for (std::size_t i = 1; i < parts.size(); ++i) label += " " + parts[i];
    return label;
}

ElementReport element_report(const screen_hierarchy::HierarchyNode& node) {
    const screen_model::UIElement& e = *node.element;
    ElementReport report;
    report.label = element_label(e);

    const bool text = !trimmed(e.text).empty();
    const bool hidden = screen_hierarchy::is_hidden(e);
    if (text) report.features.push_back("has text");
    if (e.clickable) report.features.push_back("clickable");
    if (e.scrollable) report.features.push_back("scrollable");
    if (!e.resource_id.empty()) report.features.push_back("resource id");
    if (!node.children.empty()) report.features.push_back(std::to_string(node.children.size()) + " children");
    if (hidden) report.features.push_back("hidden");

    int score = 0;
    if (e.clickable) score += 3;
    if (text) score += 2;
    if (!node.children.empty()) score += 1;
    if (!e.resource_id.empty()) score += 1;
    if (hidden) score -= 2;
    report.importance = std::max(0, score);

    report.description = e.class_name.empty() ? std::string("element") : e.class_name;
    if (!report.features.empty()) {
        report.description += " (";
        for (std::size_t i = 0; i < report.features.size(); ++i) {
            if (i > 0) report.description += ", ";
            report.description += report.features[i];
        }
        report.description += ")";
    }
    return report;
}

double element_similarity(const screen_model::UIElement& a, const screen_model::UIElement& b) {
    int same = 0;
    int total = 0;
    const auto compare = [&](const auto& x, const auto& y) {
        ++total;
        if (x == y) ++same;
    };
    compare(a.class_name, b.class_name);
    compare(a.clickable, b.clickable);
    if (!a.resource_id.empty() || !b.resource_id.empty()) compare(a.resource_id, b.resource_id);
    if (!a.text.empty() || !b.text.empty()) compare(a.text, b.text);
    if (!a.content_desc.empty() || !b.content_desc.empty()) compare(a.content_desc, b.content_desc);
    return total > 0 ? static_cast<double>(same) / total : 0.0;
}

} // namespace element_discovery
