#pragma once

#include <screen_model/ui_element.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace screen_hierarchy {

// How a node came to sit under its parent.
enum class Attachment {
    None,           // root
    Containment,    // parent rectangle contains the child rectangle
    Semantic,       // hidden element resolved through identifier/type heuristics
    Adopted         // orphan placed under the root by the fallback ladder
};

enum class SemanticRule {
    NamespaceContainer, // same resource namespace, clickable or container parent
    TextInContainer,    // text-bearing element under a layout/container type
    NestedHidden        // hidden-in-hidden, identifier convention
};

enum class Fallback {
    RelaxedTolerance,   // relations reset and rebuilt with the relaxed tolerance
    SyntheticRoot,      // islands adopted under a synthesized screen root
    LargestElementRoot  // islands adopted under the largest element
};

enum class RootSelection {
    SingleCandidate,
    LargestCandidate,
    Synthesized
};

std::string_view to_string(Attachment attachment);
std::string_view to_string(SemanticRule rule);
std::string_view to_string(Fallback fallback);
std::string_view to_string(RootSelection selection);

// Trace hooks called by the builder at well-defined points. Every hook has an
// empty default so observers override only what they need.
class HierarchyObserver {
public:
    virtual ~HierarchyObserver() = default;

    virtual void node_attached(const screen_model::UIElement& /*child*/,
        const screen_model::UIElement& /*parent*/, Attachment /*how*/) {}
    virtual void semantic_parent_resolved(const screen_model::UIElement& /*hidden*/,
        const screen_model::UIElement& /*parent*/, SemanticRule /*rule*/) {}
    virtual void fallback_triggered(Fallback /*fallback*/, std::size_t /*root_candidates*/) {}
    virtual void root_selected(const screen_model::UIElement& /*root*/, RootSelection /*how*/) {}
};

// Forwards every event to an spdlog logger (debug for attachments, info for
// fallbacks and root selection).
class SpdlogHierarchyObserver : public HierarchyObserver {
public:
    explicit SpdlogHierarchyObserver(std::shared_ptr<spdlog::logger> logger);

    void node_attached(const screen_model::UIElement& child,
        const screen_model::UIElement& parent, Attachment how) override;
    void semantic_parent_resolved(const screen_model::UIElement& hidden,
        const screen_model::UIElement& parent, SemanticRule rule) override;
    void fallback_triggered(Fallback fallback, std::size_t root_candidates) override;
    void root_selected(const screen_model::UIElement& root, RootSelection how) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace screen_hierarchy
