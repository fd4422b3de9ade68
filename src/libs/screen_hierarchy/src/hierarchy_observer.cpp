#include <screen_hierarchy/hierarchy_observer.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace screen_hierarchy {

std::string_view to_string(Attachment attachment) {
    switch (attachment) {
    case Attachment::None: return "none";
    case Attachment::Containment: return "containment";
    case Attachment::Semantic: return "semantic";
    case Attachment::Adopted: return "adopted";
    }
    return "unknown";
}

std::string_view to_string(SemanticRule rule) {
    switch (rule) {
    case SemanticRule::NamespaceContainer: return "namespace-container";
    case SemanticRule::TextInContainer: return "text-in-container";
    case SemanticRule::NestedHidden: return "nested-hidden";
    }
    return "unknown";
}

std::string_view to_string(Fallback fallback) {
    switch (fallback) {
    case Fallback::RelaxedTolerance: return "relaxed-tolerance";
    case Fallback::SyntheticRoot: return "synthetic-root";
    case Fallback::LargestElementRoot: return "largest-element-root";
    }
    return "unknown";
}

std::string_view to_string(RootSelection selection) {
    switch (selection) {
    case RootSelection::SingleCandidate: return "single-candidate";
    case RootSelection::LargestCandidate: return "largest-candidate";
    case RootSelection::Synthesized: return "synthesized";
    }
    return "unknown";
}

SpdlogHierarchyObserver::SpdlogHierarchyObserver(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

void SpdlogHierarchyObserver::node_attached(const screen_model::UIElement& child,
    const screen_model::UIElement& parent, Attachment how)
{
    logger_->debug("attach {} -> {} ({})", child.id, parent.id, to_string(how));
}

void SpdlogHierarchyObserver::semantic_parent_resolved(const screen_model::UIElement& hidden,
    const screen_model::UIElement& parent, SemanticRule rule)
{
    logger_->debug("hidden {} resolved to {} via {}", hidden.id, parent.id, to_string(rule));
}

void SpdlogHierarchyObserver::fallback_triggered(Fallback fallback, std::size_t root_candidates) {
    logger_->info("fallback {} with {} root candidates", to_string(fallback), root_candidates);
}

void SpdlogHierarchyObserver::root_selected(const screen_model::UIElement& root, RootSelection how) {
    if (root.bounds)
        logger_->info("root {} {} ({})", root.id, format_bounds(*root.bounds), to_string(how));
    else
        logger_->info("root {} ({})", root.id, to_string(how));
}

} // namespace screen_hierarchy
