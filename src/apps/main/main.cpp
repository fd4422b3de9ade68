// Element explorer: rebuilds the hierarchy of a flat screen dump and answers
// discovery queries against it. Prints one JSON document on stdout.
#include <element_discovery/actionable_children.hpp>
#include <element_discovery/discovery_engine.hpp>
#include <element_discovery/element_report.hpp>
#include <element_discovery/quality_scorer.hpp>
#include <screen_hierarchy/bounds.hpp>
#include <screen_hierarchy/hierarchy_builder.hpp>
#include <screen_hierarchy/tree_utils.hpp>
#include <screen_loaders/config_loader.hpp>
#include <screen_loaders/json_loader.hpp>
#include <screen_loaders/sample_screen.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

struct Args {
    std::string elements_path;
    std::string config_path;
    std::string target;
    std::optional<int> max_depth;
    bool no_promote = false;
    bool trace = false;
    bool stats = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: element_explorer [--elements FILE] [--config FILE] [--target ID]\n"
        "                        [--max-depth N] [--no-promote] [--trace] [--stats]\n");
}

std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };
        if (a == "--elements" || a == "--config" || a == "--target" || a == "--max-depth") {
            const char* v = value();
            if (!v) {
                (void)fprintf(stderr, "missing value for %s\n", a.c_str());
                return std::nullopt;
            }
            if (a == "--elements") {
                args.elements_path = v;
            } else if (a == "--config") {
                args.config_path = v;
            } else if (a == "--target") {
                args.target = v;
            } else {
                const std::string s = v;
                int n = 0;
                const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
                if (ec != std::errc() || ptr != s.data() + s.size() || n < 0) {
                    (void)fprintf(stderr, "invalid --max-depth: %s\n", v);
                    return std::nullopt;
                }
                args.max_depth = n;
            }
        } else if (a == "--no-promote") {
            args.no_promote = true;
        } else if (a == "--trace") {
            args.trace = true;
        } else if (a == "--stats") {
            args.stats = true;
        } else {
            (void)fprintf(stderr, "unknown argument: %s\n", a.c_str());
            return std::nullopt;
        }
    }
    return args;
}

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> explorer_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "element_explorer_latest.log";
        logger = spdlog::basic_logger_mt("element_explorer", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Explorer logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

nlohmann::json bounds_json(const screen_model::UIElement& e) {
    if (!e.bounds) return nullptr;
    return screen_hierarchy::format_bounds(*e.bounds);
}

nlohmann::json tree_json(const screen_hierarchy::HierarchyNode& node) {
    nlohmann::json j;
    j["id"] = node.id();
    j["label"] = element_discovery::element_label(*node.element);
    j["bounds"] = bounds_json(*node.element);
    j["depth"] = node.depth;
    j["attachment"] = std::string(screen_hierarchy::to_string(node.attachment));
    if (node.synthetic) j["synthetic"] = true;
    nlohmann::json children = nlohmann::json::array();
    for (const auto* c : node.children) children.push_back(tree_json(*c));
    j["children"] = std::move(children);
    return j;
}

nlohmann::json discovered_json(const element_discovery::DiscoveredElement& d) {
    nlohmann::json j;
    j["id"] = d.element->id;
    j["label"] = element_discovery::element_label(*d.element);
    j["relationship"] = std::string(element_discovery::to_string(d.relationship));
    j["confidence"] = d.confidence;
    j["reason"] = d.reason;
    j["has_text"] = d.has_text;
    j["clickable"] = d.is_clickable;
    if (d.depth) j["depth"] = *d.depth;
    if (d.path) j["path"] = *d.path;
    return j;
}

nlohmann::json group_json(const std::vector<element_discovery::DiscoveredElement>& group) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : group) arr.push_back(discovered_json(d));
    return arr;
}

nlohmann::json quality_json(const element_discovery::ElementQuality& q) {
    return {
        {"text", q.text_score},
        {"uniqueness", q.uniqueness_score},
        {"stability", q.stability_score},
        {"matchability", q.matchability_score},
        {"total", q.total_score},
    };
}

nlohmann::json actionable_json(const element_discovery::ActionableAnalysis& analysis) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : analysis.children) {
        arr.push_back({
            {"id", c.node->id()},
            {"type", std::string(element_discovery::to_string(c.type))},
            {"action", c.action_text},
            {"key", c.key},
            {"confidence", c.confidence},
            {"priority", c.priority},
        });
    }
    nlohmann::json j;
    j["children"] = std::move(arr);
    const auto* best = analysis.recommendation();
    j["recommendation"] = best ? nlohmann::json(best->node->id()) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json statistics_json(const screen_hierarchy::HierarchyAnalysisResult& result) {
    const auto s = screen_hierarchy::compute_tree_statistics(result);
    const auto v = screen_hierarchy::validate_tree(result);
    return {
        {"total_nodes", s.total_nodes},
        {"max_depth", s.max_depth},
        {"leaf_nodes", s.leaf_nodes},
        {"container_nodes", s.container_nodes},
        {"clickable_nodes", s.clickable_nodes},
        {"text_nodes", s.text_nodes},
        {"hidden_nodes", s.hidden_nodes},
        {"average_children", s.average_children},
        {"valid", v.is_valid},
        {"errors", v.errors},
    };
}

} // namespace

int main(int argc, char* argv[])
{
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    auto logger = explorer_logger();
    spdlog::set_default_logger(logger);
    if (args->trace) logger->set_level(spdlog::level::debug);

    screen_loaders::EngineConfig config;
    if (!args->config_path.empty()) {
        auto loaded = screen_loaders::load_engine_config_from_json_file(args->config_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot load config: %s\n", args->config_path.c_str());
            return 1;
        }
        config = std::move(*loaded);
    }
    if (args->max_depth) config.discovery.max_depth = *args->max_depth;
    if (args->no_promote) config.discovery.promote_to_clickable = false;

    std::vector<screen_model::UIElement> elements;
    if (args->elements_path.empty()) {
        elements = screen_loaders::generate_sample_screen();
        logger->info("No element file given, using the sample screen ({} elements)", elements.size());
    } else {
        auto loaded = screen_loaders::load_elements_from_json_file(args->elements_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot load elements: %s\n", args->elements_path.c_str());
            return 1;
        }
        elements = std::move(*loaded);
        logger->info("Loaded {} elements from {}", elements.size(), args->elements_path);
    }

    screen_hierarchy::SpdlogHierarchyObserver observer(logger);
    screen_hierarchy::HierarchyAnalysisResult hierarchy;
    try {
        hierarchy = screen_hierarchy::analyze_hierarchy(std::move(elements), config.hierarchy,
            args->trace ? &observer : nullptr);
    } catch (const std::invalid_argument& ex) {
        (void)fprintf(stderr, "invalid element list: %s\n", ex.what());
        return 1;
    }

    nlohmann::json out;
    nlohmann::json h;
    h["nodes"] = hierarchy.size();
    h["max_depth"] = hierarchy.max_depth();
    h["synthetic_root"] = hierarchy.has_synthetic_root();
    h["relaxed_retry"] = hierarchy.relaxed_retry();
    h["effective_tolerance"] = hierarchy.effective_tolerance();
    nlohmann::json leaves = nlohmann::json::array();
    for (const auto* n : hierarchy.leaf_nodes()) leaves.push_back(n->id());
    h["leaf_nodes"] = std::move(leaves);
    h["tree"] = hierarchy.empty() ? nlohmann::json(nullptr) : tree_json(*hierarchy.root());
    out["hierarchy"] = std::move(h);

    if (args->stats) out["statistics"] = statistics_json(hierarchy);

    if (!args->target.empty()) {
        const auto result = element_discovery::discover(hierarchy, args->target, config.discovery);
        nlohmann::json d;
        d["requested_target"] = result.requested_target;
        if (!result.ok()) {
            d["error"] = result.error;
            logger->warn("Discovery failed: {}", result.error);
        } else {
            d["effective_target"] = result.effective_target;
            d["promoted"] = result.promoted;
            d["self"] = discovered_json(*result.self);
            d["parents"] = group_json(result.parents);
            d["children"] = group_json(result.children);
            d["siblings"] = group_json(result.siblings);
            d["recommended"] = group_json(result.recommended);
            d["path"] = screen_hierarchy::path_to(hierarchy, result.effective_target);
            const auto& target = *result.self->element;
            d["quality"] = quality_json(element_discovery::calculate_quality(target, config.vocabulary));
            if (const auto* node = hierarchy.find(result.effective_target)) {
                const auto report = element_discovery::element_report(*node);
                d["report"] = {
                    {"features", report.features},
                    {"description", report.description},
                    {"importance", report.importance},
                };
                d["actionable"] = actionable_json(element_discovery::analyze_actionable_children(*node));
            }
            if (const auto* clickable = element_discovery::find_nearest_clickable_ancestor(hierarchy, args->target))
                d["nearest_clickable"] = clickable->id();
            else
                d["nearest_clickable"] = nullptr;
        }
        out["discovery"] = std::move(d);
    }

    std::cout << out.dump(2) << std::endl;
    return 0;
}
