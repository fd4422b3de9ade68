#include <screen_loaders/config_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace screen_loaders {

namespace {

// Reads j[key] into out when present; throws on a type mismatch so the whole
// load is rejected instead of silently half-applied.
template <typename T>
void read(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) out = j.at(key).get<T>();
}

void read_size(const nlohmann::json& j, const char* key, std::size_t& out) {
    if (!j.contains(key)) return;
    const auto v = j.at(key).get<long long>();
    if (v < 0) throw std::out_of_range(std::string(key) + " must not be negative");
    out = static_cast<std::size_t>(v);
}

void parse_hierarchy(const nlohmann::json& j, screen_hierarchy::HierarchyOptions& o) {
    read(j, "containment_tolerance_px", o.containment_tolerance_px);
    read(j, "relaxed_tolerance_px", o.relaxed_tolerance_px);
    read(j, "max_child_area_ratio", o.max_child_area_ratio);
    read_size(j, "hidden_search_window", o.hidden_search_window);
    read(j, "synthesize_root", o.synthesize_root);
    read(j, "synthetic_root_id", o.synthetic_root_id);
    read(j, "container_type_markers", o.container_type_markers);
    if (j.contains("identifier_conventions")) {
        o.identifier_conventions.clear();
        for (const auto& pair : j.at("identifier_conventions")) {
            o.identifier_conventions.emplace_back(
                pair.at("child").get<std::string>(), pair.at("parent").get<std::string>());
        }
    }
    if (o.max_child_area_ratio <= 0.0 || o.max_child_area_ratio > 1.0)
        throw std::out_of_range("max_child_area_ratio must be in (0, 1]");
    if (o.synthetic_root_id.empty())
        throw std::out_of_range("synthetic_root_id must not be empty");
}

void parse_discovery(const nlohmann::json& j, element_discovery::DiscoveryOptions& o) {
    read(j, "max_depth", o.max_depth);
    read_size(j, "max_descendants", o.max_descendants);
    read_size(j, "max_siblings", o.max_siblings);
    read_size(j, "max_recommended", o.max_recommended);
    read(j, "promotion_depth", o.promotion_depth);
    read(j, "prioritize_text", o.prioritize_text);
    read(j, "promote_to_clickable", o.promote_to_clickable);
}

void parse_vocabulary(const nlohmann::json& j, element_discovery::ScoringVocabulary& v) {
    read(j, "action_words", v.action_words);
    read(j, "meaningful_id_patterns", v.meaningful_id_patterns);
    read(j, "unique_phrases", v.unique_phrases);
}

EngineConfig parse_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("config root must be an object");
    EngineConfig config;
    if (j.contains("hierarchy")) parse_hierarchy(j.at("hierarchy"), config.hierarchy);
    if (j.contains("discovery")) parse_discovery(j.at("discovery"), config.discovery);
    if (j.contains("vocabulary")) parse_vocabulary(j.at("vocabulary"), config.vocabulary);
    return config;
}

} // namespace

std::optional<EngineConfig> load_engine_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("engine config: {}", ex.what());
    } catch (const std::logic_error& ex) {
        spdlog::warn("engine config: {}", ex.what());
    }
    return std::nullopt;
}

std::optional<EngineConfig> load_engine_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::warn("engine config: cannot open {}", path);
        return std::nullopt;
    }
    return load_engine_config_from_json(f);
}

} // namespace screen_loaders
