#pragma once

#include <element_discovery/discovery_types.hpp>
#include <element_discovery/quality_scorer.hpp>
#include <screen_hierarchy/hierarchy_options.hpp>
#include <istream>
#include <optional>
#include <string>

namespace screen_loaders {

struct EngineConfig {
    screen_hierarchy::HierarchyOptions hierarchy;
    element_discovery::DiscoveryOptions discovery;
    element_discovery::ScoringVocabulary vocabulary;
};

// Optional "hierarchy", "discovery" and "vocabulary" objects; keys that are
// missing keep their defaults, keys of the wrong type fail the load.
std::optional<EngineConfig> load_engine_config_from_json(std::istream& in);
std::optional<EngineConfig> load_engine_config_from_json_file(const std::string& path);

} // namespace screen_loaders
