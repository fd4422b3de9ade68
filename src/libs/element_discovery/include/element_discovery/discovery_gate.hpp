#pragma once

#include <element_discovery/discovery_engine.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace element_discovery {

enum class GateState {
    Idle,
    Running
};

enum class GateOutcome {
    Ran,
    Dropped // another run was in progress; the request is not queued
};

// Idle -> Running -> Idle. A request arriving while Running is dropped.
class DiscoveryGate {
public:
    GateOutcome try_run(const std::function<void()>& fn);
    GateState state() const { return state_.load(); }

private:
    std::atomic<GateState> state_{GateState::Idle};
};

// Runs discovery against one hierarchy through a DiscoveryGate and keeps the
// latest result. The hierarchy must outlive the session.
class DiscoverySession {
public:
    explicit DiscoverySession(const screen_hierarchy::HierarchyAnalysisResult& hierarchy,
        DiscoveryOptions options = {});

    GateOutcome request(const std::string& target_id);
    std::optional<DiscoveryResult> latest() const;
    GateState state() const { return gate_.state(); }

private:
    const screen_hierarchy::HierarchyAnalysisResult& hierarchy_;
    DiscoveryOptions options_;
    DiscoveryGate gate_;
    mutable std::mutex slot_mutex_;
    std::optional<DiscoveryResult> slot_;
};

} // namespace element_discovery
