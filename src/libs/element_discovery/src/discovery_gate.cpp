#include <element_discovery/discovery_gate.hpp>
#include <utility>

namespace element_discovery {

namespace {

// Returns the gate to Idle however the run ends.
struct IdleOnExit {
    std::atomic<GateState>& state;
    ~IdleOnExit() { state.store(GateState::Idle); }
};

} // namespace

GateOutcome DiscoveryGate::try_run(const std::function<void()>& fn) {
    GateState expected = GateState::Idle;
    if (!state_.compare_exchange_strong(expected, GateState::Running))
        return GateOutcome::Dropped;
    IdleOnExit reset{state_};
    fn();
    return GateOutcome::Ran;
}

DiscoverySession::DiscoverySession(const screen_hierarchy::HierarchyAnalysisResult& hierarchy,
    DiscoveryOptions options)
    : hierarchy_(hierarchy)
    , options_(std::move(options))
{
}

GateOutcome DiscoverySession::request(const std::string& target_id) {
    return gate_.try_run([&] {
        DiscoveryResult result = discover(hierarchy_, target_id, options_);
        std::lock_guard<std::mutex> lock(slot_mutex_);
        slot_ = std::move(result);
    });
}

std::optional<DiscoveryResult> DiscoverySession::latest() const {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return slot_;
}

} // namespace element_discovery
