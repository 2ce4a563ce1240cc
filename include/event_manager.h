#pragma once

#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "catalog.h"
#include "sim_types.h"
#include "simulation_context.h"

struct SimulationState;
class PolicyPipeline;

struct PendingChain {
    std::string eventKey;
    std::string sourceKey;
    int dueTurn = 0;
};

// Queued by a manual trigger between turns and fired at the start of the next event phase.
struct ForcedEvent {
    std::string eventKey; // empty for an ad-hoc effect
    EffectVector effect;
    std::string region = kNationalRegion;
    std::string description;
};

// Event manager state carried inside SimulationState and persisted with it.
struct EventTable {
    std::vector<EventDefinition> catalog;
    std::map<std::string, int> cooldowns; // event key -> turns until armed again
    std::set<std::string> retired;        // fired one-shot events
    std::vector<PendingChain> pendingChains;
    std::vector<ForcedEvent> forcedQueue;
    std::vector<std::string> recent;      // newest last, bounded

    const EventDefinition* find(const std::string& key) const;
    bool isArmed(const std::string& key) const;
};

struct FiredEvent {
    std::string key;
    std::string description;
    std::string region = kNationalRegion;
    std::string cause; // forced, chain, threshold, calendar, random
};

class EventManager {
public:
    EventManager(const SimulationConfig& config, const PolicyPipeline& pipeline);

    // One event phase of `turn`. Conditional and calendar triggers are evaluated
    // against `phaseStart`, the state as it was before this phase changed anything.
    std::vector<FiredEvent> runPhase(SimulationState& state, const SimulationState& phaseStart, int turn) const;

    static bool triggerHolds(const EventTrigger& trigger, const SimulationState& state);

    // Moves the approval of an office. Governor and legislature ratings move in
    // `region`, or in every state for a national event.
    static void adjustOfficeApproval(SimulationState& state,
                                     const std::string& office,
                                     const std::string& region,
                                     double amount);

private:
    void fire(SimulationState& state,
              const EventDefinition& def,
              const std::string& cause,
              int turn,
              std::mt19937_64& stream,
              std::vector<FiredEvent>& fired) const;
    void applyEffect(SimulationState& state, const EffectVector& effect, const std::string& region) const;
    void remember(SimulationState& state, const std::string& key) const;

    const SimulationConfig& m_config;
    const PolicyPipeline& m_pipeline;
};
