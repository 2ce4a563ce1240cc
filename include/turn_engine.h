#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "ai_decision.h"
#include "economy_model.h"
#include "election_scheduler.h"
#include "event_manager.h"
#include "policy_pipeline.h"
#include "simulation_context.h"
#include "simulation_state.h"
#include "voter_model.h"

struct TurnReport {
    SimDate startDate;
    SimDate endDate;
    int turnsAdvanced = 0;
    std::vector<std::string> electionsResolved;
    std::vector<PolicyOutcome> policiesResolved;
    std::vector<FiredEvent> eventsFired;
    std::vector<std::string> faults; // rejected intents
};

// Owns the canonical state and the clock. One turn is one month:
// events -> AI intents -> policy -> opinion -> elections -> economy -> invariant check -> clock.
class TurnEngine {
public:
    using TurnObserver = std::function<void(const SimulationState&, const TurnReport&)>;

    // Throws ConfigurationFault when the config or the initial state is invalid.
    TurnEngine(const SimulationContext& ctx, SimulationState initial);

    TurnEngine(const TurnEngine&) = delete;
    TurnEngine& operator=(const TurnEngine&) = delete;

    // Runs `months` whole turns. Each turn is committed only after every phase and the
    // invariant check succeeded; a SimulationFault leaves the last completed turn in place.
    TurnReport advance(int months);

    // Manual interventions, accepted only between turns. Throw InvalidIntervention
    // without mutating anything when rejected.
    std::string proposePolicy(const std::string& actorId, Policy policy);
    std::string proposePolicy(const std::string& actorId,
                              const std::string& templateKey,
                              const std::string& region = kNationalRegion);
    void triggerEvent(const std::string& eventKey);
    void triggerEvent(const EffectVector& effect,
                      const std::string& region,
                      const std::string& description = std::string());

    std::string saveSnapshot() const;
    // Throws LoadError; the current state is kept on failure.
    void loadSnapshot(const std::string& text);
    void saveSnapshotFile(const std::string& path) const;
    void loadSnapshotFile(const std::string& path);

    const SimulationState& state() const { return m_state; }
    const SimulationConfig& config() const { return m_config; }

    // Called after each committed turn, while advance() is still running.
    void setTurnObserver(TurnObserver observer) { m_observer = std::move(observer); }

    static void setDebugMode(bool enabled);

private:
    void runTurn(SimulationState& next, TurnReport& report) const;
    void requireIdle(const std::string& actorId) const;

    SimulationConfig m_config;
    VoterModel m_voterModel;
    PolicyPipeline m_pipeline;
    ElectionScheduler m_elections;
    EventManager m_events;
    AIDecisionEngine m_ai;
    EconomyModel m_economy;
    SimulationState m_state;
    TurnObserver m_observer;
    bool m_advancing = false;

    static bool s_debugMode;
};
