#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "simulation_context.h"

struct SimulationState;
class PolicyPipeline;

enum class IntentKind : std::uint8_t {
    Pass = 0,
    ProposePolicy = 1,
    Campaign = 2,
    AdjustBudget = 3
};

const char* intentKindKey(IntentKind kind);

struct Intent {
    std::string actorId;
    IntentKind kind = IntentKind::Pass;
    std::string policyKey;   // ProposePolicy
    std::string targetState; // Campaign, or the proposing state
    double amount = 0.0;     // Campaign spend, budget cut or fundraising total
    double score = 0.0;
};

inline bool operator==(const Intent& a, const Intent& b) {
    return a.actorId == b.actorId && a.kind == b.kind && a.policyKey == b.policyKey &&
           a.targetState == b.targetState && a.amount == b.amount && a.score == b.score;
}

// A controllable participant. decide() sees only the frozen pre-turn snapshot and
// its own random stream.
class Actor {
public:
    virtual ~Actor() = default;

    virtual const std::string& id() const = 0;
    virtual Intent decide(const SimulationState& snapshot, std::mt19937_64& stream) const = 0;
};

class StateActor : public Actor {
public:
    StateActor(const SimulationConfig& config, std::string stateId);

    const std::string& id() const override { return m_actorId; }
    const std::string& stateId() const { return m_stateId; }
    Intent decide(const SimulationState& snapshot, std::mt19937_64& stream) const override;

private:
    const SimulationConfig& m_config;
    std::string m_stateId;
    std::string m_actorId;
};

class PartyActor : public Actor {
public:
    PartyActor(const SimulationConfig& config, std::string partyId);

    const std::string& id() const override { return m_actorId; }
    const std::string& partyId() const { return m_partyId; }
    Intent decide(const SimulationState& snapshot, std::mt19937_64& stream) const override;

private:
    const SimulationConfig& m_config;
    std::string m_partyId;
    std::string m_actorId;
};

class AIDecisionEngine {
public:
    AIDecisionEngine(const SimulationConfig& config, const PolicyPipeline& pipeline);

    // One actor per state and per candidate-fielding party, sorted by actor id.
    std::vector<std::unique_ptr<Actor>> buildActors(const SimulationState& snapshot) const;

    // Every actor decides against the same snapshot. The result is sorted by actor id
    // and does not depend on the order of `actors`.
    std::vector<Intent> collectIntents(const SimulationState& snapshot,
                                       RngStreams& streams,
                                       int turn,
                                       const std::vector<const Actor*>& actors) const;

    // Applies intents in actor-id order. Returns one message per intent rejected as stale.
    std::vector<std::string> applyIntents(SimulationState& state, std::vector<Intent> intents, int turn) const;

    static std::string stateActorId(const std::string& stateId) { return "state:" + stateId; }
    static std::string partyActorId(const std::string& partyId) { return "party:" + partyId; }

private:
    std::string applyOne(SimulationState& state, const Intent& intent, int turn) const;

    const SimulationConfig& m_config;
    const PolicyPipeline& m_pipeline;
};
