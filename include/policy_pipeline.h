#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "catalog.h"
#include "sim_types.h"
#include "simulation_context.h"

struct SimulationState;
struct PoliticalParty;

enum class PolicyStatus : std::uint8_t {
    Proposed = 0,
    Voting = 1,
    Enacted = 2,
    Rejected = 3
};

const char* policyStatusKey(PolicyStatus status);
bool parsePolicyStatus(const std::string& key, PolicyStatus& out);

struct ChamberVote {
    Chamber chamber = Chamber::House;
    std::string region = kNationalRegion;
    double yesShare = 0.0;
    bool passed = false;
};

struct VoteTally {
    std::vector<ChamberVote> chambers;
    bool vetoed = false;
    bool overridden = false;
    bool passed = false;
};

struct Policy {
    std::string id;
    std::string templateKey;
    std::string title;
    std::string description;
    std::string sponsorActor;
    std::string sponsorParty;
    PolicyLevel level = PolicyLevel::Federal;
    std::string region = kNationalRegion; // state id for state-level policies
    IssueArea issue = IssueArea::Economy;
    EffectVector effect;
    double cost = 0.0;
    PolicyStatus status = PolicyStatus::Proposed;
    int proposedTurn = -1;
    int votingTurn = -1;
    int resolvedTurn = -1;
    VoteTally lastTally;

    bool isTerminal() const { return status == PolicyStatus::Enacted || status == PolicyStatus::Rejected; }
    bool isPending() const { return status == PolicyStatus::Proposed || status == PolicyStatus::Voting; }
};

struct PolicyOutcome {
    std::string policyId;
    std::string title;
    PolicyStatus status = PolicyStatus::Rejected;
    VoteTally tally;
};

// What the policy phase produced. Opinion effects of enacted policies are handed to
// the opinion phase so they land exactly once, before that turn's decay.
struct PolicyPhaseResult {
    std::vector<PolicyOutcome> outcomes;
    std::vector<std::pair<std::string, EffectVector>> pendingOpinion; // (region, effect)
};

class PolicyPipeline {
public:
    explicit PolicyPipeline(const SimulationConfig& config);

    Policy fromTemplate(const PolicyTemplate& tpl,
                        const std::string& sponsorActor,
                        const std::string& sponsorParty,
                        const std::string& region) const;

    // Empty string when the proposal is acceptable, otherwise the reason it is not.
    std::string validateProposal(const SimulationState& state, const Policy& policy) const;

    // Appends a Proposed policy and returns its assigned id. The caller validates first.
    std::string submit(SimulationState& state, Policy policy, int proposedTurn) const;

    // Steps 1 and 2 of the policy phase for turn `turn`: tally policies that entered
    // Voting in an earlier turn, then promote everything proposed before this turn.
    PolicyPhaseResult resolve(SimulationState& state, int turn) const;

    VoteTally tally(const SimulationState& state, const Policy& policy) const;

    // Platform alignment in [-1, 1]; 0 when the policy has no opinion effect.
    static double alignment(const PoliticalParty& party, const Policy& policy);
    static double alignment(const IssueVector& platform, const EffectVector& effect);

    int pendingCount(const SimulationState& state, const std::string& sponsorActor) const;
    bool hasPending(const SimulationState& state, const std::string& templateKey, const std::string& region) const;

private:
    double chamberYesShare(const SimulationState& state,
                           const Policy& policy,
                           const std::map<std::string, int>& seats) const;
    // Yes share a federal bill loses when it is strongly inflationary and the court
    // leans away from its sponsor.
    double courtPenalty(const SimulationState& state, const Policy& policy) const;
    // Applies the economy and budget effects and the approval bump of the offices
    // that carried the bill.
    void enact(SimulationState& state, Policy& policy) const;

    const SimulationConfig& m_config;
};
