#pragma once

#include <random>
#include <string>
#include <vector>

#include "sim_types.h"
#include "simulation_context.h"

struct SimulationState;
struct State;

// Electorate abstraction. Produces normalized vote shares for one contest from the
// seat's partisan lean, the opinion voters in the state see, party and office
// approval, incumbency, campaign spend in the state and a seeded noise term.
class VoterModel {
public:
    explicit VoterModel(const SimulationConfig& config);

    PartyShares voteShares(const SimulationState& state,
                           const std::string& stateId,
                           const PartyShares& lean,
                           const std::string& incumbent,
                           const std::vector<std::string>& candidates,
                           std::mt19937_64& rng) const;

    // Plurality winner. Exact ties go to the incumbent when tied, otherwise to the
    // lexicographically-first party id. Empty when there are no shares.
    static std::string pickWinner(const PartyShares& shares, const std::string& incumbent);

    // How well a platform matches what a region currently approves of, in [-1, 1].
    static double opinionAlignment(const IssueVector& platform, const IssueVector& opinion);

    // Sum of the office-holder signals a party carries in one state: president,
    // House majority, governor and state legislature majority, each relative to
    // its baseline. Zero when every rating sits at its baseline.
    double officeApproval(const SimulationState& state, const State* st, const std::string& partyId) const;

private:
    const SimulationConfig& m_config;
};
