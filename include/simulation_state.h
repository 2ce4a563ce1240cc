#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "election_scheduler.h"
#include "event_manager.h"
#include "news.h"
#include "policy_pipeline.h"
#include "public_opinion.h"
#include "sim_types.h"
#include "simulation_context.h"

struct District {
    std::string id;        // "CA-01"
    std::string incumbent; // empty when vacant
    PartyShares lean;
    PartyShares lastShares;
};

struct SenateSeat {
    std::string id;    // "CA-S1"
    int seatClass = 0; // 0..2
    std::string holder;
};

struct StateBudget {
    double revenue = 100.0; // billions
    double spending = 100.0;
    double taxRate = 0.06;

    double deficit() const { return spending - revenue; }
};

struct State {
    std::string id; // postal code
    std::string name;
    std::int64_t population = 0;
    PartyShares lean;
    StateBudget budget;
    double gdp = 0.0; // billions
    double unemployment = 4.0;
    double inflation = 2.5;
    std::string governorParty;
    std::map<std::string, int> legislatureSeats;
    std::string legislatureControl;
    std::vector<District> districts;
    std::array<SenateSeat, 2> senateSeats;
    std::vector<std::string> enactedPolicies;
    std::map<std::string, double> campaignSpend;
    double governorApproval = 50.0;    // 0..100
    double legislatureApproval = 40.0; // 0..100

    int legislatureSize() const;
    int electoralVotes() const { return static_cast<int>(districts.size()) + 2; }
};

struct PoliticalParty {
    std::string id;
    std::string name;
    IssueVector platform{}; // stance per issue in [-1, 1]
    double treasury = 0.0;  // millions
    double approval = 50.0; // 0..100
    int houseSeats = 0;
    int senateSeats = 0;
    int stateLegislatureSeats = 0;
    int governors = 0;
    bool fieldsCandidates = true;

    void adjustApproval(double delta);
};

struct Legislature {
    int houseSize = 435;
    int senateSize = 100;
    std::string presidentParty;
    std::string houseControl;
    std::string senateControl;
    double presidentApproval = 50.0; // 0..100
    double congressApproval = 40.0;  // 0..100
    std::string courtLean;           // party the Supreme Court majority leans to, empty when balanced
};

struct NationalEconomy {
    double growth = 0.02;      // fraction per year
    double unemployment = 4.0; // %
    double inflation = 3.0;    // %
    double revenue = 4900.0;   // billions
    double spending = 6300.0;
    double taxRate = 0.18;

    double deficit() const { return spending - revenue; }
};

// Aggregate root. Owns every entity by value; a load replaces it wholesale.
struct SimulationState {
    SimDate date;
    int turn = 0; // completed turns
    std::map<std::string, State> states;
    std::map<std::string, PoliticalParty> parties;
    Legislature legislature;
    RngStreams rng;
    PublicOpinionTracker opinion;
    std::vector<Policy> policies;
    int nextPolicyId = 1;
    EventTable events;
    std::vector<Election> elections;
    NationalEconomy economy;
    News news;

    State* findState(const std::string& id);
    const State* findState(const std::string& id) const;
    PoliticalParty* findParty(const std::string& id);
    const PoliticalParty* findParty(const std::string& id) const;
    Policy* findPolicy(const std::string& id);
    const Policy* findPolicy(const std::string& id) const;

    // Parties that field candidates, in id order.
    std::vector<std::string> candidateParties() const;
};

// Moves an approval rating by delta, clamped into [0, 100].
void adjustApprovalRating(double& rating, double delta);

// Seats held per party in one chamber, counted from the seat holders.
// `region` selects the state for StateLegislature.
std::map<std::string, int> chamberSeats(const SimulationState& state, Chamber chamber, const std::string& region = kNationalRegion);

// Refreshes per-party seat counts and chamber control from the seat holders.
// Control goes to the party with most seats; a tie keeps the previous controller.
void recountSeats(SimulationState& state);

// Drops the oldest resolved elections and enacted or rejected policies beyond the
// given limits. Pending policies are never dropped.
void pruneHistory(SimulationState& state, int electionLimit, int policyLimit);

// Empty when every structural invariant holds, otherwise the first violation found.
std::string checkInvariants(const SimulationState& state, const SimulationConfig& config);
