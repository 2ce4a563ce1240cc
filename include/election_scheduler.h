#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "sim_types.h"
#include "simulation_context.h"
#include "voter_model.h"

struct SimulationState;

enum class ElectionKind : std::uint8_t {
    House = 0,
    Senate = 1,
    Presidential = 2,
    Governor = 3,
    StateLegislature = 4
};

enum class ElectionStatus : std::uint8_t {
    Pending = 0,
    InProgress = 1,
    Resolved = 2
};

const char* electionKindKey(ElectionKind kind);
bool parseElectionKind(const std::string& key, ElectionKind& out);
const char* electionStatusKey(ElectionStatus status);
bool parseElectionStatus(const std::string& key, ElectionStatus& out);

struct Election {
    std::string id;
    ElectionKind kind = ElectionKind::House;
    SimDate date;
    std::vector<std::string> contestedSeats;
    ElectionStatus status = ElectionStatus::Pending;
    std::map<std::string, std::string> winners; // seat id -> party id
    std::map<std::string, int> seatTotals;      // party id -> seats (electoral votes for Presidential)
    int senateClass = -1;
};

class ElectionScheduler {
public:
    ElectionScheduler(const SimulationConfig& config, const VoterModel& voterModel);

    // Elections due in `date` that have not already been resolved, in run order.
    std::vector<Election> scheduledFor(const SimulationState& state, const SimDate& date) const;

    // Runs every due election of the state's current month. Returns resolved ids.
    // Throws SimulationFault on zero candidates or a seat-count mismatch.
    std::vector<std::string> runDue(SimulationState& state, int turn) const;

    static int senateClassFor(int year, int anchorYear);
    static std::string electionId(ElectionKind kind, const SimDate& date);

    // Approval swing after a federal result. Losing the House to the president's
    // party lifts the president and Congress, losing it to anyone else costs them;
    // a Senate flip moves the president alone.
    static void applyControlChangeApprovals(SimulationState& state,
                                            const SimulationConfig::Elections& cfg,
                                            const std::string& previousHouse,
                                            const std::string& previousSenate);

    // Largest-remainder apportionment of `seats` over `shares`; the total is always `seats`.
    static std::map<std::string, int> allocateLargestRemainder(const PartyShares& shares, int seats);

private:
    void runHouse(SimulationState& state, Election& election, int turn) const;
    void runSenate(SimulationState& state, Election& election, int turn) const;
    void runPresidential(SimulationState& state, Election& election, int turn) const;
    void runGovernor(SimulationState& state, Election& election, int turn) const;
    void runStateLegislature(SimulationState& state, Election& election, int turn) const;

    std::string decide(const PartyShares& shares,
                       const std::string& incumbent,
                       const std::string& seatId,
                       int turn) const;

    const SimulationConfig& m_config;
    const VoterModel& m_voterModel;
};
