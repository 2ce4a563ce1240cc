#include "election_scheduler.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

#include "sim_errors.h"
#include "simulation_state.h"

namespace {

std::string formatTotals(const std::map<std::string, int>& totals) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& kv : totals) {
        if (!first) oss << ", ";
        oss << kv.first << " " << kv.second;
        first = false;
    }
    return oss.str();
}

int sumSeats(const std::map<std::string, int>& totals) {
    int total = 0;
    for (const auto& kv : totals) {
        total += kv.second;
    }
    return total;
}

bool alreadyResolved(const SimulationState& state, const std::string& id) {
    for (const Election& e : state.elections) {
        if (e.id == id && e.status == ElectionStatus::Resolved) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* electionKindKey(ElectionKind kind) {
    switch (kind) {
        case ElectionKind::House: return "house";
        case ElectionKind::Senate: return "senate";
        case ElectionKind::Presidential: return "presidential";
        case ElectionKind::Governor: return "governor";
        case ElectionKind::StateLegislature: return "state_legislature";
    }
    return "house";
}

bool parseElectionKind(const std::string& key, ElectionKind& out) {
    for (ElectionKind k : {ElectionKind::House, ElectionKind::Senate, ElectionKind::Presidential,
                           ElectionKind::Governor, ElectionKind::StateLegislature}) {
        if (key == electionKindKey(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

const char* electionStatusKey(ElectionStatus status) {
    switch (status) {
        case ElectionStatus::Pending: return "pending";
        case ElectionStatus::InProgress: return "in_progress";
        case ElectionStatus::Resolved: return "resolved";
    }
    return "pending";
}

bool parseElectionStatus(const std::string& key, ElectionStatus& out) {
    for (ElectionStatus s : {ElectionStatus::Pending, ElectionStatus::InProgress, ElectionStatus::Resolved}) {
        if (key == electionStatusKey(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

ElectionScheduler::ElectionScheduler(const SimulationConfig& config, const VoterModel& voterModel)
    : m_config(config), m_voterModel(voterModel) {}

int ElectionScheduler::senateClassFor(int year, int anchorYear) {
    const int diff = year - anchorYear;
    const int half = diff >= 0 ? diff / 2 : -((-diff + 1) / 2);
    return ((half % 3) + 3) % 3;
}

std::string ElectionScheduler::electionId(ElectionKind kind, const SimDate& date) {
    return date.toString() + "-" + electionKindKey(kind);
}

std::map<std::string, int> ElectionScheduler::allocateLargestRemainder(const PartyShares& shares, int seats) {
    std::map<std::string, int> out;
    double total = 0.0;
    for (const auto& kv : shares) {
        total += std::max(0.0, kv.second);
    }
    if (shares.empty() || seats <= 0) {
        return out;
    }

    struct Remainder {
        std::string party;
        double fraction;
    };
    std::vector<Remainder> remainders;
    int assigned = 0;
    for (const auto& kv : shares) {
        const double share = total > 0.0 ? std::max(0.0, kv.second) / total : 1.0 / static_cast<double>(shares.size());
        const double quota = share * static_cast<double>(seats);
        const int whole = static_cast<int>(std::floor(quota));
        out[kv.first] = whole;
        assigned += whole;
        remainders.push_back({kv.first, quota - static_cast<double>(whole)});
    }
    std::stable_sort(remainders.begin(), remainders.end(), [](const Remainder& a, const Remainder& b) {
        return a.fraction > b.fraction;
    });
    for (std::size_t i = 0; assigned < seats; i = (i + 1) % remainders.size()) {
        ++out[remainders[i].party];
        ++assigned;
    }
    return out;
}

std::vector<Election> ElectionScheduler::scheduledFor(const SimulationState& state, const SimDate& date) const {
    std::vector<Election> due;
    if (date.month != m_config.elections.month || date.year % 2 != 0) {
        return due;
    }

    std::vector<ElectionKind> kinds = {ElectionKind::House, ElectionKind::Senate};
    if (date.year % 4 == 0) {
        kinds.push_back(ElectionKind::Presidential);
    } else {
        kinds.push_back(ElectionKind::Governor);
    }
    kinds.push_back(ElectionKind::StateLegislature);

    for (ElectionKind kind : kinds) {
        Election e;
        e.kind = kind;
        e.date = date;
        e.id = electionId(kind, date);
        if (alreadyResolved(state, e.id)) {
            continue;
        }
        for (const auto& kv : state.states) {
            const State& st = kv.second;
            switch (kind) {
                case ElectionKind::House:
                    for (const District& d : st.districts) e.contestedSeats.push_back(d.id);
                    break;
                case ElectionKind::Senate:
                    e.senateClass = senateClassFor(date.year, m_config.elections.senateCycleAnchorYear);
                    for (const SenateSeat& s : st.senateSeats) {
                        if (s.seatClass == e.senateClass) e.contestedSeats.push_back(s.id);
                    }
                    break;
                case ElectionKind::Presidential:
                    e.contestedSeats.push_back(st.id + "-PRES");
                    break;
                case ElectionKind::Governor:
                    e.contestedSeats.push_back(st.id + "-GOV");
                    break;
                case ElectionKind::StateLegislature:
                    e.contestedSeats.push_back(st.id + "-LEG");
                    break;
            }
        }
        due.push_back(e);
    }
    return due;
}

std::string ElectionScheduler::decide(const PartyShares& shares,
                                      const std::string& incumbent,
                                      const std::string& seatId,
                                      int turn) const {
    const std::string winner = VoterModel::pickWinner(shares, incumbent);
    if (winner.empty()) {
        throw SimulationFault("no eligible candidates", turn, seatId);
    }
    return winner;
}

void ElectionScheduler::runHouse(SimulationState& state, Election& election, int turn) const {
    const std::vector<std::string> candidates = state.candidateParties();
    std::mt19937_64 stream = state.rng.open("election:" + election.id, turn);
    for (auto& kv : state.states) {
        for (District& d : kv.second.districts) {
            const PartyShares shares = m_voterModel.voteShares(state, kv.first, d.lean, d.incumbent, candidates, stream);
            const std::string winner = decide(shares, d.incumbent, d.id, turn);
            d.incumbent = winner;
            d.lastShares = shares;
            election.winners[d.id] = winner;
        }
    }
    election.seatTotals = chamberSeats(state, Chamber::House);
    if (sumSeats(election.seatTotals) != state.legislature.houseSize) {
        throw SimulationFault("house recount " + std::to_string(sumSeats(election.seatTotals)) +
                                  " != " + std::to_string(state.legislature.houseSize),
                              turn, election.id);
    }
}

void ElectionScheduler::runSenate(SimulationState& state, Election& election, int turn) const {
    const std::vector<std::string> candidates = state.candidateParties();
    std::mt19937_64 stream = state.rng.open("election:" + election.id, turn);
    for (auto& kv : state.states) {
        State& st = kv.second;
        for (SenateSeat& seat : st.senateSeats) {
            if (seat.seatClass != election.senateClass) {
                continue;
            }
            const PartyShares shares = m_voterModel.voteShares(state, st.id, st.lean, seat.holder, candidates, stream);
            seat.holder = decide(shares, seat.holder, seat.id, turn);
            election.winners[seat.id] = seat.holder;
        }
    }
    election.seatTotals = chamberSeats(state, Chamber::Senate);
    if (sumSeats(election.seatTotals) != state.legislature.senateSize) {
        throw SimulationFault("senate recount " + std::to_string(sumSeats(election.seatTotals)) +
                                  " != " + std::to_string(state.legislature.senateSize),
                              turn, election.id);
    }
}

void ElectionScheduler::runPresidential(SimulationState& state, Election& election, int turn) const {
    const std::vector<std::string> candidates = state.candidateParties();
    std::mt19937_64 stream = state.rng.open("election:" + election.id, turn);
    const std::string incumbent = state.legislature.presidentParty;
    PartyShares electoralVotes;
    for (const std::string& c : candidates) {
        electoralVotes[c] = 0.0;
    }
    for (const auto& kv : state.states) {
        const State& st = kv.second;
        const std::string seatId = st.id + "-PRES";
        const PartyShares shares = m_voterModel.voteShares(state, st.id, st.lean, incumbent, candidates, stream);
        const std::string winner = decide(shares, incumbent, seatId, turn);
        election.winners[seatId] = winner;
        electoralVotes[winner] += static_cast<double>(st.electoralVotes());
    }
    const std::string president = decide(electoralVotes, incumbent, "US-PRES", turn);
    state.legislature.presidentParty = president;
    election.winners["US-PRES"] = president;
    for (const auto& kv : electoralVotes) {
        election.seatTotals[kv.first] = static_cast<int>(kv.second);
    }
}

void ElectionScheduler::runGovernor(SimulationState& state, Election& election, int turn) const {
    const std::vector<std::string> candidates = state.candidateParties();
    std::mt19937_64 stream = state.rng.open("election:" + election.id, turn);
    for (auto& kv : state.states) {
        State& st = kv.second;
        const std::string seatId = st.id + "-GOV";
        const PartyShares shares = m_voterModel.voteShares(state, st.id, st.lean, st.governorParty, candidates, stream);
        st.governorParty = decide(shares, st.governorParty, seatId, turn);
        election.winners[seatId] = st.governorParty;
        ++election.seatTotals[st.governorParty];
    }
}

void ElectionScheduler::runStateLegislature(SimulationState& state, Election& election, int turn) const {
    const std::vector<std::string> candidates = state.candidateParties();
    const int size = m_config.world.stateLegislatureSeats;
    std::mt19937_64 stream = state.rng.open("election:" + election.id, turn);
    for (auto& kv : state.states) {
        State& st = kv.second;
        const std::string seatId = st.id + "-LEG";
        const PartyShares shares = m_voterModel.voteShares(state, st.id, st.lean, st.legislatureControl, candidates, stream);
        if (shares.empty()) {
            throw SimulationFault("no eligible candidates", turn, seatId);
        }
        std::map<std::string, int> allocation = allocateLargestRemainder(shares, size);
        if (sumSeats(allocation) != size) {
            throw SimulationFault("state legislature recount " + std::to_string(sumSeats(allocation)) +
                                      " != " + std::to_string(size),
                                  turn, seatId);
        }
        for (auto it = allocation.begin(); it != allocation.end();) {
            it = it->second == 0 ? allocation.erase(it) : std::next(it);
        }
        st.legislatureSeats = allocation;
        PartyShares seatShares;
        for (const auto& seat : allocation) {
            seatShares[seat.first] = static_cast<double>(seat.second);
            election.seatTotals[seat.first] += seat.second;
        }
        election.winners[seatId] = decide(seatShares, st.legislatureControl, seatId, turn);
    }
}

std::vector<std::string> ElectionScheduler::runDue(SimulationState& state, int turn) const {
    std::vector<std::string> resolved;
    std::vector<Election> due = scheduledFor(state, state.date);
    const std::string previousHouse = state.legislature.houseControl;
    const std::string previousSenate = state.legislature.senateControl;
    for (Election& election : due) {
        election.status = ElectionStatus::InProgress;
        switch (election.kind) {
            case ElectionKind::House: runHouse(state, election, turn); break;
            case ElectionKind::Senate: runSenate(state, election, turn); break;
            case ElectionKind::Presidential: runPresidential(state, election, turn); break;
            case ElectionKind::Governor: runGovernor(state, election, turn); break;
            case ElectionKind::StateLegislature: runStateLegislature(state, election, turn); break;
        }
        election.status = ElectionStatus::Resolved;
        recountSeats(state);

        std::string summary = std::string(electionKindKey(election.kind)) + " election";
        if (election.kind == ElectionKind::Presidential) {
            summary += ": " + state.legislature.presidentParty + " wins (" + formatTotals(election.seatTotals) + ")";
        } else {
            summary += ": " + formatTotals(election.seatTotals);
        }
        state.news.addEvent(state.date, summary);
        resolved.push_back(election.id);
        state.elections.push_back(std::move(election));
    }

    if (!due.empty()) {
        applyControlChangeApprovals(state, m_config.elections, previousHouse, previousSenate);
        for (auto& kv : state.states) {
            kv.second.campaignSpend.clear();
        }
    }
    return resolved;
}

void ElectionScheduler::applyControlChangeApprovals(SimulationState& state,
                                                    const SimulationConfig::Elections& cfg,
                                                    const std::string& previousHouse,
                                                    const std::string& previousSenate) {
    Legislature& leg = state.legislature;
    if (leg.houseControl != previousHouse) {
        const double sign = leg.houseControl == leg.presidentParty ? 1.0 : -1.0;
        adjustApprovalRating(leg.presidentApproval, sign * cfg.houseFlipPresidentApproval);
        adjustApprovalRating(leg.congressApproval, sign * cfg.houseFlipCongressApproval);
    }
    if (leg.senateControl != previousSenate) {
        const double sign = leg.senateControl == leg.presidentParty ? 1.0 : -1.0;
        adjustApprovalRating(leg.presidentApproval, sign * cfg.senateFlipPresidentApproval);
    }
}
