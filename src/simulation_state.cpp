#include "simulation_state.h"

#include <algorithm>
#include <cstddef>
#include <set>
#include <sstream>
#include <utility>

int State::legislatureSize() const {
    int total = 0;
    for (const auto& kv : legislatureSeats) {
        total += kv.second;
    }
    return total;
}

void adjustApprovalRating(double& rating, double delta) {
    rating = std::clamp(rating + delta, 0.0, 100.0);
}

void PoliticalParty::adjustApproval(double delta) {
    adjustApprovalRating(approval, delta);
}

State* SimulationState::findState(const std::string& id) {
    const auto it = states.find(id);
    return it == states.end() ? nullptr : &it->second;
}

const State* SimulationState::findState(const std::string& id) const {
    const auto it = states.find(id);
    return it == states.end() ? nullptr : &it->second;
}

PoliticalParty* SimulationState::findParty(const std::string& id) {
    const auto it = parties.find(id);
    return it == parties.end() ? nullptr : &it->second;
}

const PoliticalParty* SimulationState::findParty(const std::string& id) const {
    const auto it = parties.find(id);
    return it == parties.end() ? nullptr : &it->second;
}

Policy* SimulationState::findPolicy(const std::string& id) {
    for (auto& p : policies) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

const Policy* SimulationState::findPolicy(const std::string& id) const {
    for (const auto& p : policies) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

std::vector<std::string> SimulationState::candidateParties() const {
    std::vector<std::string> out;
    for (const auto& kv : parties) {
        if (kv.second.fieldsCandidates) {
            out.push_back(kv.first);
        }
    }
    return out;
}

std::map<std::string, int> chamberSeats(const SimulationState& state, Chamber chamber, const std::string& region) {
    std::map<std::string, int> seats;
    switch (chamber) {
        case Chamber::House:
            for (const auto& kv : state.states) {
                for (const District& d : kv.second.districts) {
                    if (!d.incumbent.empty()) {
                        ++seats[d.incumbent];
                    }
                }
            }
            break;
        case Chamber::Senate:
            for (const auto& kv : state.states) {
                for (const SenateSeat& s : kv.second.senateSeats) {
                    if (!s.holder.empty()) {
                        ++seats[s.holder];
                    }
                }
            }
            break;
        case Chamber::StateLegislature:
            if (const State* st = state.findState(region)) {
                for (const auto& kv : st->legislatureSeats) {
                    if (kv.second > 0) {
                        seats[kv.first] = kv.second;
                    }
                }
            }
            break;
    }
    return seats;
}

namespace {

std::string controllingParty(const std::map<std::string, int>& seats, const std::string& previous) {
    int best = -1;
    std::string leader;
    bool tied = false;
    for (const auto& kv : seats) {
        if (kv.second > best) {
            best = kv.second;
            leader = kv.first;
            tied = false;
        } else if (kv.second == best) {
            tied = true;
        }
    }
    if (tied && !previous.empty()) {
        const auto it = seats.find(previous);
        if (it != seats.end() && it->second == best) {
            return previous;
        }
    }
    return leader;
}

int seatsOf(const std::map<std::string, int>& seats, const std::string& party) {
    const auto it = seats.find(party);
    return it == seats.end() ? 0 : it->second;
}

// A controller must hold at least as many seats as any other party.
bool holdsMostSeats(const std::map<std::string, int>& seats, const std::string& controller) {
    if (seats.empty()) {
        return controller.empty();
    }
    int best = 0;
    for (const auto& kv : seats) {
        best = std::max(best, kv.second);
    }
    return seatsOf(seats, controller) == best;
}

bool withinApprovalRange(double v) {
    return v >= 0.0 && v <= 100.0;
}

} // namespace

void recountSeats(SimulationState& state) {
    for (auto& kv : state.parties) {
        kv.second.houseSeats = 0;
        kv.second.senateSeats = 0;
        kv.second.stateLegislatureSeats = 0;
        kv.second.governors = 0;
    }

    const auto house = chamberSeats(state, Chamber::House);
    const auto senate = chamberSeats(state, Chamber::Senate);
    for (const auto& kv : house) {
        if (PoliticalParty* p = state.findParty(kv.first)) p->houseSeats = kv.second;
    }
    for (const auto& kv : senate) {
        if (PoliticalParty* p = state.findParty(kv.first)) p->senateSeats = kv.second;
    }
    for (auto& kv : state.states) {
        State& st = kv.second;
        for (const auto& seat : st.legislatureSeats) {
            if (PoliticalParty* p = state.findParty(seat.first)) p->stateLegislatureSeats += seat.second;
        }
        st.legislatureControl = controllingParty(st.legislatureSeats, st.legislatureControl);
        if (PoliticalParty* p = state.findParty(st.governorParty)) ++p->governors;
    }
    state.legislature.houseControl = controllingParty(house, state.legislature.houseControl);
    state.legislature.senateControl = controllingParty(senate, state.legislature.senateControl);
}

void pruneHistory(SimulationState& state, int electionLimit, int policyLimit) {
    const std::size_t keepElections = static_cast<std::size_t>(std::max(0, electionLimit));
    if (state.elections.size() > keepElections) {
        state.elections.erase(state.elections.begin(),
                              state.elections.end() - static_cast<std::ptrdiff_t>(keepElections));
    }

    const std::ptrdiff_t terminal =
        std::count_if(state.policies.begin(), state.policies.end(), [](const Policy& p) { return p.isTerminal(); });
    std::ptrdiff_t excess = terminal - std::max(0, policyLimit);
    if (excess <= 0) {
        return;
    }
    std::vector<Policy> kept;
    kept.reserve(state.policies.size() - static_cast<std::size_t>(excess));
    for (Policy& p : state.policies) {
        if (excess > 0 && p.isTerminal()) {
            --excess;
            continue;
        }
        kept.push_back(std::move(p));
    }
    state.policies = std::move(kept);
}

std::string checkInvariants(const SimulationState& state, const SimulationConfig& config) {
    std::ostringstream oss;
    if (state.date.month < 1 || state.date.month > 12) {
        oss << "clock month " << state.date.month << " out of range";
        return oss.str();
    }

    std::set<std::string> seatIds;
    int houseTotal = 0;
    int senateTotal = 0;
    for (const auto& kv : state.states) {
        const State& st = kv.second;
        for (const District& d : st.districts) {
            if (!seatIds.insert(d.id).second) {
                return "district id " + d.id + " appears twice";
            }
            if (d.incumbent.empty() || !state.findParty(d.incumbent)) {
                return "district " + d.id + " has no valid holder";
            }
            ++houseTotal;
        }
        for (const SenateSeat& s : st.senateSeats) {
            if (!seatIds.insert(s.id).second) {
                return "senate seat id " + s.id + " appears twice";
            }
            if (s.seatClass < 0 || s.seatClass > 2) {
                return "senate seat " + s.id + " has class outside 0..2";
            }
            if (s.holder.empty() || !state.findParty(s.holder)) {
                return "senate seat " + s.id + " has no valid holder";
            }
            ++senateTotal;
        }
        if (st.legislatureSize() != config.world.stateLegislatureSeats) {
            oss << "state legislature " << st.id << " holds " << st.legislatureSize() << " seats, expected "
                << config.world.stateLegislatureSeats;
            return oss.str();
        }
        for (const auto& seat : st.legislatureSeats) {
            if (seat.second < 0 || !state.findParty(seat.first)) {
                return "state legislature " + st.id + " has an invalid seat entry for '" + seat.first + "'";
            }
        }
        if (!st.governorParty.empty() && !state.findParty(st.governorParty)) {
            return "state " + st.id + " governor party '" + st.governorParty + "' is unknown";
        }
    }
    if (houseTotal != state.legislature.houseSize) {
        oss << "house holds " << houseTotal << " seats, expected " << state.legislature.houseSize;
        return oss.str();
    }
    if (senateTotal != state.legislature.senateSize) {
        oss << "senate holds " << senateTotal << " seats, expected " << state.legislature.senateSize;
        return oss.str();
    }

    const auto house = chamberSeats(state, Chamber::House);
    const auto senate = chamberSeats(state, Chamber::Senate);
    std::map<std::string, int> legislators;
    std::map<std::string, int> governors;
    for (const auto& kv : state.states) {
        const State& st = kv.second;
        for (const auto& seat : st.legislatureSeats) {
            legislators[seat.first] += seat.second;
        }
        if (!st.governorParty.empty()) {
            ++governors[st.governorParty];
        }
        if (!holdsMostSeats(chamberSeats(state, Chamber::StateLegislature, st.id), st.legislatureControl)) {
            return "state legislature " + st.id + " control '" + st.legislatureControl + "' does not hold the most seats";
        }
    }
    for (const auto& kv : state.parties) {
        const PoliticalParty& p = kv.second;
        if (p.houseSeats != seatsOf(house, kv.first) || p.senateSeats != seatsOf(senate, kv.first) ||
            p.stateLegislatureSeats != seatsOf(legislators, kv.first) || p.governors != seatsOf(governors, kv.first)) {
            oss << "party " << kv.first << " seat table (house " << p.houseSeats << ", senate " << p.senateSeats
                << ", state legislatures " << p.stateLegislatureSeats << ", governors " << p.governors
                << ") does not match the seat holders";
            return oss.str();
        }
    }
    if (!holdsMostSeats(house, state.legislature.houseControl)) {
        return "house control '" + state.legislature.houseControl + "' does not hold the most seats";
    }
    if (!holdsMostSeats(senate, state.legislature.senateControl)) {
        return "senate control '" + state.legislature.senateControl + "' does not hold the most seats";
    }

    const Legislature& leg = state.legislature;
    if (!withinApprovalRange(leg.presidentApproval) || !withinApprovalRange(leg.congressApproval)) {
        oss << "federal approval (president " << leg.presidentApproval << ", congress " << leg.congressApproval
            << ") outside 0..100";
        return oss.str();
    }
    if (!leg.courtLean.empty() && !state.findParty(leg.courtLean)) {
        return "court lean '" + leg.courtLean + "' is not a known party";
    }
    for (const auto& kv : state.states) {
        const State& st = kv.second;
        if (!withinApprovalRange(st.governorApproval) || !withinApprovalRange(st.legislatureApproval)) {
            return "state " + st.id + " approval outside 0..100";
        }
    }

    if (!state.opinion.withinBounds()) {
        return "opinion value outside bounds";
    }

    std::set<std::string> policyIds;
    for (const Policy& p : state.policies) {
        if (!policyIds.insert(p.id).second) {
            return "policy id " + p.id + " appears twice";
        }
        if (p.status == PolicyStatus::Enacted && p.votingTurn < 0) {
            return "policy " + p.id + " was enacted without a vote";
        }
    }

    std::set<std::string> electionIds;
    for (const Election& e : state.elections) {
        if (!electionIds.insert(e.id).second) {
            return "election " + e.id + " recorded twice";
        }
    }
    return std::string();
}
