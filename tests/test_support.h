#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "sim_types.h"
#include "simulation_context.h"
#include "simulation_state.h"

// Small hand-built worlds shared by the suites.
//
// Two states (AA, BB) with three districts each, four senators and
// config.world.stateLegislatureSeats seats per state legislature. Parties A and B field
// candidates; C does not and holds nothing. Every seat starts with A and A holds the
// presidency. A's platform is +1 on healthcare, B's is -0.5.

inline SimulationContext makeQuietContext(std::uint64_t seed = 7) {
    SimulationContext ctx(seed);
    ctx.config.world.houseSeats = 6;
    ctx.config.world.senateSeats = 4;
    ctx.config.events.randomEventChance = 0.0;
    ctx.config.eventCatalog.clear();
    ctx.config.ai.enabled = false;
    return ctx;
}

inline PoliticalParty makeTestParty(const std::string& id, double healthcareStance, bool fieldsCandidates) {
    PoliticalParty p;
    p.id = id;
    p.name = "Party " + id;
    p.platform.fill(0.0);
    p.platform[issueIndex(IssueArea::Healthcare)] = healthcareStance;
    p.treasury = 50.0;
    p.approval = 50.0;
    p.fieldsCandidates = fieldsCandidates;
    return p;
}

inline SimulationState makeRiggedState(const SimulationContext& ctx) {
    const SimulationConfig& cfg = ctx.config;
    SimulationState state;
    state.date.year = 2025;
    state.date.month = 1;
    state.rng.seed = ctx.worldSeed;
    state.opinion.configure(cfg.opinion);
    state.opinion.ensureRegion(kNationalRegion);
    state.events.catalog = cfg.eventCatalog;
    state.legislature.houseSize = 6;
    state.legislature.senateSize = 4;
    state.legislature.presidentParty = "A";

    state.parties["A"] = makeTestParty("A", 1.0, true);
    state.parties["B"] = makeTestParty("B", -0.5, true);
    state.parties["C"] = makeTestParty("C", 0.0, false);

    int seatClass = 0;
    for (const char* id : {"AA", "BB"}) {
        State st;
        st.id = id;
        st.name = std::string("State ") + id;
        st.population = 1000000;
        st.lean["A"] = 0.0;
        st.lean["B"] = 0.0;
        st.gdp = 100.0;
        st.budget.revenue = 6.0;
        st.budget.spending = 6.0;
        st.governorParty = "A";
        st.legislatureSeats["A"] = cfg.world.stateLegislatureSeats;
        for (int d = 1; d <= 3; ++d) {
            District district;
            district.id = std::string(id) + "-0" + std::to_string(d);
            district.incumbent = "A";
            district.lean = st.lean;
            st.districts.push_back(district);
        }
        for (int k = 0; k < 2; ++k) {
            SenateSeat& seat = st.senateSeats[static_cast<std::size_t>(k)];
            seat.id = std::string(id) + "-S" + std::to_string(k + 1);
            seat.seatClass = seatClass++ % 3;
            seat.holder = "A";
        }
        state.opinion.ensureRegion(st.id);
        state.states[st.id] = st;
    }
    recountSeats(state);
    return state;
}

// Hands `count` House districts (in id order) to `party`.
inline void giveDistricts(SimulationState& state, const std::string& party, int count) {
    for (auto& kv : state.states) {
        for (District& d : kv.second.districts) {
            if (count-- > 0) d.incumbent = party;
        }
    }
    recountSeats(state);
}

// Hands `count` senate seats (in id order) to `party`.
inline void giveSenateSeats(SimulationState& state, const std::string& party, int count) {
    for (auto& kv : state.states) {
        for (SenateSeat& s : kv.second.senateSeats) {
            if (count-- > 0) s.holder = party;
        }
    }
    recountSeats(state);
}

inline Policy makeHealthcarePolicy(const std::string& sponsorParty, double opinionDelta) {
    Policy p;
    p.title = "Health Access Act";
    p.sponsorActor = "party:" + sponsorParty;
    p.sponsorParty = sponsorParty;
    p.level = PolicyLevel::Federal;
    p.region = kNationalRegion;
    p.issue = IssueArea::Healthcare;
    p.effect.opinion[issueIndex(IssueArea::Healthcare)] = opinionDelta;
    return p;
}
