#include "default_scenario.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include "sim_errors.h"

namespace {

const char* kDemocrat = "Democrat";
const char* kRepublican = "Republican";
const char* kIndependent = "Independent";

constexpr int kInitialHouseDemocrats = 213;
constexpr int kInitialSenateDemocrats = 47;
// Intra-state spread of district margins around the statewide margin.
constexpr double kDistrictSpread = 0.30;

PartyShares leanFromMargin(double margin) {
    PartyShares lean;
    lean[kDemocrat] = margin / 2.0;
    lean[kRepublican] = -margin / 2.0;
    return lean;
}

IssueVector platformOf(double economy, double healthcare, double education,
                       double environment, double security, double immigration) {
    IssueVector p{};
    p[issueIndex(IssueArea::Economy)] = economy;
    p[issueIndex(IssueArea::Healthcare)] = healthcare;
    p[issueIndex(IssueArea::Education)] = education;
    p[issueIndex(IssueArea::Environment)] = environment;
    p[issueIndex(IssueArea::Security)] = security;
    p[issueIndex(IssueArea::Immigration)] = immigration;
    return p;
}

PoliticalParty makeParty(const char* id, const char* name, const IssueVector& platform,
                         double treasury, double approval, bool fieldsCandidates) {
    PoliticalParty p;
    p.id = id;
    p.name = name;
    p.platform = platform;
    p.treasury = treasury;
    p.approval = approval;
    p.fieldsCandidates = fieldsCandidates;
    return p;
}

double democraticLean(const PartyShares& lean) {
    const auto it = lean.find(kDemocrat);
    return it == lean.end() ? 0.0 : it->second;
}

} // namespace

const std::vector<StateSeed>& getDefaultStateSeeds() {
    static const std::vector<StateSeed> kSeeds = {
        {"AL", "Alabama", 5024279, -25.5, 7, false},
        {"AK", "Alaska", 733391, -10.1, 1, false},
        {"AZ", "Arizona", 7151502, 0.3, 9, true},
        {"AR", "Arkansas", 3011524, -27.6, 4, false},
        {"CA", "California", 39538223, 29.2, 52, true},
        {"CO", "Colorado", 5773714, 13.5, 8, true},
        {"CT", "Connecticut", 3605944, 20.0, 5, true},
        {"DE", "Delaware", 989948, 19.0, 1, true},
        {"FL", "Florida", 21538187, -3.4, 28, false},
        {"GA", "Georgia", 10711908, 0.2, 14, false},
        {"HI", "Hawaii", 1455271, 29.5, 2, true},
        {"ID", "Idaho", 1839106, -30.8, 2, false},
        {"IL", "Illinois", 12812508, 17.0, 17, true},
        {"IN", "Indiana", 6785528, -16.1, 9, false},
        {"IA", "Iowa", 3190369, -8.2, 4, false},
        {"KS", "Kansas", 2937880, -14.6, 4, true},
        {"KY", "Kentucky", 4505836, -25.9, 6, true},
        {"LA", "Louisiana", 4657757, -18.6, 6, false},
        {"ME", "Maine", 1362359, 9.1, 2, true},
        {"MD", "Maryland", 6177224, 33.2, 8, true},
        {"MA", "Massachusetts", 7029917, 33.5, 9, true},
        {"MI", "Michigan", 10077331, 2.8, 13, true},
        {"MN", "Minnesota", 5706494, 7.1, 8, true},
        {"MS", "Mississippi", 2961279, -16.5, 4, false},
        {"MO", "Missouri", 6154913, -15.4, 8, false},
        {"MT", "Montana", 1084225, -16.4, 2, false},
        {"NE", "Nebraska", 1961504, -19.1, 3, false},
        {"NV", "Nevada", 3104614, 2.4, 4, false},
        {"NH", "New Hampshire", 1377529, 7.4, 2, false},
        {"NJ", "New Jersey", 9288994, 15.9, 12, true},
        {"NM", "New Mexico", 2117522, 10.8, 3, true},
        {"NY", "New York", 20201249, 23.1, 26, true},
        {"NC", "North Carolina", 10439388, -1.3, 14, true},
        {"ND", "North Dakota", 779094, -33.4, 1, false},
        {"OH", "Ohio", 11799448, -8.0, 15, false},
        {"OK", "Oklahoma", 3959353, -33.1, 5, false},
        {"OR", "Oregon", 4237256, 16.1, 6, true},
        {"PA", "Pennsylvania", 13002700, 1.2, 17, true},
        {"RI", "Rhode Island", 1097379, 20.8, 2, true},
        {"SC", "South Carolina", 5118425, -11.7, 7, false},
        {"SD", "South Dakota", 886667, -26.2, 1, false},
        {"TN", "Tennessee", 6910840, -23.2, 9, false},
        {"TX", "Texas", 29145505, -5.6, 38, false},
        {"UT", "Utah", 3271616, -20.5, 4, false},
        {"VT", "Vermont", 643077, 35.4, 1, false},
        {"VA", "Virginia", 8631393, 10.1, 11, false},
        {"WA", "Washington", 7705281, 19.2, 10, true},
        {"WV", "West Virginia", 1793716, -38.9, 2, false},
        {"WI", "Wisconsin", 5893718, 0.6, 8, true},
        {"WY", "Wyoming", 576851, -43.4, 1, false},
    };
    return kSeeds;
}

SimulationState makeDefaultScenario(const SimulationContext& ctx) {
    const SimulationConfig& cfg = ctx.config;
    const std::vector<StateSeed>& seeds = getDefaultStateSeeds();

    int districtTotal = 0;
    for (const StateSeed& s : seeds) {
        districtTotal += s.houseSeats;
    }
    if (districtTotal != cfg.world.houseSeats) {
        throw ConfigurationFault("default scenario has " + std::to_string(districtTotal) +
                                 " districts but world.houseSeats is " + std::to_string(cfg.world.houseSeats));
    }
    if (static_cast<int>(seeds.size()) * 2 != cfg.world.senateSeats) {
        throw ConfigurationFault("default scenario has " + std::to_string(seeds.size() * 2) +
                                 " senate seats but world.senateSeats is " + std::to_string(cfg.world.senateSeats));
    }

    SimulationState state;
    state.date.year = cfg.world.startYear;
    state.date.month = cfg.world.startMonth;
    state.turn = 0;
    state.rng.seed = ctx.worldSeed;
    state.opinion.configure(cfg.opinion);
    state.events.catalog = cfg.eventCatalog;
    state.legislature.houseSize = cfg.world.houseSeats;
    state.legislature.senateSize = cfg.world.senateSeats;
    state.legislature.presidentParty = kRepublican;
    state.legislature.presidentApproval = 51.0;
    state.legislature.congressApproval = 38.0;
    state.legislature.courtLean = kRepublican;

    const IssueVector democratic = platformOf(0.3, 0.8, 0.6, 0.8, -0.1, -0.5);
    const IssueVector republican = platformOf(0.7, -0.5, -0.1, -0.6, 0.8, 0.8);
    state.parties[kDemocrat] = makeParty(kDemocrat, "Democratic Party", democratic, 120.0, 48.0, true);
    state.parties[kRepublican] = makeParty(kRepublican, "Republican Party", republican, 130.0, 50.0, true);
    state.parties[kIndependent] =
        makeParty(kIndependent, "Independents", platformOf(0.2, 0.1, 0.2, 0.1, 0.1, 0.0), 5.0, 35.0, false);

    state.opinion.ensureRegion(kNationalRegion);
    double totalGdp = 0.0;
    for (std::size_t i = 0; i < seeds.size(); ++i) {
        const StateSeed& seed = seeds[i];
        const double margin = seed.margin / 100.0;

        State st;
        st.id = seed.id;
        st.name = seed.name;
        st.population = seed.population;
        st.lean = leanFromMargin(margin);
        st.gdp = static_cast<double>(seed.population) * 8.0e-5;
        st.unemployment = 4.0;
        st.inflation = 2.8;
        st.budget.taxRate = 0.06;
        st.budget.revenue = st.budget.taxRate * st.gdp;
        st.budget.spending = st.budget.revenue;
        st.governorParty = seed.democraticGovernor ? kDemocrat : kRepublican;

        const int size = cfg.world.stateLegislatureSeats;
        const int dSeats = std::clamp(static_cast<int>(std::lround(size * (0.5 + 0.75 * margin))), 0, size);
        if (dSeats > 0) st.legislatureSeats[kDemocrat] = dSeats;
        if (size - dSeats > 0) st.legislatureSeats[kRepublican] = size - dSeats;

        for (int d = 0; d < seed.houseSeats; ++d) {
            District district;
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%s-%02d", seed.id, d + 1);
            district.id = buf;
            const double offset = seed.houseSeats == 1
                                      ? 0.0
                                      : kDistrictSpread * (2.0 * (static_cast<double>(d) + 0.5) / seed.houseSeats - 1.0);
            district.lean = leanFromMargin(margin + offset);
            st.districts.push_back(district);
        }

        for (int k = 0; k < 2; ++k) {
            SenateSeat& seat = st.senateSeats[static_cast<std::size_t>(k)];
            seat.id = std::string(seed.id) + "-S" + std::to_string(k + 1);
            seat.seatClass = static_cast<int>((i + static_cast<std::size_t>(k)) % 3);
        }

        for (IssueArea issue : kAllIssues) {
            const int idx = issueIndex(issue);
            const double tilt = 0.25 * margin * (democratic[idx] - republican[idx]);
            state.opinion.setRaw(st.id, issue, std::clamp(tilt, cfg.opinion.minValue, cfg.opinion.maxValue));
        }

        totalGdp += st.gdp;
        state.states[st.id] = st;
    }

    // Initial split: the most Democratic-leaning districts and seats go Democratic.
    std::vector<District*> districts;
    std::vector<SenateSeat*> seats;
    for (auto& kv : state.states) {
        for (District& d : kv.second.districts) districts.push_back(&d);
        for (SenateSeat& s : kv.second.senateSeats) seats.push_back(&s);
    }
    std::stable_sort(districts.begin(), districts.end(), [](const District* a, const District* b) {
        const double la = democraticLean(a->lean);
        const double lb = democraticLean(b->lean);
        return la != lb ? la > lb : a->id < b->id;
    });
    for (std::size_t i = 0; i < districts.size(); ++i) {
        districts[i]->incumbent = static_cast<int>(i) < kInitialHouseDemocrats ? kDemocrat : kRepublican;
    }
    std::stable_sort(seats.begin(), seats.end(), [&state](const SenateSeat* a, const SenateSeat* b) {
        const double la = democraticLean(state.states.at(a->id.substr(0, 2)).lean);
        const double lb = democraticLean(state.states.at(b->id.substr(0, 2)).lean);
        return la != lb ? la > lb : a->id < b->id;
    });
    for (std::size_t i = 0; i < seats.size(); ++i) {
        seats[i]->holder = static_cast<int>(i) < kInitialSenateDemocrats ? kDemocrat : kRepublican;
    }

    state.economy.growth = 0.02;
    state.economy.unemployment = 4.0;
    state.economy.inflation = 3.0;
    state.economy.taxRate = cfg.economy.federalTaxRate;
    state.economy.revenue = state.economy.taxRate * totalGdp;
    state.economy.spending = state.economy.revenue + 1400.0;

    recountSeats(state);
    state.news.addEvent(state.date, "Simulation begins");
    return state;
}
