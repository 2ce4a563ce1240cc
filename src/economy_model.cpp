#include "economy_model.h"

#include <algorithm>

#include "simulation_state.h"

namespace {

double drift(std::mt19937_64& rng, double range) {
    return (2.0 * SimulationContext::u01FromU64(rng()) - 1.0) * range;
}

} // namespace

EconomyModel::EconomyModel(const SimulationConfig& config) : m_config(config) {}

void EconomyModel::tickMonth(SimulationState& state, int turn) const {
    const SimulationConfig::Economy& eco = m_config.economy;
    std::mt19937_64 rng = state.rng.open("economy", turn);

    NationalEconomy& n = state.economy;
    n.growth = std::clamp(n.growth + drift(rng, eco.growthDrift), eco.minGrowth, eco.maxGrowth);
    n.inflation = std::clamp(n.inflation + drift(rng, eco.inflationDrift), eco.minInflation, eco.maxInflation);
    n.unemployment =
        std::clamp(n.unemployment + drift(rng, eco.unemploymentDrift), eco.minUnemployment, eco.maxUnemployment);

    double totalGdp = 0.0;
    for (auto& kv : state.states) {
        State& st = kv.second;
        const double growth = std::clamp(n.growth + drift(rng, eco.stateGrowthNoise), -0.1, 0.1);
        st.gdp *= 1.0 + growth / 12.0;
        // Unemployment reverts toward 5.5% and falls with growth.
        const double target = 5.5 - 50.0 * n.growth;
        st.unemployment = std::clamp(st.unemployment + 0.2 * (target - st.unemployment) + drift(rng, 0.1),
                                     eco.minUnemployment, eco.maxUnemployment);
        st.inflation = std::clamp(0.6 * n.inflation + 0.4 * st.inflation + drift(rng, 0.2),
                                  eco.minInflation, eco.maxInflation);

        st.budget.revenue = st.budget.taxRate * st.gdp;
        st.budget.spending += eco.stateSpendingReversion * (st.budget.revenue - st.budget.spending) +
                              drift(rng, eco.stateSpendingNoise);
        st.budget.spending = std::max(0.0, st.budget.spending);
        totalGdp += st.gdp;
    }
    n.revenue = n.taxRate * totalGdp;

    for (auto& kv : state.parties) {
        PoliticalParty& party = kv.second;
        if (party.fieldsCandidates) {
            party.treasury += eco.partyIncome * party.approval / 50.0;
        }
        party.adjustApproval(eco.approvalReversion * (eco.approvalBaseline - party.approval));
    }

    Legislature& leg = state.legislature;
    adjustApprovalRating(leg.presidentApproval,
                         eco.approvalReversion * (eco.presidentApprovalBaseline - leg.presidentApproval));
    adjustApprovalRating(leg.congressApproval,
                         eco.approvalReversion * (eco.congressApprovalBaseline - leg.congressApproval));
    for (auto& kv : state.states) {
        State& st = kv.second;
        adjustApprovalRating(st.governorApproval,
                             eco.approvalReversion * (eco.governorApprovalBaseline - st.governorApproval));
        adjustApprovalRating(st.legislatureApproval,
                             eco.approvalReversion * (eco.stateLegislatureApprovalBaseline - st.legislatureApproval));
    }
}
