#include "voter_model.h"

#include <algorithm>
#include <cmath>

#include "simulation_state.h"

namespace {

double officeSignal(double approval, double baseline) {
    return (approval - baseline) / 50.0;
}

} // namespace

VoterModel::VoterModel(const SimulationConfig& config) : m_config(config) {}

double VoterModel::officeApproval(const SimulationState& state, const State* st, const std::string& partyId) const {
    const SimulationConfig::Economy& eco = m_config.economy;
    const Legislature& leg = state.legislature;
    double signal = 0.0;
    if (leg.presidentParty == partyId) {
        signal += officeSignal(leg.presidentApproval, eco.presidentApprovalBaseline);
    }
    if (leg.houseControl == partyId) {
        signal += officeSignal(leg.congressApproval, eco.congressApprovalBaseline);
    }
    if (st) {
        if (st->governorParty == partyId) {
            signal += officeSignal(st->governorApproval, eco.governorApprovalBaseline);
        }
        if (st->legislatureControl == partyId) {
            signal += officeSignal(st->legislatureApproval, eco.stateLegislatureApprovalBaseline);
        }
    }
    return signal;
}

double VoterModel::opinionAlignment(const IssueVector& platform, const IssueVector& opinion) {
    double sum = 0.0;
    for (int i = 0; i < kIssueCount; ++i) {
        sum += platform[i] * opinion[i];
    }
    return std::clamp(sum / static_cast<double>(kIssueCount), -1.0, 1.0);
}

PartyShares VoterModel::voteShares(const SimulationState& state,
                                   const std::string& stateId,
                                   const PartyShares& lean,
                                   const std::string& incumbent,
                                   const std::vector<std::string>& candidates,
                                   std::mt19937_64& rng) const {
    const SimulationConfig::Elections& cfg = m_config.elections;
    const State* st = state.findState(stateId);
    const IssueVector regional = state.opinion.electorateView(st ? stateId : std::string(kNationalRegion));

    std::vector<std::string> sorted = candidates;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    PartyShares scores;
    double total = 0.0;
    for (const std::string& partyId : sorted) {
        const PoliticalParty* party = state.findParty(partyId);
        // Draw even for unknown parties so the stream position never depends on the roster.
        const double noise = (2.0 * SimulationContext::u01FromU64(rng()) - 1.0) * cfg.noise;
        if (!party) {
            continue;
        }

        double score = 1.0;
        const auto leanIt = lean.find(partyId);
        if (leanIt != lean.end()) {
            score += cfg.leanWeight * leanIt->second;
        }
        score += cfg.opinionWeight * opinionAlignment(party->platform, regional);
        score += cfg.approvalWeight * (party->approval - 50.0) / 50.0;
        score += cfg.officeApprovalWeight * officeApproval(state, st, partyId);
        if (!incumbent.empty() && incumbent == partyId) {
            score += cfg.incumbencyBonus;
        }
        if (st) {
            const auto spendIt = st->campaignSpend.find(partyId);
            if (spendIt != st->campaignSpend.end() && spendIt->second > 0.0) {
                score += cfg.campaignWeight * std::log1p(spendIt->second / cfg.campaignSpendScale);
            }
        }
        score += noise;
        score = std::max(0.01, score);
        scores[partyId] = score;
        total += score;
    }

    if (total > 0.0) {
        for (auto& kv : scores) {
            kv.second /= total;
        }
    }
    return scores;
}

std::string VoterModel::pickWinner(const PartyShares& shares, const std::string& incumbent) {
    std::string winner;
    double best = -1.0;
    for (const auto& kv : shares) {
        if (kv.second > best) {
            best = kv.second;
            winner = kv.first;
        }
    }
    if (!incumbent.empty()) {
        const auto it = shares.find(incumbent);
        if (it != shares.end() && it->second == best) {
            return incumbent;
        }
    }
    return winner;
}
