#include "policy_pipeline.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "simulation_state.h"

namespace {

bool isFiniteEffect(const EffectVector& e) {
    if (!std::isfinite(e.growth) || !std::isfinite(e.unemployment) || !std::isfinite(e.inflation) ||
        !std::isfinite(e.budget)) {
        return false;
    }
    for (double v : e.opinion) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

} // namespace

const char* policyStatusKey(PolicyStatus status) {
    switch (status) {
        case PolicyStatus::Proposed: return "proposed";
        case PolicyStatus::Voting: return "voting";
        case PolicyStatus::Enacted: return "enacted";
        case PolicyStatus::Rejected: return "rejected";
    }
    return "proposed";
}

bool parsePolicyStatus(const std::string& key, PolicyStatus& out) {
    for (PolicyStatus s : {PolicyStatus::Proposed, PolicyStatus::Voting, PolicyStatus::Enacted, PolicyStatus::Rejected}) {
        if (key == policyStatusKey(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

PolicyPipeline::PolicyPipeline(const SimulationConfig& config) : m_config(config) {}

Policy PolicyPipeline::fromTemplate(const PolicyTemplate& tpl,
                                    const std::string& sponsorActor,
                                    const std::string& sponsorParty,
                                    const std::string& region) const {
    Policy p;
    p.templateKey = tpl.key;
    p.title = tpl.title;
    p.description = tpl.description;
    p.sponsorActor = sponsorActor;
    p.sponsorParty = sponsorParty;
    p.level = tpl.level;
    p.region = tpl.level == PolicyLevel::Federal ? std::string(kNationalRegion) : region;
    p.issue = tpl.issue;
    p.effect = tpl.effect;
    p.cost = tpl.cost;
    return p;
}

std::string PolicyPipeline::validateProposal(const SimulationState& state, const Policy& policy) const {
    if (policy.title.empty() && policy.templateKey.empty()) {
        return "policy has neither title nor template key";
    }
    if (!state.findParty(policy.sponsorParty)) {
        return "unknown sponsor party '" + policy.sponsorParty + "'";
    }
    if (policy.level == PolicyLevel::Federal) {
        if (policy.region != kNationalRegion) {
            return "federal policy must target the national region";
        }
    } else if (!state.findState(policy.region)) {
        return "state policy targets unknown state '" + policy.region + "'";
    }
    if (!isFiniteEffect(policy.effect) || !std::isfinite(policy.cost)) {
        return "policy effect is not finite";
    }
    if (!policy.templateKey.empty() && hasPending(state, policy.templateKey, policy.region)) {
        return "'" + policy.templateKey + "' is already pending in " + policy.region;
    }
    return std::string();
}

std::string PolicyPipeline::submit(SimulationState& state, Policy policy, int proposedTurn) const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "P%04d", state.nextPolicyId++);
    policy.id = buf;
    policy.status = PolicyStatus::Proposed;
    policy.proposedTurn = proposedTurn;
    policy.votingTurn = -1;
    policy.resolvedTurn = -1;
    policy.lastTally = VoteTally{};
    if (policy.title.empty()) {
        policy.title = policy.templateKey;
    }
    state.news.addEvent(state.date, policy.sponsorParty + " proposes " + policy.title +
                                        (policy.level == PolicyLevel::State ? " in " + policy.region : std::string()));
    state.policies.push_back(policy);
    return policy.id;
}

int PolicyPipeline::pendingCount(const SimulationState& state, const std::string& sponsorActor) const {
    int count = 0;
    for (const Policy& p : state.policies) {
        if (p.isPending() && p.sponsorActor == sponsorActor) {
            ++count;
        }
    }
    return count;
}

bool PolicyPipeline::hasPending(const SimulationState& state, const std::string& templateKey, const std::string& region) const {
    for (const Policy& p : state.policies) {
        if (p.isPending() && p.templateKey == templateKey && p.region == region) {
            return true;
        }
    }
    return false;
}

double PolicyPipeline::alignment(const IssueVector& platform, const EffectVector& effect) {
    double weighted = 0.0;
    double magnitude = 0.0;
    for (int i = 0; i < kIssueCount; ++i) {
        weighted += platform[i] * effect.opinion[i];
        magnitude += std::abs(effect.opinion[i]);
    }
    if (magnitude <= 0.0) {
        return 0.0;
    }
    return std::clamp(weighted / magnitude, -1.0, 1.0);
}

double PolicyPipeline::alignment(const PoliticalParty& party, const Policy& policy) {
    return alignment(party.platform, policy.effect);
}

double PolicyPipeline::chamberYesShare(const SimulationState& state,
                                       const Policy& policy,
                                       const std::map<std::string, int>& seats) const {
    const SimulationConfig::Legislature& cfg = m_config.legislature;
    int total = 0;
    for (const auto& kv : seats) {
        total += kv.second;
    }
    if (total <= 0) {
        return 0.0;
    }
    double yes = 0.0;
    for (const auto& kv : seats) {
        const PoliticalParty* party = state.findParty(kv.first);
        if (!party) {
            continue;
        }
        double fraction = 0.5 + cfg.alignmentWeight * alignment(*party, policy);
        if (party->id == policy.sponsorParty) {
            fraction += cfg.sponsorLoyalty;
        }
        fraction = std::clamp(fraction, 0.0, 1.0);
        yes += (static_cast<double>(kv.second) / static_cast<double>(total)) * fraction;
    }
    return yes;
}

VoteTally PolicyPipeline::tally(const SimulationState& state, const Policy& policy) const {
    const SimulationConfig::Legislature& cfg = m_config.legislature;
    VoteTally result;

    std::string executive;
    if (policy.level == PolicyLevel::Federal) {
        for (Chamber chamber : {Chamber::House, Chamber::Senate}) {
            ChamberVote vote;
            vote.chamber = chamber;
            vote.yesShare = chamberYesShare(state, policy, chamberSeats(state, chamber));
            result.chambers.push_back(vote);
        }
        executive = state.legislature.presidentParty;
        const double penalty = courtPenalty(state, policy);
        for (ChamberVote& vote : result.chambers) {
            vote.yesShare = std::max(0.0, vote.yesShare - penalty);
        }
    } else {
        ChamberVote vote;
        vote.chamber = Chamber::StateLegislature;
        vote.region = policy.region;
        vote.yesShare = chamberYesShare(state, policy, chamberSeats(state, Chamber::StateLegislature, policy.region));
        result.chambers.push_back(vote);
        if (const State* st = state.findState(policy.region)) {
            executive = st->governorParty;
        }
    }

    bool allPassed = true;
    bool allSuper = true;
    for (ChamberVote& vote : result.chambers) {
        // Exactly at the threshold is not a majority.
        vote.passed = vote.yesShare > cfg.simpleMajority;
        allPassed = allPassed && vote.passed;
        allSuper = allSuper && vote.yesShare >= cfg.supermajority;
    }
    result.passed = allPassed;

    if (allPassed && cfg.vetoEnabled && !executive.empty() && executive != policy.sponsorParty) {
        const PoliticalParty* exec = state.findParty(executive);
        if (exec && alignment(*exec, policy) < 0.0) {
            result.vetoed = true;
            result.overridden = allSuper;
            result.passed = allSuper;
        }
    }
    return result;
}

double PolicyPipeline::courtPenalty(const SimulationState& state, const Policy& policy) const {
    const SimulationConfig::Legislature& cfg = m_config.legislature;
    const std::string& court = state.legislature.courtLean;
    if (policy.level != PolicyLevel::Federal || court.empty() || court == policy.sponsorParty) {
        return 0.0;
    }
    return policy.effect.inflation > cfg.courtInflationThreshold ? cfg.courtPenalty : 0.0;
}

void PolicyPipeline::enact(SimulationState& state, Policy& policy) const {
    const SimulationConfig::Economy& eco = m_config.economy;
    const SimulationConfig::Legislature& leg = m_config.legislature;
    const EffectVector& e = policy.effect;
    if (policy.level == PolicyLevel::Federal) {
        if (policy.sponsorParty == state.legislature.presidentParty) {
            adjustApprovalRating(state.legislature.presidentApproval, leg.presidentApprovalOnEnact);
        }
        NationalEconomy& n = state.economy;
        n.growth = std::clamp(n.growth + e.growth, eco.minGrowth, eco.maxGrowth);
        n.unemployment = std::clamp(n.unemployment + e.unemployment, eco.minUnemployment, eco.maxUnemployment);
        n.inflation = std::clamp(n.inflation + e.inflation, eco.minInflation, eco.maxInflation);
        applyBudgetDelta(policy.cost + e.budget, n.revenue, n.spending);
    } else if (State* st = state.findState(policy.region)) {
        st->gdp = std::max(0.0, st->gdp * (1.0 + e.growth));
        st->unemployment = std::clamp(st->unemployment + e.unemployment, eco.minUnemployment, eco.maxUnemployment);
        st->inflation = std::clamp(st->inflation + e.inflation, eco.minInflation, eco.maxInflation);
        applyBudgetDelta(policy.cost + e.budget, st->budget.revenue, st->budget.spending);
        st->enactedPolicies.push_back(policy.id);
        if (policy.sponsorParty == st->governorParty) {
            adjustApprovalRating(st->governorApproval, leg.governorApprovalOnEnact);
        }
        adjustApprovalRating(st->legislatureApproval, leg.stateLegislatureApprovalOnEnact);
    }
    policy.status = PolicyStatus::Enacted;
}

PolicyPhaseResult PolicyPipeline::resolve(SimulationState& state, int turn) const {
    PolicyPhaseResult result;

    for (Policy& policy : state.policies) {
        if (policy.status != PolicyStatus::Voting || policy.votingTurn >= turn) {
            continue;
        }
        policy.lastTally = tally(state, policy);
        policy.resolvedTurn = turn;
        PoliticalParty* sponsor = state.findParty(policy.sponsorParty);
        if (policy.lastTally.passed) {
            enact(state, policy);
            if (policy.effect.hasOpinionEffect()) {
                result.pendingOpinion.emplace_back(policy.region, policy.effect);
            }
            if (sponsor) sponsor->adjustApproval(m_config.legislature.approvalOnEnact);
            state.news.addEvent(state.date, "Enacted: " + policy.title +
                                                (policy.lastTally.overridden ? " (veto overridden)" : ""));
        } else {
            policy.status = PolicyStatus::Rejected;
            if (sponsor) sponsor->adjustApproval(m_config.legislature.approvalOnReject);
            state.news.addEvent(state.date, "Rejected: " + policy.title +
                                                (policy.lastTally.vetoed ? " (vetoed)" : ""));
        }

        PolicyOutcome outcome;
        outcome.policyId = policy.id;
        outcome.title = policy.title;
        outcome.status = policy.status;
        outcome.tally = policy.lastTally;
        result.outcomes.push_back(outcome);
    }

    for (Policy& policy : state.policies) {
        if (policy.status == PolicyStatus::Proposed && policy.proposedTurn < turn) {
            policy.status = PolicyStatus::Voting;
            policy.votingTurn = turn;
        }
    }
    return result;
}
