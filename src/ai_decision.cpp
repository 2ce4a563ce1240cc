#include "ai_decision.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "policy_pipeline.h"
#include "simulation_state.h"

namespace {

const char* kPartyPrefix = "party:";
const char* kStatePrefix = "state:";

bool stripPrefix(const std::string& id, const char* prefix, std::string& rest) {
    const std::string p(prefix);
    if (id.compare(0, p.size(), p) != 0) {
        return false;
    }
    rest = id.substr(p.size());
    return true;
}

double opinionGain(const PolicyTemplate& tpl, const IssueVector& current, double maxValue) {
    double gain = tpl.popularity / 100.0;
    for (int i = 0; i < kIssueCount; ++i) {
        gain += tpl.effect.opinion[i] * (maxValue - current[i]);
    }
    return gain;
}

// Bonus for a template that a recently fired event called for.
double reactionBonus(const PolicyTemplate& tpl, const SimulationState& snapshot) {
    for (const std::string& key : snapshot.events.recent) {
        const EventDefinition* def = snapshot.events.find(key);
        if (!def) continue;
        for (const EventConsequence& c : def->consequences) {
            if (c.kind == ConsequenceKind::PolicyProposal && c.target == tpl.key) {
                return 0.25;
            }
        }
    }
    return 0.0;
}

int monthsUntilElection(const SimDate& date, int electionMonth) {
    int year = date.year;
    if (year % 2 != 0) {
        ++year;
    } else if (date.month > electionMonth) {
        year += 2;
    }
    return year * 12 + (electionMonth - 1) - date.monthIndex();
}

// Adds jitter to every option in order, then returns the best one. Exact ties are
// broken by one more draw from the same stream.
Intent choose(std::vector<Intent> options, double jitter, std::mt19937_64& stream) {
    for (Intent& option : options) {
        option.score += jitter * (2.0 * SimulationContext::u01FromU64(stream()) - 1.0);
    }
    double best = options.front().score;
    for (const Intent& option : options) {
        best = std::max(best, option.score);
    }
    std::vector<std::size_t> tied;
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (options[i].score == best) tied.push_back(i);
    }
    const std::size_t pick = tied.size() == 1 ? tied.front() : tied[stream() % tied.size()];
    return options[pick];
}

} // namespace

const char* intentKindKey(IntentKind kind) {
    switch (kind) {
        case IntentKind::Pass: return "pass";
        case IntentKind::ProposePolicy: return "propose_policy";
        case IntentKind::Campaign: return "campaign";
        case IntentKind::AdjustBudget: return "adjust_budget";
    }
    return "pass";
}

StateActor::StateActor(const SimulationConfig& config, std::string stateId)
    : m_config(config), m_stateId(std::move(stateId)), m_actorId(AIDecisionEngine::stateActorId(m_stateId)) {}

Intent StateActor::decide(const SimulationState& snapshot, std::mt19937_64& stream) const {
    const SimulationConfig::AI& ai = m_config.ai;
    Intent pass;
    pass.actorId = m_actorId;
    pass.targetState = m_stateId;

    const State* st = snapshot.findState(m_stateId);
    if (!st || !ai.enabled) {
        return pass;
    }

    std::vector<Intent> options;
    options.push_back(pass);

    const double deficit = st->budget.deficit();
    if (deficit > 0.0) {
        Intent cut = pass;
        cut.kind = IntentKind::AdjustBudget;
        cut.amount = std::min(deficit, st->budget.spending * 0.02);
        cut.score = ai.budgetWeight * std::min(1.0, 10.0 * deficit / std::max(1.0, st->budget.revenue));
        options.push_back(cut);
    }

    const PoliticalParty* governor = snapshot.findParty(st->governorParty);
    int pending = 0;
    for (const Policy& p : snapshot.policies) {
        if (p.isPending() && p.sponsorActor == m_actorId) ++pending;
    }
    if (governor && pending < ai.maxPendingPerActor) {
        const IssueVector current = snapshot.opinion.regionValues(m_stateId);
        for (const PolicyTemplate& tpl : m_config.policyCatalog) {
            if (tpl.level != PolicyLevel::State) continue;
            bool alreadyPending = false;
            for (const Policy& p : snapshot.policies) {
                if (p.isPending() && p.templateKey == tpl.key && p.region == m_stateId) alreadyPending = true;
            }
            if (alreadyPending) continue;

            Intent propose = pass;
            propose.kind = IntentKind::ProposePolicy;
            propose.policyKey = tpl.key;
            propose.score = ai.opinionWeight * opinionGain(tpl, current, snapshot.opinion.maxValue()) +
                            ai.alignmentWeight * PolicyPipeline::alignment(governor->platform, tpl.effect) -
                            ai.costWeight * tpl.cost + reactionBonus(tpl, snapshot);
            if (deficit > 0.0 && tpl.cost > 0.0) {
                propose.score -= ai.budgetWeight * 0.5;
            }
            options.push_back(propose);
        }
    }
    return choose(options, ai.jitter, stream);
}

PartyActor::PartyActor(const SimulationConfig& config, std::string partyId)
    : m_config(config), m_partyId(std::move(partyId)), m_actorId(AIDecisionEngine::partyActorId(m_partyId)) {}

Intent PartyActor::decide(const SimulationState& snapshot, std::mt19937_64& stream) const {
    const SimulationConfig::AI& ai = m_config.ai;
    Intent pass;
    pass.actorId = m_actorId;

    const PoliticalParty* party = snapshot.findParty(m_partyId);
    if (!party || !ai.enabled) {
        return pass;
    }

    std::vector<Intent> options;
    options.push_back(pass);

    Intent fundraise = pass;
    fundraise.kind = IntentKind::AdjustBudget;
    fundraise.amount = ai.fundraiseAmount;
    fundraise.score = ai.budgetWeight * std::max(0.0, 1.0 - party->treasury / std::max(1.0, ai.treasuryTarget));
    options.push_back(fundraise);

    if (party->fieldsCandidates) {
        int pending = 0;
        for (const Policy& p : snapshot.policies) {
            if (p.isPending() && p.sponsorActor == m_actorId) ++pending;
        }
        if (pending < ai.maxPendingPerActor) {
            const IssueVector current = snapshot.opinion.regionValues(kNationalRegion);
            for (const PolicyTemplate& tpl : m_config.policyCatalog) {
                if (tpl.level != PolicyLevel::Federal) continue;
                bool alreadyPending = false;
                for (const Policy& p : snapshot.policies) {
                    if (p.isPending() && p.templateKey == tpl.key) alreadyPending = true;
                }
                if (alreadyPending) continue;

                Intent propose = pass;
                propose.kind = IntentKind::ProposePolicy;
                propose.policyKey = tpl.key;
                propose.score = ai.opinionWeight * opinionGain(tpl, current, snapshot.opinion.maxValue()) +
                                ai.alignmentWeight * PolicyPipeline::alignment(party->platform, tpl.effect) -
                                ai.costWeight * tpl.cost + reactionBonus(tpl, snapshot);
                options.push_back(propose);
            }
        }

        if (party->treasury >= ai.campaignCost) {
            // Most electoral weight per point of margin.
            std::string target;
            double bestValue = -1.0;
            for (const auto& kv : snapshot.states) {
                const State& st = kv.second;
                const auto own = st.lean.find(m_partyId);
                const double ownLean = own == st.lean.end() ? 0.0 : own->second;
                double rival = -1.0;
                for (const auto& lean : st.lean) {
                    if (lean.first != m_partyId) rival = std::max(rival, lean.second);
                }
                const double margin = std::abs(ownLean - rival);
                const double value = static_cast<double>(st.electoralVotes()) / (1.0 + 10.0 * margin);
                if (value > bestValue) {
                    bestValue = value;
                    target = st.id;
                }
            }
            if (!target.empty()) {
                const int months = monthsUntilElection(snapshot.date, m_config.elections.month);
                Intent campaign = pass;
                campaign.kind = IntentKind::Campaign;
                campaign.targetState = target;
                campaign.amount = ai.campaignCost;
                campaign.score = ai.campaignWeight * (1.0 - static_cast<double>(std::min(months, 24)) / 24.0) * 2.0;
                options.push_back(campaign);
            }
        }
    }
    return choose(options, ai.jitter, stream);
}

AIDecisionEngine::AIDecisionEngine(const SimulationConfig& config, const PolicyPipeline& pipeline)
    : m_config(config), m_pipeline(pipeline) {}

std::vector<std::unique_ptr<Actor>> AIDecisionEngine::buildActors(const SimulationState& snapshot) const {
    std::vector<std::unique_ptr<Actor>> actors;
    for (const auto& kv : snapshot.parties) {
        actors.push_back(std::make_unique<PartyActor>(m_config, kv.first));
    }
    for (const auto& kv : snapshot.states) {
        actors.push_back(std::make_unique<StateActor>(m_config, kv.first));
    }
    std::sort(actors.begin(), actors.end(), [](const std::unique_ptr<Actor>& a, const std::unique_ptr<Actor>& b) {
        return a->id() < b->id();
    });
    return actors;
}

std::vector<Intent> AIDecisionEngine::collectIntents(const SimulationState& snapshot,
                                                     RngStreams& streams,
                                                     int turn,
                                                     const std::vector<const Actor*>& actors) const {
    std::vector<Intent> intents;
    intents.reserve(actors.size());
    for (const Actor* actor : actors) {
        std::mt19937_64 stream = streams.open(actor->id(), turn);
        intents.push_back(actor->decide(snapshot, stream));
    }
    std::sort(intents.begin(), intents.end(), [](const Intent& a, const Intent& b) {
        return a.actorId < b.actorId;
    });
    return intents;
}

std::string AIDecisionEngine::applyOne(SimulationState& state, const Intent& intent, int turn) const {
    std::string partyId;
    std::string stateId;
    const bool isParty = stripPrefix(intent.actorId, kPartyPrefix, partyId);
    const bool isState = !isParty && stripPrefix(intent.actorId, kStatePrefix, stateId);
    if (!isParty && !isState) {
        return "unknown actor";
    }

    switch (intent.kind) {
        case IntentKind::Pass:
            return std::string();

        case IntentKind::ProposePolicy: {
            const PolicyTemplate* tpl = m_config.findPolicy(intent.policyKey);
            if (!tpl) {
                return "unknown policy template '" + intent.policyKey + "'";
            }
            std::string sponsor = partyId;
            std::string region = kNationalRegion;
            if (isState) {
                const State* st = state.findState(stateId);
                if (!st) return "unknown state";
                sponsor = st->governorParty;
                region = stateId;
            }
            if (m_pipeline.pendingCount(state, intent.actorId) >= m_config.ai.maxPendingPerActor) {
                return "pending proposal limit reached";
            }
            Policy policy = m_pipeline.fromTemplate(*tpl, intent.actorId, sponsor, region);
            const std::string reason = m_pipeline.validateProposal(state, policy);
            if (!reason.empty()) {
                return reason;
            }
            m_pipeline.submit(state, policy, turn);
            return std::string();
        }

        case IntentKind::Campaign: {
            PoliticalParty* party = state.findParty(partyId);
            State* st = state.findState(intent.targetState);
            if (!isParty || !party || !st) {
                return "campaign needs a party and a known state";
            }
            if (party->treasury < intent.amount) {
                return "treasury " + std::to_string(party->treasury) + " below campaign cost " +
                       std::to_string(intent.amount);
            }
            party->treasury -= intent.amount;
            st->campaignSpend[partyId] += intent.amount;
            return std::string();
        }

        case IntentKind::AdjustBudget: {
            if (isParty) {
                PoliticalParty* party = state.findParty(partyId);
                if (!party) return "unknown party";
                party->treasury += intent.amount;
                return std::string();
            }
            State* st = state.findState(stateId);
            if (!st) return "unknown state";
            const double deficit = st->budget.deficit();
            if (deficit <= 0.0) {
                return "state is no longer in deficit";
            }
            st->budget.spending -= std::min(intent.amount, deficit);
            return std::string();
        }
    }
    return std::string();
}

std::vector<std::string> AIDecisionEngine::applyIntents(SimulationState& state, std::vector<Intent> intents, int turn) const {
    std::stable_sort(intents.begin(), intents.end(), [](const Intent& a, const Intent& b) {
        return a.actorId < b.actorId;
    });
    std::vector<std::string> faults;
    for (const Intent& intent : intents) {
        const std::string reason = applyOne(state, intent, turn);
        if (!reason.empty()) {
            faults.push_back("intent " + std::string(intentKindKey(intent.kind)) + " by " + intent.actorId +
                             " rejected: " + reason);
        }
    }
    return faults;
}
