#include "event_manager.h"

#include <algorithm>
#include <cstddef>
#include <iterator>

#include "policy_pipeline.h"
#include "sim_errors.h"
#include "simulation_state.h"

const EventDefinition* EventTable::find(const std::string& key) const {
    for (const auto& def : catalog) {
        if (def.key == key) return &def;
    }
    return nullptr;
}

bool EventTable::isArmed(const std::string& key) const {
    if (retired.count(key) > 0) {
        return false;
    }
    const auto it = cooldowns.find(key);
    return it == cooldowns.end() || it->second <= 0;
}

EventManager::EventManager(const SimulationConfig& config, const PolicyPipeline& pipeline)
    : m_config(config), m_pipeline(pipeline) {}

bool EventManager::triggerHolds(const EventTrigger& trigger, const SimulationState& state) {
    if (trigger.kind == TriggerKind::Calendar) {
        return trigger.month == state.date.month && (trigger.year == 0 || trigger.year == state.date.year);
    }
    if (trigger.kind != TriggerKind::Threshold) {
        return false;
    }

    double metric = 0.0;
    switch (trigger.metric) {
        case TriggerMetric::FederalDeficit: metric = state.economy.deficit(); break;
        case TriggerMetric::Growth: metric = state.economy.growth; break;
        case TriggerMetric::Unemployment: metric = state.economy.unemployment; break;
        case TriggerMetric::Inflation: metric = state.economy.inflation; break;
        case TriggerMetric::Opinion: metric = state.opinion.value(trigger.region, trigger.issue); break;
        case TriggerMetric::PartyApproval: {
            const std::string partyId = trigger.party == "president" ? state.legislature.presidentParty : trigger.party;
            const PoliticalParty* party = state.findParty(partyId);
            if (!party) {
                return false;
            }
            metric = party->approval;
            break;
        }
    }
    return trigger.comparison == Comparison::Above ? metric > trigger.threshold : metric < trigger.threshold;
}

void EventManager::applyEffect(SimulationState& state, const EffectVector& effect, const std::string& region) const {
    const SimulationConfig::Economy& eco = m_config.economy;
    if (region == kNationalRegion) {
        NationalEconomy& n = state.economy;
        n.growth = std::clamp(n.growth + effect.growth, eco.minGrowth, eco.maxGrowth);
        n.unemployment = std::clamp(n.unemployment + effect.unemployment, eco.minUnemployment, eco.maxUnemployment);
        n.inflation = std::clamp(n.inflation + effect.inflation, eco.minInflation, eco.maxInflation);
        applyBudgetDelta(effect.budget, n.revenue, n.spending);
    } else {
        State* st = state.findState(region);
        if (!st) {
            throw SimulationFault("event targets unknown region", state.turn + 1, region);
        }
        st->gdp = std::max(0.0, st->gdp * (1.0 + effect.growth));
        st->unemployment = std::clamp(st->unemployment + effect.unemployment, eco.minUnemployment, eco.maxUnemployment);
        st->inflation = std::clamp(st->inflation + effect.inflation, eco.minInflation, eco.maxInflation);
        applyBudgetDelta(effect.budget, st->budget.revenue, st->budget.spending);
    }
    state.opinion.applyEffect(effect, region);
}

void EventManager::adjustOfficeApproval(SimulationState& state,
                                        const std::string& office,
                                        const std::string& region,
                                        double amount) {
    Legislature& leg = state.legislature;
    if (office == "president") {
        adjustApprovalRating(leg.presidentApproval, amount);
    } else if (office == "congress") {
        adjustApprovalRating(leg.congressApproval, amount);
    } else if (office == "governor" || office == "legislature") {
        // A national event reaches every state's offices.
        for (auto& kv : state.states) {
            State& st = kv.second;
            if (region != kNationalRegion && st.id != region) {
                continue;
            }
            adjustApprovalRating(office == "governor" ? st.governorApproval : st.legislatureApproval, amount);
        }
    }
}

void EventManager::remember(SimulationState& state, const std::string& key) const {
    std::vector<std::string>& recent = state.events.recent;
    recent.push_back(key);
    const std::size_t limit = static_cast<std::size_t>(std::max(0, m_config.events.recentMemory));
    if (recent.size() > limit) {
        recent.erase(recent.begin(), recent.end() - static_cast<std::ptrdiff_t>(limit));
    }
}

void EventManager::fire(SimulationState& state,
                        const EventDefinition& def,
                        const std::string& cause,
                        int turn,
                        std::mt19937_64& stream,
                        std::vector<FiredEvent>& fired) const {
    applyEffect(state, def.effect, def.region);
    if (PoliticalParty* benefit = state.findParty(def.partyBenefit)) {
        benefit->adjustApproval(1.0);
    }

    for (const EventConsequence& c : def.consequences) {
        const double roll = SimulationContext::u01FromU64(stream());
        if (roll >= c.probability) {
            continue;
        }
        switch (c.kind) {
            case ConsequenceKind::ChainEvent: {
                PendingChain chain;
                chain.eventKey = c.target;
                chain.sourceKey = def.key;
                chain.dueTurn = turn + std::max(1, c.delayMonths);
                state.events.pendingChains.push_back(chain);
                break;
            }
            case ConsequenceKind::PolicyProposal: {
                const PolicyTemplate* tpl = m_config.findPolicy(c.target);
                if (!tpl) {
                    break;
                }
                std::string sponsor = state.legislature.presidentParty;
                std::string region = kNationalRegion;
                if (tpl->level == PolicyLevel::State) {
                    const State* st = state.findState(def.region);
                    if (!st) {
                        break;
                    }
                    sponsor = st->governorParty;
                    region = st->id;
                }
                Policy policy = m_pipeline.fromTemplate(*tpl, "event:" + def.key, sponsor, region);
                if (m_pipeline.validateProposal(state, policy).empty()) {
                    m_pipeline.submit(state, policy, turn);
                }
                break;
            }
            case ConsequenceKind::PartyApproval: {
                const std::string partyId = c.target == "president" ? state.legislature.presidentParty : c.target;
                if (PoliticalParty* party = state.findParty(partyId)) {
                    party->adjustApproval(c.amount);
                }
                break;
            }
            case ConsequenceKind::OfficeApproval:
                adjustOfficeApproval(state, c.target, def.region, c.amount);
                break;
        }
    }

    if (!def.recurring) {
        state.events.retired.insert(def.key);
    } else if (def.cooldownTurns > 0) {
        state.events.cooldowns[def.key] = def.cooldownTurns;
    }
    remember(state, def.key);
    state.news.addEvent(state.date, def.description.empty() ? def.name : def.description);

    FiredEvent out;
    out.key = def.key;
    out.description = def.description.empty() ? def.name : def.description;
    out.region = def.region;
    out.cause = cause;
    fired.push_back(out);
}

std::vector<FiredEvent> EventManager::runPhase(SimulationState& state, const SimulationState& phaseStart, int turn) const {
    std::vector<FiredEvent> fired;
    EventTable& table = state.events;

    for (auto it = table.cooldowns.begin(); it != table.cooldowns.end();) {
        --it->second;
        it = it->second <= 0 ? table.cooldowns.erase(it) : std::next(it);
    }

    std::mt19937_64 stream = state.rng.open("events", turn);
    std::set<std::string> firedThisTurn;

    std::vector<ForcedEvent> forced;
    forced.swap(table.forcedQueue);
    for (const ForcedEvent& f : forced) {
        if (f.eventKey.empty()) {
            applyEffect(state, f.effect, f.region);
            const std::string text = f.description.empty() ? std::string("Manual intervention") : f.description;
            state.news.addEvent(state.date, text);
            FiredEvent out;
            out.key = "manual";
            out.description = text;
            out.region = f.region;
            out.cause = "forced";
            fired.push_back(out);
            continue;
        }
        const EventDefinition* def = table.find(f.eventKey);
        if (!def) {
            throw SimulationFault("forced event is not in the catalog", turn, f.eventKey);
        }
        // A one-shot event fires once even when it was queued more than once.
        if (table.retired.count(def->key) > 0) {
            continue;
        }
        fire(state, *def, "forced", turn, stream, fired);
        firedThisTurn.insert(def->key);
    }

    std::vector<PendingChain> due;
    std::vector<PendingChain> waiting;
    for (const PendingChain& chain : table.pendingChains) {
        (chain.dueTurn <= turn ? due : waiting).push_back(chain);
    }
    table.pendingChains = waiting;
    for (const PendingChain& chain : due) {
        const EventDefinition* def = table.find(chain.eventKey);
        if (!def || table.retired.count(def->key) > 0) {
            continue;
        }
        fire(state, *def, "chain", turn, stream, fired);
        firedThisTurn.insert(def->key);
    }

    // Predicates only see the state as it was when the phase began.
    std::vector<const EventDefinition*> conditional;
    for (const EventDefinition& def : table.catalog) {
        if (def.trigger.kind != TriggerKind::Threshold && def.trigger.kind != TriggerKind::Calendar) {
            continue;
        }
        if (!table.isArmed(def.key) || firedThisTurn.count(def.key) > 0) {
            continue;
        }
        if (triggerHolds(def.trigger, phaseStart)) {
            conditional.push_back(&def);
        }
    }
    for (const EventDefinition* def : conditional) {
        fire(state, *def, triggerKindKey(def->trigger.kind), turn, stream, fired);
        firedThisTurn.insert(def->key);
    }

    for (int i = 0; i < m_config.events.maxRandomPerTurn; ++i) {
        if (SimulationContext::u01FromU64(stream()) >= m_config.events.randomEventChance) {
            break;
        }
        std::vector<const EventDefinition*> candidates;
        double totalWeight = 0.0;
        for (const EventDefinition& def : table.catalog) {
            if (def.trigger.kind != TriggerKind::Random || def.trigger.weight <= 0.0) {
                continue;
            }
            if (!table.isArmed(def.key) || firedThisTurn.count(def.key) > 0) {
                continue;
            }
            candidates.push_back(&def);
            totalWeight += def.trigger.weight;
        }
        if (candidates.empty()) {
            break;
        }
        double pick = SimulationContext::u01FromU64(stream()) * totalWeight;
        const EventDefinition* chosen = candidates.back();
        for (const EventDefinition* def : candidates) {
            if (pick < def->trigger.weight) {
                chosen = def;
                break;
            }
            pick -= def->trigger.weight;
        }
        fire(state, *chosen, "random", turn, stream, fired);
        firedThisTurn.insert(chosen->key);
    }
    return fired;
}
