#include "turn_engine.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>

#include "sim_errors.h"
#include "snapshot_io.h"

bool TurnEngine::s_debugMode = false;

namespace {

double quantize(double v, double scale) {
    if (!std::isfinite(v)) return v;
    return std::round(v * scale) / scale;
}

std::uint64_t mixHash(std::uint64_t h, std::uint64_t v) {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
}

std::uint64_t hashDouble(double v, double scale = 1.0e6) {
    if (!std::isfinite(v)) {
        return 0xFFFFFFFFFFFFFFFFull;
    }
    const double q = std::round(v * scale) / scale;
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(q * scale));
}

std::uint64_t computeStateHash(const SimulationState& state) {
    std::uint64_t h = 0xC0DEC0DE12345678ull;
    h = mixHash(h, static_cast<std::uint64_t>(state.date.monthIndex()));
    h = mixHash(h, static_cast<std::uint64_t>(state.turn));
    h = mixHash(h, hashDouble(state.economy.growth));
    h = mixHash(h, hashDouble(state.economy.unemployment));
    h = mixHash(h, hashDouble(state.economy.inflation));
    h = mixHash(h, hashDouble(state.economy.revenue, 1.0e3));
    h = mixHash(h, hashDouble(state.economy.spending, 1.0e3));
    h = mixHash(h, hashDouble(state.legislature.presidentApproval));
    h = mixHash(h, hashDouble(state.legislature.congressApproval));
    h = mixHash(h, SimulationContext::hashStringFNV1a(state.legislature.courtLean));
    for (const auto& kv : state.parties) {
        const PoliticalParty& p = kv.second;
        h = mixHash(h, SimulationContext::hashStringFNV1a(p.id));
        h = mixHash(h, hashDouble(p.approval));
        h = mixHash(h, hashDouble(p.treasury, 1.0e3));
        h = mixHash(h, static_cast<std::uint64_t>(p.houseSeats));
        h = mixHash(h, static_cast<std::uint64_t>(p.senateSeats));
    }
    for (const auto& kv : state.states) {
        const State& st = kv.second;
        h = mixHash(h, hashDouble(st.gdp, 1.0e3));
        h = mixHash(h, hashDouble(st.budget.spending, 1.0e3));
        h = mixHash(h, SimulationContext::hashStringFNV1a(st.governorParty));
        h = mixHash(h, hashDouble(st.governorApproval));
        h = mixHash(h, hashDouble(st.legislatureApproval));
    }
    for (const auto& kv : state.opinion.entries()) {
        for (double v : kv.second) {
            h = mixHash(h, hashDouble(v));
        }
    }
    for (const Policy& p : state.policies) {
        h = mixHash(h, SimulationContext::hashStringFNV1a(p.id));
        h = mixHash(h, static_cast<std::uint64_t>(p.status));
    }
    for (const auto& kv : state.rng.counters) {
        h = mixHash(h, kv.second);
    }
    return h;
}

int determinismTraceTurn() {
    static int turn = []() {
        const char* v = std::getenv("USSIM_TRACE_TURN");
        if (!v || !*v) return std::numeric_limits<int>::max();
        return std::atoi(v);
    }();
    return turn;
}

void maybeTraceDeterminismStage(const char* stage, int turn, const SimulationState& state) {
    if (turn != determinismTraceTurn()) {
        return;
    }
    const std::uint64_t h = computeStateHash(state);
    std::cout << "[det-trace] turn=" << turn << " stage=" << stage << " hash=" << h << std::endl;
}

void canonicalizeDeterministicState(SimulationState& state, const SimulationConfig& config) {
    if (!config.world.deterministicMode) {
        return;
    }

    constexpr double kScale = 1.0e6;
    constexpr double kMoneyScale = 1.0e4;
    NationalEconomy& n = state.economy;
    n.growth = quantize(n.growth, kScale);
    n.unemployment = quantize(n.unemployment, kScale);
    n.inflation = quantize(n.inflation, kScale);
    n.revenue = quantize(n.revenue, kMoneyScale);
    n.spending = quantize(n.spending, kMoneyScale);
    Legislature& leg = state.legislature;
    leg.presidentApproval = std::clamp(quantize(leg.presidentApproval, kScale), 0.0, 100.0);
    leg.congressApproval = std::clamp(quantize(leg.congressApproval, kScale), 0.0, 100.0);

    for (auto& kv : state.states) {
        State& st = kv.second;
        st.gdp = std::max(0.0, quantize(st.gdp, kMoneyScale));
        st.unemployment = quantize(st.unemployment, kScale);
        st.inflation = quantize(st.inflation, kScale);
        st.budget.revenue = quantize(st.budget.revenue, kMoneyScale);
        st.budget.spending = quantize(st.budget.spending, kMoneyScale);
        st.governorApproval = std::clamp(quantize(st.governorApproval, kScale), 0.0, 100.0);
        st.legislatureApproval = std::clamp(quantize(st.legislatureApproval, kScale), 0.0, 100.0);
        for (auto& spend : st.campaignSpend) {
            spend.second = std::max(0.0, quantize(spend.second, kMoneyScale));
        }
    }
    for (auto& kv : state.parties) {
        PoliticalParty& p = kv.second;
        p.treasury = quantize(p.treasury, kMoneyScale);
        p.approval = std::clamp(quantize(p.approval, kScale), 0.0, 100.0);
    }
}

std::string actorParty(const SimulationState& state, const std::string& actorId) {
    const std::string partyPrefix = AIDecisionEngine::partyActorId("");
    const std::string statePrefix = AIDecisionEngine::stateActorId("");
    if (actorId.compare(0, partyPrefix.size(), partyPrefix) == 0) {
        const PoliticalParty* party = state.findParty(actorId.substr(partyPrefix.size()));
        return party ? party->id : std::string();
    }
    if (actorId.compare(0, statePrefix.size(), statePrefix) == 0) {
        const State* st = state.findState(actorId.substr(statePrefix.size()));
        return st ? st->governorParty : std::string();
    }
    return std::string();
}

class AdvanceGuard {
public:
    explicit AdvanceGuard(bool& flag) : m_flag(flag) { m_flag = true; }
    ~AdvanceGuard() { m_flag = false; }

private:
    bool& m_flag;
};

} // namespace

TurnEngine::TurnEngine(const SimulationContext& ctx, SimulationState initial)
    : m_config(ctx.config),
      m_voterModel(m_config),
      m_pipeline(m_config),
      m_elections(m_config, m_voterModel),
      m_events(m_config, m_pipeline),
      m_ai(m_config, m_pipeline),
      m_economy(m_config),
      m_state(std::move(initial)) {
    m_config.validate();
    m_state.opinion.configure(m_config.opinion);
    recountSeats(m_state);
    const std::string violation = checkInvariants(m_state, m_config);
    if (!violation.empty()) {
        throw ConfigurationFault(violation);
    }
}

void TurnEngine::setDebugMode(bool enabled) {
    s_debugMode = enabled;
}

void TurnEngine::requireIdle(const std::string& actorId) const {
    if (m_advancing) {
        throw InvalidIntervention("a turn is in progress", actorId, m_state.turn);
    }
}

TurnReport TurnEngine::advance(int months) {
    requireIdle("engine");
    if (months < 0) {
        throw InvalidIntervention("cannot advance by " + std::to_string(months) + " months", "engine", m_state.turn);
    }

    TurnReport report;
    report.startDate = m_state.date;
    report.endDate = m_state.date;
    AdvanceGuard guard(m_advancing);
    for (int i = 0; i < months; ++i) {
        SimulationState next = m_state;
        TurnReport step;
        runTurn(next, step);

        m_state = std::move(next);
        ++report.turnsAdvanced;
        report.endDate = m_state.date;
        report.electionsResolved.insert(report.electionsResolved.end(), step.electionsResolved.begin(), step.electionsResolved.end());
        report.policiesResolved.insert(report.policiesResolved.end(), step.policiesResolved.begin(), step.policiesResolved.end());
        report.eventsFired.insert(report.eventsFired.end(), step.eventsFired.begin(), step.eventsFired.end());
        report.faults.insert(report.faults.end(), step.faults.begin(), step.faults.end());
        if (m_observer) {
            m_observer(m_state, report);
        }
    }
    return report;
}

void TurnEngine::runTurn(SimulationState& next, TurnReport& report) const {
    const int turn = next.turn + 1;
    maybeTraceDeterminismStage("start", turn, next);

    // Frozen pre-turn view: AI actors decide against it and event predicates read it.
    const SimulationState snapshot = next;

    report.eventsFired = m_events.runPhase(next, snapshot, turn);
    maybeTraceDeterminismStage("events", turn, next);

    std::vector<Intent> intents;
    if (m_config.ai.enabled) {
        const std::vector<std::unique_ptr<Actor>> actors = m_ai.buildActors(snapshot);
        std::vector<const Actor*> view;
        view.reserve(actors.size());
        for (const auto& actor : actors) {
            view.push_back(actor.get());
        }
        intents = m_ai.collectIntents(snapshot, next.rng, turn, view);
    }
    maybeTraceDeterminismStage("ai", turn, next);

    const std::size_t intentCount = intents.size();
    PolicyPhaseResult policy = m_pipeline.resolve(next, turn);
    report.faults = m_ai.applyIntents(next, std::move(intents), turn);
    report.policiesResolved = policy.outcomes;
    maybeTraceDeterminismStage("policy", turn, next);

    for (const auto& pending : policy.pendingOpinion) {
        next.opinion.applyEffect(pending.second, pending.first);
    }
    next.opinion.decayStep();
    maybeTraceDeterminismStage("opinion", turn, next);

    report.electionsResolved = m_elections.runDue(next, turn);
    maybeTraceDeterminismStage("elections", turn, next);

    m_economy.tickMonth(next, turn);
    pruneHistory(next, m_config.world.electionHistory, m_config.world.policyHistory);
    canonicalizeDeterministicState(next, m_config);
    maybeTraceDeterminismStage("economy", turn, next);

    const std::string violation = checkInvariants(next, m_config);
    if (!violation.empty()) {
        throw SimulationFault(violation, turn, std::string());
    }

    if (s_debugMode) {
        std::cout << "[Turn] " << turn << " " << next.date.toString() << " events=" << report.eventsFired.size()
                  << " intents=" << intentCount << " rejected=" << report.faults.size() << std::endl;
        for (const FiredEvent& e : report.eventsFired) {
            std::cout << "[Event] " << e.key << " (" << e.cause << ") " << e.region << std::endl;
        }
        for (const PolicyOutcome& o : report.policiesResolved) {
            std::cout << "[Policy] " << o.policyId << " " << o.title << " -> " << policyStatusKey(o.status) << std::endl;
        }
        for (const std::string& id : report.electionsResolved) {
            std::cout << "[Election] " << id << " resolved" << std::endl;
        }
    }

    next.date.advanceMonth();
    next.turn = turn;
}

std::string TurnEngine::proposePolicy(const std::string& actorId, Policy policy) {
    requireIdle(actorId);
    const std::string party = actorParty(m_state, actorId);
    if (party.empty()) {
        throw InvalidIntervention("unknown actor", actorId, m_state.turn);
    }
    policy.sponsorActor = actorId;
    if (policy.sponsorParty.empty()) {
        policy.sponsorParty = party;
    }
    const std::string reason = m_pipeline.validateProposal(m_state, policy);
    if (!reason.empty()) {
        throw InvalidIntervention(reason, actorId, m_state.turn);
    }
    return m_pipeline.submit(m_state, std::move(policy), m_state.turn);
}

std::string TurnEngine::proposePolicy(const std::string& actorId,
                                      const std::string& templateKey,
                                      const std::string& region) {
    requireIdle(actorId);
    const PolicyTemplate* tpl = m_config.findPolicy(templateKey);
    if (!tpl) {
        throw InvalidIntervention("unknown policy template '" + templateKey + "'", actorId, m_state.turn);
    }
    const std::string party = actorParty(m_state, actorId);
    if (party.empty()) {
        throw InvalidIntervention("unknown actor", actorId, m_state.turn);
    }
    return proposePolicy(actorId, m_pipeline.fromTemplate(*tpl, actorId, party, region));
}

void TurnEngine::triggerEvent(const std::string& eventKey) {
    requireIdle("manual");
    const EventDefinition* def = m_state.events.find(eventKey);
    if (!def) {
        throw InvalidIntervention("unknown event '" + eventKey + "'", "manual", m_state.turn);
    }
    if (m_state.events.retired.count(eventKey) > 0) {
        throw InvalidIntervention("event '" + eventKey + "' has already fired and is retired", "manual", m_state.turn);
    }
    if (!def->recurring) {
        for (const ForcedEvent& queued : m_state.events.forcedQueue) {
            if (queued.eventKey == eventKey) {
                throw InvalidIntervention("one-shot event '" + eventKey + "' is already queued", "manual", m_state.turn);
            }
        }
    }
    ForcedEvent forced;
    forced.eventKey = eventKey;
    m_state.events.forcedQueue.push_back(forced);
}

void TurnEngine::triggerEvent(const EffectVector& effect, const std::string& region, const std::string& description) {
    requireIdle("manual");
    if (region != kNationalRegion && !m_state.findState(region)) {
        throw InvalidIntervention("unknown region '" + region + "'", "manual", m_state.turn);
    }
    bool finite = std::isfinite(effect.growth) && std::isfinite(effect.unemployment) &&
                  std::isfinite(effect.inflation) && std::isfinite(effect.budget);
    for (double v : effect.opinion) {
        finite = finite && std::isfinite(v);
    }
    if (!finite) {
        throw InvalidIntervention("effect is not finite", "manual", m_state.turn);
    }
    ForcedEvent forced;
    forced.effect = effect;
    forced.region = region;
    forced.description = description;
    m_state.events.forcedQueue.push_back(forced);
}

std::string TurnEngine::saveSnapshot() const {
    return ::saveSnapshot(m_state);
}

void TurnEngine::loadSnapshot(const std::string& text) {
    requireIdle("loader");
    SimulationState loaded = ::loadSnapshot(text, m_config);
    m_state = std::move(loaded);
}

void TurnEngine::saveSnapshotFile(const std::string& path) const {
    ::saveSnapshotFile(m_state, path);
}

void TurnEngine::loadSnapshotFile(const std::string& path) {
    requireIdle("loader");
    SimulationState loaded = ::loadSnapshotFile(path, m_config);
    m_state = std::move(loaded);
}
