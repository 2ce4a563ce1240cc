#include "snapshot_io.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "sim_errors.h"

using nlohmann::json;

namespace {

template <typename E>
E parseEnum(const json& j, bool (*parse)(const std::string&, E&), const char* what) {
    const std::string key = j.get<std::string>();
    E out{};
    if (!parse(key, out)) {
        throw LoadError(std::string("unknown ") + what + " '" + key + "'");
    }
    return out;
}

bool parseChamber(const std::string& key, Chamber& out) {
    for (Chamber c : {Chamber::House, Chamber::Senate, Chamber::StateLegislature}) {
        if (key == chamberKey(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

json issueMap(const IssueVector& values, bool skipZero) {
    json out = json::object();
    for (IssueArea issue : kAllIssues) {
        const double v = values[issueIndex(issue)];
        if (!skipZero || v != 0.0) {
            out[issueKey(issue)] = v;
        }
    }
    return out;
}

IssueVector readIssueMap(const json& j, double fallback) {
    IssueVector out;
    out.fill(fallback);
    for (auto it = j.begin(); it != j.end(); ++it) {
        IssueArea issue;
        if (!parseIssueKey(it.key(), issue)) {
            throw LoadError("unknown issue '" + it.key() + "'");
        }
        out[issueIndex(issue)] = it.value().get<double>();
    }
    return out;
}

} // namespace

void to_json(json& j, const SimDate& d) {
    j = json{{"year", d.year}, {"month", d.month}};
}

void from_json(const json& j, SimDate& d) {
    j.at("year").get_to(d.year);
    j.at("month").get_to(d.month);
}

void to_json(json& j, const EffectVector& e) {
    j = json{{"growth", e.growth},
             {"unemployment", e.unemployment},
             {"inflation", e.inflation},
             {"budget", e.budget},
             {"opinion", issueMap(e.opinion, true)}};
}

void from_json(const json& j, EffectVector& e) {
    j.at("growth").get_to(e.growth);
    j.at("unemployment").get_to(e.unemployment);
    j.at("inflation").get_to(e.inflation);
    j.at("budget").get_to(e.budget);
    e.opinion = readIssueMap(j.at("opinion"), 0.0);
}

void to_json(json& j, const EventTrigger& t) {
    j = json{{"kind", triggerKindKey(t.kind)},
             {"weight", t.weight},
             {"metric", triggerMetricKey(t.metric)},
             {"comparison", comparisonKey(t.comparison)},
             {"threshold", t.threshold},
             {"region", t.region},
             {"issue", issueKey(t.issue)},
             {"party", t.party},
             {"month", t.month},
             {"year", t.year}};
}

void from_json(const json& j, EventTrigger& t) {
    t.kind = parseEnum(j.at("kind"), parseTriggerKind, "trigger kind");
    j.at("weight").get_to(t.weight);
    t.metric = parseEnum(j.at("metric"), parseTriggerMetric, "trigger metric");
    t.comparison = parseEnum(j.at("comparison"), parseComparison, "comparison");
    j.at("threshold").get_to(t.threshold);
    j.at("region").get_to(t.region);
    t.issue = parseEnum(j.at("issue"), parseIssueKey, "issue");
    j.at("party").get_to(t.party);
    j.at("month").get_to(t.month);
    j.at("year").get_to(t.year);
}

void to_json(json& j, const EventConsequence& c) {
    j = json{{"kind", consequenceKindKey(c.kind)},
             {"target", c.target},
             {"delayMonths", c.delayMonths},
             {"probability", c.probability},
             {"amount", c.amount}};
}

void from_json(const json& j, EventConsequence& c) {
    c.kind = parseEnum(j.at("kind"), parseConsequenceKind, "consequence kind");
    j.at("target").get_to(c.target);
    j.at("delayMonths").get_to(c.delayMonths);
    j.at("probability").get_to(c.probability);
    j.at("amount").get_to(c.amount);
}

void to_json(json& j, const EventDefinition& e) {
    j = json{{"key", e.key},
             {"name", e.name},
             {"description", e.description},
             {"trigger", e.trigger},
             {"effect", e.effect},
             {"region", e.region},
             {"partyBenefit", e.partyBenefit},
             {"recurring", e.recurring},
             {"cooldownTurns", e.cooldownTurns},
             {"consequences", e.consequences}};
}

void from_json(const json& j, EventDefinition& e) {
    j.at("key").get_to(e.key);
    j.at("name").get_to(e.name);
    j.at("description").get_to(e.description);
    j.at("trigger").get_to(e.trigger);
    j.at("effect").get_to(e.effect);
    j.at("region").get_to(e.region);
    j.at("partyBenefit").get_to(e.partyBenefit);
    j.at("recurring").get_to(e.recurring);
    j.at("cooldownTurns").get_to(e.cooldownTurns);
    j.at("consequences").get_to(e.consequences);
}

void to_json(json& j, const PendingChain& c) {
    j = json{{"eventKey", c.eventKey}, {"sourceKey", c.sourceKey}, {"dueTurn", c.dueTurn}};
}

void from_json(const json& j, PendingChain& c) {
    j.at("eventKey").get_to(c.eventKey);
    j.at("sourceKey").get_to(c.sourceKey);
    j.at("dueTurn").get_to(c.dueTurn);
}

void to_json(json& j, const ForcedEvent& f) {
    j = json{{"eventKey", f.eventKey}, {"effect", f.effect}, {"region", f.region}, {"description", f.description}};
}

void from_json(const json& j, ForcedEvent& f) {
    j.at("eventKey").get_to(f.eventKey);
    j.at("effect").get_to(f.effect);
    j.at("region").get_to(f.region);
    j.at("description").get_to(f.description);
}

void to_json(json& j, const ChamberVote& v) {
    j = json{{"chamber", chamberKey(v.chamber)}, {"region", v.region}, {"yesShare", v.yesShare}, {"passed", v.passed}};
}

void from_json(const json& j, ChamberVote& v) {
    v.chamber = parseEnum(j.at("chamber"), parseChamber, "chamber");
    j.at("region").get_to(v.region);
    j.at("yesShare").get_to(v.yesShare);
    j.at("passed").get_to(v.passed);
}

void to_json(json& j, const VoteTally& t) {
    j = json{{"chambers", t.chambers}, {"vetoed", t.vetoed}, {"overridden", t.overridden}, {"passed", t.passed}};
}

void from_json(const json& j, VoteTally& t) {
    j.at("chambers").get_to(t.chambers);
    j.at("vetoed").get_to(t.vetoed);
    j.at("overridden").get_to(t.overridden);
    j.at("passed").get_to(t.passed);
}

void to_json(json& j, const Policy& p) {
    j = json{{"id", p.id},
             {"templateKey", p.templateKey},
             {"title", p.title},
             {"description", p.description},
             {"sponsorActor", p.sponsorActor},
             {"sponsorParty", p.sponsorParty},
             {"level", policyLevelKey(p.level)},
             {"region", p.region},
             {"issue", issueKey(p.issue)},
             {"effect", p.effect},
             {"cost", p.cost},
             {"status", policyStatusKey(p.status)},
             {"proposedTurn", p.proposedTurn},
             {"votingTurn", p.votingTurn},
             {"resolvedTurn", p.resolvedTurn},
             {"lastTally", p.lastTally}};
}

void from_json(const json& j, Policy& p) {
    j.at("id").get_to(p.id);
    j.at("templateKey").get_to(p.templateKey);
    j.at("title").get_to(p.title);
    j.at("description").get_to(p.description);
    j.at("sponsorActor").get_to(p.sponsorActor);
    j.at("sponsorParty").get_to(p.sponsorParty);
    p.level = parseEnum(j.at("level"), parsePolicyLevel, "policy level");
    j.at("region").get_to(p.region);
    p.issue = parseEnum(j.at("issue"), parseIssueKey, "issue");
    j.at("effect").get_to(p.effect);
    j.at("cost").get_to(p.cost);
    p.status = parseEnum(j.at("status"), parsePolicyStatus, "policy status");
    j.at("proposedTurn").get_to(p.proposedTurn);
    j.at("votingTurn").get_to(p.votingTurn);
    j.at("resolvedTurn").get_to(p.resolvedTurn);
    j.at("lastTally").get_to(p.lastTally);
}

void to_json(json& j, const Election& e) {
    j = json{{"id", e.id},
             {"kind", electionKindKey(e.kind)},
             {"date", e.date},
             {"contestedSeats", e.contestedSeats},
             {"status", electionStatusKey(e.status)},
             {"winners", e.winners},
             {"seatTotals", e.seatTotals},
             {"senateClass", e.senateClass}};
}

void from_json(const json& j, Election& e) {
    j.at("id").get_to(e.id);
    e.kind = parseEnum(j.at("kind"), parseElectionKind, "election kind");
    j.at("date").get_to(e.date);
    j.at("contestedSeats").get_to(e.contestedSeats);
    e.status = parseEnum(j.at("status"), parseElectionStatus, "election status");
    j.at("winners").get_to(e.winners);
    j.at("seatTotals").get_to(e.seatTotals);
    j.at("senateClass").get_to(e.senateClass);
}

void to_json(json& j, const District& d) {
    j = json{{"id", d.id}, {"incumbent", d.incumbent}, {"lean", d.lean}, {"lastShares", d.lastShares}};
}

void from_json(const json& j, District& d) {
    j.at("id").get_to(d.id);
    j.at("incumbent").get_to(d.incumbent);
    j.at("lean").get_to(d.lean);
    j.at("lastShares").get_to(d.lastShares);
}

void to_json(json& j, const SenateSeat& s) {
    j = json{{"id", s.id}, {"class", s.seatClass}, {"holder", s.holder}};
}

void from_json(const json& j, SenateSeat& s) {
    j.at("id").get_to(s.id);
    j.at("class").get_to(s.seatClass);
    j.at("holder").get_to(s.holder);
}

void to_json(json& j, const State& s) {
    j = json{{"id", s.id},
             {"name", s.name},
             {"population", s.population},
             {"lean", s.lean},
             {"budget", {{"revenue", s.budget.revenue}, {"spending", s.budget.spending}, {"taxRate", s.budget.taxRate}}},
             {"gdp", s.gdp},
             {"unemployment", s.unemployment},
             {"inflation", s.inflation},
             {"governorParty", s.governorParty},
             {"legislatureSeats", s.legislatureSeats},
             {"legislatureControl", s.legislatureControl},
             {"districts", s.districts},
             {"senateSeats", s.senateSeats},
             {"enactedPolicies", s.enactedPolicies},
             {"campaignSpend", s.campaignSpend},
             {"governorApproval", s.governorApproval},
             {"legislatureApproval", s.legislatureApproval}};
}

void from_json(const json& j, State& s) {
    j.at("id").get_to(s.id);
    j.at("name").get_to(s.name);
    j.at("population").get_to(s.population);
    j.at("lean").get_to(s.lean);
    const json& budget = j.at("budget");
    budget.at("revenue").get_to(s.budget.revenue);
    budget.at("spending").get_to(s.budget.spending);
    budget.at("taxRate").get_to(s.budget.taxRate);
    j.at("gdp").get_to(s.gdp);
    j.at("unemployment").get_to(s.unemployment);
    j.at("inflation").get_to(s.inflation);
    j.at("governorParty").get_to(s.governorParty);
    j.at("legislatureSeats").get_to(s.legislatureSeats);
    j.at("legislatureControl").get_to(s.legislatureControl);
    j.at("districts").get_to(s.districts);
    j.at("senateSeats").get_to(s.senateSeats);
    j.at("enactedPolicies").get_to(s.enactedPolicies);
    j.at("campaignSpend").get_to(s.campaignSpend);
    j.at("governorApproval").get_to(s.governorApproval);
    j.at("legislatureApproval").get_to(s.legislatureApproval);
}

void to_json(json& j, const PoliticalParty& p) {
    j = json{{"id", p.id},
             {"name", p.name},
             {"platform", issueMap(p.platform, false)},
             {"treasury", p.treasury},
             {"approval", p.approval},
             {"houseSeats", p.houseSeats},
             {"senateSeats", p.senateSeats},
             {"stateLegislatureSeats", p.stateLegislatureSeats},
             {"governors", p.governors},
             {"fieldsCandidates", p.fieldsCandidates}};
}

void from_json(const json& j, PoliticalParty& p) {
    j.at("id").get_to(p.id);
    j.at("name").get_to(p.name);
    p.platform = readIssueMap(j.at("platform"), 0.0);
    j.at("treasury").get_to(p.treasury);
    j.at("approval").get_to(p.approval);
    j.at("houseSeats").get_to(p.houseSeats);
    j.at("senateSeats").get_to(p.senateSeats);
    j.at("stateLegislatureSeats").get_to(p.stateLegislatureSeats);
    j.at("governors").get_to(p.governors);
    j.at("fieldsCandidates").get_to(p.fieldsCandidates);
}

std::string saveSnapshot(const SimulationState& state) {
    json opinion = json::object();
    for (const auto& kv : state.opinion.entries()) {
        opinion[kv.first] = issueMap(kv.second, false);
    }

    json states = json::array();
    for (const auto& kv : state.states) {
        states.push_back(kv.second);
    }
    json parties = json::array();
    for (const auto& kv : state.parties) {
        parties.push_back(kv.second);
    }

    json doc;
    doc["version"] = kSnapshotVersion;
    doc["date"] = state.date;
    doc["turn"] = state.turn;
    doc["rng"] = {{"seed", state.rng.seed}, {"counters", state.rng.counters}};
    doc["legislature"] = {{"houseSize", state.legislature.houseSize},
                          {"senateSize", state.legislature.senateSize},
                          {"presidentParty", state.legislature.presidentParty},
                          {"houseControl", state.legislature.houseControl},
                          {"senateControl", state.legislature.senateControl},
                          {"presidentApproval", state.legislature.presidentApproval},
                          {"congressApproval", state.legislature.congressApproval},
                          {"courtLean", state.legislature.courtLean}};
    doc["economy"] = {{"growth", state.economy.growth},
                      {"unemployment", state.economy.unemployment},
                      {"inflation", state.economy.inflation},
                      {"revenue", state.economy.revenue},
                      {"spending", state.economy.spending},
                      {"taxRate", state.economy.taxRate}};
    doc["parties"] = parties;
    doc["states"] = states;
    doc["opinion"] = opinion;
    doc["policies"] = state.policies;
    doc["nextPolicyId"] = state.nextPolicyId;
    doc["events"] = {{"catalog", state.events.catalog},
                     {"cooldowns", state.events.cooldowns},
                     {"retired", state.events.retired},
                     {"pendingChains", state.events.pendingChains},
                     {"forcedQueue", state.events.forcedQueue},
                     {"recent", state.events.recent}};
    doc["elections"] = state.elections;
    doc["news"] = state.news.getEvents();
    return doc.dump(2);
}

SimulationState loadSnapshot(const std::string& text, const SimulationConfig& config) {
    SimulationState state;
    try {
        const json doc = json::parse(text);
        const int version = doc.at("version").get<int>();
        if (version != kSnapshotVersion) {
            throw LoadError("unsupported snapshot version " + std::to_string(version));
        }

        doc.at("date").get_to(state.date);
        doc.at("turn").get_to(state.turn);

        const json& rng = doc.at("rng");
        rng.at("seed").get_to(state.rng.seed);
        rng.at("counters").get_to(state.rng.counters);

        const json& legislature = doc.at("legislature");
        legislature.at("houseSize").get_to(state.legislature.houseSize);
        legislature.at("senateSize").get_to(state.legislature.senateSize);
        legislature.at("presidentParty").get_to(state.legislature.presidentParty);
        legislature.at("houseControl").get_to(state.legislature.houseControl);
        legislature.at("senateControl").get_to(state.legislature.senateControl);
        legislature.at("presidentApproval").get_to(state.legislature.presidentApproval);
        legislature.at("congressApproval").get_to(state.legislature.congressApproval);
        legislature.at("courtLean").get_to(state.legislature.courtLean);

        const json& economy = doc.at("economy");
        economy.at("growth").get_to(state.economy.growth);
        economy.at("unemployment").get_to(state.economy.unemployment);
        economy.at("inflation").get_to(state.economy.inflation);
        economy.at("revenue").get_to(state.economy.revenue);
        economy.at("spending").get_to(state.economy.spending);
        economy.at("taxRate").get_to(state.economy.taxRate);

        for (const json& p : doc.at("parties")) {
            PoliticalParty party = p.get<PoliticalParty>();
            const std::string id = party.id;
            if (!state.parties.emplace(id, std::move(party)).second) {
                throw LoadError("party '" + id + "' appears twice");
            }
        }
        for (const json& s : doc.at("states")) {
            State st = s.get<State>();
            const std::string id = st.id;
            if (!state.states.emplace(id, std::move(st)).second) {
                throw LoadError("state '" + id + "' appears twice");
            }
        }

        state.opinion.configure(config.opinion);
        const json& opinion = doc.at("opinion");
        for (auto it = opinion.begin(); it != opinion.end(); ++it) {
            const IssueVector values = readIssueMap(it.value(), config.opinion.baseline);
            for (IssueArea issue : kAllIssues) {
                state.opinion.setRaw(it.key(), issue, values[issueIndex(issue)]);
            }
        }

        doc.at("policies").get_to(state.policies);
        doc.at("nextPolicyId").get_to(state.nextPolicyId);

        const json& events = doc.at("events");
        events.at("catalog").get_to(state.events.catalog);
        events.at("cooldowns").get_to(state.events.cooldowns);
        events.at("retired").get_to(state.events.retired);
        events.at("pendingChains").get_to(state.events.pendingChains);
        events.at("forcedQueue").get_to(state.events.forcedQueue);
        events.at("recent").get_to(state.events.recent);

        doc.at("elections").get_to(state.elections);
        state.news.restore(doc.at("news").get<std::vector<std::string>>());
    } catch (const json::exception& err) {
        throw LoadError(err.what());
    }

    const std::string violation = checkInvariants(state, config);
    if (!violation.empty()) {
        throw LoadError(violation);
    }
    return state;
}

void saveSnapshotFile(const SimulationState& state, const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw SimulationError("cannot open '" + path + "' for writing");
    }
    out << saveSnapshot(state);
}

SimulationState loadSnapshotFile(const std::string& path, const SimulationConfig& config) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LoadError("cannot open '" + path + "'");
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return loadSnapshot(oss.str(), config);
}
