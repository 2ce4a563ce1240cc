#include "simulation_context.h"

#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <toml++/toml.hpp>

#include "sim_errors.h"

namespace {

bool fitsInInt(double v) {
    return v >= static_cast<double>(std::numeric_limits<int>::min()) &&
           v <= static_cast<double>(std::numeric_limits<int>::max());
}

template <typename T>
void readNodeValue(const toml::node_view<const toml::node>& view, T& target) {
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
                throw std::invalid_argument("integer value " + std::to_string(*v) + " is out of range");
            }
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    readNodeValue(root[section][key], target);
}

// Seat counts accept 435 or 435.0 but never 435.5.
void readSeatCount(const toml::table& root, std::string_view key, int& target) {
    const toml::node_view<const toml::node> view = root["world"][key];
    if (!view) {
        return;
    }
    std::ostringstream oss;
    oss << "world." << key << " must be an integer seat count";
    if (const auto v = view.value_exact<std::int64_t>()) {
        if (*v >= 0 && *v <= std::numeric_limits<int>::max()) {
            target = static_cast<int>(*v);
            return;
        }
        oss << " (got " << *v << ")";
    } else if (const auto d = view.value_exact<double>()) {
        if (std::floor(*d) == *d && fitsInInt(*d) && *d >= 0.0) {
            target = static_cast<int>(*d);
            return;
        }
        oss << " (got " << *d << ")";
    }
    throw std::invalid_argument(oss.str());
}

void readEffect(const toml::table& t, EffectVector& effect) {
    readNodeValue(t["growth"], effect.growth);
    readNodeValue(t["unemployment"], effect.unemployment);
    readNodeValue(t["inflation"], effect.inflation);
    readNodeValue(t["budget"], effect.budget);
    if (const toml::table* opinion = t["opinion"].as_table()) {
        for (auto&& [k, node] : *opinion) {
            IssueArea issue;
            if (!parseIssueKey(std::string(k.str()), issue)) {
                throw std::invalid_argument("unknown issue '" + std::string(k.str()) + "' in opinion effect");
            }
            double v = 0.0;
            if (const auto d = node.value<double>()) {
                v = *d;
            }
            effect.opinion[issueIndex(issue)] = v;
        }
    }
}

IssueArea readIssue(const toml::table& t, const char* field, IssueArea fallback) {
    const auto key = t[field].value<std::string>();
    if (!key) {
        return fallback;
    }
    IssueArea issue;
    if (!parseIssueKey(*key, issue)) {
        throw std::invalid_argument("unknown issue '" + *key + "'");
    }
    return issue;
}

std::vector<PolicyTemplate> readPolicyCatalog(const toml::array& arr) {
    std::vector<PolicyTemplate> policies;
    for (const toml::node& node : arr) {
        const toml::table* t = node.as_table();
        if (!t) {
            throw std::invalid_argument("[[policy]] entry is not a table");
        }
        PolicyTemplate p;
        readNodeValue((*t)["key"], p.key);
        readNodeValue((*t)["title"], p.title);
        readNodeValue((*t)["description"], p.description);
        if (const auto level = (*t)["level"].value<std::string>()) {
            if (!parsePolicyLevel(*level, p.level)) {
                throw std::invalid_argument("policy '" + p.key + "': unknown level '" + *level + "'");
            }
        }
        p.issue = readIssue(*t, "issue", p.issue);
        readNodeValue((*t)["cost"], p.cost);
        readNodeValue((*t)["popularity"], p.popularity);
        readEffect(*t, p.effect);
        policies.push_back(p);
    }
    return policies;
}

std::vector<EventDefinition> readEventCatalog(const toml::array& arr) {
    std::vector<EventDefinition> events;
    for (const toml::node& node : arr) {
        const toml::table* t = node.as_table();
        if (!t) {
            throw std::invalid_argument("[[event]] entry is not a table");
        }
        EventDefinition ev;
        readNodeValue((*t)["key"], ev.key);
        readNodeValue((*t)["name"], ev.name);
        readNodeValue((*t)["description"], ev.description);
        readNodeValue((*t)["region"], ev.region);
        readNodeValue((*t)["partyBenefit"], ev.partyBenefit);
        readNodeValue((*t)["recurring"], ev.recurring);
        readNodeValue((*t)["cooldownTurns"], ev.cooldownTurns);
        readEffect(*t, ev.effect);

        if (const auto kind = (*t)["trigger"].value<std::string>()) {
            if (!parseTriggerKind(*kind, ev.trigger.kind)) {
                throw std::invalid_argument("event '" + ev.key + "': unknown trigger '" + *kind + "'");
            }
        }
        readNodeValue((*t)["weight"], ev.trigger.weight);
        if (const auto metric = (*t)["metric"].value<std::string>()) {
            if (!parseTriggerMetric(*metric, ev.trigger.metric)) {
                throw std::invalid_argument("event '" + ev.key + "': unknown metric '" + *metric + "'");
            }
        }
        if (const auto cmp = (*t)["comparison"].value<std::string>()) {
            if (!parseComparison(*cmp, ev.trigger.comparison)) {
                throw std::invalid_argument("event '" + ev.key + "': unknown comparison '" + *cmp + "'");
            }
        }
        readNodeValue((*t)["threshold"], ev.trigger.threshold);
        readNodeValue((*t)["metricRegion"], ev.trigger.region);
        ev.trigger.issue = readIssue(*t, "metricIssue", ev.trigger.issue);
        readNodeValue((*t)["metricParty"], ev.trigger.party);
        readNodeValue((*t)["month"], ev.trigger.month);
        readNodeValue((*t)["year"], ev.trigger.year);

        if (const toml::array* consequences = (*t)["consequences"].as_array()) {
            for (const toml::node& cnode : *consequences) {
                const toml::table* ct = cnode.as_table();
                if (!ct) {
                    throw std::invalid_argument("event '" + ev.key + "': consequence is not a table");
                }
                EventConsequence c;
                if (const auto kind = (*ct)["kind"].value<std::string>()) {
                    if (!parseConsequenceKind(*kind, c.kind)) {
                        throw std::invalid_argument("event '" + ev.key + "': unknown consequence '" + *kind + "'");
                    }
                }
                readNodeValue((*ct)["target"], c.target);
                readNodeValue((*ct)["delayMonths"], c.delayMonths);
                readNodeValue((*ct)["probability"], c.probability);
                readNodeValue((*ct)["amount"], c.amount);
                ev.consequences.push_back(c);
            }
        }
        events.push_back(ev);
    }
    return events;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationFault(message);
    }
}

} // namespace

const PolicyTemplate* SimulationConfig::findPolicy(const std::string& key) const {
    for (const auto& p : policyCatalog) {
        if (p.key == key) return &p;
    }
    return nullptr;
}

const EventDefinition* SimulationConfig::findEvent(const std::string& key) const {
    for (const auto& e : eventCatalog) {
        if (e.key == key) return &e;
    }
    return nullptr;
}

void SimulationConfig::validate() const {
    require(world.startMonth >= 1 && world.startMonth <= 12, "world.startMonth must be 1..12");
    require(world.houseSeats > 0, "world.houseSeats must be positive");
    require(world.senateSeats > 0 && world.senateSeats % 2 == 0, "world.senateSeats must be a positive even number");
    require(world.stateLegislatureSeats > 0, "world.stateLegislatureSeats must be positive");
    require(world.electionHistory >= 0 && world.policyHistory >= 0, "world history limits must be non-negative");

    require(opinion.minValue < opinion.maxValue, "opinion.minValue must be below opinion.maxValue");
    require(opinion.baseline >= opinion.minValue && opinion.baseline <= opinion.maxValue,
            "opinion.baseline must lie within [minValue, maxValue]");
    require(opinion.decayRate >= 0.0 && opinion.decayRate <= 1.0, "opinion.decayRate must be within [0, 1]");
    require(opinion.maxDeltaPerApply > 0.0, "opinion.maxDeltaPerApply must be positive");

    require(legislature.simpleMajority >= 0.5 && legislature.simpleMajority < 1.0,
            "legislature.simpleMajority must be within [0.5, 1)");
    require(legislature.supermajority >= legislature.simpleMajority && legislature.supermajority <= 1.0,
            "legislature.supermajority must be within [simpleMajority, 1]");
    require(legislature.courtPenalty >= 0.0 && legislature.courtPenalty < 1.0,
            "legislature.courtPenalty must be within [0, 1)");

    require(elections.month >= 1 && elections.month <= 12, "elections.month must be 1..12");
    require(elections.campaignSpendScale > 0.0, "elections.campaignSpendScale must be positive");
    require(elections.noise >= 0.0, "elections.noise must be non-negative");

    require(events.randomEventChance >= 0.0 && events.randomEventChance <= 1.0,
            "events.randomEventChance must be within [0, 1]");
    require(events.maxRandomPerTurn >= 0, "events.maxRandomPerTurn must be non-negative");
    require(events.recentMemory >= 0, "events.recentMemory must be non-negative");

    require(ai.maxPendingPerActor >= 1, "ai.maxPendingPerActor must be at least 1");
    require(ai.campaignCost >= 0.0 && ai.fundraiseAmount >= 0.0, "ai costs must be non-negative");

    require(economy.minGrowth <= economy.maxGrowth, "economy growth bounds are inverted");
    require(economy.minInflation <= economy.maxInflation, "economy inflation bounds are inverted");
    require(economy.minUnemployment <= economy.maxUnemployment, "economy unemployment bounds are inverted");
    require(economy.approvalReversion >= 0.0 && economy.approvalReversion <= 1.0,
            "economy.approvalReversion must be within [0, 1]");
    for (double baseline : {economy.approvalBaseline, economy.presidentApprovalBaseline, economy.congressApprovalBaseline,
                            economy.governorApprovalBaseline, economy.stateLegislatureApprovalBaseline}) {
        require(baseline >= 0.0 && baseline <= 100.0, "economy approval baselines must be within [0, 100]");
    }

    std::set<std::string> policyKeys;
    for (const auto& p : policyCatalog) {
        require(!p.key.empty(), "policy template without key");
        require(policyKeys.insert(p.key).second, "duplicate policy template '" + p.key + "'");
    }
    std::set<std::string> eventKeys;
    for (const auto& e : eventCatalog) {
        require(!e.key.empty(), "event definition without key");
        require(eventKeys.insert(e.key).second, "duplicate event '" + e.key + "'");
        require(e.cooldownTurns >= 0, "event '" + e.key + "' has a negative cooldown");
        require(e.trigger.weight >= 0.0, "event '" + e.key + "' has a negative weight");
        if (e.trigger.kind == TriggerKind::Calendar) {
            require(e.trigger.month >= 1 && e.trigger.month <= 12, "event '" + e.key + "' calendar month must be 1..12");
        }
    }
    for (const auto& e : eventCatalog) {
        for (const auto& c : e.consequences) {
            require(c.probability >= 0.0 && c.probability <= 1.0,
                    "event '" + e.key + "' consequence probability must be within [0, 1]");
            require(c.delayMonths >= 0, "event '" + e.key + "' consequence delay must be non-negative");
            if (c.kind == ConsequenceKind::ChainEvent) {
                require(eventKeys.count(c.target) > 0, "event '" + e.key + "' chains unknown event '" + c.target + "'");
            } else if (c.kind == ConsequenceKind::PolicyProposal) {
                require(policyKeys.count(c.target) > 0, "event '" + e.key + "' proposes unknown policy '" + c.target + "'");
            } else if (c.kind == ConsequenceKind::OfficeApproval) {
                require(isOfficeTarget(c.target), "event '" + e.key + "' moves approval of unknown office '" + c.target + "'");
            }
        }
    }
}

std::mt19937_64 RngStreams::open(const std::string& key, int turn) {
    std::uint64_t& counter = counters[key];
    const std::uint64_t derived = SimulationContext::deriveStreamSeed(seed, key, turn, counter);
    ++counter;
    return std::mt19937_64(derived);
}

SimulationContext::SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : worldSeed(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            throw ConfigurationFault(err);
        }
        std::cout << "[Config] Loaded " << runtimeConfigPath << " (hash " << configHash << ")\n";
    }
    config.validate();
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "world", "startYear", config.world.startYear);
        readTomlValue(root, "world", "startMonth", config.world.startMonth);
        readSeatCount(root, "houseSeats", config.world.houseSeats);
        readSeatCount(root, "senateSeats", config.world.senateSeats);
        readSeatCount(root, "stateLegislatureSeats", config.world.stateLegislatureSeats);
        readTomlValue(root, "world", "deterministicMode", config.world.deterministicMode);
        readTomlValue(root, "world", "electionHistory", config.world.electionHistory);
        readTomlValue(root, "world", "policyHistory", config.world.policyHistory);

        readTomlValue(root, "opinion", "minValue", config.opinion.minValue);
        readTomlValue(root, "opinion", "maxValue", config.opinion.maxValue);
        readTomlValue(root, "opinion", "baseline", config.opinion.baseline);
        readTomlValue(root, "opinion", "decayRate", config.opinion.decayRate);
        readTomlValue(root, "opinion", "maxDeltaPerApply", config.opinion.maxDeltaPerApply);

        readTomlValue(root, "legislature", "simpleMajority", config.legislature.simpleMajority);
        readTomlValue(root, "legislature", "supermajority", config.legislature.supermajority);
        readTomlValue(root, "legislature", "sponsorLoyalty", config.legislature.sponsorLoyalty);
        readTomlValue(root, "legislature", "alignmentWeight", config.legislature.alignmentWeight);
        readTomlValue(root, "legislature", "vetoEnabled", config.legislature.vetoEnabled);
        readTomlValue(root, "legislature", "approvalOnEnact", config.legislature.approvalOnEnact);
        readTomlValue(root, "legislature", "approvalOnReject", config.legislature.approvalOnReject);
        readTomlValue(root, "legislature", "presidentApprovalOnEnact", config.legislature.presidentApprovalOnEnact);
        readTomlValue(root, "legislature", "governorApprovalOnEnact", config.legislature.governorApprovalOnEnact);
        readTomlValue(root, "legislature", "stateLegislatureApprovalOnEnact",
                      config.legislature.stateLegislatureApprovalOnEnact);
        readTomlValue(root, "legislature", "courtPenalty", config.legislature.courtPenalty);
        readTomlValue(root, "legislature", "courtInflationThreshold", config.legislature.courtInflationThreshold);

        readTomlValue(root, "elections", "month", config.elections.month);
        readTomlValue(root, "elections", "incumbencyBonus", config.elections.incumbencyBonus);
        readTomlValue(root, "elections", "campaignWeight", config.elections.campaignWeight);
        readTomlValue(root, "elections", "campaignSpendScale", config.elections.campaignSpendScale);
        readTomlValue(root, "elections", "opinionWeight", config.elections.opinionWeight);
        readTomlValue(root, "elections", "approvalWeight", config.elections.approvalWeight);
        readTomlValue(root, "elections", "officeApprovalWeight", config.elections.officeApprovalWeight);
        readTomlValue(root, "elections", "houseFlipPresidentApproval", config.elections.houseFlipPresidentApproval);
        readTomlValue(root, "elections", "houseFlipCongressApproval", config.elections.houseFlipCongressApproval);
        readTomlValue(root, "elections", "senateFlipPresidentApproval", config.elections.senateFlipPresidentApproval);
        readTomlValue(root, "elections", "leanWeight", config.elections.leanWeight);
        readTomlValue(root, "elections", "noise", config.elections.noise);
        readTomlValue(root, "elections", "senateCycleAnchorYear", config.elections.senateCycleAnchorYear);

        readTomlValue(root, "events", "randomEventChance", config.events.randomEventChance);
        readTomlValue(root, "events", "maxRandomPerTurn", config.events.maxRandomPerTurn);
        readTomlValue(root, "events", "recentMemory", config.events.recentMemory);

        readTomlValue(root, "ai", "enabled", config.ai.enabled);
        readTomlValue(root, "ai", "opinionWeight", config.ai.opinionWeight);
        readTomlValue(root, "ai", "alignmentWeight", config.ai.alignmentWeight);
        readTomlValue(root, "ai", "costWeight", config.ai.costWeight);
        readTomlValue(root, "ai", "campaignWeight", config.ai.campaignWeight);
        readTomlValue(root, "ai", "budgetWeight", config.ai.budgetWeight);
        readTomlValue(root, "ai", "jitter", config.ai.jitter);
        readTomlValue(root, "ai", "campaignCost", config.ai.campaignCost);
        readTomlValue(root, "ai", "fundraiseAmount", config.ai.fundraiseAmount);
        readTomlValue(root, "ai", "treasuryTarget", config.ai.treasuryTarget);
        readTomlValue(root, "ai", "maxPendingPerActor", config.ai.maxPendingPerActor);

        readTomlValue(root, "economy", "growthDrift", config.economy.growthDrift);
        readTomlValue(root, "economy", "inflationDrift", config.economy.inflationDrift);
        readTomlValue(root, "economy", "unemploymentDrift", config.economy.unemploymentDrift);
        readTomlValue(root, "economy", "minGrowth", config.economy.minGrowth);
        readTomlValue(root, "economy", "maxGrowth", config.economy.maxGrowth);
        readTomlValue(root, "economy", "minInflation", config.economy.minInflation);
        readTomlValue(root, "economy", "maxInflation", config.economy.maxInflation);
        readTomlValue(root, "economy", "minUnemployment", config.economy.minUnemployment);
        readTomlValue(root, "economy", "maxUnemployment", config.economy.maxUnemployment);
        readTomlValue(root, "economy", "stateGrowthNoise", config.economy.stateGrowthNoise);
        readTomlValue(root, "economy", "stateSpendingReversion", config.economy.stateSpendingReversion);
        readTomlValue(root, "economy", "stateSpendingNoise", config.economy.stateSpendingNoise);
        readTomlValue(root, "economy", "federalTaxRate", config.economy.federalTaxRate);
        readTomlValue(root, "economy", "partyIncome", config.economy.partyIncome);
        readTomlValue(root, "economy", "approvalBaseline", config.economy.approvalBaseline);
        readTomlValue(root, "economy", "approvalReversion", config.economy.approvalReversion);
        readTomlValue(root, "economy", "presidentApprovalBaseline", config.economy.presidentApprovalBaseline);
        readTomlValue(root, "economy", "congressApprovalBaseline", config.economy.congressApprovalBaseline);
        readTomlValue(root, "economy", "governorApprovalBaseline", config.economy.governorApprovalBaseline);
        readTomlValue(root, "economy", "stateLegislatureApprovalBaseline",
                      config.economy.stateLegislatureApprovalBaseline);

        if (const toml::array* policies = root["policy"].as_array()) {
            config.policyCatalog = readPolicyCatalog(*policies);
        }
        if (const toml::array* events = root["event"].as_array()) {
            config.eventCatalog = readEventCatalog(*events);
        }

        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    return false;
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::uint64_t SimulationContext::hashStringFNV1a(const std::string& text) {
    std::uint64_t h = 1469598103934665603ull;
    for (char ch : text) {
        h ^= static_cast<std::uint8_t>(ch);
        h *= 1099511628211ull;
    }
    return h;
}

std::uint64_t SimulationContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

std::uint64_t SimulationContext::deriveStreamSeed(std::uint64_t seed,
                                                  const std::string& key,
                                                  int turn,
                                                  std::uint64_t counter) {
    const std::uint64_t t = static_cast<std::uint64_t>(static_cast<std::int64_t>(turn));
    return mix64(seed ^ hashStringFNV1a(key) ^ (t * 0x9E3779B97F4A7C15ull) ^ mix64(counter ^ 0xC0C0C0C0C0C0C0C0ull));
}

double SimulationContext::u01FromU64(std::uint64_t x) {
    // 53 random bits to [0,1).
    const std::uint64_t mantissa = (x >> 11);
    return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0);
}
