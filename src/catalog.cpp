#include "catalog.h"

#include <initializer_list>
#include <utility>

namespace {

EffectVector makeEffect(double growth,
                        double unemployment,
                        double inflation,
                        double budget,
                        std::initializer_list<std::pair<IssueArea, double>> opinion) {
    EffectVector e;
    e.growth = growth;
    e.unemployment = unemployment;
    e.inflation = inflation;
    e.budget = budget;
    for (const auto& kv : opinion) {
        e.opinion[issueIndex(kv.first)] = kv.second;
    }
    return e;
}

PolicyTemplate makePolicy(const char* key,
                          const char* title,
                          const char* description,
                          PolicyLevel level,
                          IssueArea issue,
                          double cost,
                          double popularity,
                          EffectVector effect) {
    PolicyTemplate p;
    p.key = key;
    p.title = title;
    p.description = description;
    p.level = level;
    p.issue = issue;
    p.cost = cost;
    p.popularity = popularity;
    p.effect = effect;
    return p;
}

EventTrigger randomTrigger(double weight) {
    EventTrigger t;
    t.kind = TriggerKind::Random;
    t.weight = weight;
    return t;
}

EventTrigger thresholdTrigger(TriggerMetric metric, Comparison comparison, double threshold) {
    EventTrigger t;
    t.kind = TriggerKind::Threshold;
    t.metric = metric;
    t.comparison = comparison;
    t.threshold = threshold;
    return t;
}

EventConsequence consequence(ConsequenceKind kind, const char* target, int delayMonths, double probability, double amount) {
    EventConsequence c;
    c.kind = kind;
    c.target = target;
    c.delayMonths = delayMonths;
    c.probability = probability;
    c.amount = amount;
    return c;
}

std::vector<EventDefinition> buildDefaultEvents() {
    std::vector<EventDefinition> events;

    EventDefinition hurricane;
    hurricane.key = "hurricane";
    hurricane.name = "Hurricane";
    hurricane.description = "Major hurricane hits Gulf Coast";
    hurricane.trigger = randomTrigger(1.0);
    hurricane.effect = makeEffect(-0.003, 0.2, 0.1, 0.0, {{IssueArea::Security, -0.05}});
    hurricane.recurring = true;
    hurricane.cooldownTurns = 6;
    hurricane.consequences.push_back(consequence(ConsequenceKind::PolicyProposal, "disaster_relief", 0, 1.0, 0.0));
    events.push_back(hurricane);

    EventDefinition boom;
    boom.key = "tech_boom";
    boom.name = "Tech boom";
    boom.description = "Tech productivity boom";
    boom.trigger = randomTrigger(0.6);
    boom.effect = makeEffect(0.004, -0.15, 0.0, 0.0, {{IssueArea::Economy, 0.05}});
    boom.recurring = true;
    boom.cooldownTurns = 12;
    events.push_back(boom);

    EventDefinition scandal;
    scandal.key = "scandal";
    scandal.name = "Scandal";
    scandal.description = "Political scandal rocks the administration";
    scandal.trigger = randomTrigger(1.0);
    scandal.partyBenefit = "Republican";
    scandal.recurring = true;
    scandal.cooldownTurns = 8;
    scandal.consequences.push_back(consequence(ConsequenceKind::PartyApproval, "president", 0, 1.0, -2.5));
    scandal.consequences.push_back(consequence(ConsequenceKind::OfficeApproval, "president", 0, 1.0, -2.5));
    scandal.consequences.push_back(consequence(ConsequenceKind::ChainEvent, "scandal_hearings", 2, 0.5, 0.0));
    events.push_back(scandal);

    EventDefinition hearings;
    hearings.key = "scandal_hearings";
    hearings.name = "Congressional hearings";
    hearings.description = "Congress opens hearings into the scandal";
    hearings.trigger.kind = TriggerKind::Manual;
    hearings.effect = makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Security, -0.02}});
    hearings.recurring = true;
    hearings.consequences.push_back(consequence(ConsequenceKind::PartyApproval, "president", 0, 1.0, -1.0));
    hearings.consequences.push_back(consequence(ConsequenceKind::OfficeApproval, "congress", 0, 1.0, -1.0));
    events.push_back(hearings);

    EventDefinition bipartisan;
    bipartisan.key = "bipartisan";
    bipartisan.name = "Bipartisan breakthrough";
    bipartisan.description = "Bipartisan breakthrough on a spending deal";
    bipartisan.trigger = randomTrigger(1.0);
    bipartisan.effect = makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Economy, 0.02}, {IssueArea::Education, 0.02}});
    bipartisan.recurring = true;
    bipartisan.cooldownTurns = 6;
    bipartisan.consequences.push_back(consequence(ConsequenceKind::OfficeApproval, "congress", 0, 1.0, 2.0));
    events.push_back(bipartisan);

    EventDefinition ruling;
    ruling.key = "court_ruling";
    ruling.name = "Landmark ruling";
    ruling.description = "Supreme Court issues a landmark ruling";
    ruling.trigger = randomTrigger(0.3);
    ruling.effect = makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Healthcare, -0.05}, {IssueArea::Security, 0.03}});
    events.push_back(ruling);

    EventDefinition wildfire;
    wildfire.key = "wildfire";
    wildfire.name = "Wildfire season";
    wildfire.description = "Severe wildfires burn across California";
    wildfire.trigger = randomTrigger(0.4);
    wildfire.region = "CA";
    wildfire.effect = makeEffect(-0.001, 0.05, 0.0, 0.0, {{IssueArea::Environment, 0.06}});
    wildfire.recurring = true;
    wildfire.cooldownTurns = 12;
    events.push_back(wildfire);

    EventDefinition budgetCrisis;
    budgetCrisis.key = "budget_crisis";
    budgetCrisis.name = "Budget standoff";
    budgetCrisis.description = "Federal deficit triggers a budget standoff";
    budgetCrisis.trigger = thresholdTrigger(TriggerMetric::FederalDeficit, Comparison::Above, 1800.0);
    budgetCrisis.effect = makeEffect(-0.001, 0.0, 0.0, 0.0, {{IssueArea::Economy, -0.06}});
    budgetCrisis.recurring = true;
    budgetCrisis.cooldownTurns = 24;
    budgetCrisis.consequences.push_back(consequence(ConsequenceKind::PolicyProposal, "austerity", 0, 1.0, 0.0));
    events.push_back(budgetCrisis);

    EventDefinition recession;
    recession.key = "recession_fears";
    recession.name = "Recession fears";
    recession.description = "Negative growth stokes recession fears";
    recession.trigger = thresholdTrigger(TriggerMetric::Growth, Comparison::Below, 0.0);
    recession.effect = makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Economy, -0.08}});
    recession.recurring = true;
    recession.cooldownTurns = 12;
    recession.consequences.push_back(consequence(ConsequenceKind::PolicyProposal, "stimulus", 0, 1.0, 0.0));
    events.push_back(recession);

    EventDefinition inflation;
    inflation.key = "inflation_spike";
    inflation.name = "Inflation spike";
    inflation.description = "Consumer prices jump sharply";
    inflation.trigger = thresholdTrigger(TriggerMetric::Inflation, Comparison::Above, 5.0);
    inflation.effect = makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Economy, -0.05}});
    inflation.recurring = true;
    inflation.cooldownTurns = 12;
    events.push_back(inflation);

    EventDefinition protests;
    protests.key = "healthcare_protests";
    protests.name = "Healthcare protests";
    protests.description = "Protests over healthcare costs spread nationwide";
    protests.trigger = thresholdTrigger(TriggerMetric::Opinion, Comparison::Below, -0.4);
    protests.trigger.issue = IssueArea::Healthcare;
    protests.effect = makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Healthcare, -0.03}});
    protests.recurring = true;
    protests.cooldownTurns = 18;
    protests.consequences.push_back(consequence(ConsequenceKind::PolicyProposal, "healthcare_expansion", 0, 0.5, 0.0));
    events.push_back(protests);

    EventDefinition sotu;
    sotu.key = "state_of_the_union";
    sotu.name = "State of the Union";
    sotu.description = "The President delivers the State of the Union";
    sotu.trigger.kind = TriggerKind::Calendar;
    sotu.trigger.month = 2;
    sotu.effect = makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Economy, 0.01}, {IssueArea::Healthcare, 0.01}});
    sotu.recurring = true;
    sotu.cooldownTurns = 11;
    sotu.consequences.push_back(consequence(ConsequenceKind::PartyApproval, "president", 0, 1.0, 1.0));
    events.push_back(sotu);

    return events;
}

} // namespace

const char* policyLevelKey(PolicyLevel level) {
    return level == PolicyLevel::State ? "state" : "federal";
}

bool parsePolicyLevel(const std::string& key, PolicyLevel& out) {
    if (key == "federal") {
        out = PolicyLevel::Federal;
        return true;
    }
    if (key == "state") {
        out = PolicyLevel::State;
        return true;
    }
    return false;
}

const char* triggerKindKey(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::Random: return "random";
        case TriggerKind::Threshold: return "threshold";
        case TriggerKind::Calendar: return "calendar";
        case TriggerKind::Manual: return "manual";
    }
    return "random";
}

bool parseTriggerKind(const std::string& key, TriggerKind& out) {
    for (TriggerKind k : {TriggerKind::Random, TriggerKind::Threshold, TriggerKind::Calendar, TriggerKind::Manual}) {
        if (key == triggerKindKey(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

const char* triggerMetricKey(TriggerMetric metric) {
    switch (metric) {
        case TriggerMetric::FederalDeficit: return "federal_deficit";
        case TriggerMetric::Growth: return "growth";
        case TriggerMetric::Unemployment: return "unemployment";
        case TriggerMetric::Inflation: return "inflation";
        case TriggerMetric::Opinion: return "opinion";
        case TriggerMetric::PartyApproval: return "party_approval";
    }
    return "federal_deficit";
}

bool parseTriggerMetric(const std::string& key, TriggerMetric& out) {
    for (TriggerMetric m : {TriggerMetric::FederalDeficit, TriggerMetric::Growth, TriggerMetric::Unemployment,
                            TriggerMetric::Inflation, TriggerMetric::Opinion, TriggerMetric::PartyApproval}) {
        if (key == triggerMetricKey(m)) {
            out = m;
            return true;
        }
    }
    return false;
}

const char* comparisonKey(Comparison comparison) {
    return comparison == Comparison::Below ? "below" : "above";
}

bool parseComparison(const std::string& key, Comparison& out) {
    if (key == "above") {
        out = Comparison::Above;
        return true;
    }
    if (key == "below") {
        out = Comparison::Below;
        return true;
    }
    return false;
}

const char* consequenceKindKey(ConsequenceKind kind) {
    switch (kind) {
        case ConsequenceKind::ChainEvent: return "chain_event";
        case ConsequenceKind::PolicyProposal: return "policy_proposal";
        case ConsequenceKind::PartyApproval: return "party_approval";
        case ConsequenceKind::OfficeApproval: return "office_approval";
    }
    return "chain_event";
}

bool parseConsequenceKind(const std::string& key, ConsequenceKind& out) {
    for (ConsequenceKind k : {ConsequenceKind::ChainEvent, ConsequenceKind::PolicyProposal, ConsequenceKind::PartyApproval,
                              ConsequenceKind::OfficeApproval}) {
        if (key == consequenceKindKey(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

bool isOfficeTarget(const std::string& target) {
    return target == "president" || target == "congress" || target == "governor" || target == "legislature";
}

const std::vector<PolicyTemplate>& getDefaultPolicyCatalog() {
    static const std::vector<PolicyTemplate> kPolicies = {
        makePolicy("stimulus", "Stimulus", "Counter-cyclical fiscal stimulus",
                   PolicyLevel::Federal, IssueArea::Economy, 300.0, 60.0,
                   makeEffect(0.010, -0.30, 0.20, 0.0, {{IssueArea::Economy, 0.08}, {IssueArea::Healthcare, 0.02}})),
        makePolicy("infrastructure", "Infrastructure", "Invest in roads, bridges and broadband",
                   PolicyLevel::Federal, IssueArea::Economy, 200.0, 65.0,
                   makeEffect(0.005, -0.20, 0.05, 0.0, {{IssueArea::Economy, 0.05}, {IssueArea::Environment, 0.01}})),
        makePolicy("austerity", "Austerity", "Spending restraint to curb inflation",
                   PolicyLevel::Federal, IssueArea::Economy, -100.0, 45.0,
                   makeEffect(-0.005, 0.10, -0.80, 0.0,
                              {{IssueArea::Economy, 0.02}, {IssueArea::Healthcare, -0.04}, {IssueArea::Education, -0.02}})),
        makePolicy("healthcare_expansion", "Healthcare Expansion", "Expand public health coverage",
                   PolicyLevel::Federal, IssueArea::Healthcare, 250.0, 58.0,
                   makeEffect(0.0, -0.05, 0.10, 0.0, {{IssueArea::Healthcare, 0.12}, {IssueArea::Economy, -0.02}})),
        makePolicy("border_security", "Border Security Act", "Fund border enforcement and processing",
                   PolicyLevel::Federal, IssueArea::Immigration, 80.0, 52.0,
                   makeEffect(0.0, 0.0, 0.0, 0.0, {{IssueArea::Immigration, 0.10}, {IssueArea::Security, 0.05}})),
        makePolicy("clean_energy", "Clean Energy Investment", "Tax credits for renewable generation",
                   PolicyLevel::Federal, IssueArea::Environment, 150.0, 55.0,
                   makeEffect(0.002, -0.05, 0.10, 0.0, {{IssueArea::Environment, 0.12}, {IssueArea::Economy, -0.01}})),
        makePolicy("disaster_relief", "Disaster Relief", "Emergency aid to impacted regions",
                   PolicyLevel::Federal, IssueArea::Security, 50.0, 70.0,
                   makeEffect(0.001, -0.05, 0.0, 0.0, {{IssueArea::Security, 0.04}, {IssueArea::Economy, 0.01}})),
        makePolicy("state_jobs_program", "State Jobs Program", "Hire for public works and small business grants",
                   PolicyLevel::State, IssueArea::Economy, 10.0, 62.0,
                   makeEffect(0.003, -0.20, 0.0, 0.0, {{IssueArea::Economy, 0.06}})),
        makePolicy("state_spending_freeze", "State Spending Freeze", "Temporary restraint on non-essential spending",
                   PolicyLevel::State, IssueArea::Economy, -5.0, 52.0,
                   makeEffect(-0.001, 0.0, -0.20, 0.0, {{IssueArea::Economy, 0.02}, {IssueArea::Education, -0.02}})),
        makePolicy("budget_balance_act", "Budget Balance Act", "Raise fees and cut waste to close the gap",
                   PolicyLevel::State, IssueArea::Economy, -8.0, 49.0,
                   makeEffect(-0.0005, 0.05, 0.0, 0.0, {{IssueArea::Economy, 0.01}, {IssueArea::Healthcare, -0.02}})),
        makePolicy("state_infrastructure", "State Infrastructure", "Fix roads and bridges",
                   PolicyLevel::State, IssueArea::Economy, 12.0, 64.0,
                   makeEffect(0.002, -0.10, 0.0, 0.0, {{IssueArea::Economy, 0.04}})),
        makePolicy("school_funding", "School Funding Initiative", "Raise per-pupil funding",
                   PolicyLevel::State, IssueArea::Education, 9.0, 61.0,
                   makeEffect(0.001, 0.0, 0.0, 0.0, {{IssueArea::Education, 0.10}})),
    };
    return kPolicies;
}

const std::vector<EventDefinition>& getDefaultEventCatalog() {
    static const std::vector<EventDefinition> kEvents = buildDefaultEvents();
    return kEvents;
}
