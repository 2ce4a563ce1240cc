#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sim_types.h"

enum class PolicyLevel : std::uint8_t {
    Federal = 0,
    State = 1
};

const char* policyLevelKey(PolicyLevel level);
bool parsePolicyLevel(const std::string& key, PolicyLevel& out);

// A proposal the AI (or an event consequence) can put on the floor.
struct PolicyTemplate {
    std::string key;
    std::string title;
    std::string description;
    PolicyLevel level = PolicyLevel::Federal;
    IssueArea issue = IssueArea::Economy;
    double cost = 0.0;        // billions; negative means savings
    double popularity = 50.0; // baseline public support 0..100
    EffectVector effect;
};

enum class TriggerKind : std::uint8_t {
    Random = 0,    // weighted draw, at most the configured number per turn
    Threshold = 1, // metric crosses a threshold
    Calendar = 2,  // fixed month (and optional year)
    Manual = 3     // only fires when invoked by a collaborator
};

enum class TriggerMetric : std::uint8_t {
    FederalDeficit = 0,
    Growth = 1,
    Unemployment = 2,
    Inflation = 3,
    Opinion = 4,
    PartyApproval = 5
};

enum class Comparison : std::uint8_t {
    Above = 0,
    Below = 1
};

struct EventTrigger {
    TriggerKind kind = TriggerKind::Random;
    double weight = 1.0;
    TriggerMetric metric = TriggerMetric::FederalDeficit;
    Comparison comparison = Comparison::Above;
    double threshold = 0.0;
    std::string region = kNationalRegion; // Opinion metric
    IssueArea issue = IssueArea::Economy;  // Opinion metric
    std::string party;                     // PartyApproval metric
    int month = 0;                         // Calendar: 1..12
    int year = 0;                          // Calendar: 0 means every year
};

enum class ConsequenceKind : std::uint8_t {
    ChainEvent = 0,
    PolicyProposal = 1,
    PartyApproval = 2,
    OfficeApproval = 3 // target: president, congress, governor or legislature
};

struct EventConsequence {
    ConsequenceKind kind = ConsequenceKind::ChainEvent;
    std::string target; // event key, policy template key, party id ("president" = president's party) or office
    int delayMonths = 0;
    double probability = 1.0;
    double amount = 0.0;
};

struct EventDefinition {
    std::string key;
    std::string name;
    std::string description;
    EventTrigger trigger;
    EffectVector effect;
    std::string region = kNationalRegion;
    std::string partyBenefit;
    bool recurring = false;
    int cooldownTurns = 0;
    std::vector<EventConsequence> consequences;
};

const char* triggerKindKey(TriggerKind kind);
bool parseTriggerKind(const std::string& key, TriggerKind& out);
const char* triggerMetricKey(TriggerMetric metric);
bool parseTriggerMetric(const std::string& key, TriggerMetric& out);
const char* comparisonKey(Comparison comparison);
bool parseComparison(const std::string& key, Comparison& out);
const char* consequenceKindKey(ConsequenceKind kind);
bool parseConsequenceKind(const std::string& key, ConsequenceKind& out);
bool isOfficeTarget(const std::string& target);

const std::vector<PolicyTemplate>& getDefaultPolicyCatalog();
const std::vector<EventDefinition>& getDefaultEventCatalog();
