#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "event_manager.h"
#include "policy_pipeline.h"
#include "sim_errors.h"
#include "simulation_state.h"
#include "test_support.h"

namespace {

EventDefinition thresholdEvent(const std::string& key, TriggerMetric metric, Comparison cmp, double threshold) {
    EventDefinition def;
    def.key = key;
    def.name = key;
    def.trigger.kind = TriggerKind::Threshold;
    def.trigger.metric = metric;
    def.trigger.comparison = cmp;
    def.trigger.threshold = threshold;
    return def;
}

std::vector<std::string> keysOf(const std::vector<FiredEvent>& fired) {
    std::vector<std::string> keys;
    for (const FiredEvent& e : fired) keys.push_back(e.key);
    return keys;
}

} // namespace

class EventManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx = makeQuietContext();
        state = makeRiggedState(ctx);
        state.economy.growth = 0.02;
    }

    // One event phase the way the turn engine runs it.
    std::vector<FiredEvent> runPhase(int turn) {
        PolicyPipeline pipeline(ctx.config);
        EventManager manager(ctx.config, pipeline);
        const SimulationState phaseStart = state;
        return manager.runPhase(state, phaseStart, turn);
    }

    SimulationContext ctx{0};
    SimulationState state;
};

TEST_F(EventManagerTest, PredicatesSeeTheStateAtPhaseStart) {
    state.events.catalog.push_back(thresholdEvent("slump", TriggerMetric::Growth, Comparison::Below, 0.0));

    ForcedEvent shock;
    shock.effect.growth = -0.05;
    shock.description = "Oil shock";
    state.events.forcedQueue.push_back(shock);

    const std::vector<FiredEvent> first = runPhase(1);
    EXPECT_EQ(keysOf(first), std::vector<std::string>{"manual"});
    EXPECT_LT(state.economy.growth, 0.0);
    EXPECT_TRUE(state.events.forcedQueue.empty());

    const std::vector<FiredEvent> second = runPhase(2);
    ASSERT_EQ(keysOf(second), std::vector<std::string>{"slump"});
    EXPECT_EQ(second[0].cause, "threshold");

    // One-shot events retire.
    EXPECT_EQ(state.events.retired.count("slump"), 1u);
    EXPECT_TRUE(runPhase(3).empty());
}

TEST_F(EventManagerTest, TriggerEvaluationDoesNotMutate) {
    const EventDefinition def = thresholdEvent("x", TriggerMetric::FederalDeficit, Comparison::Above, 0.0);
    const SimulationState before = state;
    EventManager::triggerHolds(def.trigger, state);
    EXPECT_EQ(state.economy.growth, before.economy.growth);
    EXPECT_EQ(state.rng.counters, before.rng.counters);
}

TEST_F(EventManagerTest, ChainedEventFiresAfterItsDelay) {
    EventDefinition scandal;
    scandal.key = "scandal";
    scandal.name = "Scandal";
    scandal.trigger.kind = TriggerKind::Manual;
    scandal.recurring = true;
    EventConsequence chain;
    chain.kind = ConsequenceKind::ChainEvent;
    chain.target = "hearings";
    chain.delayMonths = 2;
    chain.probability = 1.0;
    scandal.consequences.push_back(chain);

    EventDefinition hearings;
    hearings.key = "hearings";
    hearings.name = "Hearings";
    hearings.trigger.kind = TriggerKind::Manual;
    hearings.recurring = true;

    state.events.catalog = {scandal, hearings};
    ForcedEvent forced;
    forced.eventKey = "scandal";
    state.events.forcedQueue.push_back(forced);

    EXPECT_EQ(keysOf(runPhase(1)), std::vector<std::string>{"scandal"});
    ASSERT_EQ(state.events.pendingChains.size(), 1u);
    EXPECT_EQ(state.events.pendingChains[0].dueTurn, 3);

    EXPECT_TRUE(runPhase(2).empty());
    const std::vector<FiredEvent> third = runPhase(3);
    ASSERT_EQ(keysOf(third), std::vector<std::string>{"hearings"});
    EXPECT_EQ(third[0].cause, "chain");
    EXPECT_TRUE(state.events.pendingChains.empty());
    EXPECT_EQ(state.events.recent, (std::vector<std::string>{"scandal", "hearings"}));
}

TEST_F(EventManagerTest, RecurringCalendarEventWaitsOutItsCooldown) {
    EventDefinition address;
    address.key = "address";
    address.name = "Address";
    address.trigger.kind = TriggerKind::Calendar;
    address.trigger.month = 1;
    address.recurring = true;
    address.cooldownTurns = 2;
    EventConsequence approval;
    approval.kind = ConsequenceKind::PartyApproval;
    approval.target = "president";
    approval.amount = 2.0;
    address.consequences.push_back(approval);
    state.events.catalog.push_back(address);

    EXPECT_EQ(keysOf(runPhase(1)), std::vector<std::string>{"address"});
    EXPECT_DOUBLE_EQ(state.parties["A"].approval, 52.0);
    EXPECT_TRUE(runPhase(2).empty());
    EXPECT_EQ(keysOf(runPhase(3)), std::vector<std::string>{"address"});
}

TEST_F(EventManagerTest, PolicyConsequenceProposesForThePresident) {
    EventDefinition storm = thresholdEvent("storm", TriggerMetric::Growth, Comparison::Above, -1.0);
    EventConsequence relief;
    relief.kind = ConsequenceKind::PolicyProposal;
    relief.target = "disaster_relief";
    storm.consequences.push_back(relief);
    state.events.catalog.push_back(storm);

    runPhase(4);
    ASSERT_EQ(state.policies.size(), 1u);
    EXPECT_EQ(state.policies[0].templateKey, "disaster_relief");
    EXPECT_EQ(state.policies[0].sponsorParty, "A");
    EXPECT_EQ(state.policies[0].status, PolicyStatus::Proposed);
    EXPECT_EQ(state.policies[0].proposedTurn, 4);
}

TEST_F(EventManagerTest, RandomEventsRespectChanceAndCap) {
    EventDefinition a;
    a.key = "a";
    a.name = "A";
    a.recurring = true;
    EventDefinition b = a;
    b.key = "b";
    state.events.catalog = {a, b};

    ctx.config.events.randomEventChance = 1.0;
    ctx.config.events.maxRandomPerTurn = 1;
    EXPECT_EQ(runPhase(1).size(), 1u);

    ctx.config.events.maxRandomPerTurn = 2;
    EXPECT_EQ(runPhase(2).size(), 2u);

    ctx.config.events.randomEventChance = 0.0;
    EXPECT_TRUE(runPhase(3).empty());
}

TEST_F(EventManagerTest, EffectOnUnknownRegionIsAFault) {
    ForcedEvent forced;
    forced.region = "ZZ";
    forced.effect.growth = 0.01;
    state.events.forcedQueue.push_back(forced);
    EXPECT_THROW(runPhase(1), SimulationFault);
}

TEST_F(EventManagerTest, OneShotEventQueuedTwiceFiresOnce) {
    EventDefinition ruling;
    ruling.key = "ruling";
    ruling.name = "Ruling";
    ruling.trigger.kind = TriggerKind::Manual;
    ruling.effect.opinion[issueIndex(IssueArea::Healthcare)] = 0.1;
    state.events.catalog = {ruling};

    ForcedEvent forced;
    forced.eventKey = "ruling";
    state.events.forcedQueue = {forced, forced};

    EXPECT_EQ(keysOf(runPhase(1)), std::vector<std::string>{"ruling"});
    EXPECT_DOUBLE_EQ(state.opinion.value(kNationalRegion, IssueArea::Healthcare), 0.1);
    EXPECT_EQ(state.events.recent, std::vector<std::string>{"ruling"});
    EXPECT_TRUE(state.events.forcedQueue.empty());
}

TEST_F(EventManagerTest, NegativeEventBudgetRaisesRevenue) {
    ForcedEvent windfall;
    windfall.effect.budget = -40.0;
    state.events.forcedQueue.push_back(windfall);

    ForcedEvent settlement;
    settlement.region = "AA";
    settlement.effect.budget = -2.0;
    state.events.forcedQueue.push_back(settlement);

    const double revenue = state.economy.revenue;
    const double spending = state.economy.spending;
    runPhase(1);
    EXPECT_DOUBLE_EQ(state.economy.revenue, revenue + 40.0);
    EXPECT_DOUBLE_EQ(state.economy.spending, spending);
    EXPECT_DOUBLE_EQ(state.states["AA"].budget.revenue, 8.0);
    EXPECT_DOUBLE_EQ(state.states["AA"].budget.spending, 6.0);
}

TEST_F(EventManagerTest, OfficeApprovalConsequencesMoveTheNamedOffice) {
    EventDefinition scandal;
    scandal.key = "scandal";
    scandal.name = "Scandal";
    scandal.trigger.kind = TriggerKind::Manual;
    scandal.recurring = true;
    EventConsequence president;
    president.kind = ConsequenceKind::OfficeApproval;
    president.target = "president";
    president.amount = -2.5;
    scandal.consequences.push_back(president);

    EventDefinition recall = scandal;
    recall.key = "recall";
    recall.region = "BB";
    recall.consequences[0].target = "governor";
    recall.consequences[0].amount = -4.0;

    state.events.catalog = {scandal, recall};
    ForcedEvent first;
    first.eventKey = "scandal";
    ForcedEvent second;
    second.eventKey = "recall";
    state.events.forcedQueue = {first, second};
    runPhase(1);

    EXPECT_DOUBLE_EQ(state.legislature.presidentApproval, 47.5);
    EXPECT_DOUBLE_EQ(state.legislature.congressApproval, 40.0);
    EXPECT_DOUBLE_EQ(state.states["BB"].governorApproval, 46.0);
    EXPECT_DOUBLE_EQ(state.states["AA"].governorApproval, 50.0);
    EXPECT_DOUBLE_EQ(state.parties["A"].approval, 50.0);

    EventManager::adjustOfficeApproval(state, "legislature", kNationalRegion, 5.0);
    EXPECT_DOUBLE_EQ(state.states["AA"].legislatureApproval, 45.0);
    EXPECT_DOUBLE_EQ(state.states["BB"].legislatureApproval, 45.0);
}
