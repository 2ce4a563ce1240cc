#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "default_scenario.h"
#include "sim_errors.h"
#include "test_support.h"
#include "turn_engine.h"

namespace {

int countHouseElections(const SimulationState& state) {
    int n = 0;
    for (const Election& e : state.elections) {
        if (e.kind == ElectionKind::House) ++n;
    }
    return n;
}

} // namespace

TEST(TurnEngineScenario, TwoYearsOfTheDefaultWorld) {
    const SimulationContext ctx(2025);
    TurnEngine engine(ctx, makeDefaultScenario(ctx));
    const TurnReport report = engine.advance(24);

    EXPECT_EQ(report.turnsAdvanced, 24);
    EXPECT_EQ(engine.state().turn, 24);
    EXPECT_EQ(engine.state().date, (SimDate{2027, 1}));

    EXPECT_EQ(countHouseElections(engine.state()), 1);
    EXPECT_NE(std::find(report.electionsResolved.begin(), report.electionsResolved.end(), "2026-11-house"),
              report.electionsResolved.end());

    int house = 0;
    int senate = 0;
    for (const auto& kv : engine.state().parties) {
        house += kv.second.houseSeats;
        senate += kv.second.senateSeats;
    }
    EXPECT_EQ(house, 435);
    EXPECT_EQ(senate, 100);
    for (const auto& kv : engine.state().states) {
        EXPECT_EQ(kv.second.legislatureSize(), 100) << kv.first;
    }
    EXPECT_TRUE(engine.state().opinion.withinBounds());
}

TEST(TurnEngineScenario, SameSeedReplaysIdentically) {
    const SimulationContext ctx(99);
    TurnEngine first(ctx, makeDefaultScenario(ctx));
    TurnEngine second(ctx, makeDefaultScenario(ctx));
    first.advance(12);
    second.advance(12);
    EXPECT_EQ(first.saveSnapshot(), second.saveSnapshot());

    const SimulationContext other(100);
    TurnEngine third(other, makeDefaultScenario(other));
    third.advance(12);
    EXPECT_NE(first.saveSnapshot(), third.saveSnapshot());
}

TEST(TurnEngineScenario, SplittingAdvanceDoesNotChangeTheOutcome) {
    const SimulationContext ctx(5);
    TurnEngine whole(ctx, makeDefaultScenario(ctx));
    TurnEngine split(ctx, makeDefaultScenario(ctx));
    whole.advance(6);
    split.advance(2);
    split.advance(0);
    split.advance(4);
    EXPECT_EQ(whole.saveSnapshot(), split.saveSnapshot());
}

class TurnEngineTest : public ::testing::Test {
protected:
    void SetUp() override { ctx = makeQuietContext(); }

    SimulationContext ctx{0};
};

TEST_F(TurnEngineTest, AdvanceZeroChangesNothing) {
    TurnEngine engine(ctx, makeRiggedState(ctx));
    const std::string before = engine.saveSnapshot();
    const TurnReport report = engine.advance(0);
    EXPECT_EQ(report.turnsAdvanced, 0);
    EXPECT_EQ(report.startDate, report.endDate);
    EXPECT_EQ(engine.saveSnapshot(), before);
    EXPECT_THROW(engine.advance(-1), InvalidIntervention);
}

TEST_F(TurnEngineTest, ManualPolicyIsVotedOnTheTurnAfterProposal) {
    TurnEngine engine(ctx, makeRiggedState(ctx));
    const std::string id = engine.proposePolicy("party:A", makeHealthcarePolicy("A", 0.2));
    EXPECT_EQ(engine.state().findPolicy(id)->status, PolicyStatus::Proposed);

    engine.advance(1);
    EXPECT_EQ(engine.state().findPolicy(id)->status, PolicyStatus::Voting);

    const TurnReport report = engine.advance(1);
    ASSERT_EQ(report.policiesResolved.size(), 1u);
    EXPECT_EQ(report.policiesResolved[0].policyId, id);
    EXPECT_EQ(engine.state().findPolicy(id)->status, PolicyStatus::Enacted);
    EXPECT_NEAR(engine.state().opinion.value(kNationalRegion, IssueArea::Healthcare), 0.19, 1e-9);
}

TEST_F(TurnEngineTest, TemplateProposalFromAStateUsesTheGovernor) {
    TurnEngine engine(ctx, makeRiggedState(ctx));
    const PolicyTemplate* stateTemplate = nullptr;
    for (const PolicyTemplate& tpl : engine.config().policyCatalog) {
        if (tpl.level == PolicyLevel::State) {
            stateTemplate = &tpl;
            break;
        }
    }
    ASSERT_NE(stateTemplate, nullptr);
    const std::string id = engine.proposePolicy("state:BB", stateTemplate->key, "BB");
    const Policy* policy = engine.state().findPolicy(id);
    ASSERT_NE(policy, nullptr);
    EXPECT_EQ(policy->sponsorParty, "A");
    EXPECT_EQ(policy->region, "BB");
}

TEST_F(TurnEngineTest, RejectedInterventionsMutateNothing) {
    TurnEngine engine(ctx, makeRiggedState(ctx));
    const std::string before = engine.saveSnapshot();

    EXPECT_THROW(engine.proposePolicy("party:Z", makeHealthcarePolicy("Z", 0.1)), InvalidIntervention);
    EXPECT_THROW(engine.proposePolicy("state:ZZ", "stimulus"), InvalidIntervention);
    EXPECT_THROW(engine.proposePolicy("party:A", "no_such_template"), InvalidIntervention);
    EXPECT_THROW(engine.triggerEvent("no_such_event"), InvalidIntervention);

    EffectVector effect;
    effect.growth = 0.01;
    EXPECT_THROW(engine.triggerEvent(effect, "ZZ"), InvalidIntervention);

    EXPECT_EQ(engine.saveSnapshot(), before);
}

TEST_F(TurnEngineTest, ManualEffectIsAppliedNextTurn) {
    TurnEngine engine(ctx, makeRiggedState(ctx));
    EffectVector effect;
    effect.opinion[issueIndex(IssueArea::Economy)] = 0.1;
    engine.triggerEvent(effect, "AA", "Factory opening");
    EXPECT_DOUBLE_EQ(engine.state().opinion.value("AA", IssueArea::Economy), 0.0);

    const TurnReport report = engine.advance(1);
    ASSERT_EQ(report.eventsFired.size(), 1u);
    EXPECT_EQ(report.eventsFired[0].region, "AA");
    EXPECT_NEAR(engine.state().opinion.value("AA", IssueArea::Economy), 0.095, 1e-9);
}

TEST_F(TurnEngineTest, ObserverCannotReenterTheEngine) {
    TurnEngine engine(ctx, makeRiggedState(ctx));
    int calls = 0;
    engine.setTurnObserver([&](const SimulationState& state, const TurnReport&) {
        ++calls;
        EXPECT_EQ(state.turn, calls);
        EXPECT_THROW(engine.proposePolicy("party:A", makeHealthcarePolicy("A", 0.1)), InvalidIntervention);
        EXPECT_THROW(engine.advance(1), InvalidIntervention);
    });
    engine.advance(3);
    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(engine.state().policies.empty());

    engine.setTurnObserver(nullptr);
    EXPECT_NO_THROW(engine.proposePolicy("party:A", makeHealthcarePolicy("A", 0.1)));
}

TEST_F(TurnEngineTest, FaultKeepsTheLastCompletedTurn) {
    SimulationState initial = makeRiggedState(ctx);
    initial.date = SimDate{2026, 10};
    initial.parties["A"].fieldsCandidates = false;
    initial.parties["B"].fieldsCandidates = false;
    TurnEngine engine(ctx, initial);

    engine.advance(1);
    ASSERT_EQ(engine.state().date, (SimDate{2026, 11}));
    const std::string before = engine.saveSnapshot();

    // November 2026 has elections and nobody to run in them.
    EXPECT_THROW(engine.advance(3), SimulationFault);
    EXPECT_EQ(engine.state().turn, 1);
    EXPECT_EQ(engine.saveSnapshot(), before);

    // The engine is idle again afterwards.
    EXPECT_THROW(engine.advance(1), SimulationFault);
    EXPECT_NO_THROW(engine.triggerEvent(EffectVector{}, kNationalRegion));
}

TEST_F(TurnEngineTest, InvalidInitialStateIsAConfigurationFault) {
    SimulationState broken = makeRiggedState(ctx);
    broken.legislature.houseSize = 5;
    EXPECT_THROW((TurnEngine{ctx, broken}), ConfigurationFault);
}

TEST_F(TurnEngineTest, OneShotEventCanBeQueuedOnlyOnce) {
    EventDefinition ruling;
    ruling.key = "ruling";
    ruling.name = "Ruling";
    ruling.trigger.kind = TriggerKind::Manual;
    ruling.effect.opinion[issueIndex(IssueArea::Healthcare)] = 0.1;
    ctx.config.eventCatalog = {ruling};

    TurnEngine engine(ctx, makeRiggedState(ctx));
    engine.triggerEvent("ruling");
    EXPECT_THROW(engine.triggerEvent("ruling"), InvalidIntervention);
    EXPECT_EQ(engine.state().events.forcedQueue.size(), 1u);

    const TurnReport report = engine.advance(1);
    ASSERT_EQ(report.eventsFired.size(), 1u);
    EXPECT_NEAR(engine.state().opinion.value(kNationalRegion, IssueArea::Healthcare), 0.095, 1e-9);
    EXPECT_THROW(engine.triggerEvent("ruling"), InvalidIntervention);
}

TEST_F(TurnEngineTest, OfficeApprovalRevertsTowardItsBaseline) {
    SimulationState initial = makeRiggedState(ctx);
    initial.legislature.presidentApproval = 60.0;
    initial.states["AA"].legislatureApproval = 30.0;
    TurnEngine engine(ctx, initial);
    engine.advance(1);
    EXPECT_DOUBLE_EQ(engine.state().legislature.presidentApproval, 59.5);
    EXPECT_DOUBLE_EQ(engine.state().legislature.congressApproval, 40.0);
    EXPECT_DOUBLE_EQ(engine.state().states.at("AA").legislatureApproval, 30.5);
}

TEST_F(TurnEngineTest, ResolvedPolicyHistoryIsBounded) {
    ctx.config.world.policyHistory = 1;
    TurnEngine engine(ctx, makeRiggedState(ctx));
    const std::string first = engine.proposePolicy("party:A", makeHealthcarePolicy("A", 0.1));
    const std::string second = engine.proposePolicy("party:A", makeHealthcarePolicy("A", 0.1));
    engine.advance(1);
    const std::string pending = engine.proposePolicy("party:A", makeHealthcarePolicy("A", 0.1));
    engine.advance(1);

    EXPECT_EQ(engine.state().findPolicy(first), nullptr);
    ASSERT_NE(engine.state().findPolicy(second), nullptr);
    EXPECT_EQ(engine.state().findPolicy(second)->status, PolicyStatus::Enacted);
    ASSERT_NE(engine.state().findPolicy(pending), nullptr);
    EXPECT_EQ(engine.state().findPolicy(pending)->status, PolicyStatus::Voting);
    EXPECT_EQ(engine.state().nextPolicyId, 4);
}

TEST(SimulationHistory, PruningKeepsTheNewestElections) {
    SimulationState state;
    for (const char* id : {"2022-11-house", "2024-11-house", "2026-11-house"}) {
        Election e;
        e.id = id;
        e.status = ElectionStatus::Resolved;
        state.elections.push_back(e);
    }
    pruneHistory(state, 2, 10);
    ASSERT_EQ(state.elections.size(), 2u);
    EXPECT_EQ(state.elections.front().id, "2024-11-house");
    pruneHistory(state, 0, 10);
    EXPECT_TRUE(state.elections.empty());
}
