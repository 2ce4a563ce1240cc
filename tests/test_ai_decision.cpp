#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "ai_decision.h"
#include "default_scenario.h"
#include "policy_pipeline.h"
#include "simulation_state.h"
#include "test_support.h"

class AIDecisionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx = SimulationContext(2025);
        state = makeDefaultScenario(ctx);
    }

    std::vector<const Actor*> view(const std::vector<std::unique_ptr<Actor>>& actors) const {
        std::vector<const Actor*> out;
        for (const auto& a : actors) out.push_back(a.get());
        return out;
    }

    SimulationContext ctx{0};
    SimulationState state;
};

TEST_F(AIDecisionEngineTest, ActorsAreSortedById) {
    PolicyPipeline pipeline(ctx.config);
    AIDecisionEngine engine(ctx.config, pipeline);
    const auto actors = engine.buildActors(state);
    ASSERT_EQ(actors.size(), state.parties.size() + state.states.size());
    for (std::size_t i = 1; i < actors.size(); ++i) {
        EXPECT_LT(actors[i - 1]->id(), actors[i]->id());
    }
    EXPECT_EQ(actors.front()->id(), "party:Democrat");
}

TEST_F(AIDecisionEngineTest, IntentsDoNotDependOnActorOrder) {
    PolicyPipeline pipeline(ctx.config);
    AIDecisionEngine engine(ctx.config, pipeline);
    const auto actors = engine.buildActors(state);

    std::vector<const Actor*> forward = view(actors);
    std::vector<const Actor*> reversed = forward;
    std::reverse(reversed.begin(), reversed.end());

    RngStreams first = state.rng;
    RngStreams second = state.rng;
    const std::vector<Intent> a = engine.collectIntents(state, first, 1, forward);
    const std::vector<Intent> b = engine.collectIntents(state, second, 1, reversed);
    ASSERT_EQ(a.size(), actors.size());
    EXPECT_TRUE(a == b);
    EXPECT_EQ(first.counters, second.counters);
}

TEST_F(AIDecisionEngineTest, DecisionsReadOnlyTheSnapshot) {
    PolicyPipeline pipeline(ctx.config);
    AIDecisionEngine engine(ctx.config, pipeline);
    const auto actors = engine.buildActors(state);
    const std::string before = state.news.getEvents().back();

    RngStreams streams = state.rng;
    engine.collectIntents(state, streams, 1, view(actors));
    EXPECT_TRUE(state.policies.empty());
    EXPECT_EQ(state.news.getEvents().back(), before);
}

TEST_F(AIDecisionEngineTest, ReplayingTheSameTurnGivesTheSameIntents) {
    PolicyPipeline pipeline(ctx.config);
    AIDecisionEngine engine(ctx.config, pipeline);
    const auto actors = engine.buildActors(state);
    RngStreams first = state.rng;
    RngStreams second = state.rng;
    EXPECT_TRUE(engine.collectIntents(state, first, 5, view(actors)) ==
                engine.collectIntents(state, second, 5, view(actors)));
}

TEST(AIDecisionStaleIntents, RejectedIntentsAreReportedNotDropped) {
    SimulationContext ctx = makeQuietContext();
    SimulationState state = makeRiggedState(ctx);
    PolicyPipeline pipeline(ctx.config);
    AIDecisionEngine engine(ctx.config, pipeline);

    Intent campaign;
    campaign.actorId = "party:B";
    campaign.kind = IntentKind::Campaign;
    campaign.targetState = "AA";
    campaign.amount = 30.0;

    Intent fundraise;
    fundraise.actorId = "party:A";
    fundraise.kind = IntentKind::AdjustBudget;
    fundraise.amount = 10.0;

    Intent cut;
    cut.actorId = "state:BB";
    cut.kind = IntentKind::AdjustBudget;
    cut.targetState = "BB";
    cut.amount = 1.0;

    // An event drained B's treasury after the intents were chosen.
    state.parties["B"].treasury = 5.0;

    const std::vector<std::string> faults = engine.applyIntents(state, {cut, campaign, fundraise}, 1);
    ASSERT_EQ(faults.size(), 2u);
    EXPECT_NE(faults[0].find("party:B"), std::string::npos);
    EXPECT_NE(faults[0].find("treasury"), std::string::npos);
    EXPECT_NE(faults[1].find("state:BB"), std::string::npos);

    EXPECT_DOUBLE_EQ(state.parties["A"].treasury, 60.0);
    EXPECT_DOUBLE_EQ(state.parties["B"].treasury, 5.0);
    EXPECT_TRUE(state.states["AA"].campaignSpend.empty());
}

TEST(AIDecisionStaleIntents, ProposalLimitIsEnforcedAtApplyTime) {
    SimulationContext ctx = makeQuietContext();
    SimulationState state = makeRiggedState(ctx);
    PolicyPipeline pipeline(ctx.config);
    AIDecisionEngine engine(ctx.config, pipeline);

    Intent stimulus;
    stimulus.actorId = "party:A";
    stimulus.kind = IntentKind::ProposePolicy;
    stimulus.policyKey = "stimulus";
    Intent infrastructure = stimulus;
    infrastructure.policyKey = "infrastructure";

    const std::vector<std::string> faults = engine.applyIntents(state, {stimulus, infrastructure}, 1);
    ASSERT_EQ(state.policies.size(), 1u);
    EXPECT_EQ(state.policies[0].templateKey, "stimulus");
    EXPECT_EQ(state.policies[0].proposedTurn, 1);
    ASSERT_EQ(faults.size(), 1u);
    EXPECT_NE(faults[0].find("limit"), std::string::npos);
}
