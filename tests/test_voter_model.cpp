#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "simulation_state.h"
#include "test_support.h"
#include "voter_model.h"

TEST(VoterModelTieBreak, NonIncumbentTieGoesToFirstPartyId) {
    const PartyShares shares = {{"A", 0.5}, {"B", 0.5}};
    EXPECT_EQ(VoterModel::pickWinner(shares, ""), "A");
    EXPECT_EQ(VoterModel::pickWinner(shares, "C"), "A");
}

TEST(VoterModelTieBreak, IncumbentAmongTiedKeepsSeat) {
    const PartyShares shares = {{"A", 0.5}, {"B", 0.5}};
    EXPECT_EQ(VoterModel::pickWinner(shares, "B"), "B");
}

TEST(VoterModelTieBreak, PluralityBeatsIncumbency) {
    const PartyShares shares = {{"A", 0.3}, {"B", 0.45}, {"C", 0.25}};
    EXPECT_EQ(VoterModel::pickWinner(shares, "A"), "B");
    EXPECT_TRUE(VoterModel::pickWinner(PartyShares{}, "A").empty());
}

class VoterModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx = makeQuietContext();
        ctx.config.elections.noise = 0.0;
        state = makeRiggedState(ctx);
    }

    SimulationContext ctx{0};
    SimulationState state;
};

TEST_F(VoterModelTest, SharesAreNormalized) {
    VoterModel model(ctx.config);
    std::mt19937_64 rng(1);
    const PartyShares shares = model.voteShares(state, "AA", state.states["AA"].lean, "", {"A", "B"}, rng);
    ASSERT_EQ(shares.size(), 2u);
    EXPECT_NEAR(shares.at("A") + shares.at("B"), 1.0, 1e-12);
}

TEST_F(VoterModelTest, VacantSeatHasNoIncumbencyBonus) {
    // Same platform so only incumbency can separate the parties.
    state.parties["B"].platform = state.parties["A"].platform;
    VoterModel model(ctx.config);
    std::mt19937_64 rng(1);
    const PartyShares vacant = model.voteShares(state, "AA", state.states["AA"].lean, "", {"A", "B"}, rng);
    EXPECT_DOUBLE_EQ(vacant.at("A"), vacant.at("B"));
    EXPECT_EQ(VoterModel::pickWinner(vacant, ""), "A");

    const PartyShares held = model.voteShares(state, "AA", state.states["AA"].lean, "B", {"A", "B"}, rng);
    EXPECT_GT(held.at("B"), held.at("A"));
}

TEST_F(VoterModelTest, CampaignSpendRaisesShare) {
    state.parties["B"].platform = state.parties["A"].platform;
    VoterModel model(ctx.config);
    std::mt19937_64 rng(1);
    state.states["AA"].campaignSpend["B"] = 20.0;
    const PartyShares shares = model.voteShares(state, "AA", state.states["AA"].lean, "", {"A", "B"}, rng);
    EXPECT_GT(shares.at("B"), shares.at("A"));
}

TEST_F(VoterModelTest, CandidateOrderDoesNotChangeShares) {
    ctx.config.elections.noise = 0.05;
    VoterModel model(ctx.config);
    std::mt19937_64 first(99);
    std::mt19937_64 second(99);
    const PartyShares forward = model.voteShares(state, "BB", state.states["BB"].lean, "A", {"A", "B"}, first);
    const PartyShares reversed = model.voteShares(state, "BB", state.states["BB"].lean, "A", {"B", "A"}, second);
    EXPECT_EQ(forward, reversed);
}

TEST_F(VoterModelTest, NationalOpinionReachesStateElectorates) {
    VoterModel model(ctx.config);
    std::mt19937_64 rng(1);
    const PartyShares before = model.voteShares(state, "AA", state.states["AA"].lean, "", {"A", "B"}, rng);

    // A federal healthcare program moved the national row only.
    state.opinion.setRaw(kNationalRegion, IssueArea::Healthcare, 1.0);
    EXPECT_DOUBLE_EQ(state.opinion.value("AA", IssueArea::Healthcare), 0.0);
    EXPECT_DOUBLE_EQ(state.opinion.electorateView("AA")[issueIndex(IssueArea::Healthcare)], 1.0);

    const PartyShares after = model.voteShares(state, "AA", state.states["AA"].lean, "", {"A", "B"}, rng);
    EXPECT_GT(after.at("A"), before.at("A"));
}

TEST_F(VoterModelTest, ElectorateViewIsClampedToTheOpinionBounds) {
    state.opinion.setRaw(kNationalRegion, IssueArea::Healthcare, 0.8);
    state.opinion.setRaw("BB", IssueArea::Healthcare, 0.6);
    EXPECT_DOUBLE_EQ(state.opinion.electorateView("BB")[issueIndex(IssueArea::Healthcare)], 1.0);
    EXPECT_DOUBLE_EQ(state.opinion.electorateView(kNationalRegion)[issueIndex(IssueArea::Healthcare)], 0.8);
}

TEST_F(VoterModelTest, OfficeApprovalFollowsTheOfficeHolders) {
    state.parties["B"].platform = state.parties["A"].platform;
    VoterModel model(ctx.config);
    EXPECT_DOUBLE_EQ(model.officeApproval(state, &state.states["AA"], "A"), 0.0);

    state.legislature.presidentApproval = 30.0;
    state.states["AA"].governorApproval = 40.0;
    EXPECT_NEAR(model.officeApproval(state, &state.states["AA"], "A"), -0.6, 1e-12);
    EXPECT_DOUBLE_EQ(model.officeApproval(state, &state.states["BB"], "A"), -0.4);
    EXPECT_DOUBLE_EQ(model.officeApproval(state, &state.states["AA"], "B"), 0.0);

    std::mt19937_64 rng(1);
    const PartyShares shares = model.voteShares(state, "AA", state.states["AA"].lean, "", {"A", "B"}, rng);
    EXPECT_LT(shares.at("A"), shares.at("B"));
}
