#include <gtest/gtest.h>

#include <cstddef>
#include <random>

#include "public_opinion.h"
#include "simulation_context.h"

namespace {

SimulationConfig::Opinion defaultSettings() {
    return SimulationConfig{}.opinion;
}

} // namespace

TEST(PublicOpinionTracker, MissingEntriesReadAsBaseline) {
    PublicOpinionTracker tracker(defaultSettings());
    EXPECT_DOUBLE_EQ(tracker.value("CA", IssueArea::Economy), 0.0);
    EXPECT_TRUE(tracker.entries().empty());
}

TEST(PublicOpinionTracker, SingleApplyIsClampedToMaxDelta) {
    PublicOpinionTracker tracker(defaultSettings());
    const double applied = tracker.apply(0.9, kNationalRegion, IssueArea::Healthcare);
    EXPECT_DOUBLE_EQ(applied, 0.25);
    EXPECT_DOUBLE_EQ(tracker.value(kNationalRegion, IssueArea::Healthcare), 0.25);
}

TEST(PublicOpinionTracker, ValuesNeverLeaveBounds) {
    PublicOpinionTracker tracker(defaultSettings());
    for (int i = 0; i < 10; ++i) {
        tracker.apply(0.25, "TX", IssueArea::Security);
    }
    EXPECT_DOUBLE_EQ(tracker.value("TX", IssueArea::Security), 1.0);
    EXPECT_DOUBLE_EQ(tracker.apply(0.25, "TX", IssueArea::Security), 0.0);

    for (int i = 0; i < 20; ++i) {
        tracker.apply(-0.25, "TX", IssueArea::Security);
    }
    EXPECT_DOUBLE_EQ(tracker.value("TX", IssueArea::Security), -1.0);
    EXPECT_TRUE(tracker.withinBounds());
}

TEST(PublicOpinionTracker, RandomApplyAndDecaySequenceStaysInBounds) {
    PublicOpinionTracker tracker(defaultSettings());
    std::mt19937_64 rng(12345);
    const char* regions[] = {"national", "CA", "TX", "NY"};
    for (int step = 0; step < 2000; ++step) {
        const double delta = (SimulationContext::u01FromU64(rng()) * 2.0 - 1.0) * 0.6;
        const IssueArea issue = kAllIssues[static_cast<std::size_t>(rng() % kAllIssues.size())];
        tracker.apply(delta, regions[rng() % 4], issue);
        if (step % 7 == 0) {
            tracker.decayStep();
        }
        ASSERT_TRUE(tracker.withinBounds()) << "step " << step;
    }
}

TEST(PublicOpinionTracker, DecayMovesFivePercentTowardBaseline) {
    PublicOpinionTracker tracker(defaultSettings());
    tracker.apply(0.2, kNationalRegion, IssueArea::Healthcare);
    tracker.apply(-0.1, "CA", IssueArea::Economy);
    tracker.decayStep();
    EXPECT_NEAR(tracker.value(kNationalRegion, IssueArea::Healthcare), 0.19, 1e-12);
    EXPECT_NEAR(tracker.value("CA", IssueArea::Economy), -0.095, 1e-12);
}

TEST(PublicOpinionTracker, DecayTowardsNonZeroBaseline) {
    SimulationConfig::Opinion settings = defaultSettings();
    settings.baseline = 0.5;
    settings.decayRate = 0.5;
    PublicOpinionTracker tracker(settings);
    tracker.ensureRegion("OH");
    tracker.apply(-0.25, "OH", IssueArea::Education); // 0.5 -> 0.25
    tracker.decayStep();
    EXPECT_NEAR(tracker.value("OH", IssueArea::Education), 0.375, 1e-12);
    EXPECT_NEAR(tracker.value("OH", IssueArea::Economy), 0.5, 1e-12);
}

TEST(PublicOpinionTracker, ApplyEffectTouchesOnlyNonZeroIssues) {
    PublicOpinionTracker tracker(defaultSettings());
    EffectVector effect;
    effect.opinion[issueIndex(IssueArea::Environment)] = 0.1;
    effect.opinion[issueIndex(IssueArea::Immigration)] = -0.05;
    tracker.applyEffect(effect, "WA");
    EXPECT_DOUBLE_EQ(tracker.value("WA", IssueArea::Environment), 0.1);
    EXPECT_DOUBLE_EQ(tracker.value("WA", IssueArea::Immigration), -0.05);
    EXPECT_DOUBLE_EQ(tracker.value("WA", IssueArea::Economy), 0.0);
}
