#include <gtest/gtest.h>

#include <cstdint>
#include <fstream>
#include <random>
#include <string>

#include "sim_errors.h"
#include "simulation_context.h"

namespace {

std::string writeConfig(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
}

} // namespace

TEST(SimulationContext, EmptyPathUsesDefaults) {
    SimulationContext ctx(1);
    EXPECT_EQ(ctx.configHash, "defaults");
    EXPECT_EQ(ctx.config.world.houseSeats, 435);
    EXPECT_EQ(ctx.config.world.senateSeats, 100);
    EXPECT_FALSE(ctx.config.policyCatalog.empty());
    EXPECT_FALSE(ctx.config.eventCatalog.empty());
}

TEST(SimulationContext, FileOverridesOnlyTheKeysItNames) {
    const std::string path = writeConfig("ussim_partial.toml",
                                         "[opinion]\n"
                                         "decayRate = 0.1\n"
                                         "[legislature]\n"
                                         "vetoEnabled = false\n");
    SimulationContext ctx(1, path);
    EXPECT_DOUBLE_EQ(ctx.config.opinion.decayRate, 0.1);
    EXPECT_FALSE(ctx.config.legislature.vetoEnabled);
    EXPECT_DOUBLE_EQ(ctx.config.opinion.maxDeltaPerApply, 0.25);
    EXPECT_NE(ctx.configHash, "defaults");
}

TEST(SimulationContext, FractionalSeatCountIsRejected) {
    const std::string path = writeConfig("ussim_fractional.toml", "[world]\nhouseSeats = 435.5\n");
    EXPECT_THROW(SimulationContext(1, path), ConfigurationFault);

    SimulationContext ctx(1);
    std::string err;
    EXPECT_FALSE(ctx.loadConfig(path, &err));
    EXPECT_NE(err.find("houseSeats"), std::string::npos);
}

TEST(SimulationContext, IntegralFloatSeatCountIsAccepted) {
    const std::string path = writeConfig("ussim_integral.toml", "[world]\nhouseSeats = 435.0\n");
    SimulationContext ctx(1, path);
    EXPECT_EQ(ctx.config.world.houseSeats, 435);
}

TEST(SimulationContext, SeatCountBeyondIntRangeIsRejected) {
    const std::string big = writeConfig("ussim_bigseats.toml", "[world]\nhouseSeats = 4294967731\n");
    SimulationContext ctx(1);
    std::string err;
    EXPECT_FALSE(ctx.loadConfig(big, &err));
    EXPECT_NE(err.find("houseSeats"), std::string::npos);
    EXPECT_THROW(SimulationContext(1, big), ConfigurationFault);

    const std::string bigFloat = writeConfig("ussim_bigseats_float.toml", "[world]\nsenateSeats = 1.0e12\n");
    EXPECT_THROW(SimulationContext(1, bigFloat), ConfigurationFault);
}

TEST(SimulationContext, IntegerSettingBeyondIntRangeIsRejected) {
    const std::string path = writeConfig("ussim_bigint.toml", "[ai]\nmaxPendingPerActor = 4294967297\n");
    EXPECT_THROW(SimulationContext(1, path), ConfigurationFault);
}

TEST(SimulationContext, OfficeApprovalSettingsAreRead) {
    const std::string path = writeConfig("ussim_office.toml",
                                         "[legislature]\n"
                                         "courtPenalty = 0.1\n"
                                         "[economy]\n"
                                         "congressApprovalBaseline = 45.0\n"
                                         "[world]\n"
                                         "policyHistory = 5\n");
    SimulationContext ctx(1, path);
    EXPECT_DOUBLE_EQ(ctx.config.legislature.courtPenalty, 0.1);
    EXPECT_DOUBLE_EQ(ctx.config.economy.congressApprovalBaseline, 45.0);
    EXPECT_EQ(ctx.config.world.policyHistory, 5);
    EXPECT_EQ(ctx.config.world.electionHistory, 12);
}

TEST(SimulationContext, OfficeApprovalConsequenceNeedsAKnownOffice) {
    const std::string path = writeConfig("ussim_office_event.toml",
                                         "[[event]]\n"
                                         "key = \"impeachment\"\n"
                                         "name = \"Impeachment\"\n"
                                         "trigger = \"manual\"\n"
                                         "consequences = [ { kind = \"office_approval\", target = \"mayor\", amount = -3.0 } ]\n");
    EXPECT_THROW(SimulationContext(1, path), ConfigurationFault);
}

TEST(SimulationContext, ParseErrorIsAConfigurationFault) {
    const std::string path = writeConfig("ussim_broken.toml", "[world\nhouseSeats = \n");
    EXPECT_THROW(SimulationContext(1, path), ConfigurationFault);
}

TEST(SimulationContext, OutOfRangeValueIsAConfigurationFault) {
    const std::string path = writeConfig("ussim_range.toml", "[legislature]\nsupermajority = 0.4\n");
    EXPECT_THROW(SimulationContext(1, path), ConfigurationFault);
}

TEST(SimulationContext, PolicyArrayReplacesBuiltInCatalog) {
    const std::string path = writeConfig("ussim_catalog.toml",
                                         "event = []\n"
                                         "\n"
                                         "[[policy]]\n"
                                         "key = \"clinics\"\n"
                                         "title = \"Rural Clinics\"\n"
                                         "level = \"state\"\n"
                                         "issue = \"healthcare\"\n"
                                         "cost = 1.5\n"
                                         "opinion = { healthcare = 0.05 }\n");
    SimulationContext ctx(1, path);
    ASSERT_EQ(ctx.config.policyCatalog.size(), 1u);
    EXPECT_TRUE(ctx.config.eventCatalog.empty());

    const PolicyTemplate* clinics = ctx.config.findPolicy("clinics");
    ASSERT_NE(clinics, nullptr);
    EXPECT_EQ(clinics->level, PolicyLevel::State);
    EXPECT_DOUBLE_EQ(clinics->cost, 1.5);
    EXPECT_DOUBLE_EQ(clinics->effect.opinion[issueIndex(IssueArea::Healthcare)], 0.05);
    EXPECT_EQ(ctx.config.findPolicy("stimulus"), nullptr);
}

TEST(SimulationContext, EventChainingAnUnknownEventFailsValidation) {
    const std::string path = writeConfig("ussim_chain.toml",
                                         "[[event]]\n"
                                         "key = \"riot\"\n"
                                         "name = \"Riot\"\n"
                                         "trigger = \"manual\"\n"
                                         "consequences = [ { kind = \"chain_event\", target = \"curfew\" } ]\n");
    EXPECT_THROW(SimulationContext(1, path), ConfigurationFault);
}

TEST(RngStreams, StreamsAreKeyedAndCounted) {
    RngStreams streams;
    streams.seed = 42;

    std::mt19937_64 a = streams.open("party:A", 3);
    std::mt19937_64 b = streams.open("party:B", 3);
    EXPECT_NE(a(), b());
    EXPECT_EQ(streams.counters.at("party:A"), 1u);

    std::mt19937_64 again = streams.open("party:A", 3);
    EXPECT_EQ(streams.counters.at("party:A"), 2u);

    RngStreams fresh;
    fresh.seed = 42;
    std::mt19937_64 first = fresh.open("party:A", 3);
    EXPECT_NE(first(), again());
}

TEST(RngStreams, SameSeedKeyTurnAndCounterGiveTheSameDraws) {
    const std::uint64_t x = SimulationContext::deriveStreamSeed(9, "events", 12, 0);
    EXPECT_EQ(x, SimulationContext::deriveStreamSeed(9, "events", 12, 0));
    EXPECT_NE(x, SimulationContext::deriveStreamSeed(9, "events", 13, 0));
    EXPECT_NE(x, SimulationContext::deriveStreamSeed(10, "events", 12, 0));

    const double u = SimulationContext::u01FromU64(~0ull);
    EXPECT_GE(u, 0.0);
    EXPECT_LT(u, 1.0);
}
