#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "catalog.h"

struct SimulationConfig {
    struct World {
        int startYear = 2025;
        int startMonth = 1;
        int houseSeats = 435;
        int senateSeats = 100;
        int stateLegislatureSeats = 100;
        bool deterministicMode = true;
        int electionHistory = 12; // resolved elections kept in the state
        int policyHistory = 60;   // enacted or rejected policies kept in the state
    } world{};

    struct Opinion {
        double minValue = -1.0;
        double maxValue = 1.0;
        double baseline = 0.0;
        double decayRate = 0.05;        // fraction of the gap to baseline closed per turn
        double maxDeltaPerApply = 0.25; // single apply() is clamped to +/- this
    } opinion{};

    struct Legislature {
        double simpleMajority = 0.5;
        double supermajority = 2.0 / 3.0;
        double sponsorLoyalty = 0.3;
        double alignmentWeight = 0.5;
        bool vetoEnabled = true;
        double approvalOnEnact = 1.0;
        double approvalOnReject = -0.5;
        double presidentApprovalOnEnact = 1.0;        // federal bill of the president's party
        double governorApprovalOnEnact = 0.8;         // state bill of the governor's party
        double stateLegislatureApprovalOnEnact = 0.4; // any enacted state bill
        double courtPenalty = 0.05;                   // yes share lost to an opposed court
        double courtInflationThreshold = 0.7;         // inflation effect the court takes up
    } legislature{};

    struct Elections {
        int month = 11;
        double incumbencyBonus = 0.04;
        double campaignWeight = 0.05;
        double campaignSpendScale = 5.0; // millions; spend is scored as log1p(spend / scale)
        double opinionWeight = 0.1;
        double approvalWeight = 0.05;
        double officeApprovalWeight = 0.05;
        double houseFlipPresidentApproval = 1.0; // sign follows who won the House
        double houseFlipCongressApproval = 0.5;
        double senateFlipPresidentApproval = 0.5;
        double leanWeight = 1.0;
        double noise = 0.03;
        int senateCycleAnchorYear = 2024;
    } elections{};

    struct Events {
        double randomEventChance = 0.35;
        int maxRandomPerTurn = 1;
        int recentMemory = 12;
    } events{};

    struct AI {
        bool enabled = true;
        double opinionWeight = 1.0;
        double alignmentWeight = 0.5;
        double costWeight = 0.001;
        double campaignWeight = 0.3;
        double budgetWeight = 0.4;
        double jitter = 0.05;
        double campaignCost = 5.0;
        double fundraiseAmount = 10.0;
        double treasuryTarget = 100.0;
        int maxPendingPerActor = 1;
    } ai{};

    struct Economy {
        double growthDrift = 0.002;
        double inflationDrift = 0.05;
        double unemploymentDrift = 0.05;
        double minGrowth = -0.05;
        double maxGrowth = 0.06;
        double minInflation = 0.0;
        double maxInflation = 10.0;
        double minUnemployment = 2.5;
        double maxUnemployment = 20.0;
        double stateGrowthNoise = 0.01;
        double stateSpendingReversion = 0.2;
        double stateSpendingNoise = 1.0;
        double federalTaxRate = 0.18;
        double partyIncome = 2.0;
        double approvalBaseline = 50.0;
        double approvalReversion = 0.05;
        double presidentApprovalBaseline = 50.0;
        double congressApprovalBaseline = 40.0;
        double governorApprovalBaseline = 50.0;
        double stateLegislatureApprovalBaseline = 40.0;
    } economy{};

    std::vector<PolicyTemplate> policyCatalog = getDefaultPolicyCatalog();
    std::vector<EventDefinition> eventCatalog = getDefaultEventCatalog();

    const PolicyTemplate* findPolicy(const std::string& key) const;
    const EventDefinition* findEvent(const std::string& key) const;

    // Throws ConfigurationFault on out-of-range constants or a broken catalog.
    void validate() const;
};

// Named, counted random streams. Every draw site opens its own stream so results
// never depend on which other actors or subsystems ran before it.
struct RngStreams {
    std::uint64_t seed = 0;
    std::map<std::string, std::uint64_t> counters;

    std::mt19937_64 open(const std::string& key, int turn);
};

struct SimulationContext {
    std::uint64_t worldSeed = 0;
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    // Throws ConfigurationFault when the file cannot be parsed or holds invalid values.
    explicit SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath = std::string());

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);
    static std::uint64_t hashStringFNV1a(const std::string& text);

    static std::uint64_t mix64(std::uint64_t x);
    static std::uint64_t deriveStreamSeed(std::uint64_t seed, const std::string& key, int turn, std::uint64_t counter);
    static double u01FromU64(std::uint64_t x);
};
