#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "simulation_state.h"

struct StateSeed {
    const char* id;
    const char* name;
    std::int64_t population;
    double margin; // Democratic minus Republican presidential margin, percentage points
    int houseSeats;
    bool democraticGovernor;
};

// 50 states, 2020 census populations and apportionment.
const std::vector<StateSeed>& getDefaultStateSeeds();

// January 2025: 435 districts (D 213 / R 222), 100 senators (D 47 / R 53), Republican president.
// Throws ConfigurationFault when the configured chamber sizes do not match the seed table.
SimulationState makeDefaultScenario(const SimulationContext& ctx);
