#pragma once

#include <string>

#include "simulation_state.h"

constexpr int kSnapshotVersion = 2;

// Canonical JSON text of the whole state. Identical states give byte-identical text.
std::string saveSnapshot(const SimulationState& state);

// Parses and validates a snapshot. Throws LoadError on malformed input, missing
// fields (including RNG stream counters) or a state that breaks an invariant.
SimulationState loadSnapshot(const std::string& text, const SimulationConfig& config);

void saveSnapshotFile(const SimulationState& state, const std::string& path);
SimulationState loadSnapshotFile(const std::string& path, const SimulationConfig& config);
