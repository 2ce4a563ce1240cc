#pragma once

#include "simulation_context.h"

struct SimulationState;

// Monthly macro drift for the nation and every state, public finance, party income
// and approval mean reversion for parties and offices.
class EconomyModel {
public:
    explicit EconomyModel(const SimulationConfig& config);

    void tickMonth(SimulationState& state, int turn) const;

private:
    const SimulationConfig& m_config;
};
