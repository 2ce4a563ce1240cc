#pragma once

#include <map>
#include <string>

#include "sim_types.h"
#include "simulation_context.h"

// (region, issue) -> approval scalar. Region is kNationalRegion or a state id.
// Every mutation clamps into [min, max]; missing entries read as the baseline.
class PublicOpinionTracker {
public:
    PublicOpinionTracker() = default;
    explicit PublicOpinionTracker(const SimulationConfig::Opinion& settings);

    void configure(const SimulationConfig::Opinion& settings);

    double value(const std::string& region, IssueArea issue) const;
    IssueVector regionValues(const std::string& region) const;
    // What voters in `region` see: the regional row shifted by the national row's
    // distance from the baseline, clamped. The national region reads its own row.
    IssueVector electorateView(const std::string& region) const;

    // Adds delta (itself clamped to +/- maxDeltaPerApply). Returns the change actually applied.
    double apply(double delta, const std::string& region, IssueArea issue);
    void applyEffect(const EffectVector& effect, const std::string& region);

    // One pass moving every entry decayRate of the way toward the baseline.
    void decayStep();

    void ensureRegion(const std::string& region);
    // Raw write used by scenario setup and snapshot loading. Not clamped.
    void setRaw(const std::string& region, IssueArea issue, double value);

    bool withinBounds() const;
    const std::map<std::string, IssueVector>& entries() const { return m_entries; }

    double minValue() const { return m_settings.minValue; }
    double maxValue() const { return m_settings.maxValue; }
    double baseline() const { return m_settings.baseline; }

private:
    double clampValue(double v) const;
    IssueVector& row(const std::string& region);

    SimulationConfig::Opinion m_settings{};
    std::map<std::string, IssueVector> m_entries;
};
