#include "public_opinion.h"

#include <algorithm>

PublicOpinionTracker::PublicOpinionTracker(const SimulationConfig::Opinion& settings) : m_settings(settings) {}

void PublicOpinionTracker::configure(const SimulationConfig::Opinion& settings) {
    m_settings = settings;
}

double PublicOpinionTracker::clampValue(double v) const {
    return std::clamp(v, m_settings.minValue, m_settings.maxValue);
}

IssueVector& PublicOpinionTracker::row(const std::string& region) {
    auto it = m_entries.find(region);
    if (it == m_entries.end()) {
        IssueVector fresh;
        fresh.fill(m_settings.baseline);
        it = m_entries.emplace(region, fresh).first;
    }
    return it->second;
}

double PublicOpinionTracker::value(const std::string& region, IssueArea issue) const {
    const auto it = m_entries.find(region);
    if (it == m_entries.end()) {
        return m_settings.baseline;
    }
    return it->second[issueIndex(issue)];
}

IssueVector PublicOpinionTracker::regionValues(const std::string& region) const {
    const auto it = m_entries.find(region);
    if (it != m_entries.end()) {
        return it->second;
    }
    IssueVector fresh;
    fresh.fill(m_settings.baseline);
    return fresh;
}

IssueVector PublicOpinionTracker::electorateView(const std::string& region) const {
    IssueVector view = regionValues(region);
    if (region == kNationalRegion) {
        return view;
    }
    const IssueVector national = regionValues(kNationalRegion);
    for (int i = 0; i < kIssueCount; ++i) {
        view[i] = clampValue(view[i] + national[i] - m_settings.baseline);
    }
    return view;
}

double PublicOpinionTracker::apply(double delta, const std::string& region, IssueArea issue) {
    const double bounded = std::clamp(delta, -m_settings.maxDeltaPerApply, m_settings.maxDeltaPerApply);
    double& entry = row(region)[issueIndex(issue)];
    const double before = entry;
    entry = clampValue(entry + bounded);
    return entry - before;
}

void PublicOpinionTracker::applyEffect(const EffectVector& effect, const std::string& region) {
    for (IssueArea issue : kAllIssues) {
        const double delta = effect.opinion[issueIndex(issue)];
        if (delta != 0.0) {
            apply(delta, region, issue);
        }
    }
}

void PublicOpinionTracker::decayStep() {
    const double rate = m_settings.decayRate;
    for (auto& kv : m_entries) {
        for (double& v : kv.second) {
            v = clampValue(v + rate * (m_settings.baseline - v));
        }
    }
}

void PublicOpinionTracker::ensureRegion(const std::string& region) {
    row(region);
}

void PublicOpinionTracker::setRaw(const std::string& region, IssueArea issue, double value) {
    row(region)[issueIndex(issue)] = value;
}

bool PublicOpinionTracker::withinBounds() const {
    for (const auto& kv : m_entries) {
        for (double v : kv.second) {
            if (!(v >= m_settings.minValue && v <= m_settings.maxValue)) {
                return false;
            }
        }
    }
    return true;
}
