#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>

// Issue areas tracked by public opinion, party platforms and policy effects.
enum class IssueArea : std::uint8_t {
    Economy = 0,
    Healthcare = 1,
    Education = 2,
    Environment = 3,
    Security = 4,
    Immigration = 5,
    Count = 6
};

constexpr int kIssueCount = static_cast<int>(IssueArea::Count);
constexpr std::array<IssueArea, kIssueCount> kAllIssues = {
    IssueArea::Economy,
    IssueArea::Healthcare,
    IssueArea::Education,
    IssueArea::Environment,
    IssueArea::Security,
    IssueArea::Immigration
};

using IssueVector = std::array<double, kIssueCount>;

// party id -> value (lean, vote share, spend). Ordered so iteration never depends on hashing.
using PartyShares = std::map<std::string, double>;

const char* issueKey(IssueArea issue);
bool parseIssueKey(const std::string& key, IssueArea& out);

inline int issueIndex(IssueArea issue) {
    return static_cast<int>(issue);
}

enum class Chamber : std::uint8_t {
    House,
    Senate,
    StateLegislature
};

const char* chamberKey(Chamber chamber);

// Opinion/economy region used for national-level effects. Every other region is a state id.
extern const char* const kNationalRegion;

// Calendar month of the simulation clock. Turns are whole months.
struct SimDate {
    int year = 2025;
    int month = 1; // 1..12

    int monthIndex() const { return year * 12 + (month - 1); }
    void advanceMonth();
    std::string toString() const; // "YYYY-MM"
};

inline bool operator==(const SimDate& a, const SimDate& b) {
    return a.year == b.year && a.month == b.month;
}

inline bool operator!=(const SimDate& a, const SimDate& b) {
    return !(a == b);
}

// Numeric deltas applied atomically by an enacted policy or a fired event.
struct EffectVector {
    double growth = 0.0;       // GDP growth, fraction per year
    double unemployment = 0.0; // percentage points
    double inflation = 0.0;    // percentage points
    double budget = 0.0;       // billions; positive raises spending, negative raises revenue
    IssueVector opinion{};     // opinion delta by issue

    bool hasOpinionEffect() const;
};

// Books a budget delta: positive amounts are spending, negative ones are revenue.
void applyBudgetDelta(double amount, double& revenue, double& spending);
