#include "sim_types.h"

#include <cstdio>

const char* const kNationalRegion = "national";

const char* issueKey(IssueArea issue) {
    switch (issue) {
        case IssueArea::Economy: return "economy";
        case IssueArea::Healthcare: return "healthcare";
        case IssueArea::Education: return "education";
        case IssueArea::Environment: return "environment";
        case IssueArea::Security: return "security";
        case IssueArea::Immigration: return "immigration";
        case IssueArea::Count: break;
    }
    return "unknown";
}

bool parseIssueKey(const std::string& key, IssueArea& out) {
    for (IssueArea issue : kAllIssues) {
        if (key == issueKey(issue)) {
            out = issue;
            return true;
        }
    }
    return false;
}

const char* chamberKey(Chamber chamber) {
    switch (chamber) {
        case Chamber::House: return "house";
        case Chamber::Senate: return "senate";
        case Chamber::StateLegislature: return "state_legislature";
    }
    return "unknown";
}

void SimDate::advanceMonth() {
    ++month;
    if (month > 12) {
        month = 1;
        ++year;
    }
}

std::string SimDate::toString() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    return std::string(buf);
}

bool EffectVector::hasOpinionEffect() const {
    for (double v : opinion) {
        if (v != 0.0) return true;
    }
    return false;
}

void applyBudgetDelta(double amount, double& revenue, double& spending) {
    if (amount >= 0.0) {
        spending += amount;
    } else {
        revenue += -amount;
    }
}
