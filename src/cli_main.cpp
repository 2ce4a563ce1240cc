#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "default_scenario.h"
#include "sim_errors.h"
#include "simulation_context.h"
#include "snapshot_io.h"
#include "turn_engine.h"

namespace {

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath;
    int months = 12;
    std::string loadPath;
    std::string savePath;
    bool trace = false;
    std::vector<std::pair<std::string, std::string>> proposals; // actor id, template[@region]
    std::vector<std::string> triggers;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "ussim_cli")
              << " [--seed N] [--months N] [--config path]\n"
              << "       [--load snapshot.json] [--save snapshot.json] [--trace]\n"
              << "       [--propose ACTOR TEMPLATE[@REGION]] (repeatable)\n"
              << "       [--trigger EVENT_KEY] (repeatable)\n"
              << "Actors are party:<id> or state:<postal code>.\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--months") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.months) || opt.months < 0) return false;
        } else if (arg.rfind("--months=", 0) == 0) {
            if (!parseInt(arg.substr(9), opt.months) || opt.months < 0) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--load") {
            if (!requireValue(opt.loadPath)) return false;
        } else if (arg == "--save") {
            if (!requireValue(opt.savePath)) return false;
        } else if (arg == "--trace") {
            opt.trace = true;
        } else if (arg == "--propose") {
            std::string actor;
            std::string tpl;
            if (!requireValue(actor) || !requireValue(tpl)) return false;
            opt.proposals.emplace_back(actor, tpl);
        } else if (arg == "--trigger") {
            std::string key;
            if (!requireValue(key)) return false;
            opt.triggers.push_back(key);
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void printSummary(const SimulationState& state) {
    std::cout << "Date " << state.date.toString() << " (turn " << state.turn << ")\n";
    std::cout << "  President: " << state.legislature.presidentParty
              << "  House: " << state.legislature.houseControl
              << "  Senate: " << state.legislature.senateControl
              << "  Court: " << (state.legislature.courtLean.empty() ? std::string("balanced") : state.legislature.courtLean)
              << "\n";
    std::cout << "  Approval: president " << state.legislature.presidentApproval << ", congress "
              << state.legislature.congressApproval << "\n";
    for (const auto& kv : state.parties) {
        const PoliticalParty& p = kv.second;
        std::cout << "  " << p.id << ": house " << p.houseSeats << ", senate " << p.senateSeats
                  << ", governors " << p.governors << ", approval " << p.approval
                  << ", treasury " << p.treasury << "\n";
    }
    std::cout << "  Economy: growth " << state.economy.growth << ", unemployment " << state.economy.unemployment
              << ", inflation " << state.economy.inflation << ", deficit " << state.economy.deficit() << "\n";
}

void printReport(const TurnReport& report) {
    std::cout << "Advanced " << report.turnsAdvanced << " months, " << report.startDate.toString() << " -> "
              << report.endDate.toString() << "\n";
    for (const std::string& id : report.electionsResolved) {
        std::cout << "  [Election] " << id << "\n";
    }
    std::map<std::string, int> byStatus;
    for (const PolicyOutcome& o : report.policiesResolved) {
        ++byStatus[policyStatusKey(o.status)];
    }
    for (const auto& kv : byStatus) {
        std::cout << "  [Policy] " << kv.first << ": " << kv.second << "\n";
    }
    std::cout << "  [Event] fired: " << report.eventsFired.size() << "\n";
    for (const std::string& fault : report.faults) {
        std::cout << "  [Rejected] " << fault << "\n";
    }
}

int run(const RunOptions& opt) {
    SimulationContext ctx(opt.seed, opt.configPath);
    TurnEngine::setDebugMode(opt.trace);

    TurnEngine engine(ctx, makeDefaultScenario(ctx));
    if (!opt.loadPath.empty()) {
        engine.loadSnapshotFile(opt.loadPath);
        std::cout << "[Snapshot] Loaded " << opt.loadPath << "\n";
    }

    for (const auto& proposal : opt.proposals) {
        std::string templateKey = proposal.second;
        std::string region = kNationalRegion;
        const size_t at = templateKey.find('@');
        if (at != std::string::npos) {
            region = templateKey.substr(at + 1);
            templateKey = templateKey.substr(0, at);
        }
        const std::string id = engine.proposePolicy(proposal.first, templateKey, region);
        std::cout << "[Policy] " << proposal.first << " proposed " << templateKey << " as " << id << "\n";
    }
    for (const std::string& key : opt.triggers) {
        engine.triggerEvent(key);
        std::cout << "[Event] queued " << key << "\n";
    }

    const TurnReport report = engine.advance(opt.months);
    printReport(report);
    printSummary(engine.state());

    if (!opt.savePath.empty()) {
        engine.saveSnapshotFile(opt.savePath);
        std::cout << "[Snapshot] Wrote " << opt.savePath << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

    try {
        return run(opt);
    } catch (const ConfigurationFault& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const LoadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const InvalidIntervention& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const SimulationFault& e) {
        std::cerr << "Fault: " << e.what() << "\n";
        return 3;
    } catch (const SimulationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
