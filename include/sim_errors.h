#pragma once

#include <stdexcept>
#include <string>

// Base of every fault raised by the simulation core.
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid initial setup (config values, seat tables, district layout). Raised before any turn runs.
class ConfigurationFault : public SimulationError {
public:
    explicit ConfigurationFault(const std::string& message)
        : SimulationError("configuration fault: " + message) {}
};

// An invariant would be violated mid-turn. The turn is abandoned and the last completed turn kept.
class SimulationFault : public SimulationError {
public:
    SimulationFault(const std::string& message, int turn, const std::string& entityId)
        : SimulationError("simulation fault at turn " + std::to_string(turn) +
                          (entityId.empty() ? std::string() : " [" + entityId + "]") + ": " + message),
          m_turn(turn),
          m_entityId(entityId) {}

    int turn() const { return m_turn; }
    const std::string& entityId() const { return m_entityId; }

private:
    int m_turn;
    std::string m_entityId;
};

// Malformed or invariant-violating snapshot. The in-memory state is left untouched.
class LoadError : public SimulationError {
public:
    explicit LoadError(const std::string& message) : SimulationError("load error: " + message) {}
};

// A manual intervention that cannot be accepted right now. Nothing was mutated.
class InvalidIntervention : public SimulationError {
public:
    InvalidIntervention(const std::string& reason, const std::string& actorId, int turn)
        : SimulationError("invalid intervention by '" + actorId + "' at turn " + std::to_string(turn) + ": " + reason),
          m_reason(reason),
          m_actorId(actorId) {}

    const std::string& reason() const { return m_reason; }
    const std::string& actorId() const { return m_actorId; }

private:
    std::string m_reason;
    std::string m_actorId;
};
