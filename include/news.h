#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sim_types.h"

// Bounded narrative log of what happened, newest last. Persisted with the state.
class News {
public:
    explicit News(std::size_t capacity = 64);

    void addEvent(const SimDate& date, const std::string& event);
    const std::vector<std::string>& getEvents() const { return m_events; }

    // Used by snapshot loading; trims to capacity.
    void restore(std::vector<std::string> events);

private:
    std::vector<std::string> m_events;
    std::size_t m_capacity;
};
