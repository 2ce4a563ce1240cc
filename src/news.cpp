#include "news.h"

#include <cstddef>
#include <utility>

News::News(std::size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

void News::addEvent(const SimDate& date, const std::string& event) {
    m_events.push_back("[" + date.toString() + "] " + event);
    if (m_events.size() > m_capacity) {
        m_events.erase(m_events.begin());
    }
}

void News::restore(std::vector<std::string> events) {
    m_events = std::move(events);
    if (m_events.size() > m_capacity) {
        m_events.erase(m_events.begin(), m_events.end() - static_cast<std::ptrdiff_t>(m_capacity));
    }
}
