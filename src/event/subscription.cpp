/// @file subscription.cpp
/// @brief Matcher implementation for hark_event

#include <hark/event/subscription.hpp>

namespace hark_event {

Matcher::Matcher(std::string event_name, Predicate predicate)
    : m_event_name(std::move(event_name))
    , m_predicate(std::move(predicate)) {}

bool Matcher::matches(const std::string& event_name, const Args& args) {
    if (!accepts_name(event_name)) {
        return false;
    }

    // Recorded before the predicate runs, even if it rejects
    record(args);
    return accepts_args(args);
}

bool Matcher::accepts_args(const Args& args) const {
    if (m_predicate) {
        return m_predicate(args);
    }
    return true;
}

} // namespace hark_event
