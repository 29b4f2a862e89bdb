#include <waypoints/pass_result.hpp>

#include <format>


namespace waypoints {

namespace {

    std::string format_message(gate_error error, size_t waypoint, size_t cursor, std::string_view location) {
        auto message = std::format("waypoint {}: {} (cursor at {})", waypoint, to_string(error), cursor);
        if (!location.empty()) {
            message += std::format(" at {}", location);
        }
        return message;
    }

} // namespace


std::string_view to_string(gate_error error) noexcept {
    switch (error) {
        case gate_error::timed_out: return "timed out";
        case gate_error::already_passed: return "already passed";
    }
    return "unknown gate error";
}


gate_exception::gate_exception(gate_error error, size_t waypoint, size_t cursor, std::string_view location)
    : std::runtime_error(format_message(error, waypoint, cursor, location)),
      m_error(error),
      m_waypoint(waypoint),
      m_cursor(cursor) {}


gate_error gate_exception::error() const noexcept {
    return m_error;
}


size_t gate_exception::waypoint() const noexcept {
    return m_waypoint;
}


size_t gate_exception::cursor() const noexcept {
    return m_cursor;
}


pass_result::pass_result(size_t waypoint, size_t cursor) noexcept
    : m_waypoint(waypoint), m_cursor(cursor) {}


pass_result::pass_result(gate_error error, size_t waypoint, size_t cursor) noexcept
    : m_error(error), m_waypoint(waypoint), m_cursor(cursor) {}


bool pass_result::has_error() const noexcept {
    return m_error.has_value();
}


pass_result::operator bool() const noexcept {
    return !has_error();
}


gate_error pass_result::error() const {
    return m_error.value();
}


size_t pass_result::waypoint() const noexcept {
    return m_waypoint;
}


size_t pass_result::cursor() const noexcept {
    return m_cursor;
}


void pass_result::get_or_throw() const {
    if (m_error) {
        throw gate_exception(*m_error, m_waypoint, m_cursor);
    }
}

} // namespace waypoints
