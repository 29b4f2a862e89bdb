#include <waypoints/waypoint_gate.hpp>

#include <algorithm>
#include <stdexcept>


namespace waypoints {

namespace {

    using clock_type = waypoint_gate::clock_type;

    // Timeouts that would overflow the clock are treated as infinite.
    std::optional<clock_type::time_point> make_deadline(clock_type::time_point now, std::optional<waypoint_gate::duration> timeout) {
        if (!timeout) {
            return std::nullopt;
        }
        if (*timeout <= waypoint_gate::duration::zero()) {
            return now;
        }
        if (*timeout > clock_type::time_point::max() - now) {
            return std::nullopt;
        }
        return now + *timeout;
    }


    clock_type::time_point saturated_add(clock_type::time_point now, waypoint_gate::duration head_start) {
        if (head_start > clock_type::time_point::max() - now) {
            return clock_type::time_point::max();
        }
        return now + head_start;
    }

} // namespace


shared_gate waypoint_gate::make_shared() {
    return shared_gate(new waypoint_gate);
}


pass_result waypoint_gate::pass(size_t n, std::optional<duration> timeout, std::optional<duration> head_start) {
    return pass_range(n, n, timeout, head_start);
}


pass_result waypoint_gate::pass_range(size_t low, size_t high, std::optional<duration> timeout, std::optional<duration> head_start) {
    if (low > high) {
        throw std::invalid_argument("waypoint range must not be empty");
    }

    const auto deadline = make_deadline(clock_type::now(), timeout);

    std::unique_lock lk(m_mtx);
    while (true) {
        const auto now = clock_type::now();
        if (m_cursor > high) {
            return { gate_error::already_passed, low, m_cursor };
        }

        const bool reached = low <= m_cursor;
        const bool allowed = !m_not_before || *m_not_before <= now;
        if (reached && allowed) {
            ++m_cursor;
            m_not_before = head_start ? std::optional(saturated_add(now, *head_start)) : std::nullopt;
            const auto cursor = m_cursor;
            lk.unlock();
            m_cvar.notify_all();
            return { low, cursor };
        }

        if (deadline && *deadline <= now) {
            return { gate_error::timed_out, low, m_cursor };
        }

        // Waiting on the head start needs no notification, only the clock.
        auto wake_time = deadline;
        if (reached) {
            wake_time = wake_time ? std::min(*wake_time, *m_not_before) : *m_not_before;
        }

        if (wake_time) {
            m_cvar.wait_until(lk, *wake_time);
        }
        else {
            m_cvar.wait(lk);
        }
    }
}


size_t waypoint_gate::_debug_get_cursor() const {
    std::lock_guard lk(m_mtx);
    return m_cursor;
}


void waypoint_gate::destroy() {
    delete this;
}

} // namespace waypoints
