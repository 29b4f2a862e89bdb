#pragma once

#include "memory/rc_ptr.hpp"
#include "pass_result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>


namespace waypoints {

class waypoint_gate;

using shared_gate = rc_ptr<waypoint_gate>;


/// A series of numbered waypoints that concurrent threads must pass in order.
///
/// The gate holds a cursor, the next waypoint that may be passed. A call to @ref pass for
/// waypoint `n` blocks until the cursor reaches `n`, then moves the cursor to `n + 1` and wakes
/// all other waiters. Calls made after the cursor moved beyond `n` fail without blocking.
/// The cursor never decreases.
///
/// Share one gate between threads either by reference or through a @ref shared_gate
/// created with @ref make_shared.
class waypoint_gate : public rc_from_this {
    friend struct rc_default_delete<waypoint_gate>;

public:
    using clock_type = std::chrono::steady_clock;
    using duration = clock_type::duration;

    waypoint_gate() = default;
    waypoint_gate(const waypoint_gate&) = delete;
    waypoint_gate(waypoint_gate&&) = delete;
    waypoint_gate& operator=(const waypoint_gate&) = delete;
    waypoint_gate& operator=(waypoint_gate&&) = delete;

    static shared_gate make_shared();

    /// Block until the cursor reaches @p n, then advance it past @p n.
    /// @param timeout Maximum time to wait. Waits indefinitely when empty.
    /// @param head_start Minimum time after this pass before the next waypoint may be passed.
    pass_result pass(size_t n, std::optional<duration> timeout = std::nullopt, std::optional<duration> head_start = std::nullopt);

    /// Like @ref pass, but succeeds for any cursor within [@p low, @p high].
    /// Several threads may pass the same band of waypoints without either being favoured;
    /// each successful call still advances the cursor by exactly one.
    pass_result pass_range(size_t low, size_t high, std::optional<duration> timeout = std::nullopt, std::optional<duration> head_start = std::nullopt);

    size_t _debug_get_cursor() const;

private:
    void destroy();

private:
    mutable std::mutex m_mtx;
    std::condition_variable m_cvar;
    size_t m_cursor = 0;
    // Set by a head start: the next waypoint cannot be passed earlier.
    std::optional<clock_type::time_point> m_not_before;
};

} // namespace waypoints
