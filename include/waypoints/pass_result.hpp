#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>


namespace waypoints {

enum class gate_error {
    // The waypoint was not reached before the caller's timeout expired.
    timed_out,
    // The cursor has already moved beyond the requested waypoint.
    already_passed,
};


std::string_view to_string(gate_error error) noexcept;


class gate_exception : public std::runtime_error {
public:
    gate_exception(gate_error error, size_t waypoint, size_t cursor, std::string_view location = {});

    gate_error error() const noexcept;
    size_t waypoint() const noexcept;
    size_t cursor() const noexcept;

private:
    gate_error m_error;
    size_t m_waypoint;
    size_t m_cursor;
};


class [[nodiscard]] pass_result {
public:
    pass_result(size_t waypoint, size_t cursor) noexcept;
    pass_result(gate_error error, size_t waypoint, size_t cursor) noexcept;

    bool has_error() const noexcept;
    explicit operator bool() const noexcept;

    gate_error error() const; // Throws if the pass succeeded.
    size_t waypoint() const noexcept;
    size_t cursor() const noexcept;

    void get_or_throw() const;

    bool operator==(const pass_result&) const noexcept = default;

private:
    std::optional<gate_error> m_error;
    // For ranges, the lower end of the range.
    size_t m_waypoint = 0;
    // After a successful pass, the cursor this pass advanced to.
    size_t m_cursor = 0;
};

} // namespace waypoints
