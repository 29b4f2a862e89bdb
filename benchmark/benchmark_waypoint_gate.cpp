#include <waypoints/waypoint_gate.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <stdexcept>
#include <thread>

#include <celero/Celero.h>


// Uncontended passes measure the cost of the lock alone. The multi-threaded
// cases hand the cursor around, so every pass includes a wake-up of the next thread.


using namespace waypoints;


static constexpr size_t base_reps = 20'000;


template <size_t NumThreads>
static void hand_off(size_t reps) {
    waypoint_gate gate;
    std::atomic_size_t failures = 0;
    const auto func = [&gate, &failures, reps](size_t first) {
        for (size_t n = first; n < reps; n += NumThreads) {
            if (!gate.pass(n)) {
                failures.fetch_add(1, std::memory_order_relaxed);
            }
        }
    };

    {
        std::array<std::jthread, NumThreads> threads;
        for (size_t idx = 0; idx < NumThreads; ++idx) {
            threads[idx] = std::jthread(func, idx);
        }
    }
    if (failures != 0) {
        throw std::logic_error("waypoint must not fail in benchmark");
    }
}


BASELINE(waypoint_gate, x1_thread, 30, 1) {
    waypoint_gate gate;
    for (size_t n = 0; n < base_reps; ++n) {
        celero::DoNotOptimizeAway(gate.pass(n));
    }
}


BENCHMARK(waypoint_gate, x2_thread, 30, 1) {
    hand_off<2>(base_reps);
}


BENCHMARK(waypoint_gate, x4_thread, 30, 1) {
    hand_off<4>(base_reps);
}


BASELINE(waypoint_gate_range, x1_thread, 30, 1) {
    waypoint_gate gate;
    for (size_t n = 0; n < base_reps; ++n) {
        celero::DoNotOptimizeAway(gate.pass_range(n, n + 1));
    }
}


BENCHMARK(waypoint_gate_range, x4_thread, 30, 1) {
    waypoint_gate gate;
    std::atomic_size_t failures = 0;
    const auto func = [&gate, &failures] {
        // Every thread takes whichever waypoint comes up next.
        for (size_t rep = 0; rep < base_reps / 4; ++rep) {
            if (!gate.pass_range(0, base_reps)) {
                failures.fetch_add(1, std::memory_order_relaxed);
            }
        }
    };

    {
        std::array<std::jthread, 4> threads;
        std::ranges::generate(threads, [&] { return std::jthread(func); });
    }
    if (failures != 0) {
        throw std::logic_error("waypoint must not fail in benchmark");
    }
}
