/*
Module Name:
- timer.hpp

Abstract:
- Stopwatch for one physical attempt: wall-clock start and end instants for
  reporting, plus a steady-clock elapsed time that never goes backwards.
- Uses a GSL postcondition to document the monotonic expectation.
*/
#pragma once

// C++ standard library
#include <chrono>

// GSL
#include <gsl/gsl>

namespace hop::utils
{
    // Wall-clock bounds of an interval.
    struct Interval
    {
        std::chrono::system_clock::time_point start{};
        std::chrono::system_clock::time_point end{};
    };

    class Timer
    {
    public:
        using clock = std::chrono::steady_clock;
        static_assert(clock::is_steady, "Timer requires a steady clock");

        Timer() noexcept = default;

        [[nodiscard]] auto elapsed() const noexcept -> clock::duration
        {
            const auto d = clock::now() - start_;
            Ensures(d >= clock::duration::zero()); // relies on monotonic clock
            return d;
        }

        // Close the interval now.
        [[nodiscard]] Interval stop() const noexcept
        {
            return Interval{ wall_start_, wall_start_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed()) };
        }

    private:
        std::chrono::system_clock::time_point wall_start_ = std::chrono::system_clock::now();
        clock::time_point start_ = clock::now(); // initialised on construction
    };

} // namespace hop::utils
