#pragma once

#include <chrono>

// Measures the time since construction or the last init().
template <typename Step>
struct DurationPoint {
    explicit DurationPoint() { init(); }
    void init() { tp = std::chrono::steady_clock::now(); }
    [[nodiscard]] Step get() const {
        return std::chrono::duration_cast<Step>(
            std::chrono::steady_clock::now() - tp);
    }

   private:
    std::chrono::steady_clock::time_point tp;
};

using MilliSecondDP = DurationPoint<std::chrono::milliseconds>;
using SecondsFloatDP = DurationPoint<std::chrono::duration<double>>;
