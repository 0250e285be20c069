#pragma once

#include <chrono>

namespace ringrot {
class StopW {
    std::chrono::steady_clock::time_point time_begin;

  public:
    StopW() { time_begin = std::chrono::steady_clock::now(); }

    double ElapsedNano() const {
        std::chrono::steady_clock::time_point time_end = std::chrono::steady_clock::now();
        return static_cast<double>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(time_end - time_begin).count());
    }
};
} // namespace ringrot
