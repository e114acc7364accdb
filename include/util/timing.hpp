#pragma once
#include <chrono>

// Wall-clock timer for status lines.
struct Stopwatch {
    std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();

    void reset() { t0 = std::chrono::steady_clock::now(); }

    double seconds() const {
        using namespace std::chrono;
        return duration_cast<duration<double>>(steady_clock::now() - t0).count();
    }

    // Seconds since the last lap (or construction), then restart.
    double lap() {
        const double s = seconds();
        reset();
        return s;
    }
};
