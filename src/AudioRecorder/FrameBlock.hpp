#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

// One block of consecutively captured mono samples
struct FrameBlock {
    using Clock = std::chrono::steady_clock;

    std::vector<int16_t> samples;
    uint64_t sequence = 0;
    Clock::time_point captureTime;
};
