#pragma once

#include <cstddef>
#include <cstdint>

#include "FrameBlock.hpp"

enum class LevelBand {
    Low,     // [0, 0.5)
    Medium,  // [0.5, 0.8)
    High     // [0.8, 1.0]
};

struct LevelReading {
    // Normalized RMS, the value shown on the meter
    double value = 0.0;
    double peak = 0.0;
    double rms = 0.0;
    LevelBand band = LevelBand::Low;

    int Percent() const;
};

// Stateless: safe to call from any thread.
class LevelMeter {
public:
    static const int16_t kFullScale = 32767;

    static LevelReading ComputeLevel(const FrameBlock& block);
    static LevelReading ComputeLevel(const int16_t* samples, size_t count);

    static LevelBand Classify(double value);
    static const char* BandName(LevelBand band);
};
