#include "LevelMeter.hpp"

#include <algorithm>
#include <cmath>

namespace {

double Clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

} // namespace

int LevelReading::Percent() const {
    return static_cast<int>(std::lround(value * 100.0));
}

LevelReading LevelMeter::ComputeLevel(const FrameBlock& block) {
    return ComputeLevel(block.samples.data(), block.samples.size());
}

LevelReading LevelMeter::ComputeLevel(const int16_t* samples, size_t count) {
    LevelReading reading;
    if (!samples || count == 0) {
        return reading;
    }

    int peak = 0;
    double sumSquares = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const int sample = samples[i];
        peak = std::max(peak, std::abs(sample));
        sumSquares += static_cast<double>(sample) * sample;
    }

    // -32768 normalizes slightly above 1 and is clamped
    reading.peak = Clamp01(static_cast<double>(peak) / kFullScale);
    reading.rms = Clamp01(std::sqrt(sumSquares / count) / kFullScale);
    reading.value = reading.rms;
    reading.band = Classify(reading.value);
    return reading;
}

LevelBand LevelMeter::Classify(double value) {
    if (value >= 0.8) {
        return LevelBand::High;
    }
    if (value >= 0.5) {
        return LevelBand::Medium;
    }
    return LevelBand::Low;
}

const char* LevelMeter::BandName(LevelBand band) {
    switch (band) {
        case LevelBand::Low: return "low";
        case LevelBand::Medium: return "medium";
        case LevelBand::High: return "high";
    }
    return "low";
}
