#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "FrameBlock.hpp"
#include "../common/Category.hpp"

struct RecordingSession {
    enum class Kind {
        Take,      // indexed dataset file
        TestClip   // fixed test file, never indexed
    };

    Kind kind = Kind::Take;
    Category category = Category::OK;
    unsigned int durationSeconds = 0;
    size_t targetSamples = 0;
    std::vector<int16_t> samples;
    FrameBlock::Clock::time_point startTime;

    bool haveSequence = false;
    uint64_t lastSequence = 0;
    uint64_t discontinuities = 0;
    double lastProgressSeconds = 0.0;

    bool IsComplete() const { return samples.size() >= targetSamples; }
};
