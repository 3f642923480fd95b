#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "FrameBlock.hpp"

// Bounded ring between the real-time producer and the consumer worker.
// The producer never blocks: when the ring is full the oldest block is
// overwritten. Each consumer reads through its own cursor; a block that was
// overwritten before a subscribed consumer read it counts as an overrun.
//
// Slots are guarded by a per-slot version (odd while being written), so a
// consumer detects a block that was replaced under it and skips it.
class FrameBuffer {
public:
    using ConsumerId = size_t;

    static const size_t kMaxConsumers = 4;

    FrameBuffer(size_t slotCount = 1, size_t maxBlockSamples = 0);

    // Slots needed to hold `seconds` of audio in blocks of blockFrames
    static size_t SlotsFor(double seconds, unsigned int sampleRate, unsigned int blockFrames);

    // Reallocates the ring. Must not race with Push (call while no stream runs).
    void Reset(size_t slotCount, size_t maxBlockSamples);

    // Real-time side: no locks, no allocation.
    void Push(const int16_t* samples, size_t count, uint64_t sequence,
              FrameBlock::Clock::time_point captureTime);

    // A new consumer starts at the next block pushed.
    ConsumerId Subscribe();
    void Unsubscribe(ConsumerId id);

    // Copies the consumer's next block into `out`; false when caught up.
    bool Pop(ConsumerId id, FrameBlock& out);

    // Blocks this consumer never saw
    uint64_t Lost(ConsumerId id) const;

    uint64_t Overruns() const { return _overruns.load(); }
    uint64_t Pushed() const { return _head.load(); }
    size_t Capacity() const { return _capacity; }
    size_t MaxBlockSamples() const { return _maxBlockSamples; }

private:
    struct Slot {
        std::atomic<uint64_t> version{0};
        std::vector<int16_t> samples;
        size_t count = 0;
        uint64_t sequence = 0;
        FrameBlock::Clock::time_point captureTime;
    };

    struct Consumer {
        std::atomic<bool> active{false};
        std::atomic<uint64_t> cursor{0};
        std::atomic<uint64_t> lost{0};
    };

    std::unique_ptr<Slot[]> _slots;
    size_t _capacity;
    size_t _maxBlockSamples;

    std::atomic<uint64_t> _head{0};
    std::atomic<uint64_t> _overruns{0};

    std::array<Consumer, kMaxConsumers> _consumers;
    std::mutex _subscribeMutex;
};
