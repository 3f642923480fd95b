#include "FrameBuffer.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

FrameBuffer::FrameBuffer(size_t slotCount, size_t maxBlockSamples)
    : _capacity(0)
    , _maxBlockSamples(0) {
    Reset(slotCount, maxBlockSamples);
}

size_t FrameBuffer::SlotsFor(double seconds, unsigned int sampleRate, unsigned int blockFrames) {
    if (blockFrames == 0) {
        return 1;
    }
    const double blocks = std::ceil(seconds * sampleRate / blockFrames);
    return std::max<size_t>(1, static_cast<size_t>(blocks));
}

void FrameBuffer::Reset(size_t slotCount, size_t maxBlockSamples) {
    _capacity = std::max<size_t>(1, slotCount);
    _maxBlockSamples = maxBlockSamples;

    _slots = std::make_unique<Slot[]>(_capacity);
    for (size_t i = 0; i < _capacity; ++i) {
        _slots[i].samples.assign(_maxBlockSamples, 0);
    }

    _head = 0;
    for (Consumer& consumer : _consumers) {
        consumer.cursor = 0;
    }
}

void FrameBuffer::Push(const int16_t* samples, size_t count, uint64_t sequence,
                       FrameBlock::Clock::time_point captureTime) {
    const uint64_t index = _head.load(std::memory_order_relaxed);
    Slot& slot = _slots[index % _capacity];

    bool overrun = count > _maxBlockSamples;
    if (index >= _capacity) {
        const uint64_t evicted = index - _capacity;
        for (const Consumer& consumer : _consumers) {
            if (consumer.active.load(std::memory_order_acquire)
                && consumer.cursor.load(std::memory_order_acquire) <= evicted) {
                overrun = true;
            }
        }
    }
    if (overrun) {
        _overruns.fetch_add(1, std::memory_order_relaxed);
    }

    slot.version.store(2 * index + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    const size_t n = std::min(count, _maxBlockSamples);
    if (n > 0) {
        std::memcpy(slot.samples.data(), samples, n * sizeof(int16_t));
    }
    slot.count = n;
    slot.sequence = sequence;
    slot.captureTime = captureTime;

    slot.version.store(2 * index + 2, std::memory_order_release);
    _head.store(index + 1, std::memory_order_release);
}

FrameBuffer::ConsumerId FrameBuffer::Subscribe() {
    std::lock_guard<std::mutex> lock(_subscribeMutex);
    for (size_t id = 0; id < kMaxConsumers; ++id) {
        Consumer& consumer = _consumers[id];
        if (!consumer.active.load()) {
            consumer.cursor = _head.load(std::memory_order_acquire);
            consumer.lost = 0;
            consumer.active.store(true, std::memory_order_release);
            return id;
        }
    }
    throw std::runtime_error("FrameBuffer: no free consumer slot");
}

void FrameBuffer::Unsubscribe(ConsumerId id) {
    std::lock_guard<std::mutex> lock(_subscribeMutex);
    if (id < kMaxConsumers) {
        _consumers[id].active.store(false, std::memory_order_release);
    }
}

bool FrameBuffer::Pop(ConsumerId id, FrameBlock& out) {
    if (id >= kMaxConsumers || !_consumers[id].active.load(std::memory_order_acquire)) {
        return false;
    }

    Consumer& consumer = _consumers[id];
    uint64_t cursor = consumer.cursor.load(std::memory_order_relaxed);

    for (;;) {
        const uint64_t head = _head.load(std::memory_order_acquire);
        if (cursor >= head) {
            consumer.cursor.store(cursor, std::memory_order_release);
            return false;
        }

        if (head - cursor > _capacity) {
            const uint64_t oldest = head - _capacity;
            consumer.lost.fetch_add(oldest - cursor, std::memory_order_relaxed);
            cursor = oldest;
        }

        const Slot& slot = _slots[cursor % _capacity];
        const uint64_t expected = 2 * cursor + 2;
        if (slot.version.load(std::memory_order_acquire) != expected) {
            // Already replaced by a newer block
            consumer.lost.fetch_add(1, std::memory_order_relaxed);
            ++cursor;
            continue;
        }

        const size_t n = std::min(slot.count, slot.samples.size());
        out.samples.assign(slot.samples.begin(), slot.samples.begin() + n);
        out.sequence = slot.sequence;
        out.captureTime = slot.captureTime;

        std::atomic_thread_fence(std::memory_order_acquire);
        if (slot.version.load(std::memory_order_relaxed) != expected) {
            consumer.lost.fetch_add(1, std::memory_order_relaxed);
            ++cursor;
            continue;
        }

        consumer.cursor.store(cursor + 1, std::memory_order_release);
        return true;
    }
}

uint64_t FrameBuffer::Lost(ConsumerId id) const {
    if (id >= kMaxConsumers) {
        return 0;
    }
    return _consumers[id].lost.load();
}
