#include "AudioRecorder/FrameBuffer.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <thread>
#include <vector>

using namespace test_utils;

namespace {

void PushBlock(FrameBuffer& buffer, uint64_t sequence, size_t samples = 8) {
    std::vector<int16_t> data(samples, static_cast<int16_t>(sequence % 1000));
    buffer.Push(data.data(), data.size(), sequence, FrameBlock::Clock::now());
}

} // namespace

int main() {
    std::cout << "=== FrameBuffer Test ===" << std::endl;

    Check(FrameBuffer::SlotsFor(2.0, 48000, 1024) == 94, "2 s at 48 kHz in 1024-frame blocks needs 94 slots");
    Check(FrameBuffer::SlotsFor(0.0, 48000, 1024) == 1, "at least one slot");
    Check(FrameBuffer::SlotsFor(1.0, 48000, 0) == 1, "zero block size falls back to one slot");

    {
        FrameBuffer buffer(4, 8);
        FrameBuffer::ConsumerId id = buffer.Subscribe();
        FrameBlock block;
        Check(!buffer.Pop(id, block), "empty buffer has nothing to pop");

        for (uint64_t seq = 0; seq < 3; ++seq) {
            PushBlock(buffer, seq);
        }
        bool ordered = true;
        for (uint64_t seq = 0; seq < 3; ++seq) {
            ordered = ordered && buffer.Pop(id, block) && block.sequence == seq
                   && block.samples.size() == 8 && block.samples[0] == static_cast<int16_t>(seq);
        }
        Check(ordered, "blocks come out in push order with their samples");
        Check(!buffer.Pop(id, block), "consumer is caught up");
        Check(buffer.Overruns() == 0, "no overruns while the consumer keeps up");
    }

    {
        FrameBuffer buffer(4, 8);
        PushBlock(buffer, 0);
        PushBlock(buffer, 1);
        FrameBuffer::ConsumerId id = buffer.Subscribe();
        FrameBlock block;
        Check(!buffer.Pop(id, block), "a new consumer starts at the next pushed block");
        PushBlock(buffer, 2);
        Check(buffer.Pop(id, block) && block.sequence == 2, "a new consumer sees blocks pushed after subscribing");
    }

    {
        FrameBuffer buffer(4, 8);
        for (uint64_t seq = 0; seq < 10; ++seq) {
            PushBlock(buffer, seq);
        }
        Check(buffer.Overruns() == 0, "overwriting with no consumer is not an overrun");
        Check(buffer.Pushed() == 10, "pushed counter");
    }

    {
        FrameBuffer buffer(4, 8);
        FrameBuffer::ConsumerId id = buffer.Subscribe();
        for (uint64_t seq = 0; seq < 6; ++seq) {
            PushBlock(buffer, seq);
        }
        Check(buffer.Overruns() == 2, "each evicted unread block counts one overrun");

        FrameBlock block;
        Check(buffer.Pop(id, block) && block.sequence == 2, "lagging consumer resumes at the oldest retained block");
        Check(buffer.Lost(id) == 2, "lagging consumer counts the blocks it missed");
        uint64_t last = block.sequence;
        while (buffer.Pop(id, block)) {
            Check(block.sequence == last + 1, "remaining blocks are contiguous");
            last = block.sequence;
        }
        Check(last == 5, "consumer drains up to the newest block");
    }

    {
        FrameBuffer buffer(8, 8);
        FrameBuffer::ConsumerId fast = buffer.Subscribe();
        FrameBuffer::ConsumerId slow = buffer.Subscribe();
        Check(fast != slow, "consumers get distinct ids");

        FrameBlock block;
        for (uint64_t seq = 0; seq < 4; ++seq) {
            PushBlock(buffer, seq);
            Check(buffer.Pop(fast, block) && block.sequence == seq, "fast consumer keeps up");
        }
        Check(buffer.Pop(slow, block) && block.sequence == 0, "slow consumer has its own cursor");

        buffer.Unsubscribe(slow);
        Check(!buffer.Pop(slow, block), "unsubscribed consumer pops nothing");
        for (uint64_t seq = 4; seq < 20; ++seq) {
            PushBlock(buffer, seq);
            buffer.Pop(fast, block);
        }
        Check(buffer.Overruns() == 0, "an unsubscribed consumer does not cause overruns");
    }

    {
        FrameBuffer buffer(4, 8);
        FrameBuffer::ConsumerId id = buffer.Subscribe();
        PushBlock(buffer, 0, 16);
        FrameBlock block;
        Check(buffer.Overruns() == 1, "an oversized block counts as an overrun");
        Check(buffer.Pop(id, block) && block.samples.size() == 8, "an oversized block is truncated to the slot size");
    }

    {
        FrameBuffer buffer(2, 4);
        std::vector<FrameBuffer::ConsumerId> ids;
        for (size_t i = 0; i < FrameBuffer::kMaxConsumers; ++i) {
            ids.push_back(buffer.Subscribe());
        }
        Check(Throws<std::runtime_error>([&] { buffer.Subscribe(); }), "subscribing beyond the consumer limit throws");
        buffer.Unsubscribe(ids[1]);
        Check(buffer.Subscribe() == ids[1], "a released consumer slot is reused");
    }

    {
        // Producer thread against a reader: every block read must be whole
        const uint64_t kBlocks = 20000;
        const size_t kSamples = 64;
        FrameBuffer buffer(16, kSamples);
        FrameBuffer::ConsumerId id = buffer.Subscribe();

        std::thread producer([&buffer] {
            std::vector<int16_t> data(kSamples);
            for (uint64_t seq = 0; seq < kBlocks; ++seq) {
                std::fill(data.begin(), data.end(), static_cast<int16_t>(seq % 30000));
                buffer.Push(data.data(), data.size(), seq, FrameBlock::Clock::now());
            }
        });

        bool torn = false;
        bool ordered = true;
        uint64_t received = 0;
        int64_t last = -1;
        FrameBlock block;
        while (last + 1 < static_cast<int64_t>(kBlocks)) {
            if (!buffer.Pop(id, block)) {
                if (buffer.Pushed() == kBlocks && !buffer.Pop(id, block)) {
                    break;
                }
                continue;
            }
            ++received;
            for (int16_t s : block.samples) {
                torn = torn || s != block.samples.front();
            }
            torn = torn || block.samples.front() != static_cast<int16_t>(block.sequence % 30000);
            ordered = ordered && static_cast<int64_t>(block.sequence) > last;
            last = static_cast<int64_t>(block.sequence);
        }
        producer.join();

        Check(!torn, "no torn blocks under concurrent push/pop");
        Check(ordered, "sequences strictly increase under concurrent push/pop");
        Check(received + buffer.Lost(id) <= kBlocks, "received plus lost never exceeds pushed");
    }

    return Finish("FrameBuffer Test");
}
