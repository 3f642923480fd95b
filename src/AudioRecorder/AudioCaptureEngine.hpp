#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "FrameBlock.hpp"
#include "../AudioDevices/AudioDevice.hpp"
#include "../AudioDevices/IAudioBackend.hpp"
#include "../common/AudioFormat.hpp"

// Owns the driver input stream: Closed -> Open -> Streaming -> Open -> Closed.
// A device that disappears while streaming moves the engine straight to
// Closed and fires the device-lost callback.
class AudioCaptureEngine {
public:
    enum class State {
        Closed,
        Open,
        Streaming
    };

    // Called from the real-time context once per block:
    // (samples, frames, sequence, capture time). Must not block.
    using FrameCallback = std::function<void(const int16_t*, size_t, uint64_t,
                                             FrameBlock::Clock::time_point)>;
    using DeviceLostCallback = std::function<void(const std::string&)>;

    static const unsigned int kDefaultBufferFrames = 1024;

    explicit AudioCaptureEngine(std::shared_ptr<IAudioBackend> backend);
    ~AudioCaptureEngine();

    AudioCaptureEngine(const AudioCaptureEngine&) = delete;
    AudioCaptureEngine& operator=(const AudioCaptureEngine&) = delete;

    // Throws UnsupportedFormatError; the engine stays Closed on failure.
    void Open(const AudioDevice& device, const AudioFormat& format = AudioFormat(),
              unsigned int bufferFrames = kDefaultBufferFrames);
    void Start(FrameCallback onFrame);
    void Stop();
    void Close();

    State GetState() const { return _state.load(); }
    bool IsDeviceLost() const { return _device_lost.load(); }
    std::string DeviceLostReason() const;

    // May be invoked from the driver's thread; keep it short.
    void SetDeviceLostCallback(DeviceLostCallback cb);

    const AudioDevice& Device() const { return _device; }
    const AudioFormat& Format() const { return _format; }
    unsigned int BlockFrames() const { return _buffer_frames; }

    uint64_t DriverOverruns() const { return _driver_overruns.load(); }
    uint64_t BlocksDelivered() const { return _next_sequence.load(); }

    static const char* StateName(State state);

private:
    void OnInput(const int16_t* samples, size_t frames, bool overflow);
    void OnBackendError(const std::string& message, bool deviceLost);

    std::shared_ptr<IAudioBackend> _backend;
    std::atomic<State> _state;

    AudioDevice _device;
    AudioFormat _format;
    unsigned int _buffer_frames;

    FrameCallback _on_frame;
    DeviceLostCallback _on_device_lost;

    std::atomic<uint64_t> _next_sequence;
    std::atomic<uint64_t> _driver_overruns;
    std::atomic<bool> _device_lost;

    mutable std::mutex _lost_mutex;
    std::string _lost_reason;

    std::mutex _control_mutex;
};
