#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "AudioDevice.hpp"

// Driver-level access to input devices. Implementations report device
// listing and open failures by throwing (DeviceQueryError,
// UnsupportedFormatError); stream-time failures go through ErrorCallback.
class IAudioBackend {
public:
    // Invoked from the driver's real-time thread once per block:
    // (samples, frames, overflow reported by the driver)
    using InputCallback = std::function<void(const int16_t*, size_t, bool)>;
    // (message, device lost)
    using ErrorCallback = std::function<void(const std::string&, bool)>;

    virtual ~IAudioBackend() = default;

    virtual std::vector<AudioDevice> ListDevices() = 0;
    virtual unsigned int DefaultInputDevice() = 0;

    // bufferFrames is updated with the block size the driver grants.
    virtual void OpenInput(const AudioDevice& device, unsigned int sampleRate,
                           unsigned int channels, unsigned int& bufferFrames,
                           InputCallback onInput, ErrorCallback onError) = 0;
    virtual void StartStream() = 0;
    // Returns once no further InputCallback invocations can happen.
    virtual void StopStream() = 0;
    virtual void CloseStream() = 0;

    virtual bool IsStreamOpen() const = 0;
    virtual bool IsStreamRunning() const = 0;
};
