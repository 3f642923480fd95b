#pragma once

#include <memory>
#include <string>
#include <vector>

#include "AudioDevice.hpp"
#include "IAudioBackend.hpp"

class DeviceEnumerator {
public:
    explicit DeviceEnumerator(std::shared_ptr<IAudioBackend> backend);

    // Input-capable devices, queried fresh on every call (devices can be
    // hot-plugged). Throws DeviceQueryError; an empty result is valid.
    std::vector<AudioDevice> ListDevices() const;

    bool FindById(unsigned int id, AudioDevice& device) const;

    // The system default input, or the first input-capable device when the
    // default has no input channels. Returns false when there is none.
    bool DefaultDevice(AudioDevice& device) const;

    static std::string Describe(const AudioDevice& device);

    static const char* const kNoDevicesMessage;

private:
    std::shared_ptr<IAudioBackend> _backend;
};
