#include "DeviceEnumerator.hpp"
#include "../common/debug_log.hpp"

const char* const DeviceEnumerator::kNoDevicesMessage = "No input devices found!";

DeviceEnumerator::DeviceEnumerator(std::shared_ptr<IAudioBackend> backend)
    : _backend(std::move(backend)) {
}

std::vector<AudioDevice> DeviceEnumerator::ListDevices() const {
    std::vector<AudioDevice> all = _backend->ListDevices();

    std::vector<AudioDevice> inputs;
    DEBUG_LOG("Available audio devices:" << DEBUG_LOG_ENDL);
    for (const AudioDevice& device : all) {
        DEBUG_LOG("Device " << device.id << ": " << device.name << DEBUG_LOG_ENDL);
        DEBUG_LOG("  Input channels: " << device.inputChannels << DEBUG_LOG_ENDL);
        if (device.inputChannels > 0) {
            DEBUG_LOG("  Supported sample rates: ");
            for (unsigned int sr : device.sampleRates) {
                DEBUG_LOG(sr << " ");
            }
            DEBUG_LOG(DEBUG_LOG_ENDL);
            inputs.push_back(device);
        }
    }
    return inputs;
}

bool DeviceEnumerator::FindById(unsigned int id, AudioDevice& device) const {
    for (const AudioDevice& candidate : ListDevices()) {
        if (candidate.id == id) {
            device = candidate;
            return true;
        }
    }
    return false;
}

bool DeviceEnumerator::DefaultDevice(AudioDevice& device) const {
    std::vector<AudioDevice> inputs = ListDevices();
    if (inputs.empty()) {
        return false;
    }

    const unsigned int defaultId = _backend->DefaultInputDevice();
    for (const AudioDevice& candidate : inputs) {
        if (candidate.id == defaultId) {
            device = candidate;
            return true;
        }
    }

    DEBUG_LOG("Default device has no input channels, using: " << inputs.front().name << DEBUG_LOG_ENDL);
    device = inputs.front();
    return true;
}

std::string DeviceEnumerator::Describe(const AudioDevice& device) {
    return device.name + " (" + std::to_string(device.inputChannels) + " ch)";
}
