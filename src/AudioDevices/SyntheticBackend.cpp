#include "SyntheticBackend.hpp"
#include "../common/RecorderErrors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace {

const double kTwoPi = 6.283185307179586;

} // namespace

SyntheticBackend::SyntheticBackend()
    : SyntheticBackend({DefaultDevice()}, Options{}) {
}

SyntheticBackend::SyntheticBackend(std::vector<AudioDevice> devices, Options options)
    : _devices(std::move(devices))
    , _toneHz(options.toneHz)
    , _amplitude(options.amplitude)
    , _realtimeFactor(options.realtimeFactor) {
}

SyntheticBackend::~SyntheticBackend() {
    StopStream();
    CloseStream();
}

AudioDevice SyntheticBackend::DefaultDevice() {
    AudioDevice device;
    device.id = 1;
    device.name = "Synthetic Tone";
    device.inputChannels = 1;
    device.sampleRates = {16000, 44100, 48000};
    device.preferredSampleRate = 48000;
    device.isDefaultInput = true;
    return device;
}

std::vector<AudioDevice> SyntheticBackend::ListDevices() {
    if (_failQuery.load()) {
        throw DeviceQueryError("synthetic audio subsystem unavailable");
    }
    std::lock_guard<std::mutex> lock(_devicesMutex);
    return _devices;
}

unsigned int SyntheticBackend::DefaultInputDevice() {
    std::lock_guard<std::mutex> lock(_devicesMutex);
    for (const AudioDevice& device : _devices) {
        if (device.isDefaultInput) {
            return device.id;
        }
    }
    return _devices.empty() ? 0 : _devices.front().id;
}

void SyntheticBackend::SetDevices(std::vector<AudioDevice> devices) {
    std::lock_guard<std::mutex> lock(_devicesMutex);
    _devices = std::move(devices);
}

void SyntheticBackend::OpenInput(const AudioDevice& device, unsigned int sampleRate,
                                 unsigned int channels, unsigned int& bufferFrames,
                                 InputCallback onInput, ErrorCallback onError) {
    StopStream();
    CloseStream();

    {
        std::lock_guard<std::mutex> lock(_devicesMutex);
        auto it = std::find_if(_devices.begin(), _devices.end(),
                               [&device](const AudioDevice& d) { return d.id == device.id; });
        if (it == _devices.end()) {
            throw UnsupportedFormatError("unknown synthetic device " + std::to_string(device.id));
        }
        if (!it->SupportsSampleRate(sampleRate) || channels != 1) {
            throw UnsupportedFormatError("synthetic device cannot deliver "
                                         + std::to_string(sampleRate) + " Hz x "
                                         + std::to_string(channels) + " ch");
        }
    }

    if (bufferFrames == 0) {
        bufferFrames = 512;
    }

    _onInput = std::move(onInput);
    _onError = std::move(onError);
    _sampleRate = sampleRate;
    _bufferFrames = bufferFrames;
    _block.assign(bufferFrames, 0);
    _phase = 0.0;
    _loseDevice = false;
    _open = true;
}

void SyntheticBackend::StartStream() {
    if (!_open.load()) {
        throw DeviceLostError("synthetic stream is not open");
    }
    if (_running.load()) {
        return;
    }

    _shouldStop = false;
    _running = true;
    _captureThread = std::make_unique<std::thread>(&SyntheticBackend::CaptureThread, this);
}

void SyntheticBackend::StopStream() {
    _shouldStop = true;
    if (_captureThread && _captureThread->joinable()) {
        _captureThread->join();
    }
    _captureThread.reset();
    _running = false;
}

void SyntheticBackend::CloseStream() {
    _open = false;
}

void SyntheticBackend::SimulateDeviceLoss() {
    _loseDevice = true;
}

void SyntheticBackend::CaptureThread() {
    const double phaseStep = kTwoPi * _toneHz / static_cast<double>(_sampleRate);
    auto nextBlockTime = std::chrono::steady_clock::now();

    while (!_shouldStop.load()) {
        if (_loseDevice.load()) {
            _running = false;
            if (_onError) {
                _onError("synthetic device disconnected", true);
            }
            return;
        }

        const double scale = std::max(0.0, std::min(1.0, _amplitude.load())) * 32767.0;
        for (int16_t& sample : _block) {
            sample = static_cast<int16_t>(std::lround(std::sin(_phase) * scale));
            _phase += phaseStep;
            if (_phase >= kTwoPi) {
                _phase -= kTwoPi;
            }
        }

        if (_onInput) {
            _onInput(_block.data(), _block.size(), _injectOverflow.exchange(false));
        }
        ++_blocksProduced;

        const double factor = std::max(0.001, _realtimeFactor.load());
        const double blockSeconds = static_cast<double>(_bufferFrames) / _sampleRate / factor;
        nextBlockTime += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(blockSeconds));
        std::this_thread::sleep_until(nextBlockTime);
    }
}
