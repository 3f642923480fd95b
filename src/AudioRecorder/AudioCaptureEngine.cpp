#include "AudioCaptureEngine.hpp"
#include "../common/RecorderErrors.hpp"
#include "../common/debug_log.hpp"

AudioCaptureEngine::AudioCaptureEngine(std::shared_ptr<IAudioBackend> backend)
    : _backend(std::move(backend))
    , _state(State::Closed)
    , _buffer_frames(kDefaultBufferFrames)
    , _next_sequence(0)
    , _driver_overruns(0)
    , _device_lost(false) {
}

AudioCaptureEngine::~AudioCaptureEngine() {
    Close();
}

const char* AudioCaptureEngine::StateName(State state) {
    switch (state) {
        case State::Closed: return "Closed";
        case State::Open: return "Open";
        case State::Streaming: return "Streaming";
    }
    return "Closed";
}

void AudioCaptureEngine::SetDeviceLostCallback(DeviceLostCallback cb) {
    std::lock_guard<std::mutex> lock(_control_mutex);
    _on_device_lost = std::move(cb);
}

std::string AudioCaptureEngine::DeviceLostReason() const {
    std::lock_guard<std::mutex> lock(_lost_mutex);
    return _lost_reason;
}

void AudioCaptureEngine::Open(const AudioDevice& device, const AudioFormat& format,
                              unsigned int bufferFrames) {
    std::lock_guard<std::mutex> lock(_control_mutex);

    if (_state.load() != State::Closed || _backend->IsStreamOpen()) {
        _backend->StopStream();
        _backend->CloseStream();
        _state = State::Closed;
    }

    if (format.bitsPerSample != 16) {
        throw UnsupportedFormatError(std::to_string(format.bitsPerSample)
                                     + "-bit capture requested, only 16-bit PCM is supported");
    }
    if (format.channels != 1) {
        throw UnsupportedFormatError(std::to_string(format.channels)
                                     + " channels requested, only mono capture is supported");
    }
    if (device.inputChannels < format.channels) {
        throw UnsupportedFormatError("device '" + device.name + "' has no input channels");
    }
    if (!device.sampleRates.empty() && !device.SupportsSampleRate(format.sampleRate)) {
        throw UnsupportedFormatError(std::to_string(format.sampleRate)
                                     + " Hz not supported by '" + device.name
                                     + "' (preferred rate: "
                                     + std::to_string(device.preferredSampleRate) + ")");
    }

    unsigned int frames = bufferFrames;
    _backend->OpenInput(device, format.sampleRate, format.channels, frames,
                        [this](const int16_t* samples, size_t count, bool overflow) {
                            OnInput(samples, count, overflow);
                        },
                        [this](const std::string& message, bool deviceLost) {
                            OnBackendError(message, deviceLost);
                        });

    _device = device;
    _format = format;
    _buffer_frames = frames;
    _next_sequence = 0;
    _device_lost = false;
    {
        std::lock_guard<std::mutex> lostLock(_lost_mutex);
        _lost_reason.clear();
    }
    _state = State::Open;

    DEBUG_LOG("Capture engine open on '" << device.name << "', "
              << format.sampleRate << " Hz, " << frames << " frames per block" << DEBUG_LOG_ENDL);
}

void AudioCaptureEngine::Start(FrameCallback onFrame) {
    std::lock_guard<std::mutex> lock(_control_mutex);

    const State state = _state.load();
    if (state == State::Streaming) {
        return;
    }
    if (state == State::Closed) {
        if (_device_lost.load()) {
            throw DeviceLostError(DeviceLostReason());
        }
        throw InvalidParameterError("no input device is open");
    }

    _on_frame = std::move(onFrame);
    _state = State::Streaming;
    try {
        _backend->StartStream();
    } catch (...) {
        // The backend may have reported the device lost before throwing
        _state = _device_lost.load() ? State::Closed : State::Open;
        throw;
    }

    DEBUG_LOG("=== Capture started ===" << DEBUG_LOG_ENDL);
}

void AudioCaptureEngine::Stop() {
    std::lock_guard<std::mutex> lock(_control_mutex);

    // After a device loss the backend thread may still need joining
    _backend->StopStream();

    State expected = State::Streaming;
    if (_state.compare_exchange_strong(expected, State::Open)) {
        DEBUG_LOG("Capture stopped after " << _next_sequence.load() << " blocks" << DEBUG_LOG_ENDL);
    }
}

void AudioCaptureEngine::Close() {
    std::lock_guard<std::mutex> lock(_control_mutex);

    _backend->StopStream();
    _backend->CloseStream();
    _state = State::Closed;
}

void AudioCaptureEngine::OnInput(const int16_t* samples, size_t frames, bool overflow) {
    if (_state.load(std::memory_order_acquire) != State::Streaming) {
        return;
    }

    const uint64_t sequence = _next_sequence.fetch_add(1, std::memory_order_relaxed);
    if (overflow) {
        _driver_overruns.fetch_add(1, std::memory_order_relaxed);
    }
    if (_on_frame) {
        _on_frame(samples, frames, sequence, FrameBlock::Clock::now());
    }
}

void AudioCaptureEngine::OnBackendError(const std::string& message, bool deviceLost) {
    if (!deviceLost) {
        ERROR_LOG("Audio stream error: " << message << ERROR_LOG_ENDL);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_lost_mutex);
        _lost_reason = message;
    }
    _device_lost = true;
    _state = State::Closed;

    if (_on_device_lost) {
        _on_device_lost(message);
    }
}
