#include "RtAudioBackend.hpp"
#include "../common/RecorderErrors.hpp"
#include "../common/debug_log.hpp"

int RtAudioBackend::Record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                           double /*streamTime*/, RtAudioStreamStatus status, void* userData)
{
    RtAudioBackend* backend = static_cast<RtAudioBackend*>(userData);

    if (inputBuffer && backend->_onInput) {
        backend->_onInput(static_cast<const int16_t*>(inputBuffer),
                          nBufferFrames,
                          (status & RTAUDIO_INPUT_OVERFLOW) != 0);
    }

    return 0;
}

RtAudioBackend::RtAudioBackend()
    : _streaming(false)
    , _audio(RtAudio::UNSPECIFIED,
             [this](RtAudioErrorType type, const std::string& errorText) {
                 OnRtAudioError(type, errorText);
             }) {
    _audio.showWarnings(false);
    DEBUG_LOG("RtAudio API: " << RtAudio::getApiDisplayName(_audio.getCurrentApi()) << DEBUG_LOG_ENDL);
}

RtAudioBackend::~RtAudioBackend() {
    StopStream();
    CloseStream();
}

void RtAudioBackend::OnRtAudioError(RtAudioErrorType type, const std::string& errorText) {
    if (type == RTAUDIO_WARNING) {
        DEBUG_LOG("RtAudio warning: " << errorText << DEBUG_LOG_ENDL);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_errorMutex);
        _lastErrorText = errorText;
    }

    if (!_streaming.load()) {
        return;
    }

    const bool deviceLost = type == RTAUDIO_DEVICE_DISCONNECT
                         || type == RTAUDIO_DRIVER_ERROR
                         || type == RTAUDIO_SYSTEM_ERROR;
    if (deviceLost) {
        _streaming = false;
    }
    if (_onError) {
        _onError(errorText, deviceLost);
    }
}

void RtAudioBackend::ClearLastError() {
    std::lock_guard<std::mutex> lock(_errorMutex);
    _lastErrorText.clear();
}

std::string RtAudioBackend::TakeLastError() {
    std::lock_guard<std::mutex> lock(_errorMutex);
    std::string text;
    text.swap(_lastErrorText);
    return text;
}

std::vector<AudioDevice> RtAudioBackend::ListDevices() {
    if (_audio.getCurrentApi() == RtAudio::RTAUDIO_DUMMY) {
        throw DeviceQueryError("RtAudio was built without a usable audio API");
    }

    ClearLastError();
    // getDeviceIds() probes the system again on every call
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    std::string error = TakeLastError();
    if (!error.empty()) {
        throw DeviceQueryError(error);
    }

    std::vector<AudioDevice> devices;
    devices.reserve(deviceIds.size());
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
        error = TakeLastError();
        if (!error.empty()) {
            throw DeviceQueryError(error);
        }

        AudioDevice device;
        device.id = info.ID;
        device.name = info.name;
        device.inputChannels = info.inputChannels;
        device.sampleRates = info.sampleRates;
        device.preferredSampleRate = info.preferredSampleRate;
        device.isDefaultInput = info.isDefaultInput;
        devices.push_back(device);
    }
    return devices;
}

unsigned int RtAudioBackend::DefaultInputDevice() {
    return _audio.getDefaultInputDevice();
}

void RtAudioBackend::OpenInput(const AudioDevice& device, unsigned int sampleRate,
                               unsigned int channels, unsigned int& bufferFrames,
                               InputCallback onInput, ErrorCallback onError) {
    StopStream();
    CloseStream();

    _onInput = std::move(onInput);
    _onError = std::move(onError);

    _parameters.deviceId = device.id;
    _parameters.nChannels = channels;
    _parameters.firstChannel = 0;

    RtAudio::StreamOptions options;
    options.flags = RTAUDIO_SCHEDULE_REALTIME;
    options.streamName = "DatasetRecorder";

    unsigned int frames = bufferFrames;

    DEBUG_LOG("Opening stream on '" << device.name << "':" << DEBUG_LOG_ENDL);
    DEBUG_LOG("  Sample rate: " << sampleRate << DEBUG_LOG_ENDL);
    DEBUG_LOG("  Buffer frames: " << frames << DEBUG_LOG_ENDL);
    DEBUG_LOG("  Format: SINT16" << DEBUG_LOG_ENDL);

    ClearLastError();
    if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                          sampleRate, &frames, &RtAudioBackend::Record, this, &options)) {
        std::string error = TakeLastError();
        throw UnsupportedFormatError(error.empty() ? _audio.getErrorText() : error);
    }

    bufferFrames = frames;
    DEBUG_LOG("Stream opened, driver granted " << frames << " frames per block" << DEBUG_LOG_ENDL);
}

void RtAudioBackend::StartStream() {
    _streaming = true;
    if (_audio.startStream()) {
        _streaming = false;
        throw DeviceLostError(_audio.getErrorText());
    }
}

void RtAudioBackend::StopStream() {
    _streaming = false;
    if (!_audio.isStreamRunning()) {
        return;
    }
    if (_audio.stopStream()) {
        ERROR_LOG("Error stopping stream: " << _audio.getErrorText() << ERROR_LOG_ENDL);
        if (_audio.isStreamRunning() && _audio.abortStream()) {
            ERROR_LOG("Error aborting stream: " << _audio.getErrorText() << ERROR_LOG_ENDL);
        }
    }
}

void RtAudioBackend::CloseStream() {
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
}

bool RtAudioBackend::IsStreamOpen() const {
    return _audio.isStreamOpen();
}

bool RtAudioBackend::IsStreamRunning() const {
    return _audio.isStreamRunning();
}
