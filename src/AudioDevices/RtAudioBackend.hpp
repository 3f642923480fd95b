#pragma once

#include <RtAudio.h>

#include <atomic>
#include <mutex>
#include <string>

#include "IAudioBackend.hpp"

// IAudioBackend over RtAudio 6. RtAudio reports failures through its error
// callback rather than exceptions; the last non-warning error is kept so
// synchronous calls can turn it into the matching RecorderError.
class RtAudioBackend : public IAudioBackend {
public:
    RtAudioBackend();
    ~RtAudioBackend() override;

    std::vector<AudioDevice> ListDevices() override;
    unsigned int DefaultInputDevice() override;

    void OpenInput(const AudioDevice& device, unsigned int sampleRate,
                   unsigned int channels, unsigned int& bufferFrames,
                   InputCallback onInput, ErrorCallback onError) override;
    void StartStream() override;
    void StopStream() override;
    void CloseStream() override;

    bool IsStreamOpen() const override;
    bool IsStreamRunning() const override;

private:
    static int Record(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                      double streamTime, RtAudioStreamStatus status, void* userData);

    void OnRtAudioError(RtAudioErrorType type, const std::string& errorText);
    void ClearLastError();
    std::string TakeLastError();

    InputCallback _onInput;
    ErrorCallback _onError;
    std::atomic<bool> _streaming;

    std::mutex _errorMutex;
    std::string _lastErrorText;

    RtAudio::StreamParameters _parameters;
    // Declared last: its constructor may already report through OnRtAudioError
    RtAudio _audio;
};
