#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "IAudioBackend.hpp"

// Hardware-free backend: a paced thread plays the role of the driver's
// real-time context and delivers a sine tone in fixed-size blocks.
// Used by the tests and by the shell's --synthetic mode.
class SyntheticBackend : public IAudioBackend {
public:
    struct Options {
        double toneHz = 440.0;
        double amplitude = 0.25;
        // >1 delivers blocks faster than real time
        double realtimeFactor = 1.0;
    };

    SyntheticBackend();
    SyntheticBackend(std::vector<AudioDevice> devices, Options options);
    ~SyntheticBackend() override;

    static AudioDevice DefaultDevice();

    std::vector<AudioDevice> ListDevices() override;
    unsigned int DefaultInputDevice() override;

    void OpenInput(const AudioDevice& device, unsigned int sampleRate,
                   unsigned int channels, unsigned int& bufferFrames,
                   InputCallback onInput, ErrorCallback onError) override;
    void StartStream() override;
    void StopStream() override;
    void CloseStream() override;

    bool IsStreamOpen() const override { return _open.load(); }
    bool IsStreamRunning() const override { return _running.load(); }

    void SetDevices(std::vector<AudioDevice> devices);
    void SetQueryFailure(bool fail) { _failQuery = fail; }
    void SetAmplitude(double amplitude) { _amplitude = amplitude; }
    void SetRealtimeFactor(double factor) { _realtimeFactor = factor; }

    // The producer thread reports the loss on its next block and stops.
    void SimulateDeviceLoss();
    // The next block is flagged as a driver overflow.
    void InjectOverflow() { _injectOverflow = true; }

    uint64_t BlocksProduced() const { return _blocksProduced.load(); }

private:
    void CaptureThread();

    mutable std::mutex _devicesMutex;
    std::vector<AudioDevice> _devices;
    double _toneHz;
    std::atomic<double> _amplitude;
    std::atomic<double> _realtimeFactor;
    std::atomic<bool> _failQuery{false};

    InputCallback _onInput;
    ErrorCallback _onError;
    unsigned int _sampleRate = 0;
    unsigned int _bufferFrames = 0;
    std::vector<int16_t> _block;
    double _phase = 0.0;

    std::unique_ptr<std::thread> _captureThread;
    std::atomic<bool> _open{false};
    std::atomic<bool> _running{false};
    std::atomic<bool> _shouldStop{false};
    std::atomic<bool> _loseDevice{false};
    std::atomic<bool> _injectOverflow{false};
    std::atomic<uint64_t> _blocksProduced{0};
};
