#pragma once

#include <RtAudio.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "../common/AudioFormat.hpp"

// Plays the test clip back through the default output device.
class TestClipPlayer {
public:
    TestClipPlayer();
    ~TestClipPlayer();

    // Reads a 16-bit WAV with libsndfile; false if it is missing or unreadable.
    static bool LoadClip(const std::string& path, std::vector<int16_t>& samples, AudioFormat& format);

    // Non-blocking. Returns false when there is no clip to play; throws
    // UnsupportedFormatError when the output stream cannot be opened.
    bool Play(const std::string& path);
    void Stop();
    bool IsPlaying() const;

    double ClipSeconds() const;

private:
    static int Playback(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                        double streamTime, RtAudioStreamStatus status, void* userData);

    std::vector<int16_t> _samples;
    AudioFormat _format;
    std::atomic<size_t> _position;
    std::atomic<bool> _finished;

    RtAudio _audio;
};
