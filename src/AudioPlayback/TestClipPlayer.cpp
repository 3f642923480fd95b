#include "TestClipPlayer.hpp"
#include "../common/RecorderErrors.hpp"
#include "../common/debug_log.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cstring>

TestClipPlayer::TestClipPlayer()
    : _position(0)
    , _finished(true)
    , _audio(RtAudio::UNSPECIFIED, [](RtAudioErrorType type, const std::string& errorText) {
          if (type == RTAUDIO_WARNING) {
              DEBUG_LOG("RtAudio warning: " << errorText << DEBUG_LOG_ENDL);
          } else {
              ERROR_LOG("Playback error: " << errorText << ERROR_LOG_ENDL);
          }
      }) {
    _audio.showWarnings(false);
}

TestClipPlayer::~TestClipPlayer() {
    Stop();
}

bool TestClipPlayer::LoadClip(const std::string& path, std::vector<int16_t>& samples, AudioFormat& format) {
    SF_INFO sfinfo = {};
    SNDFILE* infile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!infile) {
        DEBUG_LOG("Could not open " << path << ": " << sf_strerror(nullptr) << DEBUG_LOG_ENDL);
        return false;
    }

    if ((sfinfo.format & SF_FORMAT_SUBMASK) != SF_FORMAT_PCM_16 || sfinfo.channels < 1) {
        DEBUG_LOG(path << " is not 16-bit PCM" << DEBUG_LOG_ENDL);
        sf_close(infile);
        return false;
    }

    const sf_count_t items = sfinfo.frames * sfinfo.channels;
    samples.assign(static_cast<size_t>(items), 0);
    const sf_count_t itemsRead = sf_read_short(infile, samples.data(), items);
    sf_close(infile);

    if (itemsRead != items) {
        DEBUG_LOG("Read " << itemsRead << " samples from " << path << ", expected " << items << DEBUG_LOG_ENDL);
        samples.resize(static_cast<size_t>(std::max<sf_count_t>(0, itemsRead)));
    }

    format.sampleRate = static_cast<unsigned int>(sfinfo.samplerate);
    format.channels = static_cast<unsigned int>(sfinfo.channels);
    format.bitsPerSample = 16;
    return true;
}

int TestClipPlayer::Playback(void* outputBuffer, void* /*inputBuffer*/, unsigned int nBufferFrames,
                             double /*streamTime*/, RtAudioStreamStatus /*status*/, void* userData)
{
    TestClipPlayer* player = static_cast<TestClipPlayer*>(userData);
    int16_t* out = static_cast<int16_t*>(outputBuffer);

    const size_t wanted = static_cast<size_t>(nBufferFrames) * player->_format.channels;
    const size_t position = player->_position.load();
    const size_t available = player->_samples.size() - std::min(position, player->_samples.size());
    const size_t count = std::min(wanted, available);

    if (count > 0) {
        std::memcpy(out, player->_samples.data() + position, count * sizeof(int16_t));
    }
    if (count < wanted) {
        std::memset(out + count, 0, (wanted - count) * sizeof(int16_t));
    }
    player->_position = position + count;

    if (count < wanted) {
        player->_finished = true;
        // Drain the last buffer and stop
        return 1;
    }
    return 0;
}

bool TestClipPlayer::Play(const std::string& path) {
    Stop();

    if (!LoadClip(path, _samples, _format) || _samples.empty()) {
        return false;
    }

    const unsigned int outputDevice = _audio.getDefaultOutputDevice();
    if (outputDevice == 0) {
        throw UnsupportedFormatError("no output device available for playback");
    }

    RtAudio::StreamParameters parameters;
    parameters.deviceId = outputDevice;
    parameters.nChannels = _format.channels;
    parameters.firstChannel = 0;

    unsigned int bufferFrames = 1024;
    _position = 0;
    _finished = false;

    if (_audio.openStream(&parameters, nullptr, RTAUDIO_SINT16, _format.sampleRate,
                          &bufferFrames, &TestClipPlayer::Playback, this)) {
        _finished = true;
        throw UnsupportedFormatError("cannot open playback stream: " + _audio.getErrorText());
    }
    if (_audio.startStream()) {
        _finished = true;
        _audio.closeStream();
        throw UnsupportedFormatError("cannot start playback: " + _audio.getErrorText());
    }

    DEBUG_LOG("Playing " << path << " (" << ClipSeconds() << "s)" << DEBUG_LOG_ENDL);
    return true;
}

void TestClipPlayer::Stop() {
    if (_audio.isStreamRunning() && _audio.stopStream()) {
        ERROR_LOG("Error stopping playback: " << _audio.getErrorText() << ERROR_LOG_ENDL);
    }
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
    _finished = true;
}

bool TestClipPlayer::IsPlaying() const {
    return !_finished.load() && _audio.isStreamRunning();
}

double TestClipPlayer::ClipSeconds() const {
    if (_format.sampleRate == 0 || _format.channels == 0) {
        return 0.0;
    }
    return static_cast<double>(_samples.size()) / (_format.sampleRate * _format.channels);
}
