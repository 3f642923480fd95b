#pragma once

struct AudioFormat {
    unsigned int sampleRate = 48000;
    unsigned int bitsPerSample = 16;
    unsigned int channels = 1;

    unsigned int BytesPerSample() const { return bitsPerSample / 8; }
    unsigned int BlockAlign() const { return channels * bitsPerSample / 8; }
    unsigned int ByteRate() const { return sampleRate * channels * bitsPerSample / 8; }
};

inline bool operator==(const AudioFormat& a, const AudioFormat& b) {
    return a.sampleRate == b.sampleRate
        && a.bitsPerSample == b.bitsPerSample
        && a.channels == b.channels;
}

inline bool operator!=(const AudioFormat& a, const AudioFormat& b) {
    return !(a == b);
}
