#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ISavingWorker.hpp"

// Writes 16-bit PCM RIFF/WAVE files through libsndfile. The file is
// written next to its destination as "<path>.part" and renamed into place
// once libsndfile has finalized the header.
class WavWorker : public ISavingWorker {
public:
    void Save(const std::string& path, const std::vector<int16_t>& samples,
              const AudioFormat& format) override;

    static std::string TemporaryPath(const std::string& path);
};
