#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../common/AudioFormat.hpp"

class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    // Throws WriteFailedError. Either the complete file exists at `path`
    // afterwards or nothing new does.
    virtual void Save(const std::string& path, const std::vector<int16_t>& samples,
                      const AudioFormat& format) = 0;
};
