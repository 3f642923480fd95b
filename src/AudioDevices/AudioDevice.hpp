#pragma once

#include <string>
#include <vector>

struct AudioDevice {
    unsigned int id = 0;
    std::string name;
    unsigned int inputChannels = 0;
    std::vector<unsigned int> sampleRates;
    unsigned int preferredSampleRate = 0;
    bool isDefaultInput = false;

    bool SupportsSampleRate(unsigned int rate) const {
        for (unsigned int sr : sampleRates) {
            if (sr == rate) {
                return true;
            }
        }
        return false;
    }
};
