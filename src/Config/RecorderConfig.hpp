#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

struct RecorderConfig {
    std::string outputRoot = "output";
    std::string testDirectory = ".test";
    std::string prefix = "sample";
    unsigned int durationSeconds = 5;
    // Empty: continue after the highest file already on disk
    std::optional<unsigned int> startingIndex = 1;
    unsigned int sampleRate = 48000;
    unsigned int bufferFrames = 1024;
    unsigned int testClipSeconds = 3;
    // Empty: system default input
    std::optional<unsigned int> deviceId;

    // Throws InvalidParameterError
    void Validate() const;

    static RecorderConfig FromJson(const nlohmann::json& json);
    nlohmann::json ToJson() const;

    // Missing file gives the defaults; unreadable or malformed files throw
    // InvalidParameterError.
    static RecorderConfig Load(const std::string& path);
    void Save(const std::string& path) const;
};
