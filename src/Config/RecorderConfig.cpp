#include "RecorderConfig.hpp"
#include "../AudioRecorder/RecordingController.hpp"
#include "../common/RecorderErrors.hpp"
#include "../common/debug_log.hpp"

#include <fstream>
#include <limits>

namespace {

// Non-negative integer that fits in an unsigned int
bool ReadIndexValue(const nlohmann::json& value, unsigned int& out) {
    if (value.is_number_unsigned()) {
        const auto n = value.get<unsigned long long>();
        if (n > std::numeric_limits<unsigned int>::max()) {
            return false;
        }
        out = static_cast<unsigned int>(n);
        return true;
    }
    if (value.is_number_integer()) {
        const auto n = value.get<long long>();
        if (n < 0 || static_cast<unsigned long long>(n) > std::numeric_limits<unsigned int>::max()) {
            return false;
        }
        out = static_cast<unsigned int>(n);
        return true;
    }
    return false;
}

std::optional<unsigned int> ReadOptionalIndex(const nlohmann::json& json, const char* key,
                                              std::optional<unsigned int> fallback) {
    if (!json.contains(key)) {
        return fallback;
    }
    const nlohmann::json& value = json.at(key);
    if (value.is_null()) {
        return std::nullopt;
    }
    unsigned int index = 0;
    if (!ReadIndexValue(value, index)) {
        throw InvalidParameterError(std::string(key) + " must be null or an integer between 0 and "
                                    + std::to_string(std::numeric_limits<unsigned int>::max()));
    }
    return index;
}

unsigned int ReadUnsigned(const nlohmann::json& json, const char* key, unsigned int fallback) {
    if (!json.contains(key)) {
        return fallback;
    }
    unsigned int value = 0;
    if (!ReadIndexValue(json.at(key), value)) {
        throw InvalidParameterError(std::string(key) + " must be an integer between 0 and "
                                    + std::to_string(std::numeric_limits<unsigned int>::max()));
    }
    return value;
}

} // namespace

void RecorderConfig::Validate() const {
    if (outputRoot.empty()) {
        throw InvalidParameterError("output_root must not be empty");
    }
    if (testDirectory.empty()) {
        throw InvalidParameterError("test_dir must not be empty");
    }
    RecordingController::ValidatePrefix(prefix);
    RecordingController::ValidateDuration(durationSeconds);
    RecordingController::ValidateDuration(testClipSeconds);
    if (sampleRate == 0) {
        throw InvalidParameterError("sample_rate must be positive");
    }
    if (bufferFrames == 0) {
        throw InvalidParameterError("buffer_frames must be positive");
    }
}

RecorderConfig RecorderConfig::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw InvalidParameterError("configuration must be a JSON object");
    }

    RecorderConfig config;
    try {
        config.outputRoot = json.value("output_root", config.outputRoot);
        config.testDirectory = json.value("test_dir", config.testDirectory);
        config.prefix = json.value("prefix", config.prefix);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidParameterError(e.what());
    }
    config.durationSeconds = ReadUnsigned(json, "duration_seconds", config.durationSeconds);
    config.startingIndex = ReadOptionalIndex(json, "starting_index", config.startingIndex);
    config.sampleRate = ReadUnsigned(json, "sample_rate", config.sampleRate);
    config.bufferFrames = ReadUnsigned(json, "buffer_frames", config.bufferFrames);
    config.testClipSeconds = ReadUnsigned(json, "test_clip_seconds", config.testClipSeconds);
    config.deviceId = ReadOptionalIndex(json, "device_id", config.deviceId);

    config.Validate();
    return config;
}

nlohmann::json RecorderConfig::ToJson() const {
    nlohmann::json json;
    json["output_root"] = outputRoot;
    json["test_dir"] = testDirectory;
    json["prefix"] = prefix;
    json["duration_seconds"] = durationSeconds;
    json["starting_index"] = startingIndex ? nlohmann::json(*startingIndex) : nlohmann::json(nullptr);
    json["sample_rate"] = sampleRate;
    json["buffer_frames"] = bufferFrames;
    json["test_clip_seconds"] = testClipSeconds;
    json["device_id"] = deviceId ? nlohmann::json(*deviceId) : nlohmann::json(nullptr);
    return json;
}

RecorderConfig RecorderConfig::Load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        DEBUG_LOG("No config at " << path << ", using defaults" << DEBUG_LOG_ENDL);
        return RecorderConfig();
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidParameterError("cannot parse " + path + ": " + e.what());
    }
    return FromJson(json);
}

void RecorderConfig::Save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw WriteFailedError("cannot open " + path + " for writing");
    }
    out << ToJson().dump(4) << std::endl;
    if (!out) {
        throw WriteFailedError("error writing " + path);
    }
}
