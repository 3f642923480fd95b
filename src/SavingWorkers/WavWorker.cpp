#include "WavWorker.hpp"
#include "../common/RecorderErrors.hpp"
#include "../common/debug_log.hpp"

#include <sndfile.h>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        ERROR_LOG("Could not remove " << path.string() << ": " << ec.message() << ERROR_LOG_ENDL);
    }
}

} // namespace

std::string WavWorker::TemporaryPath(const std::string& path) {
    return path + ".part";
}

void WavWorker::Save(const std::string& path, const std::vector<int16_t>& samples,
                     const AudioFormat& format) {
    if (format.bitsPerSample != 16) {
        throw WriteFailedError("only 16-bit PCM output is supported, got "
                               + std::to_string(format.bitsPerSample) + " bits");
    }
    if (format.channels == 0 || format.sampleRate == 0) {
        throw WriteFailedError("invalid output format for " + path);
    }
    if (samples.empty()) {
        DEBUG_LOG("No audio data to save!" << DEBUG_LOG_ENDL);
        throw WriteFailedError("no audio data to save to " + path);
    }
    if (samples.size() % format.channels != 0) {
        throw WriteFailedError("sample count is not a multiple of the channel count");
    }

    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw WriteFailedError("could not create " + target.parent_path().string()
                                   + ": " + ec.message());
        }
    }

    const fs::path temporary(TemporaryPath(path));

    SF_INFO sfinfo = {};
    sfinfo.samplerate = static_cast<int>(format.sampleRate);
    sfinfo.channels = static_cast<int>(format.channels);
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* outfile = sf_open(temporary.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        throw WriteFailedError("could not open output file " + temporary.string()
                               + ": " + sf_strerror(nullptr));
    }

    const sf_count_t itemsWritten = sf_write_short(outfile, samples.data(),
                                                   static_cast<sf_count_t>(samples.size()));
    std::string writeError;
    if (itemsWritten != static_cast<sf_count_t>(samples.size())) {
        writeError = "wrote " + std::to_string(itemsWritten) + " samples, expected "
                   + std::to_string(samples.size()) + " (" + sf_strerror(outfile) + ")";
    }
    sf_write_sync(outfile);

    if (sf_close(outfile) != 0 && writeError.empty()) {
        writeError = "could not finalize " + temporary.string();
    }
    if (!writeError.empty()) {
        RemoveQuietly(temporary);
        throw WriteFailedError(writeError);
    }

    fs::rename(temporary, target, ec);
    if (ec) {
        RemoveQuietly(temporary);
        throw WriteFailedError("could not move " + temporary.string() + " to "
                               + target.string() + ": " + ec.message());
    }

    DEBUG_LOG("Successfully saved " << samples.size() << " samples to " << path << DEBUG_LOG_ENDL);
}
