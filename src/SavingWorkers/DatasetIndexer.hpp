#pragma once

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "../common/Category.hpp"

// Hands out "<root>/<OK|NG>/<prefix>_<n>.wav" paths, one counter per
// category. A counter starts at the requested starting index, or one past
// the highest index already on disk when none is given; a candidate that
// already exists is always skipped, so earlier takes are never overwritten.
class DatasetIndexer {
public:
    explicit DatasetIndexer(std::filesystem::path outputRoot = "output");

    // Changing the prefix or the starting index restarts the counter.
    std::filesystem::path NextPath(Category category, const std::string& prefix,
                                   std::optional<unsigned int> startingIndex = std::nullopt);

    // Only after the file returned by NextPath has been written
    void Advance(Category category);

    std::filesystem::path CategoryDirectory(Category category) const;
    const std::filesystem::path& OutputRoot() const { return _outputRoot; }

    static std::string FileName(const std::string& prefix, unsigned int index);

    // Highest n among "<prefix>_<n>.wav" in `directory`, 0 when there is none
    static unsigned int ScanHighestIndex(const std::filesystem::path& directory,
                                         const std::string& prefix);

private:
    struct Counter {
        std::mutex mutex;
        bool initialized = false;
        std::string prefix;
        std::optional<unsigned int> startingIndex;
        unsigned int next = 1;
    };

    std::filesystem::path _outputRoot;
    std::array<Counter, 2> _counters;
};
