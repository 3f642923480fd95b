#include "DatasetIndexer.hpp"
#include "../common/debug_log.hpp"

#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* const kExtension = ".wav";

bool ParseIndex(const std::string& digits, unsigned int& index) {
    if (digits.empty() || digits.size() > 9) {
        return false;
    }
    unsigned int value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned int>(c - '0');
    }
    index = value;
    return true;
}

bool Exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

} // namespace

DatasetIndexer::DatasetIndexer(fs::path outputRoot)
    : _outputRoot(std::move(outputRoot)) {
}

fs::path DatasetIndexer::CategoryDirectory(Category category) const {
    return _outputRoot / CategoryName(category);
}

std::string DatasetIndexer::FileName(const std::string& prefix, unsigned int index) {
    return prefix + "_" + std::to_string(index) + kExtension;
}

unsigned int DatasetIndexer::ScanHighestIndex(const fs::path& directory, const std::string& prefix) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        // Missing directory: nothing recorded yet
        return 0;
    }

    const std::string head = prefix + "_";
    const std::string tail = kExtension;
    unsigned int highest = 0;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            ERROR_LOG("Error scanning " << directory.string() << ": " << ec.message() << ERROR_LOG_ENDL);
            break;
        }
        const std::string name = it->path().filename().string();
        if (name.size() <= head.size() + tail.size()
            || name.compare(0, head.size(), head) != 0
            || name.compare(name.size() - tail.size(), tail.size(), tail) != 0) {
            continue;
        }

        unsigned int index = 0;
        if (ParseIndex(name.substr(head.size(), name.size() - head.size() - tail.size()), index)
            && index > highest) {
            highest = index;
        }
    }
    return highest;
}

fs::path DatasetIndexer::NextPath(Category category, const std::string& prefix,
                                  std::optional<unsigned int> startingIndex) {
    Counter& counter = _counters[CategoryIndex(category)];
    std::lock_guard<std::mutex> lock(counter.mutex);

    const fs::path directory = CategoryDirectory(category);

    if (!counter.initialized || counter.prefix != prefix || counter.startingIndex != startingIndex) {
        counter.prefix = prefix;
        counter.startingIndex = startingIndex;
        counter.next = startingIndex ? *startingIndex : ScanHighestIndex(directory, prefix) + 1;
        counter.initialized = true;
        DEBUG_LOG("Index for " << CategoryName(category) << " starts at " << counter.next << DEBUG_LOG_ENDL);
    }

    while (Exists(directory / FileName(prefix, counter.next))) {
        DEBUG_LOG(FileName(prefix, counter.next) << " already exists, skipping" << DEBUG_LOG_ENDL);
        ++counter.next;
    }

    return directory / FileName(prefix, counter.next);
}

void DatasetIndexer::Advance(Category category) {
    Counter& counter = _counters[CategoryIndex(category)];
    std::lock_guard<std::mutex> lock(counter.mutex);
    if (!counter.initialized) {
        return;
    }
    ++counter.next;
}
