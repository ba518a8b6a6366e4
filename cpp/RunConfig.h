#pragma once

#include <cstddef>
#include <filesystem>

namespace fs = std::filesystem;

namespace metamerger {

// Longest sidecar name body (without ".json") the export tool produces before cutting.
constexpr std::size_t kDefaultTruncationLength = 46;

struct RunConfig {
    bool deleteConsumedSidecars = false;
    bool deleteEmptyDirectories = false;
    fs::path completedDirectory;   // empty: leave processed files in place
    fs::path logDirectory;         // empty: current directory
    std::size_t truncationLength = kDefaultTruncationLength;
};

}  // namespace metamerger
