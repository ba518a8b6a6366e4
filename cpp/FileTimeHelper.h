#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace metamerger {

// Set access and modification time (and creation time on Windows) to the UTC instant.
// On failure returns false and fills error.
bool setFileTimes(const fs::path& filepath, std::time_t timestamp, std::string& error);

// Modification time as epoch seconds, (time_t)-1 if the file cannot be stat'ed
std::time_t getModificationTime(const fs::path& filepath);

// Move file to target, creating parent directories; refuses to overwrite an existing target
bool moveFile(const fs::path& from, const fs::path& to, std::string& error);

}  // namespace metamerger
