#include "ScopedTempFile.h"
#include <atomic>
#include <chrono>
#include <iostream>

namespace metamerger {

namespace {

const char kTempInfix[] = ".mmtmp";

std::string uniqueSuffix() {
    static std::atomic<unsigned> counter{0};
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(ticks) + "_" + std::to_string(counter++);
}

}  // namespace

ScopedTempFile::ScopedTempFile(const fs::path& target)
    : target_(target) {
    fs::path dir = target.parent_path();
    std::string name = "." + target.stem().string() + kTempInfix + uniqueSuffix() + target.extension().string();
    tempPath_ = dir.empty() ? fs::path(name) : dir / name;
}

ScopedTempFile::~ScopedTempFile() {
    if (committed_) return;
    std::error_code ec;
    if (fs::exists(tempPath_, ec) && !fs::remove(tempPath_, ec) && ec)
        std::cerr << "Could not remove temp file " << tempPath_ << ": " << ec.message() << std::endl;
}

bool ScopedTempFile::copyFromTarget(std::string& error) {
    std::error_code ec;
    fs::copy_file(target_, tempPath_, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "Copy to temp file failed: " + ec.message();
        return false;
    }
    return true;
}

bool ScopedTempFile::commit(std::string& error) {
    std::error_code ec;
    if (!fs::is_regular_file(tempPath_, ec) || fs::file_size(tempPath_, ec) == 0) {
        error = "Temp file missing or empty: " + tempPath_.filename().string();
        return false;
    }
    fs::rename(tempPath_, target_, ec);
    if (ec) {
        error = "Replace failed: " + ec.message();
        return false;
    }
    committed_ = true;
    return true;
}

bool isTempFileName(const std::string& fileName) {
    return !fileName.empty() && fileName[0] == '.' && fileName.find(kTempInfix) != std::string::npos;
}

}  // namespace metamerger
