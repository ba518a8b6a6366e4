#include "ExifHelper.h"
#include "FileTimeHelper.h"
#include "MediaFormat.h"
#include "Pipeline.h"
#include "RunConfig.h"
#include "RunLog.h"
#include "ScopedTempFile.h"
#include "VideoMetaHelper.h"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

int runAllTests();

namespace {

void printUsage(const char* argv0) {
    std::cout << "Usage:\n"
              << "  " << argv0 << " <directory|file> [options]\n"
              << "  " << argv0 << " --test\n"
              << "Options:\n"
              << "  --delete-sidecars        Delete consumed JSON sidecars of fully processed directories\n"
              << "  --completed-dir <dir>    Move successfully processed media files under <dir>\n"
              << "  --delete-empty-dirs      Remove directories left empty after moves\n"
              << "  --truncation <n>         Sidecar name length at which the export tool cuts names (default "
              << metamerger::kDefaultTruncationLength << ")\n"
              << "  --log-dir <dir>          Where to write the run log (default: current directory)\n";
}

// Returns false on a malformed command line
bool parseArguments(int argc, char* argv[], fs::path& input, metamerger::RunConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << name << " needs a value" << std::endl;
                return nullptr;
            }
            return argv[++i];
        };
        if (arg == "--delete-sidecars") {
            config.deleteConsumedSidecars = true;
        } else if (arg == "--delete-empty-dirs") {
            config.deleteEmptyDirectories = true;
        } else if (arg == "--completed-dir") {
            const char* v = needValue("--completed-dir");
            if (!v) return false;
            config.completedDirectory = v;
        } else if (arg == "--log-dir") {
            const char* v = needValue("--log-dir");
            if (!v) return false;
            config.logDirectory = v;
        } else if (arg == "--truncation") {
            const char* v = needValue("--truncation");
            if (!v) return false;
            try {
                int n = std::stoi(v);
                if (n <= 0) throw std::out_of_range("truncation");
                config.truncationLength = static_cast<std::size_t>(n);
            } catch (const std::exception&) {
                std::cerr << "Invalid --truncation value: " << v << std::endl;
                return false;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (input.empty()) {
            input = arg;
        } else {
            std::cerr << "Only one directory or file may be given" << std::endl;
            return false;
        }
    }
    return !input.empty();
}

struct DirectoryFiles {
    std::vector<fs::path> media;
    std::vector<fs::path> sidecars;
};

bool isInside(const fs::path& path, const fs::path& dir) {
    if (dir.empty()) return false;
    auto rel = path.lexically_relative(dir);
    return !rel.empty() && rel != "." && *rel.begin() != "..";
}

// Media and sidecar files per directory, names sorted so runs are reproducible
std::map<fs::path, DirectoryFiles> collectFiles(const fs::path& root, const metamerger::RunConfig& config) {
    std::map<fs::path, DirectoryFiles> byDirectory;
    const fs::path completed = config.completedDirectory.empty()
        ? fs::path() : fs::weakly_canonical(config.completedDirectory);
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied);
         it != fs::recursive_directory_iterator(); ++it) {
        const fs::path& p = it->path();
        if (it->is_directory()) {
            if (isInside(fs::weakly_canonical(p), completed) || fs::weakly_canonical(p) == completed)
                it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file()) continue;
        if (metamerger::isTempFileName(p.filename().string())) {
            std::cerr << "Leftover temp file (ignored): " << p << std::endl;
            continue;
        }
        if (metamerger::isSidecarFile(p))
            byDirectory[p.parent_path()].sidecars.push_back(p);
        else if (metamerger::isSupportedMediaFile(p))
            byDirectory[p.parent_path()].media.push_back(p);
    }
    for (auto& entry : byDirectory) {
        std::sort(entry.second.media.begin(), entry.second.media.end());
        std::sort(entry.second.sidecars.begin(), entry.second.sidecars.end());
    }
    return byDirectory;
}

std::string embeddedInfo(const fs::path& mediaPath) {
    switch (metamerger::resolveFormatFamily(mediaPath)) {
        case metamerger::FormatFamily::JpegLike:
        case metamerger::FormatFamily::Heic:
            return metamerger::getExifInfoString(mediaPath);
        case metamerger::FormatFamily::ContainerTagged:
            return metamerger::getVideoInfoString(mediaPath);
        default:
            return "";
    }
}

void reportOutcome(const metamerger::ProcessingOutcome& outcome, int seq, metamerger::RunLog& log) {
    std::string text = std::to_string(seq) + ". " + metamerger::describeOutcome(outcome);
    if (outcome.kind == metamerger::OutcomeKind::Failed)
        std::cerr << text << std::endl;
    else
        std::cout << text << std::endl;
    log.line(text);
    if (outcome.embeddedWritten) {
        std::string info = embeddedInfo(outcome.mediaPath);
        if (!info.empty()) {
            std::cout << "  [after fix] " << info << std::endl;
            log.line("  [after fix] " + info);
        }
    }
}

// Sidecar deletion and moves for one directory, after the core is done with it
void finishDirectory(const metamerger::DirectoryReport& report, const fs::path& root,
                     const metamerger::RunConfig& config, metamerger::RunLog& log) {
    const bool allOk = report.allSucceeded();
    for (const auto& outcome : report.outcomes) {
        if (!metamerger::isProcessedSuccessfully(outcome)) continue;
        if (config.deleteConsumedSidecars && allOk && !outcome.sidecarPath.empty()) {
            std::error_code ec;
            if (fs::remove(outcome.sidecarPath, ec)) {
                log.line("  Deleted sidecar: " + outcome.sidecarPath.string());
            } else if (ec) {
                std::cerr << "Could not delete " << outcome.sidecarPath << ": " << ec.message() << std::endl;
                log.line("  Error: could not delete " + outcome.sidecarPath.string() + ": " + ec.message());
            }
        }
        if (!config.completedDirectory.empty()) {
            fs::path target = config.completedDirectory / outcome.mediaPath.lexically_relative(root);
            std::string error;
            if (metamerger::moveFile(outcome.mediaPath, target, error)) {
                log.line("  Moved to: " + target.string());
            } else {
                std::cerr << "Move failed for " << outcome.mediaPath << ": " << error << std::endl;
                log.line("  Error: move failed: " + error);
            }
        }
    }
    if (!allOk && (config.deleteConsumedSidecars || config.deleteEmptyDirectories))
        log.line("  Directory not fully processed, sidecars and directory kept: " + report.directory.string());
}

// Deepest first so parents emptied by their children go too; the root itself stays
void removeEmptyDirectories(std::vector<fs::path> candidates, const fs::path& root, metamerger::RunLog& log) {
    std::sort(candidates.begin(), candidates.end(), [](const fs::path& a, const fs::path& b) {
        return std::distance(a.begin(), a.end()) > std::distance(b.begin(), b.end());
    });
    std::set<fs::path> tried;
    for (fs::path dir : candidates) {
        while (isInside(dir, root) && tried.insert(dir).second) {
            std::error_code ec;
            if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) break;
            if (!fs::remove(dir, ec)) {
                std::cerr << "Could not remove " << dir << ": " << ec.message() << std::endl;
                break;
            }
            std::cout << "Removed empty directory: " << dir << std::endl;
            log.line("Removed empty directory: " + dir.string());
            dir = dir.parent_path();
        }
    }
}

void printSummary(const metamerger::RunSummary& summary, metamerger::RunLog& log) {
    std::cout << "------------------------------------------" << std::endl;
    std::cout << "[Summary]" << std::endl;
    std::cout << "  Total processed:    " << summary.total() << std::endl;
    std::cout << "  Updated:            " << summary.updated() << std::endl;
    std::cout << "  Timestamp only:     " << summary.skippedUnsupported() << std::endl;
    std::cout << "  No sidecar:         " << summary.skippedUnmatched() << std::endl;
    std::cout << "  Errors:             " << summary.failed() << std::endl;
    log.line("------------------------------------------\n[Summary]");
    log.line("  Total: " + std::to_string(summary.total()) +
             "  Updated: " + std::to_string(summary.updated()) +
             "  TimestampOnly: " + std::to_string(summary.skippedUnsupported()) +
             "  NoSidecar: " + std::to_string(summary.skippedUnmatched()) +
             "  Errors: " + std::to_string(summary.failed()));
    if (!summary.failures().empty()) {
        std::cout << "[Error details]" << std::endl;
        const auto& failures = summary.failures();
        for (size_t i = 0; i < failures.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << failures[i].first << "\n      " << failures[i].second << std::endl;
            log.line("  Error: " + failures[i].first + " | " + failures[i].second);
        }
    }
    std::cout << "------------------------------------------" << std::endl;
}

bool run(const fs::path& input, const metamerger::RunConfig& config) {
    try {
        if (!fs::exists(input)) {
            std::cerr << "Path does not exist: " << input << std::endl;
            return false;
        }
        const bool singleFile = fs::is_regular_file(input);
        const fs::path root = singleFile ? input.parent_path() : input;
        metamerger::RunLog log(metamerger::runLogPath(config.logDirectory, input), input);

        std::map<fs::path, DirectoryFiles> byDirectory;
        if (singleFile) {
            if (!metamerger::isSupportedMediaFile(input)) {
                std::cerr << "Not a supported media file: " << input << std::endl;
                return false;
            }
            DirectoryFiles files;
            files.media.push_back(input);
            for (const auto& entry : fs::directory_iterator(root.empty() ? fs::path(".") : root)) {
                if (entry.is_regular_file() && metamerger::isSidecarFile(entry.path()))
                    files.sidecars.push_back(entry.path());
            }
            std::sort(files.sidecars.begin(), files.sidecars.end());
            byDirectory[root] = files;
        } else {
            byDirectory = collectFiles(input, config);
        }

        metamerger::RunSummary summary;
        std::vector<fs::path> finishedDirectories;
        int seq = 0;
        for (const auto& entry : byDirectory) {
            if (entry.second.media.empty()) continue;
            std::cout << "---- Directory: " << entry.first << " ----" << std::endl;
            log.line("---- Directory: " + entry.first.string() + " ----");
            metamerger::DirectoryReport report =
                metamerger::processDirectory(entry.first, entry.second.media, entry.second.sidecars, config);
            for (const auto& outcome : report.outcomes)
                reportOutcome(outcome, ++seq, log);
            summary.merge(report.summary);
            finishDirectory(report, root, config, log);
            if (report.allSucceeded())
                finishedDirectories.push_back(entry.first);
        }

        if (config.deleteEmptyDirectories && !config.completedDirectory.empty() && !singleFile)
            removeEmptyDirectories(finishedDirectories, root, log);

        printSummary(summary, log);
        if (log.isOpen())
            std::cout << "Log written to: " << log.path().string() << std::endl;
        return summary.failed() == 0;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Filesystem error: " << e.what() << std::endl;
        return false;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
    SetConsoleCP(65001);
#endif
    // Suppress Exiv2 warnings (e.g. "Directory Photo has an unexpected next pointer"); keep errors visible
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::error);
#ifdef EXV_ENABLE_BMFF
    if (!Exiv2::enableBMFF())
        std::cerr << "Exiv2: BMFF support unavailable, HEIC files get file times only" << std::endl;
#endif
    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "--test" || arg == "-t")
            return runAllTests();
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }
    fs::path input;
    metamerger::RunConfig config;
    if (!parseArguments(argc, argv, input, config)) {
        printUsage(argv[0]);
        return 2;
    }
    return run(input, config) ? 0 : 1;
}
