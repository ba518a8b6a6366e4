#include "ExifHelper.h"
#include "FileTimeHelper.h"
#include "FormatWriter.h"
#include "MetadataExtractor.h"
#include "Pipeline.h"
#include "RunLog.h"
#include "ScopedTempFile.h"
#include "SidecarMatcher.h"
#include "TimeConvert.h"
#include "VideoMetaHelper.h"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Tally {
    int passed = 0;
    int failed = 0;
};

void check(Tally& tally, bool ok, const std::string& label, const std::string& detail = "") {
    if (ok) ++tally.passed; else ++tally.failed;
    std::cout << (ok ? "[PASS]" : "[FAIL]") << " " << label;
    if (!ok && !detail.empty()) std::cout << "  (" << detail << ")";
    std::cout << std::endl;
}

// Scratch directory removed again when the test group ends
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) {
        path_ = fs::temp_directory_path() /
                ("metamerger_" + name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

void writeFile(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Blank JPEG from Exiv2, optionally carrying a camera make so preservation can be checked
void makeJpeg(const fs::path& p, const std::string& make = "") {
    auto image = Exiv2::ImageFactory::create(Exiv2::ImageType::jpeg, p.string());
    if (!make.empty()) {
        image->readMetadata();
        image->exifData()["Exif.Image.Make"] = make;
        image->writeMetadata();
    }
}

std::string sidecarJson(const std::string& timestamp, double lat, double lon, double alt) {
    std::ostringstream ss;
    ss << std::setprecision(10)
       << "{ \"title\": \"x\", \"photoTakenTime\": { \"timestamp\": \"" << timestamp << "\", \"formatted\": \"ignored\" },"
       << " \"geoData\": { \"latitude\": " << lat << ", \"longitude\": " << lon << ", \"altitude\": " << alt
       << ", \"latitudeSpan\": 0.0 } }";
    return ss.str();
}

bool noTempFilesIn(const fs::path& dir) {
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (metamerger::isTempFileName(entry.path().filename().string())) return false;
    }
    return true;
}

struct MatcherTestCase {
    std::string media;
    std::vector<std::string> candidates;
    std::string expected;   // Empty means expect no match
};

void runMatcherTests(Tally& tally) {
    std::cout << "\n========== Sidecar matcher (findBestSidecar) ==========\n" << std::endl;
    const std::string longName = "Screenshot_20200101-123456_Some Long Application Name.jpg";
    const std::string cutBody = longName.substr(0, metamerger::kDefaultTruncationLength);
    std::vector<MatcherTestCase> cases = {
        { "IMG_0001.jpg", { "IMG_0001.jpg.json" }, "IMG_0001.jpg.json" },
        { "IMG_0001.JPG", { "IMG_0001.jpg.json" }, "IMG_0001.jpg.json" },
        { "IMG_0001.jpg", { "IMG_0001.json" }, "IMG_0001.json" },
        { "IMG_0001.jpg", { "IMG_0001.jpg.supplemental-metadata.json" }, "IMG_0001.jpg.supplemental-metadata.json" },
        { "IMG_0001.jpg", { "IMG_0001.jpg.supplemental-met.json" }, "IMG_0001.jpg.supplemental-met.json" },
        { "IMG_20230101(1).jpg", { "IMG_20230101.jpg.json", "IMG_20230101.jpg(1).json" }, "IMG_20230101.jpg(1).json" },
        { "IMG_20230101(2).jpg", { "IMG_20230101.jpg(1).json" }, "" },
        { "IMG_20230101.jpg", { "IMG_20230101.jpg(1).json" }, "" },
        { "IMG_0001(1).jpg", { "IMG_0001.jpg(1).json", "IMG_0001(1).jpg.json" }, "IMG_0001(1).jpg.json" },
        { "IMG_0001(1).jpg", { "IMG_0001.jpg.supplemental-metadata(1).json" }, "IMG_0001.jpg.supplemental-metadata(1).json" },
        { longName, { "other.jpg.json", cutBody + ".json" }, cutBody + ".json" },
        { longName, { longName.substr(0, 20) + ".json" }, "" },
        { longName, { cutBody + ".json", longName + ".json" }, longName + ".json" },
        { "IMG_1.jpg", { "IMG_10.jpg.json" }, "" },
        { "IMG_10.jpg", { "IMG_1.jpg.json" }, "" },
        { "IMG_0001.jpg", { "IMG_0001.jpg" }, "" },
        { "IMG_0001.jpg", {}, "" },
        { "IMG_0001.jpg", { "a.json", "IMG_0001.jpg.json", "IMG_0001.json" }, "IMG_0001.jpg.json" },
    };

    for (const auto& c : cases) {
        auto match = metamerger::findBestSidecar(c.media, c.candidates, metamerger::kDefaultTruncationLength);
        std::string got = match ? c.candidates[match->index] : "";
        check(tally, got == c.expected, c.media + " => " + (got.empty() ? "(none)" : got),
              "expected: " + (c.expected.empty() ? std::string("(none)") : c.expected));
    }

    // Pool hands each sidecar out once, exact matches first
    metamerger::SidecarPool pool({ "d/IMG_0001.jpg.json", "d/IMG_0001.jpg(1).json" }, metamerger::kDefaultTruncationLength);
    metamerger::MatchRule rule = metamerger::MatchRule::NoMatch;
    auto first = pool.claim("IMG_0001.jpg", &rule);
    check(tally, first && first->filename() == "IMG_0001.jpg.json" && rule == metamerger::MatchRule::Exact,
          "pool: exact claim");
    auto again = pool.claim("IMG_0001.jpg");
    check(tally, !again, "pool: claimed sidecar is not handed out twice");
    auto edition = pool.claim("IMG_0001(1).jpg", &rule);
    check(tally, edition && rule == metamerger::MatchRule::TransposedEdition && pool.remaining() == 0,
          "pool: transposed edition claim");

    // "<name>-edited.jpg" lists before "<name>.jpg" and matches "<name>.json" as a cut name
    const std::string cut(metamerger::kDefaultTruncationLength, 'A');
    metamerger::SidecarPool dirPool({ "d/" + cut + ".json" }, metamerger::kDefaultTruncationLength);
    dirPool.assign({ cut + "-edited.jpg", cut + ".jpg" });
    auto edited = dirPool.claim(cut + "-edited.jpg");
    check(tally, !edited, "assign: truncated match does not take another file's exact sidecar");
    auto owner = dirPool.claim(cut + ".jpg", &rule);
    check(tally, owner && owner->filename() == cut + ".json" && rule == metamerger::MatchRule::Exact &&
                 dirPool.remaining() == 0,
          "assign: exact owner keeps its sidecar");

    metamerger::SidecarPool cutPool({ "d/" + cutBody + ".json" }, metamerger::kDefaultTruncationLength);
    cutPool.assign({ longName });
    auto truncated = cutPool.claim(longName, &rule);
    check(tally, truncated && rule == metamerger::MatchRule::Truncated, "assign: truncated name without an exact owner");
}

struct ExtractorTestCase {
    std::string label;
    std::string json;
    bool ok;
    std::time_t takenAt;
    bool hasGps;
};

void runExtractorTests(Tally& tally) {
    std::cout << "\n========== Metadata extractor (parseSidecarJson) ==========\n" << std::endl;
    std::vector<ExtractorTestCase> cases = {
        { "string timestamp with GPS", sidecarJson("1700000000", 37.7749, -122.4194, 12.5), true, 1700000000, true },
        { "zero GPS placeholder", sidecarJson("1700000000", 0.0, 0.0, 0.0), true, 1700000000, false },
        { "numeric timestamp", R"({"photoTakenTime":{"timestamp":1600000000}})", true, 1600000000, false },
        { "geoDataExif fallback",
          R"({"photoTakenTime":{"timestamp":"1600000000"},"geoData":{"latitude":0.0,"longitude":0.0},"geoDataExif":{"latitude":48.85,"longitude":2.35}})",
          true, 1600000000, true },
        { "out of range GPS dropped", R"({"photoTakenTime":{"timestamp":"1600000000"},"geoData":{"latitude":123.0,"longitude":2.0}})",
          true, 1600000000, false },
        { "missing photoTakenTime", R"({"creationTime":{"timestamp":"1600000000"}})", false, 0, false },
        { "non-numeric timestamp", R"({"photoTakenTime":{"timestamp":"yesterday"}})", false, 0, false },
        { "zero timestamp", R"({"photoTakenTime":{"timestamp":"0"}})", false, 0, false },
        { "negative timestamp", R"({"photoTakenTime":{"timestamp":"-5"}})", false, 0, false },
        { "timestamp past year 9999", R"({"photoTakenTime":{"timestamp":"999999999999999999"}})", false, 0, false },
        { "five-digit year", R"({"photoTakenTime":{"timestamp":"300000000000"}})", false, 0, false },
        { "last second of year 9999", R"({"photoTakenTime":{"timestamp":"253402300799"}})", true, 253402300799, false },
        { "truncated JSON", R"({"photoTakenTime":{"timestamp":"1600000000")", false, 0, false },
        { "array root", R"([1,2,3])", false, 0, false },
    };
    for (const auto& c : cases) {
        metamerger::CanonicalMetadata m;
        std::string error;
        bool ok = metamerger::parseSidecarJson(c.json, m, error);
        bool pass = ok == c.ok && (!ok || (m.takenAt == c.takenAt && m.gps.has_value() == c.hasGps));
        check(tally, pass, c.label, ok ? "parsed" : error);
    }

    metamerger::CanonicalMetadata m;
    std::string error;
    metamerger::parseSidecarJson(sidecarJson("1700000000", -33.8568, 151.2153, -3.0), m, error);
    check(tally, m.gps && std::fabs(m.gps->latitude + 33.8568) < 1e-9 && m.gps->altitude && *m.gps->altitude == -3.0,
          "southern latitude and negative altitude kept");
}

void runGpsFormatTests(Tally& tally) {
    std::cout << "\n========== GPS encodings (formatGpsRational / formatIso6709) ==========\n" << std::endl;
    struct Case { double in; std::string expected; };
    std::vector<Case> cases = {
        { 37.7749, "37/1 46/1 296400/10000" },
        { -122.4194, "122/1 25/1 98400/10000" },
        { 0.5, "0/1 30/1 0/10000" },
        { 89.99999999, "90/1 0/1 0/10000" },
    };
    for (const auto& c : cases) {
        std::string got = metamerger::formatGpsRational(c.in);
        check(tally, got == c.expected, std::to_string(c.in) + " => " + got, "expected: " + c.expected);
    }

    metamerger::GpsPosition gps;
    gps.latitude = 37.7749;
    gps.longitude = -122.4194;
    check(tally, metamerger::formatIso6709(gps) == "+37.7749-122.4194/", "ISO 6709 without altitude", metamerger::formatIso6709(gps));
    gps.altitude = 12.5;
    check(tally, metamerger::formatIso6709(gps) == "+37.7749-122.4194+12.500/", "ISO 6709 with altitude", metamerger::formatIso6709(gps));
}

void runTimeFormatTests(Tally& tally) {
    std::cout << "\n========== Time conversion ==========\n" << std::endl;
    check(tally, metamerger::timestampToExifString(1700000000) == "2023:11:14 22:13:20", "EXIF string is UTC",
          metamerger::timestampToExifString(1700000000));
    check(tally, metamerger::timestampToContainerString(1700000000) == "2023-11-14T22:13:20.000000Z", "container creation_time");
    check(tally, metamerger::utcStringToTimestamp("2023:11:14 22:13:20") == 1700000000, "EXIF string back to epoch");
    check(tally, metamerger::utcStringToTimestamp("not a time") == static_cast<std::time_t>(-1), "bad string rejected");
    check(tally, metamerger::timestampToExifString(253402300799) == "9999:12:31 23:59:59", "year 9999 formats");
    check(tally, metamerger::timestampToExifString(300000000000).empty() &&
                 metamerger::timestampToContainerString(999999999999999999).empty(),
          "instants past year 9999 do not format", metamerger::timestampToExifString(300000000000));
}

void runExifWriterTests(Tally& tally) {
    std::cout << "\n========== EXIF writer (round trip, preservation, idempotence) ==========\n" << std::endl;
    ScratchDir dir("exif");
    const fs::path jpg = dir.path() / "photo.jpg";
    makeJpeg(jpg, "TestCam");

    metamerger::CanonicalMetadata m;
    m.takenAt = 1700000000;
    m.gps = metamerger::GpsPosition{ -33.8568, 151.2153, 58.25 };

    auto writer = metamerger::makeFormatWriter(metamerger::resolveFormatFamily(jpg));
    metamerger::WriteResult r = writer->apply(jpg, m);
    check(tally, r.status == metamerger::WriteStatus::Written, "first write", r.message);

    metamerger::CanonicalMetadata back;
    bool read = metamerger::readExifMetadata(jpg, back);
    check(tally, read && back.takenAt == m.takenAt, "taken time round trip");
    check(tally, read && back.gps && std::fabs(back.gps->latitude - m.gps->latitude) < 1e-6 &&
                 std::fabs(back.gps->longitude - m.gps->longitude) < 1e-6,
          "GPS round trip within 1e-6 degrees");
    check(tally, read && back.gps && back.gps->altitude && std::fabs(*back.gps->altitude - 58.25) < 0.01,
          "altitude round trip");

    Exiv2::ExifData exif;
    metamerger::getExifData(jpg.string(), exif);
    auto make = exif.findKey(Exiv2::ExifKey("Exif.Image.Make"));
    check(tally, make != exif.end() && make->toString() == "TestCam", "unrelated tag preserved");
    auto latRef = exif.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitudeRef"));
    check(tally, latRef != exif.end() && latRef->toString() == "S", "hemisphere carried by reference tag");

    const std::string before = readFile(jpg);
    r = writer->apply(jpg, m);
    check(tally, r.status == metamerger::WriteStatus::AlreadyCurrent && readFile(jpg) == before,
          "second write leaves content unchanged");
    check(tally, noTempFilesIn(dir.path()), "no temp files left behind");

    metamerger::CanonicalMetadata farFuture;
    farFuture.takenAt = 300000000000;
    const std::string current = readFile(jpg);
    r = writer->apply(jpg, farFuture);
    Exiv2::ExifData kept;
    metamerger::getExifData(jpg.string(), kept);
    auto original = kept.findKey(Exiv2::ExifKey("Exif.Photo.DateTimeOriginal"));
    check(tally, r.status == metamerger::WriteStatus::Failed && readFile(jpg) == current &&
                 original != kept.end() && original->toString() == "2023:11:14 22:13:20",
          "unformattable taken time fails without touching existing dates", r.message);

    const fs::path video = dir.path() / "future.mp4";
    writeFile(video, "not a real mp4");
    auto videoWriter = metamerger::makeFormatWriter(metamerger::resolveFormatFamily(video));
    r = videoWriter->apply(video, farFuture);
    check(tally, r.status == metamerger::WriteStatus::Failed && readFile(video) == "not a real mp4",
          "unformattable creation_time fails before ffmpeg runs", r.message);

    const fs::path garbage = dir.path() / "garbage.jpg";
    writeFile(garbage, "this is not a jpeg at all");
    r = writer->apply(garbage, m);
    check(tally, r.status == metamerger::WriteStatus::Failed && readFile(garbage) == "this is not a jpeg at all",
          "failed write leaves original intact", r.message);

    const fs::path heic = dir.path() / "unknown.heic";
    writeFile(heic, "not really heic");
    auto heicWriter = metamerger::makeFormatWriter(metamerger::resolveFormatFamily(heic));
    r = heicWriter->apply(heic, m);
    check(tally, r.status == metamerger::WriteStatus::Unsupported, "unidentified HEIC falls back to file times", r.message);
    check(tally, noTempFilesIn(dir.path()), "no temp files after failures");
}

void runPipelineTests(Tally& tally) {
    std::cout << "\n========== Pipeline (processDirectory) ==========\n" << std::endl;
    ScratchDir dir("pipeline");
    const fs::path d = dir.path();
    const std::time_t taken = 1700000000;
    const std::time_t oldTime = 1000000000;
    std::string error;

    makeJpeg(d / "photo.jpg");
    writeFile(d / "photo.jpg.json", sidecarJson("1700000000", 37.7749, -122.4194, 0.0));

    writeFile(d / "raw.nef", std::string("NEF\0RAWDATA", 11));
    writeFile(d / "raw.nef.json", sidecarJson("1700000000", 0.0, 0.0, 0.0));

    makeJpeg(d / "broken.jpg");
    writeFile(d / "broken.jpg.json", R"({"title":"broken.jpg"})");
    metamerger::setFileTimes(d / "broken.jpg", oldTime, error);

    writeFile(d / "garbage.jpg", "garbage bytes");
    writeFile(d / "garbage.jpg.json", sidecarJson("1700000000", 0.0, 0.0, 0.0));

    writeFile(d / "clip.mp4", "not a real mp4");
    writeFile(d / "clip.mp4.json", sidecarJson("1700000000", 1.0, 2.0, 0.0));

    makeJpeg(d / "lonely.jpg");
    writeFile(d / "notes.txt", "ignored");

    const std::string rawBefore = readFile(d / "raw.nef");
    const std::string brokenBefore = readFile(d / "broken.jpg");
    const std::string garbageBefore = readFile(d / "garbage.jpg");
    const std::string clipBefore = readFile(d / "clip.mp4");

    std::vector<fs::path> media = { d / "broken.jpg", d / "clip.mp4", d / "garbage.jpg",
                                    d / "lonely.jpg", d / "notes.txt", d / "photo.jpg", d / "raw.nef" };
    std::vector<fs::path> sidecars = { d / "broken.jpg.json", d / "clip.mp4.json", d / "garbage.jpg.json",
                                       d / "photo.jpg.json", d / "raw.nef.json" };
    metamerger::RunConfig config;

    metamerger::DirectoryReport first = metamerger::processDirectory(d, media, sidecars, config);
    auto outcomeOf = [](const metamerger::DirectoryReport& report, const std::string& name) {
        for (const auto& o : report.outcomes)
            if (o.mediaPath.filename() == name) return o;
        return metamerger::ProcessingOutcome();
    };

    auto photo = outcomeOf(first, "photo.jpg");
    check(tally, photo.kind == metamerger::OutcomeKind::Updated && photo.embeddedWritten, "photo.jpg updated",
          metamerger::describeOutcome(photo));
    check(tally, metamerger::getModificationTime(d / "photo.jpg") == taken, "photo.jpg mtime set");

    auto raw = outcomeOf(first, "raw.nef");
    check(tally, raw.kind == metamerger::OutcomeKind::SkippedUnsupportedFormat, "raw.nef timestamp only",
          metamerger::describeOutcome(raw));
    check(tally, readFile(d / "raw.nef") == rawBefore, "raw.nef content byte-identical");
    check(tally, metamerger::getModificationTime(d / "raw.nef") == taken, "raw.nef mtime equals photoTakenTime");

    auto broken = outcomeOf(first, "broken.jpg");
    check(tally, broken.kind == metamerger::OutcomeKind::Failed && broken.failure == metamerger::FailureKind::CorruptMetadata,
          "corrupt sidecar -> CorruptMetadata", metamerger::describeOutcome(broken));
    check(tally, readFile(d / "broken.jpg") == brokenBefore && metamerger::getModificationTime(d / "broken.jpg") == oldTime,
          "corrupt sidecar leaves media untouched");

    auto garbage = outcomeOf(first, "garbage.jpg");
    check(tally, garbage.kind == metamerger::OutcomeKind::Failed && garbage.failure == metamerger::FailureKind::WriteFailure,
          "unreadable image -> WriteFailure", metamerger::describeOutcome(garbage));
    check(tally, readFile(d / "garbage.jpg") == garbageBefore, "failed write leaves original intact");

    auto clip = outcomeOf(first, "clip.mp4");
    check(tally, clip.kind == metamerger::OutcomeKind::Failed && clip.failure == metamerger::FailureKind::WriteFailure &&
                 readFile(d / "clip.mp4") == clipBefore,
          "broken container -> WriteFailure, original intact", metamerger::describeOutcome(clip));

    auto lonely = outcomeOf(first, "lonely.jpg");
    check(tally, lonely.kind == metamerger::OutcomeKind::SkippedUnmatched, "no sidecar -> SkippedUnmatched");

    auto notes = outcomeOf(first, "notes.txt");
    check(tally, notes.kind == metamerger::OutcomeKind::Failed && notes.failure == metamerger::FailureKind::UnsupportedMediaType,
          "unsupported extension rejected");

    check(tally, first.summary.updated() == 1 && first.summary.skippedUnsupported() == 1 &&
                 first.summary.skippedUnmatched() == 1 && first.summary.failed() == 4 && first.summary.total() == 7,
          "summary counts");
    check(tally, !first.allSucceeded() && !metamerger::isProcessedSuccessfully(lonely) &&
                 metamerger::isProcessedSuccessfully(raw),
          "only Updated/SkippedUnsupportedFormat count as processed");
    check(tally, noTempFilesIn(d), "no temp files after run");

    const std::string photoAfterFirst = readFile(d / "photo.jpg");
    metamerger::DirectoryReport second = metamerger::processDirectory(d, media, sidecars, config);
    bool sameKinds = first.outcomes.size() == second.outcomes.size();
    for (size_t i = 0; sameKinds && i < first.outcomes.size(); ++i)
        sameKinds = first.outcomes[i].kind == second.outcomes[i].kind && first.outcomes[i].failure == second.outcomes[i].failure;
    check(tally, sameKinds, "second run gives identical outcomes");
    check(tally, readFile(d / "photo.jpg") == photoAfterFirst && !outcomeOf(second, "photo.jpg").embeddedWritten,
          "second run does not rewrite content");
}

void runTempFileTests(Tally& tally) {
    std::cout << "\n========== Temp file replace (ScopedTempFile) ==========\n" << std::endl;
    ScratchDir dir("tempfile");
    const fs::path d = dir.path();
    std::string error;

    {
        metamerger::ScopedTempFile temp(d / "missing.jpg");
        check(tally, !temp.copyFromTarget(error) && !fs::exists(temp.path()), "copy from a missing target fails", error);
    }

    const fs::path photo = d / "photo.jpg";
    writeFile(photo, "original content");
    {
        metamerger::ScopedTempFile temp(photo);
        bool copied = temp.copyFromTarget(error);
        writeFile(temp.path(), "");
        check(tally, copied && !temp.commit(error), "empty temp file is not committed", error);
    }
    check(tally, readFile(photo) == "original content" && noTempFilesIn(d), "original intact after refused commit");

    // A directory sitting at the target path makes the final rename fail
    const fs::path blocked = d / "clip.mov";
    fs::create_directories(blocked);
    writeFile(blocked / "inside.txt", "keep");
    {
        metamerger::ScopedTempFile temp(blocked);
        writeFile(temp.path(), "new content");
        check(tally, !temp.commit(error), "rename over a directory fails", error);
    }
    check(tally, fs::is_directory(blocked) && readFile(blocked / "inside.txt") == "keep" && noTempFilesIn(d),
          "temp removed after failed rename");

    {
        metamerger::ScopedTempFile temp(photo);
        writeFile(temp.path(), "replacement");
        check(tally, temp.commit(error) && readFile(photo) == "replacement" && noTempFilesIn(d), "commit replaces target", error);
    }
}

void runWriteFailureTests(Tally& tally) {
    std::cout << "\n========== Embedded write failures ==========\n" << std::endl;
    ScratchDir dir("writefail");
    const fs::path locked = dir.path() / "locked";
    fs::create_directories(locked);
    const fs::path jpg = locked / "photo.jpg";
    makeJpeg(jpg, "TestCam");
    const std::string before = readFile(jpg);

    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);
    const fs::path canary = locked / "canary";
    bool writable = static_cast<bool>(std::ofstream(canary));
    if (writable) {
        std::cout << "[SKIP] directory permissions not enforced for this user" << std::endl;
    } else {
        metamerger::CanonicalMetadata m;
        m.takenAt = 1700000000;
        auto writer = metamerger::makeFormatWriter(metamerger::resolveFormatFamily(jpg));
        metamerger::WriteResult r = writer->apply(jpg, m);
        check(tally, r.status == metamerger::WriteStatus::Failed, "write into a read-only directory fails", r.message);
        check(tally, readFile(jpg) == before && noTempFilesIn(locked), "original byte-identical, no temp file left");
    }
    std::error_code ec;
    fs::permissions(locked, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) std::cout << "[WARN] could not restore permissions: " << ec.message() << std::endl;
}

void runDirectoryAssignmentTests(Tally& tally) {
    std::cout << "\n========== Pipeline (sidecar assignment, file time failures) ==========\n" << std::endl;
    ScratchDir dir("assign");
    const fs::path d = dir.path();
    metamerger::RunConfig config;

    const std::string name(metamerger::kDefaultTruncationLength, 'B');
    makeJpeg(d / (name + "-edited.jpg"));
    makeJpeg(d / (name + ".jpg"));
    writeFile(d / (name + ".json"), sidecarJson("1700000000", 0.0, 0.0, 0.0));
    metamerger::DirectoryReport report = metamerger::processDirectory(
        d, { d / (name + "-edited.jpg"), d / (name + ".jpg") }, { d / (name + ".json") }, config);
    check(tally, report.outcomes.size() == 2 &&
                 report.outcomes[0].kind == metamerger::OutcomeKind::SkippedUnmatched &&
                 report.outcomes[1].kind == metamerger::OutcomeKind::Updated &&
                 report.outcomes[1].sidecarPath.filename() == name + ".json",
          "exact owner listed after an edited copy gets its sidecar",
          report.outcomes.empty() ? "" : metamerger::describeOutcome(report.outcomes[0]));

    const fs::path photo = d / "photo.jpg";
    const fs::path raw = d / "raw.dng";
    makeJpeg(photo);
    writeFile(d / "photo.jpg.json", sidecarJson("1700000000", 0.0, 0.0, 0.0));
    writeFile(raw, std::string("DNG\0RAW", 7));
    writeFile(d / "raw.dng.json", sidecarJson("1700000000", 0.0, 0.0, 0.0));
    const std::string rawBefore = readFile(raw);

    auto refuse = [](const fs::path&, std::time_t, std::string& error) {
        error = "Operation not permitted";
        return false;
    };
    report = metamerger::processDirectory(d, { photo, raw }, { d / "photo.jpg.json", d / "raw.dng.json" }, config, refuse);
    const metamerger::ProcessingOutcome& photoOutcome = report.outcomes[0];
    const metamerger::ProcessingOutcome& rawOutcome = report.outcomes[1];
    check(tally, photoOutcome.kind == metamerger::OutcomeKind::Failed &&
                 photoOutcome.failure == metamerger::FailureKind::TimestampFailure && photoOutcome.embeddedWritten &&
                 photoOutcome.reason.find("embedded metadata was already updated") != std::string::npos,
          "file time failure after an embedded write -> TimestampFailure", metamerger::describeOutcome(photoOutcome));
    check(tally, rawOutcome.failure == metamerger::FailureKind::TimestampFailure && !rawOutcome.embeddedWritten &&
                 readFile(raw) == rawBefore,
          "file time failure on RAW leaves content unchanged", metamerger::describeOutcome(rawOutcome));
    check(tally, !report.allSucceeded() && report.summary.failed() == 2, "file time failures counted");
    check(tally, metamerger::describeOutcome(photoOutcome).find("[JpegLike]") != std::string::npos &&
                 metamerger::describeOutcome(rawOutcome).find("[FilesystemOnly]") != std::string::npos,
          "outcome names the format family");
}

void runRunLogTests(Tally& tally) {
    std::cout << "\n========== Run log ==========\n" << std::endl;
    ScratchDir dir("runlog");
    const fs::path logFile = dir.path() / "album_20240101_000000.log";
    const std::string bom = "\xEF\xBB\xBF";
    {
        metamerger::RunLog log(logFile, dir.path() / "album");
        log.line("first run");
    }
    {
        metamerger::RunLog log(logFile, dir.path() / "album");
        log.line("second run");
    }
    const std::string content = readFile(logFile);
    check(tally, content.compare(0, bom.size(), bom) == 0, "log starts with a UTF-8 BOM");
    check(tally, content.find(bom, bom.size()) == std::string::npos, "reopened log gets no second BOM");
    check(tally, content.find("first run") != std::string::npos && content.find("second run") != std::string::npos,
          "reopened log appends");
}

void runContainerTests(Tally& tally) {
    std::cout << "\n========== Container tags (ffmpeg) ==========\n" << std::endl;
    if (!metamerger::ffmpegAvailable()) {
        std::cout << "[SKIP] ffmpeg/ffprobe not on PATH" << std::endl;
        return;
    }
    ScratchDir dir("container");
    const fs::path clip = dir.path() / "clip.mp4";
    std::string cmd = "ffmpeg -nostdin -v error -y -f lavfi -i color=c=black:s=16x16:d=1 -c:v mpeg4 '" + clip.string() + "' 2>&1";
    if (std::system(cmd.c_str()) != 0 || !fs::exists(clip)) {
        std::cout << "[SKIP] could not generate a sample clip" << std::endl;
        return;
    }
    metamerger::CanonicalMetadata m;
    m.takenAt = 1700000000;
    metamerger::GpsPosition gps;
    gps.latitude = 37.7749;
    gps.longitude = -122.4194;
    m.gps = gps;
    auto writer = metamerger::makeFormatWriter(metamerger::resolveFormatFamily(clip));
    metamerger::WriteResult r = writer->apply(clip, m);
    check(tally, r.status == metamerger::WriteStatus::Written, "creation_time and location written", r.message);
    metamerger::ContainerTags tags;
    check(tally, metamerger::readContainerTags(clip, tags) && tags.creationTime == "2023-11-14T22:13:20",
          "creation_time read back", tags.creationTime);
    check(tally, tags.location == "+37.7749-122.4194/", "MP4 location read back", tags.location);
    r = writer->apply(clip, m);
    check(tally, r.status == metamerger::WriteStatus::AlreadyCurrent, "second write skipped");
    check(tally, noTempFilesIn(dir.path()), "no temp files left behind");
}

}  // namespace

int runAllTests() {
    std::cout << "MetaMerger self-test run" << std::endl;
    Tally tally;
    try {
        runMatcherTests(tally);
        runExtractorTests(tally);
        runGpsFormatTests(tally);
        runTimeFormatTests(tally);
        runExifWriterTests(tally);
        runTempFileTests(tally);
        runWriteFailureTests(tally);
        runPipelineTests(tally);
        runDirectoryAssignmentTests(tally);
        runRunLogTests(tally);
        runContainerTests(tally);
    } catch (const std::exception& e) {
        std::cout << "[FAIL] unexpected exception: " << e.what() << std::endl;
        ++tally.failed;
    }
    std::cout << "\nTests: " << tally.passed << " passed, " << tally.failed << " failed." << std::endl;
    return tally.failed == 0 ? 0 : 1;
}
