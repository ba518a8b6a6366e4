#include "FormatWriter.h"
#include "ExifHelper.h"
#include "VideoMetaHelper.h"

namespace metamerger {

namespace {

// JPEG, PNG, WebP, GIF. Data Exiv2 cannot identify is a broken file, not an unsupported one.
class ExifImageWriter : public FormatWriter {
public:
    FormatFamily family() const override { return FormatFamily::JpegLike; }

    WriteResult apply(const fs::path& mediaPath, const CanonicalMetadata& metadata) const override {
        return writeExifMetadata(mediaPath, metadata, false);
    }
};

// HEIC is only recognized when Exiv2 is built with BMFF support, and even then it is read-only.
class HeicWriter : public FormatWriter {
public:
    FormatFamily family() const override { return FormatFamily::Heic; }

    WriteResult apply(const fs::path& mediaPath, const CanonicalMetadata& metadata) const override {
        return writeExifMetadata(mediaPath, metadata, true);
    }
};

class ContainerTagWriter : public FormatWriter {
public:
    FormatFamily family() const override { return FormatFamily::ContainerTagged; }

    WriteResult apply(const fs::path& mediaPath, const CanonicalMetadata& metadata) const override {
        return writeContainerMetadata(mediaPath, metadata);
    }
};

// RAW containers are proprietary; only the file times are restored.
class FilesystemOnlyWriter : public FormatWriter {
public:
    FormatFamily family() const override { return FormatFamily::FilesystemOnly; }

    WriteResult apply(const fs::path&, const CanonicalMetadata&) const override {
        return WriteResult::unsupported("RAW format: file times only");
    }
};

}  // namespace

std::unique_ptr<FormatWriter> makeFormatWriter(FormatFamily family) {
    switch (family) {
        case FormatFamily::JpegLike: return std::make_unique<ExifImageWriter>();
        case FormatFamily::Heic: return std::make_unique<HeicWriter>();
        case FormatFamily::ContainerTagged: return std::make_unique<ContainerTagWriter>();
        case FormatFamily::FilesystemOnly: return std::make_unique<FilesystemOnlyWriter>();
        case FormatFamily::Unsupported: break;
    }
    return nullptr;
}

}  // namespace metamerger
