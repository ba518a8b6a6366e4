#pragma once

#include "MediaFormat.h"
#include "Metadata.h"
#include "WriteResult.h"
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace metamerger {

// Applies a metadata record to the embedded tags of one format family.
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    virtual FormatFamily family() const = 0;

    // Never leaves a partially written file at mediaPath.
    virtual WriteResult apply(const fs::path& mediaPath, const CanonicalMetadata& metadata) const = 0;
};

// Writer for a resolved family; nullptr for FormatFamily::Unsupported
std::unique_ptr<FormatWriter> makeFormatWriter(FormatFamily family);

}  // namespace metamerger
