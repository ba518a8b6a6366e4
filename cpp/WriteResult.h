#pragma once

#include <string>

namespace metamerger {

enum class WriteStatus {
    Written,          // content rewritten and atomically replaced
    AlreadyCurrent,   // embedded tags already hold these values, file untouched
    Unsupported,      // format cannot carry embedded metadata here; file untouched
    Failed            // original left untouched
};

struct WriteResult {
    WriteStatus status = WriteStatus::Failed;
    std::string message;

    static WriteResult written() { return { WriteStatus::Written, "" }; }
    static WriteResult alreadyCurrent() { return { WriteStatus::AlreadyCurrent, "" }; }
    static WriteResult unsupported(const std::string& why) { return { WriteStatus::Unsupported, why }; }
    static WriteResult failed(const std::string& why) { return { WriteStatus::Failed, why }; }
};

}  // namespace metamerger
