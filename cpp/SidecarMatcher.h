#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace metamerger {

// Sidecar name as the export tool builds it: <title>[.<supplemental-metadata, possibly cut>][(N)].json
struct SidecarName {
    std::string body;              // name without ".json"
    std::string preEditionBody;    // body without the "(N)" counter
    std::string title;             // preEditionBody without the supplemental suffix
    std::string edition;           // digits of "(N)", empty if none
    bool supplemental = false;
};

// Parse a candidate file name; false if it is not a ".json" name
bool parseSidecarName(const std::string& fileName, SidecarName& out);

// Ordered by preference
enum class MatchRule {
    NoMatch,
    Exact,               // IMG_0001.jpg.json, IMG_0001.json, IMG_0001.jpg.supplemental-metadata.json
    TransposedEdition,   // IMG_0001(1).jpg <- IMG_0001.jpg(1).json
    Truncated            // cut title that is a prefix of the media name
};

struct SidecarMatch {
    std::size_t index = 0;   // position in the candidate list
    MatchRule rule = MatchRule::NoMatch;
};

// Rule that pairs candidate with media, and the matched title length for tie-breaks
MatchRule matchSidecar(const std::string& mediaFileName, const std::string& candidateFileName,
                       std::size_t truncationLength, std::size_t& matchedLength);

// Best candidate for a media file: exact before transposed before truncated, then the longest
// matched title, then listing order. Empty when nothing matches.
std::optional<SidecarMatch> findBestSidecar(const std::string& mediaFileName,
                                            const std::vector<std::string>& candidateFileNames,
                                            std::size_t truncationLength);

const char* matchRuleName(MatchRule rule);

// Sidecars of one directory. Each sidecar is handed out at most once per run.
class SidecarPool {
public:
    SidecarPool(std::vector<fs::path> sidecars, std::size_t truncationLength);

    // Pair sidecars with all media names of the directory up front, one rule at a time:
    // every exact pair first, then transposed editions, then truncated names. A weaker match
    // never takes a sidecar that another file matches more strongly.
    void assign(const std::vector<std::string>& mediaFileNames);

    // Hand out the sidecar assigned to the media file name, or match and remove the best
    // remaining one if the name was not assigned
    std::optional<fs::path> claim(const std::string& mediaFileName, MatchRule* rule = nullptr);

    // Sidecars not yet handed out
    std::size_t remaining() const { return sidecars_.size() + assigned_.size(); }

private:
    struct Assignment {
        fs::path sidecar;
        MatchRule rule = MatchRule::NoMatch;
    };

    fs::path take(std::size_t index);

    std::vector<fs::path> sidecars_;
    std::vector<std::string> names_;
    std::map<std::string, Assignment> assigned_;
    std::size_t truncationLength_;
};

}  // namespace metamerger
