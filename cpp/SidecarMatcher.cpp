#include "SidecarMatcher.h"
#include <algorithm>
#include <cctype>
#include <utility>

namespace metamerger {

namespace {

const std::string kJsonExtension = ".json";
const std::string kSupplementalSuffix = "supplemental-metadata";

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

bool endsWithIgnoreCase(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && equalsIgnoreCase(s.substr(s.size() - suffix.size()), suffix);
}

// Strip a trailing "(digits)"; returns the digits or empty
std::string stripEdition(std::string& name) {
    if (name.size() < 3 || name.back() != ')') return "";
    std::size_t open = name.rfind('(');
    if (open == std::string::npos || open + 2 > name.size() - 1) return "";
    std::string digits = name.substr(open + 1, name.size() - open - 2);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }))
        return "";
    name.erase(open);
    return digits;
}

// Stem compared exactly, extension (after the last dot) case-insensitively
bool sameName(const std::string& a, const std::string& b) {
    std::size_t da = a.rfind('.');
    std::size_t db = b.rfind('.');
    if (da == std::string::npos || db == std::string::npos)
        return a == b;
    return a.compare(0, da, b, 0, db) == 0 && da == db && equalsIgnoreCase(a.substr(da), b.substr(db));
}

// Is prefix a leading part of name? Characters from stemLength on (the extension) compare case-insensitively.
bool isNamePrefix(const std::string& name, const std::string& prefix, std::size_t stemLength) {
    if (prefix.size() > name.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (i < stemLength) {
            if (name[i] != prefix[i]) return false;
        } else if (std::tolower(static_cast<unsigned char>(name[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

struct MediaName {
    std::string full;        // IMG_0001(1).jpg
    std::string stem;        // IMG_0001(1)
    std::string baseStem;    // IMG_0001
    std::string extension;   // .jpg
    std::string edition;     // 1
    std::string target() const { return baseStem + extension; }
};

MediaName parseMediaName(const std::string& fileName) {
    MediaName m;
    m.full = fileName;
    std::size_t dot = fileName.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        m.stem = fileName;
    } else {
        m.stem = fileName.substr(0, dot);
        m.extension = fileName.substr(dot);
    }
    m.baseStem = m.stem;
    m.edition = stripEdition(m.baseStem);
    return m;
}

}  // namespace

bool parseSidecarName(const std::string& fileName, SidecarName& out) {
    if (!endsWithIgnoreCase(fileName, kJsonExtension) || fileName.size() == kJsonExtension.size())
        return false;
    SidecarName name;
    name.body = fileName.substr(0, fileName.size() - kJsonExtension.size());
    name.preEditionBody = name.body;
    name.edition = stripEdition(name.preEditionBody);
    name.title = name.preEditionBody;

    std::size_t dot = name.title.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        std::string suffix = name.title.substr(dot + 1);
        if (kSupplementalSuffix.compare(0, suffix.size(), suffix) == 0) {
            name.title.erase(dot);
            name.supplemental = true;
        }
    }
    out = name;
    return true;
}

MatchRule matchSidecar(const std::string& mediaFileName, const std::string& candidateFileName,
                       std::size_t truncationLength, std::size_t& matchedLength) {
    SidecarName cand;
    if (!parseSidecarName(candidateFileName, cand)) return MatchRule::NoMatch;
    const MediaName media = parseMediaName(mediaFileName);
    matchedLength = cand.title.size();

    if (sameName(cand.body, media.full) || cand.body == media.stem ||
        (cand.supplemental && cand.edition.empty() && sameName(cand.title, media.full)))
        return MatchRule::Exact;

    if (cand.edition != media.edition) return MatchRule::NoMatch;

    const std::string target = media.target();
    if (!media.edition.empty() && (sameName(cand.title, target) || cand.title == media.baseStem))
        return MatchRule::TransposedEdition;

    if (cand.preEditionBody.size() >= truncationLength && !cand.title.empty() &&
        cand.title.size() < target.size() && isNamePrefix(target, cand.title, media.baseStem.size()))
        return MatchRule::Truncated;

    return MatchRule::NoMatch;
}

std::optional<SidecarMatch> findBestSidecar(const std::string& mediaFileName,
                                            const std::vector<std::string>& candidateFileNames,
                                            std::size_t truncationLength) {
    std::optional<SidecarMatch> best;
    std::size_t bestLength = 0;
    for (std::size_t i = 0; i < candidateFileNames.size(); ++i) {
        std::size_t length = 0;
        MatchRule rule = matchSidecar(mediaFileName, candidateFileNames[i], truncationLength, length);
        if (rule == MatchRule::NoMatch) continue;
        bool better = !best || rule < best->rule || (rule == best->rule && length > bestLength);
        if (better) {
            best = SidecarMatch{i, rule};
            bestLength = length;
        }
    }
    return best;
}

const char* matchRuleName(MatchRule rule) {
    switch (rule) {
        case MatchRule::NoMatch: return "NoMatch";
        case MatchRule::Exact: return "Exact";
        case MatchRule::TransposedEdition: return "TransposedEdition";
        case MatchRule::Truncated: return "Truncated";
    }
    return "?";
}

SidecarPool::SidecarPool(std::vector<fs::path> sidecars, std::size_t truncationLength)
    : sidecars_(std::move(sidecars)), truncationLength_(truncationLength) {
    names_.reserve(sidecars_.size());
    for (const auto& p : sidecars_)
        names_.push_back(p.filename().string());
}

fs::path SidecarPool::take(std::size_t index) {
    fs::path taken = sidecars_[index];
    sidecars_.erase(sidecars_.begin() + static_cast<std::ptrdiff_t>(index));
    names_.erase(names_.begin() + static_cast<std::ptrdiff_t>(index));
    return taken;
}

void SidecarPool::assign(const std::vector<std::string>& mediaFileNames) {
    for (MatchRule rule : { MatchRule::Exact, MatchRule::TransposedEdition, MatchRule::Truncated }) {
        for (const auto& media : mediaFileNames) {
            if (assigned_.count(media)) continue;
            bool found = false;
            std::size_t bestIndex = 0;
            std::size_t bestLength = 0;
            for (std::size_t i = 0; i < names_.size(); ++i) {
                std::size_t length = 0;
                if (matchSidecar(media, names_[i], truncationLength_, length) != rule) continue;
                if (!found || length > bestLength) {
                    found = true;
                    bestIndex = i;
                    bestLength = length;
                }
            }
            if (found)
                assigned_[media] = Assignment{take(bestIndex), rule};
        }
    }
}

std::optional<fs::path> SidecarPool::claim(const std::string& mediaFileName, MatchRule* rule) {
    auto planned = assigned_.find(mediaFileName);
    if (planned != assigned_.end()) {
        Assignment assignment = planned->second;
        assigned_.erase(planned);
        if (rule) *rule = assignment.rule;
        return assignment.sidecar;
    }
    auto match = findBestSidecar(mediaFileName, names_, truncationLength_);
    if (!match) return std::nullopt;
    if (rule) *rule = match->rule;
    return take(match->index);
}

}  // namespace metamerger
