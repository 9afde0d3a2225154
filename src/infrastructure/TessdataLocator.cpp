/**
 * @file TessdataLocator.cpp
 * @brief Implementation of TessdataLocator.
 */

#include "infrastructure/TessdataLocator.hpp"
#include <cstdlib>

namespace scansorter::infrastructure {

namespace fs = std::filesystem;

bool TessdataLocator::HasLanguageData(const fs::path& dir, const std::string& language) {
    std::error_code ec;
    return fs::is_regular_file(dir / (language + ".traineddata"), ec);
}

std::vector<fs::path> TessdataLocator::DefaultCandidates() {
    std::vector<fs::path> candidates;
    const char* prefix = std::getenv("TESSDATA_PREFIX");
    if (prefix && *prefix) {
        candidates.emplace_back(prefix);
        candidates.emplace_back(fs::path(prefix) / "tessdata");
    }
    candidates.emplace_back("/usr/share/tesseract-ocr/5/tessdata");
    candidates.emplace_back("/usr/share/tesseract-ocr/4.00/tessdata");
    candidates.emplace_back("/usr/share/tessdata");
    candidates.emplace_back("/usr/local/share/tessdata");
    return candidates;
}

std::optional<fs::path> TessdataLocator::Resolve(const std::string& overridePath, const std::string& language) {
    std::vector<fs::path> candidates;

    if (!overridePath.empty()) {
        const fs::path p(overridePath);
        std::error_code ec;
        if (fs::is_regular_file(p, ec)) {
            // Path to the tesseract executable.
            candidates.push_back(p.parent_path() / "tessdata");
        } else {
            candidates.push_back(p);
            candidates.push_back(p / "tessdata");
        }
    } else {
        candidates = DefaultCandidates();
    }

    for (const auto& dir : candidates) {
        if (HasLanguageData(dir, language)) {
            return dir;
        }
    }
    return std::nullopt;
}

} // namespace scansorter::infrastructure
