/**
 * @file TessdataLocator.hpp
 * @brief Discovery of the OCR engine's language data.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scansorter::infrastructure {

/**
 * @brief Finds the OCR engine's language data directory.
 */
class TessdataLocator {
public:
    /**
     * @brief Resolves the tessdata directory holding <language>.traineddata.
     *
     * An explicit override may name the tessdata directory, a directory with a
     * tessdata/ child, or the tesseract executable. When an override is given no
     * other location is tried.
     */
    static std::optional<std::filesystem::path> Resolve(const std::string& overridePath, const std::string& language);

    /** @brief TESSDATA_PREFIX followed by the usual distribution locations. */
    static std::vector<std::filesystem::path> DefaultCandidates();

    static bool HasLanguageData(const std::filesystem::path& dir, const std::string& language);
};

} // namespace scansorter::infrastructure
