/**
 * @file ConfigLoader.hpp
 * @brief Application settings and their loading from settings.json.
 *
 * All three working directories derive from a single root directory by fixed
 * names, so only the root and the error-bucket layout are configurable.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace scansorter::infrastructure {

/**
 * @enum ErrorLayout
 * @brief Where the error bucket lives relative to the finished bucket.
 */
enum class ErrorLayout {
    Nested,  ///< <root>/wavesfinished/UncapturedPO
    Sibling  ///< <root>/waveserrors
};

/**
 * @struct AppSettings
 * @brief Everything the watcher needs, read-only once startup completes.
 */
struct AppSettings {
    std::string rootDirectory = "/renamescans";
    ErrorLayout errorLayout = ErrorLayout::Nested;

    std::string tessdataOverride; ///< Empty means auto-discovery.
    std::string language = "eng";

    std::chrono::milliseconds settleDelay{3000};
    int gateAttempts = 10;
    std::chrono::milliseconds gateBackoff{2000};
    int decodeAttempts = 5;
    std::chrono::milliseconds decodeDelay{1000};

    std::vector<std::string> imageExtensions{".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp"};

    std::string intakeDirectory() const;
    std::string finishedDirectory() const;
    std::string errorDirectory() const;
};

class ConfigLoader {
public:
    /**
     * @brief Builds settings for a root directory, applying <root>/settings.json if present.
     *
     * A missing file yields defaults. A malformed file is reported on stderr and ignored.
     */
    static AppSettings Load(const std::string& rootDirectory);

    /**
     * @brief Applies a settings.json document on top of @p settings.
     *
     * Either every key is applied or none is.
     * @param error Receives the reason when the document is rejected.
     * @return True if the document was applied.
     */
    static bool ApplyJson(const std::string& jsonText, AppSettings& settings, std::string& error);

    /** @brief Parses "nested" / "sibling". */
    static std::optional<ErrorLayout> ParseErrorLayout(const std::string& value);
};

} // namespace scansorter::infrastructure
