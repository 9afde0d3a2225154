/**
 * @file ClassificationPipeline.hpp
 * @brief Per-file orchestration: gate, extract, parse, file.
 */

#pragma once

#include "application/TextExtractor.hpp"
#include "domain/ClassificationOutcome.hpp"
#include "domain/FileEventHandler.hpp"
#include "infrastructure/Filer.hpp"
#include "infrastructure/ReadinessGate.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace scansorter::application {

/**
 * @class ClassificationPipeline
 * @brief Classifies one intake file at a time and files it into a bucket.
 *
 * Every per-file failure is converted into a ClassificationReport and a status
 * message; nothing propagates to the caller. The pipeline keeps no state between
 * files.
 */
class ClassificationPipeline : public domain::FileEventHandler {
public:
    /** @brief Receives one line per progress or outcome message. */
    using StatusCallback = std::function<void(const std::string&)>;

    struct Settings {
        std::string finishedDirectory;
        std::string errorDirectory;
        std::vector<std::string> imageExtensions; ///< Lowercase, with leading dot.
    };

    ClassificationPipeline(Settings settings,
                           std::unique_ptr<infrastructure::ReadinessGate> gate,
                           std::unique_ptr<TextExtractor> extractor,
                           std::unique_ptr<infrastructure::Filer> filer,
                           StatusCallback statusCallback = nullptr);

    /** @brief Classifies the file named by the event. @see domain::FileEventHandler::onFileCreated */
    void onFileCreated(const domain::IntakeEvent& event) override;

    /**
     * @brief Runs the full pipeline on one file.
     * @return What happened to the file. Never throws for per-file failures.
     */
    domain::ClassificationReport classify(const std::string& path);

    /** @brief Case-insensitive match of the path's extension against the configured list. */
    bool isSupportedImage(const std::string& path) const;

private:
    void runStages(domain::ClassificationReport& report);
    void fileReadableWithoutToken(domain::ClassificationReport& report, const std::string& level,
                                  const std::string& reason);
    infrastructure::FilingResult fileWithRetry(const std::string& path,
                                               const std::function<infrastructure::FilingResult()>& move);
    void emit(const std::string& message) const;

    Settings m_settings;
    std::unique_ptr<infrastructure::ReadinessGate> m_gate;
    std::unique_ptr<TextExtractor> m_extractor;
    std::unique_ptr<infrastructure::Filer> m_filer;
    StatusCallback m_statusCallback;
};

} // namespace scansorter::application
