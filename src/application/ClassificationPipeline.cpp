/**
 * @file ClassificationPipeline.cpp
 * @brief Implementation of ClassificationPipeline.
 */

#include "application/ClassificationPipeline.hpp"
#include "domain/PoTokenParser.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace scansorter::application {

using domain::ClassificationReport;
using domain::FileOutcome;
using domain::PipelineStage;

ClassificationPipeline::ClassificationPipeline(Settings settings,
                                               std::unique_ptr<infrastructure::ReadinessGate> gate,
                                               std::unique_ptr<TextExtractor> extractor,
                                               std::unique_ptr<infrastructure::Filer> filer,
                                               StatusCallback statusCallback)
    : m_settings(std::move(settings))
    , m_gate(std::move(gate))
    , m_extractor(std::move(extractor))
    , m_filer(std::move(filer))
    , m_statusCallback(std::move(statusCallback)) {}

void ClassificationPipeline::onFileCreated(const domain::IntakeEvent& event) {
    classify(event.path);
}

bool ClassificationPipeline::isSupportedImage(const std::string& path) const {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return std::find(m_settings.imageExtensions.begin(), m_settings.imageExtensions.end(), ext) !=
           m_settings.imageExtensions.end();
}

ClassificationReport ClassificationPipeline::classify(const std::string& path) {
    ClassificationReport report;
    report.sourcePath = path;
    report.stage = PipelineStage::Detected;

    try {
        runStages(report);
    } catch (const std::exception& e) {
        report.stage = PipelineStage::Errored;
        report.outcome = FileOutcome::UnexpectedError;
        report.message = "[ERROR] Unexpected error while processing " + path + ": " + e.what();
    }

    emit(report.message);
    return report;
}

void ClassificationPipeline::runStages(ClassificationReport& report) {
    const std::string& path = report.sourcePath;

    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        report.stage = PipelineStage::Skipped;
        report.outcome = FileOutcome::Vanished;
        report.message = "[WARNING] File disappeared before processing: " + path;
        return;
    }
    if (!fs::is_regular_file(status)) {
        report.stage = PipelineStage::Skipped;
        report.outcome = FileOutcome::NotAFile;
        report.message = "[INFO] Ignoring non-file entry: " + path;
        return;
    }

    emit("[INFO] New file detected: " + path);

    if (!isSupportedImage(path)) {
        report.stage = PipelineStage::Skipped;
        report.outcome = FileOutcome::UnsupportedExtension;
        report.message = "[WARNING] Unsupported file format detected: " + path;
        return;
    }

    // Detected -> Gated
    const auto progress = [this](const std::string& line) { emit(line); };
    const infrastructure::GateResult gate = m_gate->waitUntilReady(path, progress);
    if (gate.status == infrastructure::GateStatus::Missing) {
        report.stage = PipelineStage::Skipped;
        report.outcome = FileOutcome::Vanished;
        report.message = "[WARNING] File disappeared while waiting for it to be written: " + path;
        return;
    }
    if (gate.status != infrastructure::GateStatus::Ready) {
        report.stage = PipelineStage::Skipped;
        report.outcome = FileOutcome::LockTimeout;
        report.message = "[ERROR] File still empty or locked after " + std::to_string(gate.attempts) +
                         " attempts, leaving it in place: " + path;
        return;
    }
    report.stage = PipelineStage::Gated;

    // Gated -> Extracted
    const ExtractionResult extraction = m_extractor->extract(path, progress);
    if (!extraction.success()) {
        report.stage = PipelineStage::Errored;
        if (extraction.status == ExtractStatus::Unreadable) {
            report.outcome = FileOutcome::DecodeFailure;
            fileReadableWithoutToken(report, "[ERROR]",
                                     "Image could not be read after " + std::to_string(extraction.decodeAttempts) +
                                         " attempts (" + extraction.errorMessage + ")");
        } else {
            report.outcome = FileOutcome::EngineFailure;
            fileReadableWithoutToken(report, "[ERROR]", "OCR engine failed (" + extraction.errorMessage + ")");
        }
        return;
    }
    report.stage = PipelineStage::Extracted;
    emit("[INFO] OCR raw output for " + path + ": " + extraction.text);

    // Extracted -> Parsed
    report.token = domain::PoTokenParser::Parse(extraction.text);
    report.stage = PipelineStage::Parsed;

    // Parsed -> Filed
    if (!report.token) {
        report.outcome = FileOutcome::NoTokenFound;
        fileReadableWithoutToken(report, "[WARNING]", "PO Number could not be extracted");
        return;
    }

    const std::string token = *report.token;
    emit("[INFO] Extracted PO Number: " + token);
    const infrastructure::FilingResult filed = fileWithRetry(path, [this, &path, &token]() {
        return m_filer->fileClassified(path, m_settings.finishedDirectory, token);
    });
    if (!filed.success) {
        report.outcome = FileOutcome::FilesystemFailure;
        report.message = "[ERROR] Could not move " + path + " to the finished directory, it remains in intake: " +
                         filed.error;
        return;
    }

    report.stage = PipelineStage::Filed;
    report.outcome = FileOutcome::Classified;
    report.destination = filed.destination;
    report.message = "[INFO] File renamed to '" + fs::path(filed.destination).filename().string() +
                     "' and moved to: " + filed.destination;
}

void ClassificationPipeline::fileReadableWithoutToken(ClassificationReport& report, const std::string& level,
                                                      const std::string& reason) {
    const std::string& path = report.sourcePath;
    const infrastructure::FilingResult filed = fileWithRetry(path, [this, &path]() {
        return m_filer->fileUnclassified(path, m_settings.errorDirectory);
    });
    if (!filed.success) {
        report.outcome = FileOutcome::FilesystemFailure;
        report.message = "[ERROR] " + reason + ". Could not move " + path +
                         " to the error directory, it remains in intake: " + filed.error;
        return;
    }

    if (report.stage == PipelineStage::Parsed) {
        report.stage = PipelineStage::Filed;
    }
    report.destination = filed.destination;
    report.message = level + " " + reason + ": " + path + ". File moved to: " + filed.destination;
}

infrastructure::FilingResult ClassificationPipeline::fileWithRetry(
        const std::string& path, const std::function<infrastructure::FilingResult()>& move) {
    infrastructure::FilingResult result = move();
    if (result.success) {
        return result;
    }
    emit("[WARNING] Move failed for " + path + " (" + result.error + "). Retrying once.");
    return move();
}

void ClassificationPipeline::emit(const std::string& message) const {
    if (m_statusCallback) {
        m_statusCallback(message);
        return;
    }
    if (message.rfind("[ERROR]", 0) == 0) {
        std::cerr << "[ClassificationPipeline] " << message << std::endl;
    } else {
        std::cout << "[ClassificationPipeline] " << message << std::endl;
    }
}

} // namespace scansorter::application
