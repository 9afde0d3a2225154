/**
 * @file ScanSorterApp.cpp
 * @brief Implementation of the ScanSorterApp class.
 */
#include "app/ScanSorterApp.hpp"

#include "infrastructure/Filer.hpp"
#include "infrastructure/LeptonicaImageDecoder.hpp"
#include "infrastructure/ReadinessGate.hpp"
#include "infrastructure/TessdataLocator.hpp"
#include "infrastructure/TesseractOcrEngine.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace scansorter::app {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
    localtime_r(&tt, &tm);
    return tm;
}

// "2024-01-31 14:05:09 - [INFO] message"
void LogLine(const std::string& message) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = ToLocalTime(now);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    std::ostream& out = message.rfind("[ERROR]", 0) == 0 ? std::cerr : std::cout;
    out << stamp << " - " << message << std::endl;
}

} // namespace

ScanSorterApp::ScanSorterApp(infrastructure::AppSettings settings)
    : m_settings(std::move(settings)) {}

ScanSorterApp::~ScanSorterApp() {
    Shutdown();
}

void ScanSorterApp::Init() {
    for (const std::string& dir : {m_settings.rootDirectory, m_settings.intakeDirectory(),
                                   m_settings.finishedDirectory(), m_settings.errorDirectory()}) {
        std::string error;
        if (!infrastructure::Filer::EnsureDirectory(dir, error)) {
            throw StartupError(error);
        }
    }

    const auto tessdata = infrastructure::TessdataLocator::Resolve(m_settings.tessdataOverride, m_settings.language);
    if (!tessdata) {
        if (!m_settings.tessdataOverride.empty()) {
            throw StartupError("No " + m_settings.language + ".traineddata found at " + m_settings.tessdataOverride +
                               ". Provide the correct tessdata path.");
        }
        throw StartupError("Tesseract language data (" + m_settings.language +
                           ".traineddata) not found. Install Tesseract or pass --tessdata.");
    }

    auto engine = std::make_shared<infrastructure::TesseractOcrEngine>(tessdata->string(), m_settings.language);
    std::string engineError;
    if (!engine->initialize(engineError)) {
        throw StartupError(engineError);
    }
    LogLine("[INFO] Tesseract successfully loaded from: " + tessdata->string());

    infrastructure::ReadinessGate::Settings gateSettings;
    gateSettings.settleDelay = m_settings.settleDelay;
    gateSettings.probe = domain::RetryPolicy{m_settings.gateAttempts, m_settings.gateBackoff};

    auto extractor = std::make_unique<application::TextExtractor>(
        std::make_shared<infrastructure::LeptonicaImageDecoder>(),
        engine,
        domain::RetryPolicy{m_settings.decodeAttempts, m_settings.decodeDelay});

    application::ClassificationPipeline::Settings pipelineSettings;
    pipelineSettings.finishedDirectory = m_settings.finishedDirectory();
    pipelineSettings.errorDirectory = m_settings.errorDirectory();
    pipelineSettings.imageExtensions = m_settings.imageExtensions;

    m_pipeline = std::make_unique<application::ClassificationPipeline>(
        std::move(pipelineSettings),
        std::make_unique<infrastructure::ReadinessGate>(gateSettings),
        std::move(extractor),
        std::make_unique<infrastructure::Filer>(),
        LogLine);

    m_watcher = std::make_unique<infrastructure::InotifyDirectoryWatcher>(m_settings.intakeDirectory(), *m_pipeline);
}

int ScanSorterApp::Run(const std::atomic<bool>& stopRequested) {
    Init();

    std::string error;
    if (!m_watcher->start(error)) {
        throw StartupError(error);
    }
    LogLine("[INFO] Monitoring directory: " + m_settings.intakeDirectory());

    while (!stopRequested.load() && m_watcher->isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    const bool stoppedBySignal = stopRequested.load();
    LogLine(stoppedBySignal ? "[INFO] Stopping directory monitoring."
                            : "[ERROR] Directory monitoring ended unexpectedly.");
    Shutdown();
    return stoppedBySignal ? 0 : 1;
}

void ScanSorterApp::Shutdown() {
    if (m_watcher) {
        m_watcher->stop();
        m_watcher.reset();
    }
    m_pipeline.reset();
}

} // namespace scansorter::app
