/**
 * @file ScanSorterApp.hpp
 * @brief Main application class for ScanSorter.
 */

#pragma once

#include "application/ClassificationPipeline.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/InotifyDirectoryWatcher.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>

namespace scansorter::app {

/**
 * @class StartupError
 * @brief A precondition for watching is not met. Fatal.
 */
class StartupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ScanSorterApp
 * @brief Orchestrates the application lifecycle: startup checks, watching, shutdown.
 */
class ScanSorterApp {
public:
    explicit ScanSorterApp(infrastructure::AppSettings settings);
    ~ScanSorterApp();

    /**
     * @brief Prepares directories and the OCR engine, then watches until @p stopRequested is set.
     * @return 0 on clean shutdown, 1 if watching ended on its own.
     * @throws StartupError if the OCR engine or the directories are unavailable.
     */
    int Run(const std::atomic<bool>& stopRequested);

private:
    /**
     * @brief Creates the working directories and loads the OCR engine.
     * @throws StartupError
     */
    void Init();

    /** @brief Stops the watcher and releases the pipeline. */
    void Shutdown();

    infrastructure::AppSettings m_settings;
    std::unique_ptr<application::ClassificationPipeline> m_pipeline;
    std::unique_ptr<infrastructure::InotifyDirectoryWatcher> m_watcher;
};

} // namespace scansorter::app
