#include "app/ScanSorterApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

using namespace scansorter;

namespace {

std::atomic<bool> g_stopRequested{false};

void HandleStopSignal(int) {
    g_stopRequested.store(true);
}

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--root_directory DIR] [--tessdata PATH] [--language CODE]\n"
              << "  --root_directory  Root housing 'waves', 'wavesfinished' and the error directory.\n"
              << "                    Default: /renamescans\n"
              << "  --tessdata        Tesseract data directory, install directory or executable.\n"
              << "  --language        OCR language code. Default: eng\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string rootDirectory = (std::filesystem::path("/") / "renamescans").string();
    std::string tessdata;
    std::string language;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }

        std::string* target = nullptr;
        if (arg == "--root_directory") target = &rootDirectory;
        else if (arg == "--tessdata") target = &tessdata;
        else if (arg == "--language") target = &language;

        if (!target) {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        *target = argv[++i];
    }

    infrastructure::AppSettings settings = infrastructure::ConfigLoader::Load(rootDirectory);
    if (!tessdata.empty()) settings.tessdataOverride = tessdata;
    if (!language.empty()) settings.language = language;

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    try {
        app::ScanSorterApp application(std::move(settings));
        return application.Run(g_stopRequested);
    } catch (const app::StartupError& e) {
        std::cerr << "[ScanSorter] " << e.what() << std::endl;
        return 1;
    }
}
