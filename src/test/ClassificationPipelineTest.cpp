#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "application/ClassificationPipeline.hpp"
#include "test/TestSupport.hpp"

using namespace scansorter;
using application::ClassificationPipeline;
using domain::FileOutcome;
using domain::PipelineStage;

namespace fs = std::filesystem;

namespace {

struct Harness {
    explicit Harness(const fs::path& root, std::string errorDir = "")
        : intake(root / "waves"), finished(root / "wavesfinished"),
          errors(errorDir.empty() ? finished / "UncapturedPO" : fs::path(errorDir)) {
        fs::create_directories(intake);

        infrastructure::ReadinessGate::Settings gateSettings;
        gateSettings.settleDelay = std::chrono::milliseconds(0);
        gateSettings.probe = domain::RetryPolicy{2, std::chrono::milliseconds(5)};

        decoder = std::make_shared<test::FakeDecoder>();
        engine = std::make_shared<test::FakeOcrEngine>();

        ClassificationPipeline::Settings settings;
        settings.finishedDirectory = finished.string();
        settings.errorDirectory = errors.string();
        settings.imageExtensions = {".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp"};

        pipeline = std::make_unique<ClassificationPipeline>(
            settings,
            std::make_unique<infrastructure::ReadinessGate>(gateSettings),
            std::make_unique<application::TextExtractor>(decoder, engine,
                                                         domain::RetryPolicy{2, std::chrono::milliseconds(1)}),
            std::make_unique<infrastructure::Filer>(),
            [this](const std::string& line) { messages.push_back(line); });
    }

    bool logged(const std::string& needle) const {
        for (const auto& line : messages) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    fs::path intake;
    fs::path finished;
    fs::path errors;
    std::shared_ptr<test::FakeDecoder> decoder;
    std::shared_ptr<test::FakeOcrEngine> engine;
    std::unique_ptr<ClassificationPipeline> pipeline;
    std::vector<std::string> messages;
};

} // namespace

int main() {
    std::cout << "[Test] Starting ClassificationPipeline Test..." << std::endl;
    test::TempDir dir("pipeline");
    Harness h(dir.path());

    // Token found: renamed into the finished directory.
    {
        const fs::path source = h.intake / "scan001.png";
        test::WriteFile(source, "Invoice for PO904821 dated today");
        auto report = h.pipeline->classify(source.string());

        assert(report.outcome == FileOutcome::Classified);
        assert(report.stage == PipelineStage::Filed);
        assert(report.token && *report.token == "PO904821");
        assert(!fs::exists(source));
        const fs::path dest(report.destination);
        assert(dest.parent_path() == h.finished);
        assert(std::regex_match(dest.filename().string(), std::regex("PO904821_[0-9a-f]{6}\\.png")));
        assert(test::ReadFile(dest) == "Invoice for PO904821 dated today");
        assert(h.logged("New file detected"));
        assert(h.logged("OCR raw output"));
        assert(h.logged("File renamed to '" + dest.filename().string() + "'"));
    }

    // Prefixed token wins over a later plain one.
    {
        const fs::path source = h.intake / "scan002.jpg";
        test::WriteFile(source, "Ref 99 APO1023 see PO55");
        auto report = h.pipeline->classify(source.string());
        assert(report.outcome == FileOutcome::Classified);
        assert(*report.token == "APO1023");
        assert(fs::path(report.destination).extension() == ".jpg");
    }

    // No token: moved to the error bucket under its own name.
    {
        const fs::path source = h.intake / "scan003.png";
        test::WriteFile(source, "Thank you for your order");
        auto report = h.pipeline->classify(source.string());

        assert(report.outcome == FileOutcome::NoTokenFound);
        assert(report.stage == PipelineStage::Filed);
        assert(domain::OutcomeToString(report.outcome) == "NoTokenFound");
        assert(domain::StageToString(report.stage) == "Filed");
        assert(!report.token);
        assert(fs::path(report.destination) == h.errors / "scan003.png");
        assert(fs::exists(h.errors / "scan003.png"));
        assert(!fs::exists(source));
        assert(report.message.rfind("[WARNING] PO Number could not be extracted", 0) == 0);
    }

    // Lowercase po is not a token.
    {
        const fs::path source = h.intake / "lower.png";
        test::WriteFile(source, "po12345");
        auto report = h.pipeline->classify(source.string());
        assert(report.outcome == FileOutcome::NoTokenFound);
    }

    // Unsupported extension: left untouched, never decoded.
    {
        const fs::path source = h.intake / "notes.txt";
        test::WriteFile(source, "PO123");
        const int decodesBefore = h.decoder->calls;
        auto report = h.pipeline->classify(source.string());

        assert(report.outcome == FileOutcome::UnsupportedExtension);
        assert(report.stage == PipelineStage::Skipped);
        assert(fs::exists(source));
        assert(h.decoder->calls == decodesBefore);
        assert(report.message.find("Unsupported file format detected") != std::string::npos);
    }

    // Extension match ignores case.
    {
        assert(h.pipeline->isSupportedImage("/x/SCAN.PNG"));
        assert(h.pipeline->isSupportedImage("/x/scan.Tiff"));
        assert(!h.pipeline->isSupportedImage("/x/scan"));
        assert(!h.pipeline->isSupportedImage("/x/scan.pdf"));
    }

    // Corrupt image: decode retries exhausted, file goes to the error bucket.
    {
        const fs::path source = h.intake / "broken.png";
        test::WriteFile(source, "CORRUPT bytes");
        auto report = h.pipeline->classify(source.string());

        assert(report.outcome == FileOutcome::DecodeFailure);
        assert(report.stage == PipelineStage::Errored);
        assert(h.logged("[WARNING] Image '" + source.string() + "' is locked or unreadable. Retrying (1/2)..."));
        assert(fs::exists(h.errors / "broken.png"));
        assert(!fs::exists(source));
        assert(report.message.rfind("[ERROR]", 0) == 0);
    }

    // Engine failure: not retried, file goes to the error bucket.
    {
        const fs::path source = h.intake / "engine.png";
        test::WriteFile(source, "ENGINE_FAIL");
        const int enginesBefore = h.engine->calls;
        auto report = h.pipeline->classify(source.string());

        assert(report.outcome == FileOutcome::EngineFailure);
        assert(h.engine->calls == enginesBefore + 1);
        assert(fs::exists(h.errors / "engine.png"));
    }

    // Empty file never becomes ready and stays in intake.
    {
        const fs::path source = h.intake / "empty.png";
        test::WriteFile(source, "");
        auto report = h.pipeline->classify(source.string());

        assert(report.outcome == FileOutcome::LockTimeout);
        assert(report.stage == PipelineStage::Skipped);
        assert(h.logged("[INFO] Waiting for file access: " + source.string() + " (1/2)"));
        assert(!report.moved());
        assert(fs::exists(source));
        fs::remove(source);
    }

    // Vanished and non-file entries are skipped.
    {
        auto gone = h.pipeline->classify((h.intake / "gone.png").string());
        assert(gone.outcome == FileOutcome::Vanished);

        const fs::path subdir = h.intake / "folder.png";
        fs::create_directories(subdir);
        auto folder = h.pipeline->classify(subdir.string());
        assert(folder.outcome == FileOutcome::NotAFile);
        assert(fs::is_directory(subdir));
    }

    // Two files with the same token never overwrite each other.
    {
        const fs::path a = h.intake / "dup_a.png";
        const fs::path b = h.intake / "dup_b.png";
        test::WriteFile(a, "PO777 first");
        test::WriteFile(b, "PO777 second");
        auto ra = h.pipeline->classify(a.string());
        auto rb = h.pipeline->classify(b.string());
        assert(ra.outcome == FileOutcome::Classified && rb.outcome == FileOutcome::Classified);
        assert(ra.destination != rb.destination);
        assert(test::ReadFile(ra.destination) == "PO777 first");
        assert(test::ReadFile(rb.destination) == "PO777 second");
    }

    // Watcher entry point.
    {
        const fs::path source = h.intake / "event.png";
        test::WriteFile(source, "PO42");
        h.pipeline->onFileCreated(domain::IntakeEvent::Now(source.string()));
        assert(!fs::exists(source));
        assert(h.logged("File renamed to 'PO42_"));
    }

    // Error bucket unusable: the move is retried once, then the file stays put.
    {
        test::TempDir other("pipeline_blocked");
        const fs::path blocker = other.path() / "not_a_dir";
        test::WriteFile(blocker, "x");
        Harness blocked(other.path(), blocker.string());

        const fs::path source = blocked.intake / "stuck.png";
        test::WriteFile(source, "no token here");
        auto report = blocked.pipeline->classify(source.string());

        assert(report.outcome == FileOutcome::FilesystemFailure);
        assert(!report.moved());
        assert(fs::exists(source));
        assert(blocked.logged("Retrying once"));
        assert(report.message.rfind("[ERROR]", 0) == 0);
    }

    std::cout << "[PASS] ClassificationPipeline Test." << std::endl;
    return 0;
}
