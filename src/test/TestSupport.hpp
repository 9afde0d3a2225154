// Shared fakes and helpers for the test executables.
#pragma once

#include "domain/OcrEngine.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace scansorter::test {

/** @brief Creates a fresh directory under the system temp dir and removes it on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& tag)
        : TempDir(tag, std::filesystem::temp_directory_path()) {}

    TempDir(const std::string& tag, const std::filesystem::path& base) {
        std::random_device rd;
        m_path = base / ("scansorter_" + tag + "_" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/** @brief "Image" whose pixels are the file's text. */
class FakeImage : public domain::DecodedImage {
public:
    explicit FakeImage(std::string text) : text(std::move(text)) {}
    std::string text;
};

/**
 * @brief Decodes any file by reading it as text.
 *
 * Files starting with "CORRUPT" never decode. The first @c failuresBeforeSuccess
 * calls fail regardless of content.
 */
class FakeDecoder : public domain::ImageDecoder {
public:
    std::unique_ptr<domain::DecodedImage> decode(const std::string& imagePath) override {
        ++calls;
        if (failuresBeforeSuccess > 0) {
            --failuresBeforeSuccess;
            return nullptr;
        }
        if (throwOnDecode) {
            throw std::runtime_error("decoder exploded");
        }
        std::string content = ReadFile(imagePath);
        if (content.rfind("CORRUPT", 0) == 0) {
            return nullptr;
        }
        return std::make_unique<FakeImage>(content);
    }

    std::atomic<int> calls{0};
    int failuresBeforeSuccess = 0;
    bool throwOnDecode = false;
};

/** @brief Returns the fake image's text. Text "ENGINE_FAIL" makes it throw. */
class FakeOcrEngine : public domain::OcrEngine {
public:
    std::string recognize(const domain::DecodedImage& image) override {
        ++calls;
        const auto& fake = dynamic_cast<const FakeImage&>(image);
        if (fake.text.rfind("ENGINE_FAIL", 0) == 0) {
            throw domain::OcrEngineError("unsupported image format");
        }
        return fake.text;
    }

    std::atomic<int> calls{0};
};

} // namespace scansorter::test
