/**
 * @file TesseractOcrEngine.hpp
 * @brief OcrEngine adapter for the Tesseract library.
 */

#pragma once

#include "domain/OcrEngine.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

namespace scansorter::infrastructure {

class TesseractOcrEngine : public domain::OcrEngine {
public:
    /**
     * @param tessdataDir Resolved tessdata directory. Passed in explicitly, never read from globals.
     * @param language Tesseract language code, e.g. "eng".
     */
    TesseractOcrEngine(std::string tessdataDir, std::string language);
    ~TesseractOcrEngine() override;

    /**
     * @brief Loads the language model. Must succeed before recognize() is used.
     * @param errorMsg Receives the reason on failure.
     */
    bool initialize(std::string& errorMsg);

    /** @brief Runs OCR on a LeptonicaImage. @throws domain::OcrEngineError */
    std::string recognize(const domain::DecodedImage& image) override;

private:
    std::string m_tessdataDir;
    std::string m_language;

    // TessBaseAPI is not safe for concurrent recognition; one call at a time.
    std::unique_ptr<tesseract::TessBaseAPI> m_api;
    std::mutex m_mutex;
    bool m_initialized = false;
};

} // namespace scansorter::infrastructure
