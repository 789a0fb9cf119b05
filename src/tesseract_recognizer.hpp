#ifndef TESSERACT_RECOGNIZER_HPP
#define TESSERACT_RECOGNIZER_HPP

#include <string>

#include "text_recognizer.hpp"

struct TesseractOptions {
    std::string tessdata_path;  // empty = TESSDATA_PREFIX or the built-in default
    int engine_mode;            // tesseract::OcrEngineMode, 3 = default

    TesseractOptions() {
        engine_mode = 3;
    }
};

// Tesseract backend. Every call builds its own TessBaseAPI, so one
// instance may be shared by concurrent requests.
class TesseractRecognizer : public TextRecognizer {
public:
    explicit TesseractRecognizer(const TesseractOptions& options = TesseractOptions());
    ~TesseractRecognizer() override;

    RecognitionResult recognize(const cv::Mat& image, const RecognitionConfig& config) override;

    const TesseractOptions& options() const { return options_; }

private:
    TesseractOptions options_;
};

#endif // TESSERACT_RECOGNIZER_HPP
