#ifndef DOCUMENT_ENGINE_HPP
#define DOCUMENT_ENGINE_HPP

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <memory>
#include <string>

#include "document_recognizer.hpp"
#include "image_normalizer.hpp"
#include "layout_classifier.hpp"
#include "processing_result.hpp"
#include "region_extractor.hpp"
#include "tesseract_recognizer.hpp"
#include "text_recognizer.hpp"

struct ProcessingOptions {
    int timeout_ms;  // wall-clock budget for the whole call, 0 = none

    ProcessingOptions() {
        timeout_ms = 0;
    }
};

struct EngineConfig {
    ClassifierConfig classifier;
    RegionExtractorConfig region;
    RecognizerConfig recognizer;
};

// Entry point: image in, structured result out. Picks the region path for
// identity cards and the full-document path for everything else. Holds no
// per-request state, one instance can serve concurrent calls.
class DocumentEngine {
public:
    explicit DocumentEngine(const TesseractOptions& options = TesseractOptions(),
                            const EngineConfig& config = EngineConfig());
    explicit DocumentEngine(std::unique_ptr<TextRecognizer> recognizer,
                            const EngineConfig& config = EngineConfig());
    ~DocumentEngine();

    // Encoded image file contents
    ProcessingOutcome process(const uint8_t* data, size_t length,
                              const std::string& typeHint = std::string(),
                              const ProcessingOptions& options = ProcessingOptions());

    ProcessingOutcome processImage(const cv::Mat& image,
                                   const std::string& typeHint = std::string(),
                                   const ProcessingOptions& options = ProcessingOptions());

    // Raw pixels, format 0: BGRA, 1: BGR, 2: RGB
    ProcessingOutcome processBuffer(const uint8_t* pixels, int width, int height, int format,
                                    const std::string& typeHint = std::string(),
                                    const ProcessingOptions& options = ProcessingOptions());

private:
    void init(const EngineConfig& config);

    // Never throws: exceptions become InputError or OcrEngineUnavailable
    ProcessingOutcome run(const NormalizedImage& normalized, const std::string& typeHint,
                          const ProcessingOptions& options);
    ProcessingOutcome runStages(const NormalizedImage& normalized, const std::string& typeHint,
                                const ProcessingOptions& options);

    // Identity card fields read by region; returns false when nothing was resolved
    bool runRegionPath(const cv::Mat& image, const std::string& subtype, const Deadline& deadline,
                       ProcessingOutcome& outcome);

    std::unique_ptr<TextRecognizer> recognizer_;
    std::unique_ptr<ImageNormalizer> normalizer_;
    std::unique_ptr<LayoutClassifier> classifier_;
    std::unique_ptr<RegionExtractor> region_extractor_;
    std::unique_ptr<DocumentRecognizer> document_recognizer_;
};

#endif // DOCUMENT_ENGINE_HPP
