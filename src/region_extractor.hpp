#ifndef REGION_EXTRACTOR_HPP
#define REGION_EXTRACTOR_HPP

#include <opencv2/opencv.hpp>
#include <memory>
#include <string>
#include <vector>

#include "document_templates.hpp"
#include "image_enhancer.hpp"
#include "processing_result.hpp"
#include "text_recognizer.hpp"

struct RegionExtractorConfig {
    int min_crop_width;
    int min_crop_height;
    std::string language;       // recognition language for card fields
    RegionEnhanceConfig enhance;

    RegionExtractorConfig() {
        min_crop_width = 50;
        min_crop_height = 20;
        language = "ron";
    }
};

struct RegionExtractionResult {
    bool success;               // false only when the engine itself failed
    ErrorKind failure;
    std::string error_message;

    bool resolved;              // some layout produced a positive confidence
    std::string card_type;      // subtype, or <subtype>_auto_detected
    std::vector<ExtractedField> fields;
    float mean_confidence;      // mean of per-field confidences
    int overall_confidence;

    RegionExtractionResult()
        : success(false), failure(ErrorKind::None), resolved(false),
          mean_confidence(0), overall_confidence(0) {}
};

// Reads identity card fields from fixed fractional regions, one crop per
// field, without whole-page recognition.
class RegionExtractor {
public:
    explicit RegionExtractor(TextRecognizer& recognizer,
                             const RegionExtractorConfig& config = RegionExtractorConfig());
    ~RegionExtractor();

    // Known subtype
    RegionExtractionResult extract(const cv::Mat& image, const RegionMap& map,
                                   const Deadline& deadline = Deadline());

    // Unresolved subtype: every registered layout, best mean confidence wins
    RegionExtractionResult extractBestLayout(const cv::Mat& image,
                                             const Deadline& deadline = Deadline());

    // Fractional rectangle to pixels, clamped to the image
    static cv::Rect toPixelRect(const RegionRect& rect, const cv::Size& imageSize);

    static ValidationOutcome validateField(const std::string& name, const std::string& value,
                                           const RegionMap& map);

private:
    ExtractedField extractField(const cv::Mat& image, const RegionField& region,
                                const RegionMap& map, const Deadline& deadline,
                                RecognitionResult& recognition);

    TextRecognizer& recognizer_;
    RegionExtractorConfig config_;
    std::unique_ptr<ImageEnhancer> enhancer_;
};

#endif // REGION_EXTRACTOR_HPP
