#ifndef DOCUMENT_RECOGNIZER_HPP
#define DOCUMENT_RECOGNIZER_HPP

#include <opencv2/opencv.hpp>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "document_templates.hpp"
#include "image_enhancer.hpp"
#include "medical_extractor.hpp"
#include "processing_result.hpp"
#include "text_recognizer.hpp"

struct RecognizerConfig {
    int min_best_score;    // best strategy must reach this quality
    int min_text_length;   // ... and this many characters

    RecognizerConfig() {
        min_best_score = 20;
        min_text_length = 10;
    }
};

struct OcrStrategy {
    std::string name;
    PageEnhanceConfig preprocess;
    std::string language;
    int page_seg_mode;
};

struct StrategyOutcome {
    std::string name;
    RecognitionStatus status;
    std::string text;        // cleaned
    int quality;
    std::string error_message;

    StrategyOutcome() : status(RecognitionStatus::Failed), quality(0) {}
};

struct TextExtraction {
    bool success;
    ErrorKind failure;
    std::string error_message;

    std::string text;
    std::string strategy;
    int quality;
    std::vector<StrategyOutcome> attempts;

    TextExtraction() : success(false), failure(ErrorKind::None), quality(0) {}
};

struct TemplateMatch {
    const DocumentTemplate* matched;  // nullptr when nothing cleared its threshold
    float score;
    std::vector<std::string> matched_patterns;

    TemplateMatch() : matched(nullptr), score(0) {}
};

// Full-page recognition followed by regex template matching, field
// extraction and domain post-processing. Used for every document that is
// not read through fixed card regions.
class DocumentRecognizer {
public:
    explicit DocumentRecognizer(TextRecognizer& recognizer,
                                const RecognizerConfig& config = RecognizerConfig());
    ~DocumentRecognizer();

    ProcessingOutcome recognize(const cv::Mat& image, const std::string& hintType,
                                const Deadline& deadline = Deadline());

    // Runs every strategy, keeps the best (quality, length)
    TextExtraction extractText(const cv::Mat& image, const Deadline& deadline = Deadline());

    // Everything after recognition, on already cleaned text
    ProcessingResult analyzeText(const std::string& text, int ocrConfidence,
                                 const std::string& hintType) const;

    std::string cleanOcrText(const std::string& text) const;

    TemplateMatch matchTemplate(const std::string& text, const std::string& hintType) const;
    float scoreTemplate(const std::string& text, const DocumentTemplate& tmpl,
                        std::vector<std::string>* matchedPatterns = nullptr) const;

    StructuredData extractFields(const std::string& text, const DocumentTemplate& tmpl,
                                 float fieldConfidence = 0) const;
    void applyPostProcessing(StructuredData& data, const DocumentTemplate& tmpl) const;
    void addDomainData(StructuredData& data, const std::string& text,
                       const DocumentTemplate& tmpl) const;

    // DD.MM.YYYY or YYYY.MM.DD (any of . - /) to YYYY-MM-DD, else unchanged
    static std::string normalizeDate(const std::string& date);

    static const std::vector<OcrStrategy>& strategies();

private:
    struct CompiledTemplate {
        const DocumentTemplate* source;
        std::vector<std::regex> identification;
        std::vector<std::vector<std::regex>> fields;
    };

    struct Correction {
        std::regex pattern;
        std::string replacement;
    };

    const CompiledTemplate* compiledFor(const DocumentTemplate& tmpl) const;

    TextRecognizer& recognizer_;
    RecognizerConfig config_;
    std::unique_ptr<ImageEnhancer> enhancer_;
    std::unique_ptr<MedicalExtractor> medical_;
    std::vector<CompiledTemplate> templates_;
    std::vector<Correction> corrections_;
};

#endif // DOCUMENT_RECOGNIZER_HPP
