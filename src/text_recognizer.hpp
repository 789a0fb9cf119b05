#ifndef TEXT_RECOGNIZER_HPP
#define TEXT_RECOGNIZER_HPP

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

enum class RecognitionStatus {
    Ok = 0,
    Failed,       // this image could not be recognized
    Unavailable,  // engine or language data missing
    TimedOut
};

inline const char* recognitionStatusName(RecognitionStatus status) {
    switch (status) {
        case RecognitionStatus::Ok: return "ok";
        case RecognitionStatus::Failed: return "failed";
        case RecognitionStatus::Unavailable: return "unavailable";
        case RecognitionStatus::TimedOut: return "timed_out";
    }
    return "failed";
}

struct RecognitionConfig {
    std::string language;      // Tesseract language spec, e.g. "ron+eng"
    int page_seg_mode;         // Tesseract PSM value
    std::string whitelist;     // empty = all characters
    bool char_confidences;     // fill RecognitionResult::char_confidences
    int timeout_ms;            // 0 = no limit

    RecognitionConfig() {
        language = "ron+eng";
        page_seg_mode = 6;
        char_confidences = false;
        timeout_ms = 0;
    }
};

struct RecognitionResult {
    RecognitionStatus status;
    std::string text;
    std::vector<float> char_confidences;  // 0-100 per recognized symbol
    float mean_confidence;                // engine-reported, 0-100
    std::string error_message;

    RecognitionResult() : status(RecognitionStatus::Failed), mean_confidence(0) {}

    bool ok() const { return status == RecognitionStatus::Ok; }
    // Unavailable or timed out: no point trying other inputs
    bool fatal() const {
        return status == RecognitionStatus::Unavailable || status == RecognitionStatus::TimedOut;
    }
};

// Wall-clock budget shared by all recognizer calls of one request
class Deadline {
public:
    Deadline() : limited_(false) {}

    explicit Deadline(int timeout_ms) : limited_(timeout_ms > 0) {
        end_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));
    }

    bool limited() const { return limited_; }

    bool expired() const {
        return limited_ && std::chrono::steady_clock::now() >= end_;
    }

    // Milliseconds left, 0 when unlimited or expired
    int remainingMs() const {
        if (!limited_) return 0;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_ - std::chrono::steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }

    // Per-call recognizer timeout: 0 = unlimited, never 0 while time is left
    int recognizerTimeoutMs() const {
        if (!limited_) return 0;
        return std::max(1, remainingMs());
    }

private:
    bool limited_;
    std::chrono::steady_clock::time_point end_;
};

// Character recognition capability. Implementations must be safe to call
// from several threads as long as each call gets its own arguments.
class TextRecognizer {
public:
    virtual ~TextRecognizer() {}

    // image is 8-bit, one or three channels
    virtual RecognitionResult recognize(const cv::Mat& image, const RecognitionConfig& config) = 0;
};

#endif // TEXT_RECOGNIZER_HPP
