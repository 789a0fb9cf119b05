#ifndef FAKE_RECOGNIZER_HPP
#define FAKE_RECOGNIZER_HPP

#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "text_recognizer.hpp"

// Scripted recognizer: queued responses first, then the handler, then the
// fallback. Every call is recorded.
class FakeRecognizer : public TextRecognizer {
public:
    typedef std::function<RecognitionResult(const cv::Mat&, const RecognitionConfig&)> Handler;

    RecognitionResult recognize(const cv::Mat& image, const RecognitionConfig& config) override {
        calls.push_back(config);
        sizes.push_back(image.size());
        if (!queue.empty()) {
            RecognitionResult next = queue.front();
            queue.pop_front();
            return next;
        }
        if (handler) {
            return handler(image, config);
        }
        return fallback;
    }

    std::deque<RecognitionResult> queue;
    Handler handler;
    RecognitionResult fallback;

    std::vector<RecognitionConfig> calls;
    std::vector<cv::Size> sizes;
};

inline RecognitionResult recognized(const std::string& text, std::vector<float> confidences = {}) {
    RecognitionResult result;
    result.status = RecognitionStatus::Ok;
    result.text = text;
    result.char_confidences = confidences;
    return result;
}

inline RecognitionResult recognitionFailure(RecognitionStatus status, const std::string& message) {
    RecognitionResult result;
    result.status = status;
    result.error_message = message;
    return result;
}

#endif // FAKE_RECOGNIZER_HPP
