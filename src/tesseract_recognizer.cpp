#include "tesseract_recognizer.hpp"

#include <memory>

#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include <tesseract/resultiterator.h>

#define LOG_TAG "TesseractRecognizer"
#include "log.hpp"

namespace {

RecognitionResult failure(RecognitionStatus status, const std::string& message) {
    RecognitionResult result;
    result.status = status;
    result.error_message = message;
    return result;
}

// Tesseract wants RGB or gray, continuous rows are not required
cv::Mat toTesseractLayout(const cv::Mat& image) {
    cv::Mat converted;
    switch (image.channels()) {
        case 3:
            cv::cvtColor(image, converted, cv::COLOR_BGR2RGB);
            break;
        case 4:
            cv::cvtColor(image, converted, cv::COLOR_BGRA2RGB);
            break;
        default:
            converted = image;
            break;
    }
    return converted;
}

struct TessApiDeleter {
    void operator()(tesseract::TessBaseAPI* api) const {
        if (api) {
            api->End();
            delete api;
        }
    }
};

}  // namespace

TesseractRecognizer::TesseractRecognizer(const TesseractOptions& options) : options_(options) {}

TesseractRecognizer::~TesseractRecognizer() {}

RecognitionResult TesseractRecognizer::recognize(const cv::Mat& image, const RecognitionConfig& config) {
    if (image.empty() || image.depth() != CV_8U) {
        return failure(RecognitionStatus::Failed, "Recognizer needs a non-empty 8-bit image");
    }

    try {
        std::unique_ptr<tesseract::TessBaseAPI, TessApiDeleter> api(new tesseract::TessBaseAPI());

        const char* datapath = options_.tessdata_path.empty() ? nullptr : options_.tessdata_path.c_str();
        if (api->Init(datapath, config.language.c_str(),
                      static_cast<tesseract::OcrEngineMode>(options_.engine_mode)) != 0) {
            LOGE("Could not initialize Tesseract with language %s", config.language.c_str());
            return failure(RecognitionStatus::Unavailable,
                           "Could not initialize Tesseract with language " + config.language);
        }

        api->SetPageSegMode(static_cast<tesseract::PageSegMode>(config.page_seg_mode));
        if (!config.whitelist.empty()) {
            api->SetVariable("tessedit_char_whitelist", config.whitelist.c_str());
        }

        cv::Mat input = toTesseractLayout(image);
        api->SetImage(input.data, input.cols, input.rows,
                      input.channels(), static_cast<int>(input.step));

        ETEXT_DESC monitor;
        if (config.timeout_ms > 0) {
            monitor.set_deadline_msecs(config.timeout_ms);
        }

        int status = api->Recognize(&monitor);
        if (config.timeout_ms > 0 && monitor.deadline_exceeded()) {
            LOGE("Recognition exceeded %d ms", config.timeout_ms);
            return failure(RecognitionStatus::TimedOut, "Text recognition timed out");
        }
        if (status < 0) {
            return failure(RecognitionStatus::Failed, "Tesseract recognition failed");
        }

        RecognitionResult result;
        result.status = RecognitionStatus::Ok;

        char* text = api->GetUTF8Text();
        if (text) {
            result.text = text;
            delete[] text;
        }
        result.mean_confidence = static_cast<float>(api->MeanTextConf());

        if (config.char_confidences) {
            std::unique_ptr<tesseract::ResultIterator> it(api->GetIterator());
            if (it) {
                const tesseract::PageIteratorLevel level = tesseract::RIL_SYMBOL;
                do {
                    char* symbol = it->GetUTF8Text(level);
                    if (symbol != nullptr && *symbol != '\0') {
                        result.char_confidences.push_back(it->Confidence(level));
                    }
                    delete[] symbol;
                } while (it->Next(level));
            }
        }

        LOGD("Recognized %zu bytes, mean confidence %.1f (psm %d, %s)",
             result.text.size(), result.mean_confidence, config.page_seg_mode, config.language.c_str());
        return result;
    } catch (const std::exception& e) {
        LOGE("Tesseract error: %s", e.what());
        return failure(RecognitionStatus::Failed, std::string("Tesseract error: ") + e.what());
    }
}
