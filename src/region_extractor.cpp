#include "region_extractor.hpp"
#include "cnp_validator.hpp"
#include "confidence.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cstdio>

#define LOG_TAG "RegionExtractor"
#include "log.hpp"

namespace {

ValidationOutcome accept(const std::string& normalized) {
    ValidationOutcome outcome;
    outcome.valid = true;
    outcome.normalized = normalized;
    return outcome;
}

ValidationOutcome reject(const std::string& error) {
    ValidationOutcome outcome;
    outcome.valid = false;
    outcome.error = error;
    return outcome;
}

bool isNameText(const std::string& value) {
    for (char32_t cp : decodeUtf8(value)) {
        if (cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'-') continue;
        if (!isRomanianLetter(cp)) return false;
    }
    return true;
}

ExtractedField regionFailure(const std::string& name, const std::string& message) {
    ExtractedField field;
    field.name = name;
    field.has_validator = true;
    field.error_kind = ErrorKind::RegionExtractionError;
    field.validation = reject(message);
    return field;
}

RegionExtractionResult fatal(const RecognitionResult& recognition) {
    RegionExtractionResult result;
    result.failure = ErrorKind::OcrEngineUnavailable;
    result.error_message = recognition.error_message.empty()
        ? std::string("Text recognition ") + recognitionStatusName(recognition.status)
        : recognition.error_message;
    return result;
}

}  // namespace

RegionExtractor::RegionExtractor(TextRecognizer& recognizer, const RegionExtractorConfig& config)
    : recognizer_(recognizer), config_(config) {
    enhancer_ = std::make_unique<ImageEnhancer>();
}

RegionExtractor::~RegionExtractor() {}

cv::Rect RegionExtractor::toPixelRect(const RegionRect& rect, const cv::Size& imageSize) {
    int x1 = static_cast<int>(rect.x_start * imageSize.width);
    int x2 = static_cast<int>(rect.x_end * imageSize.width);
    int y1 = static_cast<int>(rect.y_start * imageSize.height);
    int y2 = static_cast<int>(rect.y_end * imageSize.height);

    x1 = std::max(0, std::min(x1, imageSize.width));
    x2 = std::max(0, std::min(x2, imageSize.width));
    y1 = std::max(0, std::min(y1, imageSize.height));
    y2 = std::max(0, std::min(y2, imageSize.height));

    return cv::Rect(x1, y1, std::max(0, x2 - x1), std::max(0, y2 - y1));
}

ValidationOutcome RegionExtractor::validateField(const std::string& name, const std::string& value,
                                                 const RegionMap& map) {
    if (name == "cnp" && map.validates_cnp) {
        CnpValidation cnp = validateCnp(value);
        if (!cnp.valid) {
            return reject(cnp.message);
        }
        return accept(value);
    }

    if (name == "nume" || name == "prenume") {
        if (utf8Length(value) < 2) {
            return reject("Name too short");
        }
        if (!isNameText(value)) {
            return reject("Name contains invalid characters");
        }
        return accept(capitalizeWords(value));
    }

    if (name == "address") {
        if (utf8Length(value) < 5) {
            return reject("Address too short");
        }
        return accept(value);
    }

    return accept(value);
}

ExtractedField RegionExtractor::extractField(const cv::Mat& image, const RegionField& region,
                                             const RegionMap& map, const Deadline& deadline,
                                             RecognitionResult& recognition) {
    cv::Rect pixels = toPixelRect(region.rect, image.size());

    if (pixels.width < config_.min_crop_width || pixels.height < config_.min_crop_height) {
        char message[96];
        snprintf(message, sizeof(message), "Region too small for OCR: %dx%d", pixels.width, pixels.height);
        LOGI("%s: %s", region.name.c_str(), message);
        recognition.status = RecognitionStatus::Ok;
        return regionFailure(region.name, message);
    }

    cv::Mat enhanced;
    try {
        enhanced = enhancer_->enhanceRegion(image(pixels), config_.enhance);
    } catch (const std::exception& e) {
        LOGE("Enhancement failed for %s: %s", region.name.c_str(), e.what());
        recognition.status = RecognitionStatus::Ok;
        return regionFailure(region.name, std::string("Region enhancement failed: ") + e.what());
    }

    if (deadline.expired()) {
        recognition = RecognitionResult();
        recognition.status = RecognitionStatus::TimedOut;
        recognition.error_message = "Processing deadline exceeded";
        return regionFailure(region.name, recognition.error_message);
    }

    RecognitionConfig ocr;
    ocr.language = config_.language;
    ocr.page_seg_mode = region.ocr.page_seg_mode;
    ocr.whitelist = region.ocr.whitelist;
    ocr.char_confidences = true;
    ocr.timeout_ms = deadline.recognizerTimeoutMs();

    recognition = recognizer_.recognize(enhanced, ocr);
    if (!recognition.ok()) {
        LOGE("Recognition %s for %s: %s", recognitionStatusName(recognition.status),
             region.name.c_str(), recognition.error_message.c_str());
        return regionFailure(region.name, recognition.error_message.empty()
            ? std::string("Text recognition failed") : recognition.error_message);
    }

    ExtractedField field;
    field.name = region.name;
    field.raw_text = trim(recognition.text);
    field.confidence = meanPositive(recognition.char_confidences);
    field.has_validator = true;
    field.validation = validateField(field.name, field.raw_text, map);
    field.error_kind = field.validation.valid ? ErrorKind::None : ErrorKind::ValidationError;

    LOGD("%s: '%s' conf=%.1f valid=%d", field.name.c_str(), field.raw_text.c_str(),
         field.confidence, field.validation.valid);
    return field;
}

RegionExtractionResult RegionExtractor::extract(const cv::Mat& image, const RegionMap& map,
                                                const Deadline& deadline) {
    RegionExtractionResult result;
    result.card_type = map.subtype;

    if (image.empty()) {
        result.failure = ErrorKind::InputError;
        result.error_message = "Empty image";
        return result;
    }

    std::vector<float> confidences;
    for (const auto& region : map.fields) {
        RecognitionResult recognition;
        ExtractedField field = extractField(image, region, map, deadline, recognition);
        if (recognition.fatal()) {
            return fatal(recognition);
        }
        confidences.push_back(field.confidence);
        result.fields.push_back(field);
    }

    double sum = 0;
    for (float c : confidences) {
        sum += c;
    }
    result.mean_confidence = confidences.empty() ? 0.0f : static_cast<float>(sum / confidences.size());
    result.overall_confidence = computeRegionConfidence(confidences);
    result.resolved = result.mean_confidence > 0;
    result.success = true;

    LOGI("%s: %zu fields, confidence %d", map.subtype.c_str(), result.fields.size(),
         result.overall_confidence);
    return result;
}

RegionExtractionResult RegionExtractor::extractBestLayout(const cv::Mat& image, const Deadline& deadline) {
    RegionExtractionResult best;
    best.success = true;
    best.card_type = "unknown";

    for (const auto& map : TemplateRegistry::instance().regionMaps()) {
        RegionExtractionResult candidate = extract(image, map, deadline);
        if (!candidate.success) {
            return candidate;
        }
        if (candidate.mean_confidence > best.mean_confidence) {
            best = candidate;
            best.card_type = map.subtype + "_auto_detected";
        }
    }

    if (!best.resolved) {
        LOGI("No card layout produced a usable reading");
    }
    return best;
}
