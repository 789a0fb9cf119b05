#include "document_engine.hpp"
#include "cnp_validator.hpp"

#include <chrono>
#include <new>

#define LOG_TAG "DocumentEngine"
#include "log.hpp"

namespace {

ProcessingOutcome failure(ErrorKind kind, const std::string& message) {
    ProcessingOutcome outcome;
    outcome.failure = kind;
    outcome.error_message = message;
    return outcome;
}

double elapsedMs(const std::chrono::steady_clock::time_point& start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

DocumentEngine::DocumentEngine(const TesseractOptions& options, const EngineConfig& config) {
    recognizer_ = std::make_unique<TesseractRecognizer>(options);
    init(config);
}

DocumentEngine::DocumentEngine(std::unique_ptr<TextRecognizer> recognizer, const EngineConfig& config)
    : recognizer_(std::move(recognizer)) {
    if (!recognizer_) {
        recognizer_ = std::make_unique<TesseractRecognizer>();
    }
    init(config);
}

DocumentEngine::~DocumentEngine() {}

void DocumentEngine::init(const EngineConfig& config) {
    normalizer_ = std::make_unique<ImageNormalizer>();
    classifier_ = std::make_unique<LayoutClassifier>(config.classifier);
    region_extractor_ = std::make_unique<RegionExtractor>(*recognizer_, config.region);
    document_recognizer_ = std::make_unique<DocumentRecognizer>(*recognizer_, config.recognizer);
}

ProcessingOutcome DocumentEngine::process(const uint8_t* data, size_t length,
                                          const std::string& typeHint,
                                          const ProcessingOptions& options) {
    NormalizedImage normalized = normalizer_->decode(data, length);
    return run(normalized, typeHint, options);
}

ProcessingOutcome DocumentEngine::processImage(const cv::Mat& image, const std::string& typeHint,
                                               const ProcessingOptions& options) {
    NormalizedImage normalized;
    try {
        normalized = normalizer_->fromMat(image);
    } catch (const std::exception& e) {
        LOGE("Image conversion failed: %s", e.what());
        return failure(ErrorKind::InputError, std::string("Cannot convert image: ") + e.what());
    }
    return run(normalized, typeHint, options);
}

ProcessingOutcome DocumentEngine::processBuffer(const uint8_t* pixels, int width, int height, int format,
                                                const std::string& typeHint,
                                                const ProcessingOptions& options) {
    NormalizedImage normalized;
    try {
        normalized = normalizer_->fromBuffer(pixels, width, height, format);
    } catch (const std::exception& e) {
        LOGE("Buffer conversion failed: %s", e.what());
        return failure(ErrorKind::InputError, std::string("Cannot convert buffer: ") + e.what());
    }
    return run(normalized, typeHint, options);
}

bool DocumentEngine::runRegionPath(const cv::Mat& image, const std::string& subtype,
                                   const Deadline& deadline, ProcessingOutcome& outcome) {
    RegionExtractionResult extraction;
    const RegionMap* map = subtype.empty() ? nullptr : TemplateRegistry::instance().findRegionMap(subtype);

    if (map) {
        extraction = region_extractor_->extract(image, *map, deadline);
    } else {
        LOGI("Card subtype unresolved, trying every layout");
        extraction = region_extractor_->extractBestLayout(image, deadline);
    }

    if (!extraction.success) {
        outcome = failure(extraction.failure, extraction.error_message);
        return true;
    }

    if (!extraction.resolved) {
        LOGI("Region extraction produced no usable field, falling back to full document");
        return false;
    }

    ProcessingResult& result = outcome.result;
    result.matched_template_id = "ro_identity_card";
    result.document_type = kDocTypeRomanianId;
    result.overall_confidence = extraction.overall_confidence;
    result.processing_metadata.extraction_method = "multi_template_region";
    result.processing_metadata.card_type = extraction.card_type;
    result.processing_metadata.ocr_confidence = extraction.overall_confidence;

    StructuredData& data = result.structured_data;
    for (const auto& field : extraction.fields) {
        data.recordField(field);
    }

    // A CNP only reaches data.values once it validated
    if (data.hasValue("cnp")) {
        std::string birthDate = extractBirthDateFromCnp(data.value("cnp"));
        std::string gender = extractGenderFromCnp(data.value("cnp"));
        if (!birthDate.empty()) {
            data.values["data_nasterii"] = birthDate;
        }
        if (!gender.empty()) {
            data.values["gender"] = gender;
        }
    }

    outcome.success = true;
    return true;
}

ProcessingOutcome DocumentEngine::run(const NormalizedImage& normalized, const std::string& typeHint,
                                      const ProcessingOptions& options) {
    // OpenCV errors come from the pixels the caller handed in; anything
    // else thrown below is a recognition backend fault.
    try {
        return runStages(normalized, typeHint, options);
    } catch (const cv::Exception& e) {
        LOGE("Image rejected by OpenCV: %s", e.what());
        return failure(ErrorKind::InputError, std::string("Image processing failed: ") + e.what());
    } catch (const std::bad_alloc&) {
        LOGE("Out of memory for this image");
        return failure(ErrorKind::InputError, "Image too large");
    } catch (const std::exception& e) {
        LOGE("Processing threw: %s", e.what());
        return failure(ErrorKind::OcrEngineUnavailable, e.what());
    }
}

ProcessingOutcome DocumentEngine::runStages(const NormalizedImage& normalized, const std::string& typeHint,
                                            const ProcessingOptions& options) {
    auto start = std::chrono::steady_clock::now();

    if (!normalized.success) {
        LOGE("Input rejected: %s", normalized.error_message.c_str());
        return failure(ErrorKind::InputError, normalized.error_message);
    }

    Deadline deadline(options.timeout_ms);
    const cv::Mat& image = normalized.image;

    LayoutDecision layout = classifier_->classify(image);
    HintResolution hint = TemplateRegistry::instance().resolveHint(typeHint);

    LOGI("Processing %dx%d image, layout=%s subtype=%s hint=%s", image.cols, image.rows,
         layoutName(layout.layout), layout.subtype.c_str(), hint.document_type.c_str());

    ProcessingOutcome outcome;
    bool handled = false;

    bool idHint = hint.recognized && hint.document_type == kDocTypeRomanianId;
    if (layout.layout == DocumentLayout::IdentityCard || idHint) {
        std::string subtype = !layout.subtype.empty() ? layout.subtype : hint.subtype;
        handled = runRegionPath(image, subtype, deadline, outcome);
    }

    if (!handled) {
        outcome = document_recognizer_->recognize(image, hint.document_type, deadline);
    }

    if (!outcome.success) {
        LOGE("Processing failed (%s): %s", errorKindName(outcome.failure), outcome.error_message.c_str());
        return outcome;
    }

    ProcessingMetadata& meta = outcome.result.processing_metadata;
    meta.layout = layout;
    meta.type_hint = typeHint;
    meta.normalized_hint = hint.document_type;
    meta.processing_time_ms = elapsedMs(start);

    LOGI("Done: %s via %s, confidence %d in %.1f ms", outcome.result.document_type.c_str(),
         meta.extraction_method.c_str(), outcome.result.overall_confidence, meta.processing_time_ms);
    return outcome;
}
