#include "document_recognizer.hpp"
#include "cnp_validator.hpp"
#include "confidence.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cstdio>

#define LOG_TAG "DocumentRecognizer"
#include "log.hpp"

namespace {

const int kPsmBlock = 6;
const int kPsmSingleWord = 8;

std::vector<OcrStrategy> buildStrategies() {
    std::vector<OcrStrategy> strategies;

    OcrStrategy aggressive;
    aggressive.name = "aggressive_preprocessing";
    aggressive.preprocess = PageEnhanceConfig::aggressive();
    aggressive.language = "ron+eng";
    aggressive.page_seg_mode = kPsmBlock;
    strategies.push_back(aggressive);

    OcrStrategy simple;
    simple.name = "simple_preprocessing";
    simple.preprocess = PageEnhanceConfig::simple();
    simple.language = "ron+eng";
    simple.page_seg_mode = kPsmSingleWord;
    strategies.push_back(simple);

    OcrStrategy english;
    english.name = "fallback_english";
    english.preprocess = PageEnhanceConfig::simple();
    english.language = "eng";
    english.page_seg_mode = kPsmBlock;
    strategies.push_back(english);

    return strategies;
}

// Collapses horizontal whitespace and drops blank lines
std::string normalizeWhitespace(const std::string& text) {
    std::string result;
    for (const auto& rawLine : splitLines(text)) {
        std::string line;
        bool pendingSpace = false;
        for (char c : rawLine) {
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
                pendingSpace = !line.empty();
                continue;
            }
            if (pendingSpace) {
                line += ' ';
                pendingSpace = false;
            }
            line += c;
        }
        if (line.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += '\n';
        }
        result += line;
    }
    return result;
}

bool betterThan(const StrategyOutcome& candidate, const StrategyOutcome& best) {
    if (candidate.quality != best.quality) {
        return candidate.quality > best.quality;
    }
    return utf8Length(candidate.text) > utf8Length(best.text);
}

}  // namespace

const std::vector<OcrStrategy>& DocumentRecognizer::strategies() {
    static const std::vector<OcrStrategy> list = buildStrategies();
    return list;
}

DocumentRecognizer::DocumentRecognizer(TextRecognizer& recognizer, const RecognizerConfig& config)
    : recognizer_(recognizer), config_(config) {
    enhancer_ = std::make_unique<ImageEnhancer>();
    medical_ = std::make_unique<MedicalExtractor>();

    const auto flags = std::regex::ECMAScript | std::regex::icase;
    const TemplateRegistry& registry = TemplateRegistry::instance();

    for (const auto& tmpl : registry.templates()) {
        CompiledTemplate compiled;
        compiled.source = &tmpl;
        for (const auto& pattern : tmpl.identification_patterns) {
            compiled.identification.push_back(std::regex(pattern, flags));
        }
        for (const auto& field : tmpl.extraction_fields) {
            std::vector<std::regex> patterns;
            for (const auto& pattern : field.patterns) {
                patterns.push_back(std::regex(pattern, flags));
            }
            compiled.fields.push_back(patterns);
        }
        templates_.push_back(compiled);
    }

    for (const auto& correction : registry.ocrCorrections()) {
        Correction c;
        c.pattern = std::regex(correction.first, std::regex::ECMAScript);
        c.replacement = correction.second;
        corrections_.push_back(c);
    }
}

DocumentRecognizer::~DocumentRecognizer() {}

const DocumentRecognizer::CompiledTemplate* DocumentRecognizer::compiledFor(const DocumentTemplate& tmpl) const {
    for (const auto& compiled : templates_) {
        if (compiled.source == &tmpl || compiled.source->template_id == tmpl.template_id) {
            return &compiled;
        }
    }
    return nullptr;
}

// ==================== Recognition ====================

std::string DocumentRecognizer::cleanOcrText(const std::string& text) const {
    std::string cleaned = text;
    for (const auto& correction : corrections_) {
        cleaned = std::regex_replace(cleaned, correction.pattern, correction.replacement);
    }
    return normalizeWhitespace(cleaned);
}

TextExtraction DocumentRecognizer::extractText(const cv::Mat& image, const Deadline& deadline) {
    TextExtraction extraction;

    if (image.empty()) {
        extraction.failure = ErrorKind::InputError;
        extraction.error_message = "Empty image";
        return extraction;
    }

    int bestIndex = -1;
    bool anyRecognized = false;
    std::string lastError;

    for (const auto& strategy : strategies()) {
        StrategyOutcome outcome;
        outcome.name = strategy.name;

        if (deadline.expired()) {
            extraction.failure = ErrorKind::OcrEngineUnavailable;
            extraction.error_message = "Processing deadline exceeded";
            LOGE("Deadline exceeded before %s", strategy.name.c_str());
            return extraction;
        }

        cv::Mat prepared;
        try {
            prepared = enhancer_->enhancePage(image, strategy.preprocess);
        } catch (const std::exception& e) {
            outcome.status = RecognitionStatus::Failed;
            outcome.error_message = std::string("Preprocessing failed: ") + e.what();
            LOGE("%s: %s", strategy.name.c_str(), outcome.error_message.c_str());
            lastError = outcome.error_message;
            extraction.attempts.push_back(outcome);
            continue;
        }

        RecognitionConfig ocr;
        ocr.language = strategy.language;
        ocr.page_seg_mode = strategy.page_seg_mode;
        ocr.timeout_ms = deadline.recognizerTimeoutMs();

        RecognitionResult recognition = recognizer_.recognize(prepared, ocr);
        outcome.status = recognition.status;

        if (recognition.fatal()) {
            // Unavailable engine or exhausted budget: other strategies cannot do better
            extraction.failure = ErrorKind::OcrEngineUnavailable;
            extraction.error_message = recognition.error_message.empty()
                ? std::string("Text recognition ") + recognitionStatusName(recognition.status)
                : recognition.error_message;
            LOGE("%s: %s", strategy.name.c_str(), extraction.error_message.c_str());
            outcome.error_message = extraction.error_message;
            extraction.attempts.push_back(outcome);
            return extraction;
        }

        if (!recognition.ok()) {
            outcome.error_message = recognition.error_message;
            lastError = recognition.error_message;
            LOGI("%s failed: %s", strategy.name.c_str(), recognition.error_message.c_str());
            extraction.attempts.push_back(outcome);
            continue;
        }

        anyRecognized = true;
        outcome.text = trim(cleanOcrText(recognition.text));
        outcome.quality = estimateTextQuality(outcome.text);
        LOGI("%s: quality %d, %zu chars", strategy.name.c_str(), outcome.quality,
             utf8Length(outcome.text));

        extraction.attempts.push_back(outcome);
        if (bestIndex < 0 || betterThan(outcome, extraction.attempts[bestIndex])) {
            bestIndex = static_cast<int>(extraction.attempts.size()) - 1;
        }
    }

    if (!anyRecognized || bestIndex < 0) {
        extraction.failure = ErrorKind::OcrEngineUnavailable;
        extraction.error_message = lastError.empty()
            ? std::string("All recognition strategies failed")
            : "All recognition strategies failed: " + lastError;
        return extraction;
    }

    const StrategyOutcome& best = extraction.attempts[bestIndex];
    if (best.quality < config_.min_best_score ||
        static_cast<int>(utf8Length(best.text)) < config_.min_text_length) {
        char message[160];
        snprintf(message, sizeof(message),
                 "Recognized text unusable (best strategy %s: quality %d, %zu chars)",
                 best.name.c_str(), best.quality, utf8Length(best.text));
        extraction.failure = ErrorKind::OcrEngineUnavailable;
        extraction.error_message = message;
        LOGE("%s", message);
        return extraction;
    }

    extraction.success = true;
    extraction.text = best.text;
    extraction.strategy = best.name;
    extraction.quality = best.quality;
    return extraction;
}

// ==================== Template matching ====================

float DocumentRecognizer::scoreTemplate(const std::string& text, const DocumentTemplate& tmpl,
                                        std::vector<std::string>* matchedPatterns) const {
    const CompiledTemplate* compiled = compiledFor(tmpl);
    if (compiled == nullptr || compiled->identification.empty()) {
        return 0;
    }

    std::string key = matchKey(text);
    int matched = 0;
    for (size_t i = 0; i < compiled->identification.size(); i++) {
        if (std::regex_search(key, compiled->identification[i])) {
            matched++;
            if (matchedPatterns) {
                matchedPatterns->push_back(tmpl.identification_patterns[i]);
            }
        }
    }

    float score = static_cast<float>(matched) / compiled->identification.size() * 100.0f;

    if (tmpl.isMedical()) {
        size_t terms = medical_->findMedicalTerms(text).size();
        score += std::min(5.0f * terms, 20.0f);
    }

    return std::min(score, 100.0f);
}

TemplateMatch DocumentRecognizer::matchTemplate(const std::string& text, const std::string& hintType) const {
    std::vector<const DocumentTemplate*> candidates;
    const auto& all = TemplateRegistry::instance().templates();

    if (!hintType.empty()) {
        for (const auto& tmpl : all) {
            if (tmpl.document_type == hintType) {
                candidates.push_back(&tmpl);
            }
        }
    }
    for (const auto& tmpl : all) {
        if (std::find(candidates.begin(), candidates.end(), &tmpl) == candidates.end()) {
            candidates.push_back(&tmpl);
        }
    }

    TemplateMatch best;
    for (const DocumentTemplate* tmpl : candidates) {
        std::vector<std::string> patterns;
        float score = scoreTemplate(text, *tmpl, &patterns);
        LOGD("Template %s: %.1f (threshold %d)", tmpl->template_id.c_str(), score,
             tmpl->confidence_threshold);

        if (score >= tmpl->confidence_threshold && score > best.score) {
            best.matched = tmpl;
            best.score = score;
            best.matched_patterns = patterns;
        }
    }

    if (best.matched) {
        LOGI("Matched template %s (%.1f)", best.matched->template_id.c_str(), best.score);
    } else {
        LOGI("No template matched");
    }
    return best;
}

// ==================== Field extraction ====================

StructuredData DocumentRecognizer::extractFields(const std::string& text, const DocumentTemplate& tmpl,
                                                 float fieldConfidence) const {
    StructuredData data;
    const CompiledTemplate* compiled = compiledFor(tmpl);
    if (compiled == nullptr) {
        return data;
    }

    for (size_t i = 0; i < tmpl.extraction_fields.size(); i++) {
        const ExtractionField& spec = tmpl.extraction_fields[i];

        std::string value;
        for (const auto& pattern : compiled->fields[i]) {
            std::smatch match;
            if (std::regex_search(text, match, pattern) && match.size() > 1 && match[1].matched) {
                value = trim(match[1].str());
                break;
            }
        }

        if (value.empty()) {
            if (spec.required) {
                LOGD("Required field %s not found", spec.name.c_str());
            }
            continue;
        }

        ExtractedField field;
        field.name = spec.name;
        field.raw_text = value;
        field.confidence = fieldConfidence;

        if (spec.validator == FieldValidator::Cnp) {
            CnpValidation cnp = validateCnp(value);
            field.has_validator = true;
            field.validation.valid = cnp.valid;
            if (cnp.valid) {
                field.validation.normalized = value;
            } else {
                field.validation.error = cnp.message;
                field.error_kind = ErrorKind::ValidationError;
                LOGI("Field %s rejected: %s", spec.name.c_str(), cnp.message.c_str());
            }
        }

        data.recordField(field);
    }

    return data;
}

std::string DocumentRecognizer::normalizeDate(const std::string& date) {
    static const std::regex dayFirst("(\\d{2})[./-](\\d{2})[./-](\\d{4})");
    static const std::regex yearFirst("(\\d{4})[./-](\\d{2})[./-](\\d{2})");

    std::string value = trim(date);
    std::smatch match;
    if (std::regex_search(value, match, dayFirst) && match.position(0) == 0) {
        return match[3].str() + "-" + match[2].str() + "-" + match[1].str();
    }
    if (std::regex_search(value, match, yearFirst) && match.position(0) == 0) {
        return match[1].str() + "-" + match[2].str() + "-" + match[3].str();
    }
    return date;
}

void DocumentRecognizer::applyPostProcessing(StructuredData& data, const DocumentTemplate& tmpl) const {
    if (!tmpl.has_post_processing) {
        return;
    }
    const PostProcessingRules& rules = tmpl.post_processing;

    if (rules.normalize_names) {
        static const char* const kNameFields[] = {"nume", "prenume", "nume_pacient"};
        for (const char* name : kNameFields) {
            if (data.hasValue(name)) {
                data.values[name] = capitalizeWords(data.value(name));
            }
        }
    }

    // Only valid CNPs ever reach data.values
    if (rules.validate_cnp_date_consistency && data.hasValue("cnp") && data.hasValue("data_nasterii")) {
        std::string cnpDate = extractBirthDateFromCnp(data.value("cnp"));
        bool consistent = !cnpDate.empty() && cnpDate == normalizeDate(data.value("data_nasterii"));
        data.flags["cnp_date_consistent"] = consistent;
        if (!consistent) {
            LOGI("CNP date %s disagrees with birth date %s", cnpDate.c_str(),
                 data.value("data_nasterii").c_str());
        }
    }

    if (rules.extract_gender_from_cnp && data.hasValue("cnp")) {
        std::string gender = extractGenderFromCnp(data.value("cnp"));
        if (!gender.empty()) {
            data.values["gender"] = gender;
        }
    }
}

void DocumentRecognizer::addDomainData(StructuredData& data, const std::string& text,
                                       const DocumentTemplate& tmpl) const {
    if (!tmpl.isMedical()) {
        return;
    }

    std::vector<std::string> terms = medical_->findMedicalTerms(text);
    data.has_medical_terms = true;
    data.recognized_medical_terms = terms;

    bool labTests = false;
    bool medications = false;
    for (const auto& term : terms) {
        labTests = labTests || medical_->isLabTestTerm(term);
        medications = medications || medical_->isMedicationTerm(term);
    }
    data.flags["contains_lab_tests"] = labTests;
    data.flags["contains_medications"] = medications;

    if (tmpl.has_post_processing && tmpl.post_processing.extract_test_results) {
        data.has_test_results = true;
        data.test_results = medical_->extractLabResults(text);
        LOGI("Extracted %zu test results", data.test_results.size());
    }

    if (tmpl.has_post_processing && tmpl.post_processing.extract_medications) {
        data.has_medications = true;
        data.medications = medical_->extractMedications(text);
        LOGI("Extracted %zu medications", data.medications.size());
    }
}

// ==================== Entry points ====================

ProcessingResult DocumentRecognizer::analyzeText(const std::string& text, int ocrConfidence,
                                                 const std::string& hintType) const {
    ProcessingResult result;
    result.raw_text = text;
    result.processing_metadata.extraction_method = "full_document";
    result.processing_metadata.ocr_confidence = ocrConfidence;

    TemplateMatch match = matchTemplate(text, hintType);
    if (match.matched == nullptr) {
        result.document_type = "unknown";
        result.processing_metadata.template_error = "No template reached its confidence threshold";
        result.overall_confidence = computeFinalConfidence(static_cast<float>(ocrConfidence), 0, 0, 0);
        return result;
    }

    const DocumentTemplate& tmpl = *match.matched;
    result.matched_template_id = tmpl.template_id;
    result.document_type = tmpl.document_type;
    result.processing_metadata.template_confidence = match.score;
    result.processing_metadata.matched_patterns = match.matched_patterns;

    StructuredData data = extractFields(text, tmpl, static_cast<float>(ocrConfidence));
    applyPostProcessing(data, tmpl);
    addDomainData(data, text, tmpl);

    int termCount = static_cast<int>(data.recognized_medical_terms.size());
    result.processing_metadata.medical_terms_found = termCount;
    result.overall_confidence = computeFinalConfidence(static_cast<float>(ocrConfidence), match.score,
                                                       data.entryCount(), termCount);
    result.structured_data = data;

    LOGI("%s: %d entries, confidence %d", tmpl.template_id.c_str(), data.entryCount(),
         result.overall_confidence);
    return result;
}

ProcessingOutcome DocumentRecognizer::recognize(const cv::Mat& image, const std::string& hintType,
                                                const Deadline& deadline) {
    ProcessingOutcome outcome;

    TextExtraction extraction = extractText(image, deadline);
    if (!extraction.success) {
        outcome.failure = extraction.failure;
        outcome.error_message = extraction.error_message;
        return outcome;
    }

    outcome.result = analyzeText(extraction.text, extraction.quality, hintType);
    outcome.result.processing_metadata.ocr_strategy = extraction.strategy;
    outcome.success = true;
    return outcome;
}
