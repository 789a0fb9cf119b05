#include "processing_result.hpp"
#include "text_utils.hpp"

#include <cstdarg>
#include <cstdio>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InputError: return "input_error";
        case ErrorKind::RegionExtractionError: return "region_extraction_error";
        case ErrorKind::TemplateNoMatchError: return "template_no_match";
        case ErrorKind::ValidationError: return "validation_error";
        case ErrorKind::OcrEngineUnavailable: return "ocr_engine_unavailable";
    }
    return "none";
}

const char* layoutName(DocumentLayout layout) {
    switch (layout) {
        case DocumentLayout::IdentityCard: return "identity_card";
        case DocumentLayout::LabResult: return "lab_result";
        case DocumentLayout::Unknown:
        default:
            return "unknown";
    }
}

// ==================== StructuredData ====================

void StructuredData::recordField(const ExtractedField& field) {
    fields.push_back(field);

    if (field.error_kind == ErrorKind::RegionExtractionError) {
        errors[field.name + "_error"] = field.validation.error;
        flags[field.name + "_valid"] = false;
        return;
    }

    if (!field.has_validator) {
        if (!field.raw_text.empty()) {
            values[field.name] = field.raw_text;
        }
        return;
    }

    if (field.validation.valid) {
        values[field.name] = field.validation.normalized.empty()
            ? field.raw_text : field.validation.normalized;
        flags[field.name + "_valid"] = true;
    } else {
        errors[field.name + "_error"] = field.validation.error;
        flags[field.name + "_valid"] = false;
    }
}

bool StructuredData::hasValue(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string StructuredData::value(const std::string& key) const {
    auto it = values.find(key);
    return it == values.end() ? std::string() : it->second;
}

const ExtractedField* StructuredData::field(const std::string& name) const {
    for (const auto& f : fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

int StructuredData::entryCount() const {
    int count = static_cast<int>(values.size() + flags.size() + errors.size());
    if (has_test_results) count++;
    if (has_medications) count++;
    if (has_medical_terms) count++;
    return count;
}

// ==================== JSON ====================

namespace {

void append_fmt(std::string& s, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    s += buf;
}

// OCR output may carry broken UTF-8; JSON strings must not
void appendString(std::string& json, const std::string& value) {
    json += '"';
    for (unsigned char c : sanitizeUtf8(value)) {
        switch (c) {
            case '"': json += "\\\""; break;
            case '\\': json += "\\\\"; break;
            case '\n': json += "\\n"; break;
            case '\r': json += "\\r"; break;
            case '\t': json += "\\t"; break;
            default:
                if (c < 0x20) {
                    append_fmt(json, "\\u%04x", c);
                } else {
                    json += static_cast<char>(c);
                }
                break;
        }
    }
    json += '"';
}

void appendKey(std::string& json, const std::string& key) {
    appendString(json, key);
    json += ':';
}

void appendBool(std::string& json, bool value) {
    json += value ? "true" : "false";
}

void appendStringList(std::string& json, const std::vector<std::string>& items) {
    json += '[';
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) json += ',';
        appendString(json, items[i]);
    }
    json += ']';
}

void appendNullableString(std::string& json, const std::string& value) {
    if (value.empty()) {
        json += "null";
    } else {
        appendString(json, value);
    }
}

void appendLayout(std::string& json, const LayoutDecision& layout) {
    json += '{';
    appendKey(json, "layout");
    appendString(json, layoutName(layout.layout));
    json += ',';
    appendKey(json, "subtype");
    appendNullableString(json, layout.subtype);
    json += ",\"card_shape\":";
    appendBool(json, layout.card_shape);
    json += ",\"has_photo\":";
    appendBool(json, layout.has_photo);
    json += ",\"has_structured_text\":";
    appendBool(json, layout.has_structured_text);
    json += ",\"has_lab_header\":";
    appendBool(json, layout.has_lab_header);
    append_fmt(json, ",\"aspect_ratio\":%.4f", layout.aspect_ratio);
    append_fmt(json, ",\"dark_ratio\":%.4f", layout.dark_ratio);
    append_fmt(json, ",\"edge_ratio\":%.4f", layout.edge_ratio);
    append_fmt(json, ",\"text_rows\":%d", layout.text_rows);
    append_fmt(json, ",\"photo_area_ratio\":%.4f", layout.photo_area_ratio);
    json += '}';
}

void appendMetadata(std::string& json, const ProcessingMetadata& meta) {
    json += '{';
    appendKey(json, "extraction_method");
    appendString(json, meta.extraction_method);
    if (!meta.card_type.empty()) {
        json += ',';
        appendKey(json, "card_type");
        appendString(json, meta.card_type);
    }
    json += ',';
    appendKey(json, "layout");
    appendLayout(json, meta.layout);
    json += ',';
    appendKey(json, "type_hint");
    appendNullableString(json, meta.type_hint);
    json += ',';
    appendKey(json, "normalized_hint");
    appendNullableString(json, meta.normalized_hint);
    if (!meta.ocr_strategy.empty()) {
        json += ',';
        appendKey(json, "ocr_strategy");
        appendString(json, meta.ocr_strategy);
    }
    append_fmt(json, ",\"ocr_confidence\":%d", meta.ocr_confidence);
    append_fmt(json, ",\"template_confidence\":%.2f", meta.template_confidence);
    json += ',';
    appendKey(json, "matched_patterns");
    appendStringList(json, meta.matched_patterns);
    if (!meta.template_error.empty()) {
        json += ',';
        appendKey(json, "template_error");
        appendString(json, meta.template_error);
    }
    append_fmt(json, ",\"medical_terms_found\":%d", meta.medical_terms_found);
    json += ',';
    appendKey(json, "language_detected");
    appendString(json, meta.language_detected);
    append_fmt(json, ",\"processing_time_ms\":%.2f", meta.processing_time_ms);
    json += '}';
}

}  // namespace

std::string structuredDataToJson(const StructuredData& data) {
    std::string json;
    json.reserve(1024);
    json += '{';
    bool first = true;

    auto separator = [&]() {
        if (!first) json += ',';
        first = false;
    };

    for (const auto& kv : data.values) {
        separator();
        appendKey(json, kv.first);
        appendString(json, kv.second);
    }
    for (const auto& kv : data.flags) {
        separator();
        appendKey(json, kv.first);
        appendBool(json, kv.second);
    }
    for (const auto& kv : data.errors) {
        separator();
        appendKey(json, kv.first);
        appendString(json, kv.second);
    }

    if (data.has_test_results) {
        separator();
        appendKey(json, "test_results");
        json += '[';
        for (size_t i = 0; i < data.test_results.size(); i++) {
            const LabTestResult& r = data.test_results[i];
            if (i > 0) json += ',';
            json += '{';
            appendKey(json, "test_name"); appendString(json, r.test_name); json += ',';
            appendKey(json, "normalized_name"); appendString(json, r.normalized_name); json += ',';
            appendKey(json, "value"); appendString(json, r.value); json += ',';
            appendKey(json, "unit"); appendString(json, r.unit); json += ',';
            appendKey(json, "reference_min"); appendNullableString(json, r.reference_min); json += ',';
            appendKey(json, "reference_max"); appendNullableString(json, r.reference_max); json += ',';
            appendKey(json, "status"); appendString(json, r.status);
            json += '}';
        }
        json += ']';
    }

    if (data.has_medications) {
        separator();
        appendKey(json, "medications");
        json += '[';
        for (size_t i = 0; i < data.medications.size(); i++) {
            const MedicationEntry& m = data.medications[i];
            if (i > 0) json += ',';
            json += '{';
            appendKey(json, "medication_name"); appendString(json, m.medication_name); json += ',';
            appendKey(json, "normalized_name"); appendNullableString(json, m.normalized_name); json += ',';
            appendKey(json, "dosage"); appendString(json, m.dosage); json += ',';
            appendKey(json, "quantity"); appendString(json, m.quantity); json += ',';
            appendKey(json, "recognized"); appendBool(json, m.recognized);
            json += '}';
        }
        json += ']';
    }

    if (data.has_medical_terms) {
        separator();
        appendKey(json, "recognized_medical_terms");
        appendStringList(json, data.recognized_medical_terms);
    }

    if (!data.fields.empty()) {
        separator();
        appendKey(json, "field_details");
        json += '[';
        for (size_t i = 0; i < data.fields.size(); i++) {
            const ExtractedField& f = data.fields[i];
            if (i > 0) json += ',';
            json += '{';
            appendKey(json, "name"); appendString(json, f.name); json += ',';
            appendKey(json, "raw_text"); appendString(json, f.raw_text);
            append_fmt(json, ",\"confidence\":%.2f,", f.confidence);
            appendKey(json, "valid"); appendBool(json, f.validation.valid); json += ',';
            appendKey(json, "error"); appendNullableString(json, f.validation.error); json += ',';
            appendKey(json, "error_kind"); appendString(json, errorKindName(f.error_kind));
            json += '}';
        }
        json += ']';
    }

    json += '}';
    return json;
}

std::string toJson(const ProcessingResult& result) {
    std::string json;
    json.reserve(2048);

    json += '{';
    appendKey(json, "raw_text");
    appendString(json, result.raw_text);
    json += ',';
    appendKey(json, "matched_template_id");
    appendNullableString(json, result.matched_template_id);
    json += ',';
    appendKey(json, "document_type");
    appendString(json, result.document_type);
    append_fmt(json, ",\"overall_confidence\":%d,", result.overall_confidence);
    appendKey(json, "structured_data");
    json += structuredDataToJson(result.structured_data);
    json += ',';
    appendKey(json, "processing_metadata");
    appendMetadata(json, result.processing_metadata);
    json += '}';

    return json;
}

std::string toJson(const ProcessingOutcome& outcome) {
    if (outcome.success) {
        std::string json = "{\"success\":true,\"result\":";
        json += toJson(outcome.result);
        json += '}';
        return json;
    }

    std::string json = "{\"success\":false,";
    appendKey(json, "error_kind");
    appendString(json, errorKindName(outcome.failure));
    json += ',';
    appendKey(json, "error_message");
    appendString(json, outcome.error_message);
    json += '}';
    return json;
}
