#ifndef PROCESSING_RESULT_HPP
#define PROCESSING_RESULT_HPP

#include <map>
#include <string>
#include <vector>

enum class ErrorKind {
    None = 0,
    InputError,             // unreadable image, fatal
    RegionExtractionError,  // card region unusable, per field
    TemplateNoMatchError,   // no template cleared its threshold, non-fatal
    ValidationError,        // validator rejected a value, per field
    OcrEngineUnavailable    // recognizer missing, timed out or unusable output, fatal
};

const char* errorKindName(ErrorKind kind);

enum class DocumentLayout {
    Unknown = 0,
    IdentityCard,
    LabResult
};

const char* layoutName(DocumentLayout layout);

struct LayoutDecision {
    DocumentLayout layout;
    std::string subtype;  // empty when unresolved

    // Evidence
    bool card_shape;
    bool has_photo;
    bool has_structured_text;
    bool has_lab_header;
    float aspect_ratio;
    float dark_ratio;         // dark pixels in the left strip
    float edge_ratio;         // strong-edge pixels in the left strip
    int text_rows;            // rows above the edge density threshold
    float photo_area_ratio;   // dark region bbox / image area

    LayoutDecision()
        : layout(DocumentLayout::Unknown),
          card_shape(false), has_photo(false), has_structured_text(false),
          has_lab_header(false), aspect_ratio(0), dark_ratio(0), edge_ratio(0),
          text_rows(0), photo_area_ratio(0) {}
};

struct ValidationOutcome {
    bool valid;
    std::string error;
    std::string normalized;

    ValidationOutcome() : valid(false) {}
};

struct ExtractedField {
    std::string name;
    std::string raw_text;
    float confidence;        // 0-100
    bool has_validator;
    ValidationOutcome validation;
    ErrorKind error_kind;    // None, RegionExtractionError or ValidationError

    ExtractedField()
        : confidence(0), has_validator(false), error_kind(ErrorKind::None) {}
};

struct LabTestResult {
    std::string test_name;
    std::string normalized_name;
    std::string value;
    std::string unit;
    std::string reference_min;
    std::string reference_max;
    std::string status;  // low, normal, high, unknown
};

struct MedicationEntry {
    std::string medication_name;
    std::string normalized_name;
    std::string dosage;
    std::string quantity;
    bool recognized;

    MedicationEntry() : recognized(false) {}
};

struct StructuredData {
    // Canonical field values; invalid values never appear here
    std::map<std::string, std::string> values;
    // <field>_valid and derived flags such as cnp_date_consistent
    std::map<std::string, bool> flags;
    // <field>_error messages
    std::map<std::string, std::string> errors;

    std::vector<ExtractedField> fields;

    bool has_test_results;
    std::vector<LabTestResult> test_results;

    bool has_medications;
    std::vector<MedicationEntry> medications;

    bool has_medical_terms;
    std::vector<std::string> recognized_medical_terms;

    StructuredData()
        : has_test_results(false), has_medications(false), has_medical_terms(false) {}

    // Stores a field under the <field> / <field>_valid / <field>_error keys
    void recordField(const ExtractedField& field);

    bool hasValue(const std::string& key) const;
    std::string value(const std::string& key) const;
    const ExtractedField* field(const std::string& name) const;

    // Number of top-level entries as serialized
    int entryCount() const;
    bool empty() const { return entryCount() == 0; }
};

struct ProcessingMetadata {
    std::string extraction_method;  // multi_template_region or full_document
    std::string card_type;
    LayoutDecision layout;
    std::string type_hint;
    std::string normalized_hint;

    std::string ocr_strategy;
    int ocr_confidence;
    float template_confidence;
    std::vector<std::string> matched_patterns;
    std::string template_error;
    int medical_terms_found;
    std::string language_detected;

    double processing_time_ms;

    ProcessingMetadata()
        : ocr_confidence(0), template_confidence(0), medical_terms_found(0),
          language_detected("romanian"), processing_time_ms(0) {}
};

struct ProcessingResult {
    std::string raw_text;
    std::string matched_template_id;  // empty when no template matched
    std::string document_type;
    int overall_confidence;           // 0-100
    StructuredData structured_data;
    ProcessingMetadata processing_metadata;

    ProcessingResult() : document_type("unknown"), overall_confidence(0) {}
};

// Either a complete result or a typed call-level failure
struct ProcessingOutcome {
    bool success;
    ErrorKind failure;
    std::string error_message;
    ProcessingResult result;

    ProcessingOutcome() : success(false), failure(ErrorKind::None) {}
};

std::string structuredDataToJson(const StructuredData& data);
std::string toJson(const ProcessingResult& result);
std::string toJson(const ProcessingOutcome& outcome);

#endif // PROCESSING_RESULT_HPP
