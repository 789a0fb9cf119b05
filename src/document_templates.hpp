#ifndef DOCUMENT_TEMPLATES_HPP
#define DOCUMENT_TEMPLATES_HPP

#include <string>
#include <utility>
#include <vector>

// Identity card subtypes
extern const char* const kSubtypeElectronic;   // carte_electronica
extern const char* const kSubtypeStandard;     // carte_identitate
extern const char* const kSubtypeOldBulletin;  // buletin_identitate

// Document type tags
extern const char* const kDocTypeRomanianId;
extern const char* const kDocTypeLabResult;
extern const char* const kDocTypePrescription;

enum class FieldValidator {
    None = 0,
    Cnp
};

struct ExtractionField {
    std::string name;
    std::vector<std::string> patterns;  // first match wins, capture group 1
    FieldValidator validator;
    bool required;

    ExtractionField() : validator(FieldValidator::None), required(false) {}
    ExtractionField(const std::string& n, const std::vector<std::string>& p,
                    FieldValidator v = FieldValidator::None, bool req = false)
        : name(n), patterns(p), validator(v), required(req) {}
};

struct PostProcessingRules {
    bool normalize_names;
    bool validate_cnp_date_consistency;
    bool extract_gender_from_cnp;
    bool extract_test_results;
    bool identify_abnormal_values;
    bool map_medical_terms;
    bool extract_medications;
    bool parse_dosage_instructions;

    PostProcessingRules()
        : normalize_names(false), validate_cnp_date_consistency(false),
          extract_gender_from_cnp(false), extract_test_results(false),
          identify_abnormal_values(false), map_medical_terms(false),
          extract_medications(false), parse_dosage_instructions(false) {}
};

struct DocumentTemplate {
    std::string template_id;
    std::string document_type;
    std::string language;
    int confidence_threshold;  // 0-100
    // Matched against the upper-cased, diacritic-free text
    std::vector<std::string> identification_patterns;
    std::vector<ExtractionField> extraction_fields;
    bool has_post_processing;
    PostProcessingRules post_processing;

    DocumentTemplate() : confidence_threshold(0), has_post_processing(false) {}

    bool isMedical() const;
};

// Fractional rectangle, all values in [0, 1]
struct RegionRect {
    float x_start;
    float x_end;
    float y_start;
    float y_end;

    RegionRect() : x_start(0), x_end(0), y_start(0), y_end(0) {}
    RegionRect(float x0, float x1, float y0, float y1)
        : x_start(x0), x_end(x1), y_start(y0), y_end(y1) {}
};

struct FieldOcrConfig {
    std::string whitelist;
    int page_seg_mode;  // Tesseract PSM value

    FieldOcrConfig() : page_seg_mode(6) {}
    FieldOcrConfig(const std::string& w, int psm) : whitelist(w), page_seg_mode(psm) {}
};

struct RegionField {
    std::string name;
    RegionRect rect;
    FieldOcrConfig ocr;
};

struct RegionMap {
    std::string subtype;
    std::string alignment_reference;
    std::vector<RegionField> fields;
    RegionRect photo_region;
    bool validates_cnp;  // CNP is printed and checked on this variant
};

struct HintResolution {
    std::string document_type;  // normalized, or the hint unchanged if unknown
    std::string subtype;        // card subtype named by the hint, if any
    bool recognized;

    HintResolution() : recognized(false) {}
};

// Immutable catalog of templates, card region maps and medical vocabulary.
// Built once on first use, read-only afterwards.
class TemplateRegistry {
public:
    static const TemplateRegistry& instance();

    const std::vector<DocumentTemplate>& templates() const { return templates_; }
    const DocumentTemplate* findTemplate(const std::string& templateId) const;

    const std::vector<RegionMap>& regionMaps() const { return region_maps_; }
    const RegionMap* findRegionMap(const std::string& subtype) const;

    // Romanian term -> canonical English key
    const std::vector<std::pair<std::string, std::string>>& medicalTests() const { return medical_tests_; }
    const std::vector<std::pair<std::string, std::string>>& medications() const { return medications_; }
    const std::vector<std::pair<std::string, std::string>>& units() const { return units_; }
    const std::vector<std::pair<std::string, std::string>>& referenceTerms() const { return reference_terms_; }

    // Keywords rewarded by the text quality estimate
    const std::vector<std::string>& qualityKeywords() const { return quality_keywords_; }

    // Regex -> replacement, applied to raw OCR output
    const std::vector<std::pair<std::string, std::string>>& ocrCorrections() const { return ocr_corrections_; }

    HintResolution resolveHint(const std::string& hint) const;

private:
    TemplateRegistry();

    std::vector<DocumentTemplate> templates_;
    std::vector<RegionMap> region_maps_;
    std::vector<std::pair<std::string, std::string>> medical_tests_;
    std::vector<std::pair<std::string, std::string>> medications_;
    std::vector<std::pair<std::string, std::string>> units_;
    std::vector<std::pair<std::string, std::string>> reference_terms_;
    std::vector<std::string> quality_keywords_;
    std::vector<std::pair<std::string, std::string>> ocr_corrections_;
    std::vector<std::pair<std::string, HintResolution>> hint_aliases_;
};

#endif // DOCUMENT_TEMPLATES_HPP
