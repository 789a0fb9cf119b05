#ifndef MEDICAL_EXTRACTOR_HPP
#define MEDICAL_EXTRACTOR_HPP

#include <regex>
#include <string>
#include <vector>

#include "processing_result.hpp"

// Domain extraction for lab reports and prescriptions: test results with
// reference ranges, medications with dosage, and known medical terms.
class MedicalExtractor {
public:
    MedicalExtractor();
    ~MedicalExtractor();

    // One entry per line shaped like "Name[:] value [unit] [(... min-max ...)]"
    std::vector<LabTestResult> extractLabResults(const std::string& text) const;

    // Capitalized tokens with optional "<n> mg" and "<n> tablete|capsule|comprimate".
    // Only tokens that are known medications or carry a dosage are returned.
    std::vector<MedicationEntry> extractMedications(const std::string& text) const;

    // Registry test names first, then medications, in registry order.
    // Matching ignores case and diacritics; the registry spelling is returned.
    std::vector<std::string> findMedicalTerms(const std::string& text) const;

    bool isLabTestTerm(const std::string& term) const;
    bool isMedicationTerm(const std::string& term) const;

    // Canonical key when a known test name is contained, else lower_snake_case
    std::string normalizeTestName(const std::string& name) const;

    // "low", "normal", "high", or "unknown" when a number does not parse
    static std::string determineResultStatus(const std::string& value,
                                             const std::string& referenceMin,
                                             const std::string& referenceMax);

private:
    std::regex lab_line_;
    std::regex medication_;
};

#endif // MEDICAL_EXTRACTOR_HPP
