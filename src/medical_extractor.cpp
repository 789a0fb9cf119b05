#include "medical_extractor.hpp"
#include "document_templates.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cstdlib>

#define LOG_TAG "MedicalExtractor"
#include "log.hpp"

namespace {

const char* const kNumber = "([0-9]+(?:[.,][0-9]+)?)";

// Multi-byte letters are matched as whole sequences, never as loose bytes
const std::string kUpperStart = "(?:[A-Z]|Ă|Â|Î|Ș|Ț|Ş|Ţ)";
const std::string kLowerRun = "(?:[a-z]|ă|â|î|ș|ț|ş|ţ)+";
const std::string kLetterRun = "(?:[A-Za-z ]|Ă|Â|Î|Ș|Ț|Ş|Ţ|ă|â|î|ș|ț|ş|ţ)";

// Anchored at the line start only; text after the range (a status word,
// a flag) is ignored. The value must not continue as a date (12.03.2024).
std::string buildLabLinePattern() {
    return std::string("^[ \\t]*(?:(?:-|\\*|•)[ \\t]*)?") +
           "(" + kUpperStart + kLetterRun + "*?)" +
           "[ \\t:]+" + kNumber + "(?![.,]?[0-9])" +
           "[ \\t]*((?:[A-Za-z%/]|µ|μ)+)?" +
           "[ \\t]*(?:\\([^)]*?" + kNumber + "[ \\t]*(?:-|–)[ \\t]*" + kNumber + "[^)]*\\))?";
}

// A name starts the text or follows a space or punctuation mark. \b cannot be
// used: it sees no boundary before a multi-byte capital such as Ș.
std::string buildMedicationPattern() {
    return std::string("(?:^|[\\s,;:.()/-])") +
           "(" + kUpperStart + kLowerRun + ")" +
           "(?:[ \\t]*([0-9]+[ \\t]*mg|mg))?" +
           "(?:[ \\t]*([0-9]+)[ \\t]*(?:tablete|capsule|comprimate))?";
}

std::string decimalPoint(const std::string& number) {
    std::string result = number;
    std::replace(result.begin(), result.end(), ',', '.');
    return result;
}

bool parseNumber(const std::string& text, double& out) {
    std::string normalized = decimalPoint(trim(text));
    if (normalized.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(normalized.c_str(), &end);
    return end != nullptr && *end == '\0';
}

std::string searchKey(const std::string& text) {
    return foldDiacritics(toLowerRo(text));
}

bool containsTerm(const std::string& haystackKey, const std::string& term) {
    return haystackKey.find(searchKey(term)) != std::string::npos;
}

}  // namespace

MedicalExtractor::MedicalExtractor()
    : lab_line_(buildLabLinePattern()),
      medication_(buildMedicationPattern()) {}

MedicalExtractor::~MedicalExtractor() {}

std::vector<LabTestResult> MedicalExtractor::extractLabResults(const std::string& text) const {
    std::vector<LabTestResult> results;

    for (const auto& line : splitLines(text)) {
        std::smatch match;
        if (!std::regex_search(line, match, lab_line_, std::regex_constants::match_continuous)) {
            continue;
        }

        LabTestResult result;
        result.test_name = trim(match[1].str());
        if (utf8Length(result.test_name) < 2) {
            continue;
        }
        result.normalized_name = normalizeTestName(result.test_name);
        result.value = decimalPoint(match[2].str());
        result.unit = match[3].matched ? match[3].str() : "";

        if (match[4].matched && match[5].matched) {
            result.reference_min = decimalPoint(match[4].str());
            result.reference_max = decimalPoint(match[5].str());
            result.status = determineResultStatus(result.value, result.reference_min, result.reference_max);
        } else {
            result.status = "unknown";
        }

        LOGD("Test %s = %s %s [%s]", result.normalized_name.c_str(), result.value.c_str(),
             result.unit.c_str(), result.status.c_str());
        results.push_back(result);
    }

    return results;
}

std::vector<MedicationEntry> MedicalExtractor::extractMedications(const std::string& text) const {
    std::vector<MedicationEntry> medications;
    const auto& known = TemplateRegistry::instance().medications();

    auto begin = std::sregex_iterator(text.begin(), text.end(), medication_);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;

        MedicationEntry entry;
        entry.medication_name = trim(match[1].str());
        entry.dosage = match[2].matched ? match[2].str() : "";
        entry.quantity = match[3].matched ? match[3].str() : "";

        std::string key = searchKey(entry.medication_name);
        for (const auto& med : known) {
            if (containsTerm(key, med.first)) {
                entry.normalized_name = med.second;
                entry.recognized = true;
                break;
            }
        }

        if (!entry.recognized && entry.dosage.empty()) {
            continue;
        }
        medications.push_back(entry);
    }

    return medications;
}

std::vector<std::string> MedicalExtractor::findMedicalTerms(const std::string& text) const {
    std::vector<std::string> found;
    std::string key = searchKey(text);
    const TemplateRegistry& registry = TemplateRegistry::instance();

    for (const auto& term : registry.medicalTests()) {
        if (containsTerm(key, term.first)) {
            found.push_back(term.first);
        }
    }
    for (const auto& term : registry.medications()) {
        if (containsTerm(key, term.first)) {
            found.push_back(term.first);
        }
    }

    return found;
}

bool MedicalExtractor::isLabTestTerm(const std::string& term) const {
    for (const auto& entry : TemplateRegistry::instance().medicalTests()) {
        if (entry.first == term) return true;
    }
    return false;
}

bool MedicalExtractor::isMedicationTerm(const std::string& term) const {
    for (const auto& entry : TemplateRegistry::instance().medications()) {
        if (entry.first == term) return true;
    }
    return false;
}

std::string MedicalExtractor::normalizeTestName(const std::string& name) const {
    std::string key = searchKey(trim(name));

    for (const auto& term : TemplateRegistry::instance().medicalTests()) {
        if (containsTerm(key, term.first)) {
            return term.second;
        }
    }

    std::string snake = toLowerRo(trim(name));
    std::replace(snake.begin(), snake.end(), ' ', '_');
    return snake;
}

std::string MedicalExtractor::determineResultStatus(const std::string& value,
                                                    const std::string& referenceMin,
                                                    const std::string& referenceMax) {
    double val = 0, minVal = 0, maxVal = 0;
    if (!parseNumber(value, val) || !parseNumber(referenceMin, minVal) ||
        !parseNumber(referenceMax, maxVal)) {
        return "unknown";
    }

    if (val < minVal) {
        return "low";
    }
    if (val > maxVal) {
        return "high";
    }
    return "normal";
}
