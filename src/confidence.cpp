#include "confidence.hpp"
#include "document_templates.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

int clampScore(double score) {
    if (score < 0) return 0;
    if (score > 100) return 100;
    return static_cast<int>(score);
}

bool isPlainTextSymbol(char32_t cp) {
    if (cp < 0x80) {
        char c = static_cast<char>(cp);
        if (std::isalnum(static_cast<unsigned char>(c))) return true;
        return std::strchr(" \n\t.,:-()", c) != nullptr && c != '\0';
    }
    return isRomanianLetter(cp);
}

}  // namespace

int computeFinalConfidence(float ocrConfidence, float templateConfidence,
                           int fieldCount, int medicalTermCount) {
    double templateBoost = std::min(std::max(templateConfidence, 0.0f) * 0.3, 20.0);
    double fieldBoost = std::min(std::max(fieldCount, 0) * 2.0, 15.0);
    double termBoost = std::min(std::max(medicalTermCount, 0) * 3.0, 10.0);
    return clampScore(ocrConfidence + templateBoost + fieldBoost + termBoost);
}

int computeRegionConfidence(const std::vector<float>& fieldConfidences) {
    if (fieldConfidences.empty()) {
        return 0;
    }
    double sum = 0;
    for (float c : fieldConfidences) {
        sum += c;
    }
    return clampScore(sum / fieldConfidences.size());
}

float meanPositive(const std::vector<float>& values) {
    double sum = 0;
    int count = 0;
    for (float v : values) {
        if (v > 0) {
            sum += v;
            count++;
        }
    }
    return count > 0 ? static_cast<float>(sum / count) : 0.0f;
}

int estimateTextQuality(const std::string& text) {
    std::u32string codepoints = decodeUtf8(text);
    if (codepoints.size() < 5) {
        return 0;
    }

    int score = 50;
    if (codepoints.size() > 100) {
        score += 10;
    }

    std::string lower = foldDiacritics(toLowerRo(text));
    for (const auto& keyword : TemplateRegistry::instance().qualityKeywords()) {
        if (lower.find(keyword) != std::string::npos) {
            score += 5;
        }
    }

    size_t special = 0;
    for (char32_t cp : codepoints) {
        if (!isPlainTextSymbol(cp)) {
            special++;
        }
    }
    if (static_cast<double>(special) / codepoints.size() > 0.3) {
        score -= 20;
    }

    if (hasRomanianDiacritics(text)) {
        score += 10;
    }

    return clampScore(score);
}
