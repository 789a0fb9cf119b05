#include "text_utils.hpp"

#include <cctype>
#include <sstream>

namespace {

const char32_t kReplacementChar = 0xFFFD;

struct CasePair {
    char32_t upper;
    char32_t lower;
    char32_t base;  // ASCII letter without the diacritic
};

// Romanian letters with diacritics, comma-below and legacy cedilla forms
const CasePair kRomanianLetters[] = {
    {0x0102, 0x0103, U'a'},  // Ă ă
    {0x00C2, 0x00E2, U'a'},  // Â â
    {0x00CE, 0x00EE, U'i'},  // Î î
    {0x0218, 0x0219, U's'},  // Ș ș
    {0x015E, 0x015F, U's'},  // Ş ş
    {0x021A, 0x021B, U't'},  // Ț ț
    {0x0162, 0x0163, U't'},  // Ţ ţ
    {0x00C3, 0x00E3, U'a'},  // Ã ã (frequent OCR confusion for ă)
};

char32_t upperOf(char32_t cp) {
    if (cp < 0x80) {
        return static_cast<char32_t>(std::toupper(static_cast<int>(cp)));
    }
    for (const auto& pair : kRomanianLetters) {
        if (pair.lower == cp) return pair.upper;
    }
    return cp;
}

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Bytes used by the well-formed sequence at data, 0 when malformed
// (bad lead, missing or bad continuation, overlong, surrogate, > U+10FFFF).
size_t decodeSequence(const unsigned char* data, size_t remaining, char32_t& cp) {
    unsigned char byte = data[0];
    size_t length;
    char32_t minimum;

    if (byte < 0x80) {
        cp = byte;
        return 1;
    } else if ((byte >> 5) == 0x6) {
        length = 2;
        minimum = 0x80;
        cp = byte & 0x1F;
    } else if ((byte >> 4) == 0xE) {
        length = 3;
        minimum = 0x800;
        cp = byte & 0x0F;
    } else if ((byte >> 3) == 0x1E) {
        length = 4;
        minimum = 0x10000;
        cp = byte & 0x07;
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }
    for (size_t k = 1; k < length; k++) {
        if (!isContinuation(data[k])) {
            return 0;
        }
        cp = (cp << 6) | (data[k] & 0x3F);
    }

    if (cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return length;
}

char32_t lowerOf(char32_t cp) {
    if (cp < 0x80) {
        return static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
    }
    for (const auto& pair : kRomanianLetters) {
        if (pair.upper == cp) return pair.lower;
    }
    return cp;
}

}  // namespace

std::u32string decodeUtf8(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());

    const unsigned char* data = reinterpret_cast<const unsigned char*>(text.data());
    size_t length = text.size();
    size_t i = 0;

    while (i < length) {
        char32_t cp = 0;
        size_t used = decodeSequence(data + i, length - i, cp);
        if (used == 0) {
            // Malformed sequence: one replacement per offending byte
            result.push_back(kReplacementChar);
            ++i;
            continue;
        }
        result.push_back(cp);
        i += used;
    }

    return result;
}

std::string sanitizeUtf8(const std::string& text) {
    return encodeUtf8(decodeUtf8(text));
}

std::string encodeUtf8(const std::u32string& text) {
    std::string result;
    result.reserve(text.size());

    for (char32_t cp : text) {
        if (cp < 0x80) {
            result.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            result.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    return result;
}

std::string toUpperRo(const std::string& text) {
    std::u32string cps = decodeUtf8(text);
    for (auto& cp : cps) {
        cp = upperOf(cp);
    }
    return encodeUtf8(cps);
}

std::string toLowerRo(const std::string& text) {
    std::u32string cps = decodeUtf8(text);
    for (auto& cp : cps) {
        cp = lowerOf(cp);
    }
    return encodeUtf8(cps);
}

std::string foldDiacritics(const std::string& text) {
    std::u32string cps = decodeUtf8(text);
    for (auto& cp : cps) {
        for (const auto& pair : kRomanianLetters) {
            if (pair.lower == cp) {
                cp = pair.base;
                break;
            }
            if (pair.upper == cp) {
                cp = static_cast<char32_t>(std::toupper(static_cast<int>(pair.base)));
                break;
            }
        }
    }
    return encodeUtf8(cps);
}

std::string matchKey(const std::string& text) {
    return toUpperRo(foldDiacritics(text));
}

bool isRomanianLetter(char32_t cp) {
    if ((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z')) {
        return true;
    }
    for (const auto& pair : kRomanianLetters) {
        if (pair.upper == cp || pair.lower == cp) return true;
    }
    return false;
}

bool hasRomanianDiacritics(const std::string& text) {
    for (char32_t cp : decodeUtf8(text)) {
        if (cp < 0x80) continue;
        for (const auto& pair : kRomanianLetters) {
            if (pair.lower == cp || pair.upper == cp) return true;
        }
    }
    return false;
}

std::string capitalizeWords(const std::string& text) {
    std::istringstream stream(trim(text));
    std::string word;
    std::string result;

    while (stream >> word) {
        std::u32string cps = decodeUtf8(word);
        // Title case: a letter after a non-letter starts a new part ("Ana-Maria")
        bool startOfPart = true;
        for (auto& cp : cps) {
            bool letter = isRomanianLetter(cp);
            cp = startOfPart ? upperOf(cp) : lowerOf(cp);
            startOfPart = !letter;
        }
        if (!result.empty()) result += ' ';
        result += encodeUtf8(cps);
    }

    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}
