#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

#include <string>
#include <vector>

// UTF-8 helpers aware of the Romanian alphabet (ă â î ș ț, plus the legacy
// cedilla forms ş ţ). Code points outside ASCII and that set pass through.

std::u32string decodeUtf8(const std::string& text);
// Malformed sequences become U+FFFD
std::string sanitizeUtf8(const std::string& text);
std::string encodeUtf8(const std::u32string& text);

std::string toUpperRo(const std::string& text);
std::string toLowerRo(const std::string& text);

// Strip Romanian diacritics (ă -> a, Ș -> S, ...)
std::string foldDiacritics(const std::string& text);

// Upper-cased, diacritic-free key used for case-insensitive matching
std::string matchKey(const std::string& text);

bool isRomanianLetter(char32_t cp);
bool hasRomanianDiacritics(const std::string& text);

// Title case per word: "POPESCU ana-maria" -> "Popescu Ana-Maria"
std::string capitalizeWords(const std::string& text);

std::string trim(const std::string& s);
std::vector<std::string> splitLines(const std::string& text);

// Number of code points, not bytes
size_t utf8Length(const std::string& text);

#endif // TEXT_UTILS_HPP
