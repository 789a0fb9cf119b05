#include <catch2/catch.hpp>

#include "text_utils.hpp"

TEST_CASE("Romanian case mapping", "[text]") {
    REQUIRE(toUpperRo("ăâîșț") == "ĂÂÎȘȚ");
    REQUIRE(toLowerRo("ĂÂÎȘȚ") == "ăâîșț");
    REQUIRE(toUpperRo("ştefan") == "ŞTEFAN");
    REQUIRE(toUpperRo("Cluj-Napoca 12") == "CLUJ-NAPOCA 12");
}

TEST_CASE("Diacritic folding and match keys", "[text]") {
    REQUIRE(foldDiacritics("Ștefan Țară") == "Stefan Tara");
    REQUIRE(foldDiacritics("şţ ŞŢ") == "st ST");
    REQUIRE(matchKey("Rețetă medicală") == "RETETA MEDICALA");
    REQUIRE(matchKey("Hemoglobină") == "HEMOGLOBINA");
}

TEST_CASE("Letter classification", "[text]") {
    REQUIRE(isRomanianLetter(U'a'));
    REQUIRE(isRomanianLetter(U'Z'));
    REQUIRE(isRomanianLetter(U'ș'));
    REQUIRE(isRomanianLetter(U'Ț'));
    REQUIRE_FALSE(isRomanianLetter(U'7'));
    REQUIRE_FALSE(isRomanianLetter(U'ü'));

    REQUIRE(hasRomanianDiacritics("Brașov"));
    REQUIRE(hasRomanianDiacritics("ȘTEFAN"));
    REQUIRE_FALSE(hasRomanianDiacritics("Brasov"));
}

TEST_CASE("Word capitalization", "[text]") {
    REQUIRE(capitalizeWords("POPESCU ana-maria") == "Popescu Ana-Maria");
    REQUIRE(capitalizeWords("IONESCU-POPA ȘTEFANIA") == "Ionescu-Popa Ștefania");
    REQUIRE(capitalizeWords("d'ARTAGNAN") == "D'Artagnan");
    REQUIRE(capitalizeWords("  ștefan   ION ") == "Ștefan Ion");
    REQUIRE(capitalizeWords("") == "");
}

TEST_CASE("Trimming, lines and length", "[text]") {
    REQUIRE(trim("  abc \n") == "abc");
    REQUIRE(trim("   ") == "");

    std::vector<std::string> lines = splitLines("a\r\nb\n\nc");
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "a");
    REQUIRE(lines[1] == "b");
    REQUIRE(lines[2] == "");
    REQUIRE(lines[3] == "c");

    REQUIRE(utf8Length("ăa") == 2);
    REQUIRE(utf8Length("Țară") == 4);
    REQUIRE(decodeUtf8("ș").size() == 1);
    REQUIRE(encodeUtf8(decodeUtf8("Țară")) == "Țară");
}

TEST_CASE("Malformed UTF-8 is replaced", "[text]") {
    const std::string replacement = "\xEF\xBF\xBD";

    // lead byte followed by ASCII instead of a continuation byte
    REQUIRE(sanitizeUtf8("a\xC8Zb") == "a" + replacement + "Zb");
    // stray continuation byte
    REQUIRE(sanitizeUtf8("\x99x") == replacement + "x");
    // truncated sequence at the end
    REQUIRE(sanitizeUtf8("Ion\xC8") == "Ion" + replacement);
    // overlong encoding of '/'
    REQUIRE(sanitizeUtf8("\xC0\xAF") == replacement + replacement);
    // UTF-16 surrogate
    REQUIRE(sanitizeUtf8("\xED\xA0\x80") == replacement + replacement + replacement);

    REQUIRE(sanitizeUtf8("Ștefan Țară") == "Ștefan Țară");
    REQUIRE(decodeUtf8("a\xC8Zb").size() == 4);
}
