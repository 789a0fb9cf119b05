#include <catch2/catch.hpp>

#include "cnp_validator.hpp"

#include <string>

TEST_CASE("Known CNP vectors", "[cnp]") {
    SECTION("valid male born 1996") {
        CnpValidation v = validateCnp("1960523123457");
        REQUIRE(v.valid);
        REQUIRE(v.reason.empty());
        REQUIRE(extractBirthDateFromCnp("1960523123457") == "1996-05-23");
        REQUIRE(extractGenderFromCnp("1960523123457") == "M");
    }

    SECTION("wrong control digit") {
        CnpValidation v = validateCnp("1960523123458");
        REQUIRE_FALSE(v.valid);
        REQUIRE(v.reason == "checksum");
        REQUIRE_FALSE(v.message.empty());
    }

    SECTION("remainder 10 maps to control digit 1") {
        REQUIRE(computeCnpControlDigit("285123140001") == 1);
        REQUIRE(validateCnp("2851231400011").valid);
        REQUIRE(extractGenderFromCnp("2851231400011") == "F");
        REQUIRE(extractBirthDateFromCnp("2851231400011") == "1985-12-31");
    }

    SECTION("leap day in 2004") {
        REQUIRE(validateCnp("6040229400013").valid);
        REQUIRE(extractBirthDateFromCnp("6040229400013") == "2004-02-29");
        REQUIRE(extractGenderFromCnp("6040229400013") == "F");
    }
}

TEST_CASE("CNP rejection reasons", "[cnp]") {
    REQUIRE(validateCnp("").reason == "length");
    REQUIRE(validateCnp("196052312345").reason == "length");
    REQUIRE(validateCnp("19605231234570").reason == "length");
    REQUIRE(validateCnp("19605231234a7").reason == "format");
    REQUIRE(validateCnp("1960523 23457").reason == "format");
    REQUIRE(validateCnp("0960523123457").reason == "century");
    REQUIRE(validateCnp("7960523123457").reason == "century");
    REQUIRE(validateCnp("9960523123457").reason == "century");
    REQUIRE(validateCnp("1961323123457").reason == "date");
    REQUIRE(validateCnp("1960532123457").reason == "date");
    REQUIRE(validateCnp("6030229400013").reason == "date");   // 2003 is not a leap year
    REQUIRE(validateCnp("5500101400011", 2024).reason == "year");
}

TEST_CASE("Exactly one control digit validates a well-formed prefix", "[cnp]") {
    const char* prefixes[] = {"196052312345", "285123140001", "604022940001", "180010122114"};
    for (const char* prefix : prefixes) {
        int validCount = 0;
        for (char d = '0'; d <= '9'; d++) {
            std::string cnp = std::string(prefix) + d;
            CnpValidation v = validateCnp(cnp);
            if (v.valid) {
                validCount++;
                REQUIRE(d - '0' == computeCnpControlDigit(cnp));
                REQUIRE(extractBirthDateFromCnp(cnp).size() == 10);
                std::string gender = extractGenderFromCnp(cnp);
                REQUIRE((gender == "M" || gender == "F"));
            } else {
                REQUIRE(v.reason == "checksum");
            }
        }
        REQUIRE(validCount == 1);
    }
}

TEST_CASE("Derivations are empty for invalid CNPs", "[cnp]") {
    REQUIRE(extractBirthDateFromCnp("1960523123458").empty());
    REQUIRE(extractGenderFromCnp("1960523123458").empty());
    REQUIRE(extractBirthDateFromCnp("abc").empty());
    REQUIRE(extractGenderFromCnp("").empty());
    REQUIRE(computeCnpControlDigit("12345") == -1);
    REQUIRE(computeCnpControlDigit("19605231234x") == -1);
}

TEST_CASE("Nineteenth century CNPs", "[cnp]") {
    // 3 = male born 1800-1899
    std::string prefix = "385010140001";
    std::string cnp = prefix + static_cast<char>('0' + computeCnpControlDigit(prefix));
    REQUIRE(validateCnp(cnp).valid);
    REQUIRE(extractBirthDateFromCnp(cnp) == "1885-01-01");
    REQUIRE(extractGenderFromCnp(cnp) == "M");
}
