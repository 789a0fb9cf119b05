#include <catch2/catch.hpp>

#include "confidence.hpp"

#include <string>

TEST_CASE("Final confidence formula", "[confidence]") {
    REQUIRE(computeFinalConfidence(50, 0, 0, 0) == 50);
    REQUIRE(computeFinalConfidence(50, 10, 0, 0) == 53);
    REQUIRE(computeFinalConfidence(50, 5, 0, 0) == 51);     // 51.5 truncated
    REQUIRE(computeFinalConfidence(40, 100, 0, 0) == 60);   // template boost capped at 20
    REQUIRE(computeFinalConfidence(40, 0, 20, 0) == 55);    // field boost capped at 15
    REQUIRE(computeFinalConfidence(40, 0, 0, 2) == 46);
    REQUIRE(computeFinalConfidence(40, 0, 0, 9) == 50);     // term boost capped at 10
    REQUIRE(computeFinalConfidence(50, 100, 100, 100) == 95);
}

TEST_CASE("Final confidence is bounded", "[confidence]") {
    REQUIRE(computeFinalConfidence(95, 100, 10, 10) == 100);
    REQUIRE(computeFinalConfidence(-30, 0, 0, 0) == 0);
    REQUIRE(computeFinalConfidence(0, -50, -3, -1) == 0);
}

TEST_CASE("Final confidence is monotonic in every input", "[confidence]") {
    const float ocrValues[] = {0, 20, 55, 80, 100};
    const float templateValues[] = {0, 30, 65, 100};
    const int countValues[] = {0, 1, 4, 8, 20};

    for (float ocr : ocrValues) {
        for (float templ : templateValues) {
            for (int fields : countValues) {
                for (int terms : countValues) {
                    int base = computeFinalConfidence(ocr, templ, fields, terms);
                    REQUIRE(base >= 0);
                    REQUIRE(base <= 100);
                    REQUIRE(computeFinalConfidence(ocr + 5, templ, fields, terms) >= base);
                    REQUIRE(computeFinalConfidence(ocr, templ + 5, fields, terms) >= base);
                    REQUIRE(computeFinalConfidence(ocr, templ, fields + 1, terms) >= base);
                    REQUIRE(computeFinalConfidence(ocr, templ, fields, terms + 1) >= base);
                }
            }
        }
    }
}

TEST_CASE("Region confidence is the plain mean", "[confidence]") {
    REQUIRE(computeRegionConfidence({}) == 0);
    REQUIRE(computeRegionConfidence({80, 70, 0}) == 50);
    REQUIRE(computeRegionConfidence({91.5f, 91.0f}) == 91);
    REQUIRE(computeRegionConfidence({150, 150}) == 100);
}

TEST_CASE("Mean of positive values", "[confidence]") {
    REQUIRE(meanPositive({}) == 0.0f);
    REQUIRE(meanPositive({0, -1}) == 0.0f);
    REQUIRE(meanPositive({0, 80, 90}) == Approx(85.0f));
}

TEST_CASE("Text quality estimate", "[confidence]") {
    SECTION("too short") {
        REQUIRE(estimateTextQuality("") == 0);
        REQUIRE(estimateTextQuality("abcd") == 0);
        REQUIRE(estimateTextQuality("ăîșțâ") == 60);  // five code points, diacritics
    }

    SECTION("base score with keywords") {
        REQUIRE(estimateTextQuality("Ion Popescu") == 50);
        REQUIRE(estimateTextQuality("Pacient: Ion Popescu") == 55);
        REQUIRE(estimateTextQuality("LABORATOR\nREZULTATE\nHemoglobina: 14.2 g/dL (12-16)") == 60);
    }

    SECTION("diacritics bonus") {
        REQUIRE(estimateTextQuality("Pacient: Ion Popescu, născut") == 65);
        REQUIRE(estimateTextQuality("PACIENT: ȘTEFAN") == 65);
    }

    SECTION("noise penalty") {
        REQUIRE(estimateTextQuality("#$%&@#$%&@ab") == 30);
    }

    SECTION("long text bonus") {
        std::string text;
        for (int i = 0; i < 12; i++) {
            text += "Ion Popescu ";
        }
        REQUIRE(estimateTextQuality(text) == 60);
    }

    SECTION("clamped at 100") {
        std::string text = "pacient patient data date laborator laboratory rezultate results normal "
                           "analize test medic doctor spital hospital diagnostic diagnosis ăîș";
        REQUIRE(estimateTextQuality(text) == 100);
    }
}
