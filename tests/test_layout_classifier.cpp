#include <catch2/catch.hpp>

#include "layout_classifier.hpp"

namespace {

// Card-shaped white image: dark photo block on the left and bands of
// vertical strokes standing in for printed text lines.
cv::Mat syntheticCard(int photoWidth, int bands = 4) {
    cv::Mat image(300, 480, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::rectangle(image, cv::Rect(0, 0, photoWidth, 300), cv::Scalar(0, 0, 0), cv::FILLED);

    for (int band = 0; band < bands; band++) {
        int top = 40 + band * 50;
        for (int x = 168; x + 4 <= 456; x += 8) {
            cv::rectangle(image, cv::Rect(x, top, 4, 10), cv::Scalar(0, 0, 0), cv::FILLED);
        }
    }
    return image;
}

}  // namespace

TEST_CASE("Identity card layout from pixel statistics", "[layout]") {
    LayoutClassifier classifier;

    SECTION("large photo block: electronic card") {
        LayoutDecision d = classifier.classify(syntheticCard(120));
        REQUIRE(d.layout == DocumentLayout::IdentityCard);
        REQUIRE(d.card_shape);
        REQUIRE(d.has_photo);
        REQUIRE(d.has_structured_text);
        REQUIRE(d.text_rows > 3);
        REQUIRE(d.aspect_ratio == Approx(1.6f));
        REQUIRE(d.photo_area_ratio == Approx(0.25f).margin(0.005f));
        REQUIRE(d.subtype == "carte_electronica");
    }

    SECTION("smaller photo block: standard card") {
        LayoutDecision d = classifier.classify(syntheticCard(96));
        REQUIRE(d.layout == DocumentLayout::IdentityCard);
        REQUIRE(d.photo_area_ratio == Approx(0.2f).margin(0.005f));
        REQUIRE(d.subtype == "carte_identitate");
    }

    SECTION("tiny photo block: subtype unresolved") {
        // 40 px wide block: dark fraction of the strip still above 0.15
        LayoutDecision d = classifier.classify(syntheticCard(40));
        REQUIRE(d.layout == DocumentLayout::IdentityCard);
        REQUIRE(d.subtype.empty());
    }
}

TEST_CASE("Non-card images", "[layout]") {
    LayoutClassifier classifier;

    SECTION("blank page") {
        cv::Mat blank(300, 480, CV_8UC3, cv::Scalar(255, 255, 255));
        LayoutDecision d = classifier.classify(blank);
        REQUIRE(d.layout == DocumentLayout::Unknown);
        REQUIRE_FALSE(d.has_photo);
        REQUIRE(d.text_rows == 0);
        REQUIRE(d.subtype.empty());
    }

    SECTION("photo without text") {
        LayoutDecision d = classifier.classify(syntheticCard(120, 0));
        REQUIRE(d.has_photo);
        REQUIRE_FALSE(d.has_structured_text);
        REQUIRE(d.layout == DocumentLayout::Unknown);
    }

    SECTION("portrait page is not card shaped") {
        cv::Mat card = syntheticCard(120);
        cv::Mat portrait;
        cv::resize(card, portrait, cv::Size(300, 480), 0, 0, cv::INTER_NEAREST);
        LayoutDecision d = classifier.classify(portrait);
        REQUIRE_FALSE(d.card_shape);
        REQUIRE(d.layout == DocumentLayout::Unknown);
    }

    SECTION("empty image never throws") {
        LayoutDecision d = classifier.classify(cv::Mat());
        REQUIRE(d.layout == DocumentLayout::Unknown);
    }

    SECTION("grayscale input") {
        cv::Mat gray;
        cv::cvtColor(syntheticCard(120), gray, cv::COLOR_BGR2GRAY);
        REQUIRE(classifier.classify(gray).layout == DocumentLayout::IdentityCard);
    }
}

TEST_CASE("Classification is repeatable", "[layout]") {
    LayoutClassifier classifier;
    cv::Mat card = syntheticCard(120);
    LayoutDecision a = classifier.classify(card);
    LayoutDecision b = classifier.classify(card);
    REQUIRE(a.layout == b.layout);
    REQUIRE(a.subtype == b.subtype);
    REQUIRE(a.text_rows == b.text_rows);
}
