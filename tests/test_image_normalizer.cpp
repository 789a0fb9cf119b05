#include <catch2/catch.hpp>

#include "image_normalizer.hpp"

#include <vector>

namespace {

std::vector<uint8_t> encodePng(const cv::Mat& image) {
    std::vector<uchar> buffer;
    cv::imencode(".png", image, buffer);
    return std::vector<uint8_t>(buffer.begin(), buffer.end());
}

}  // namespace

TEST_CASE("Decoding encoded images", "[normalizer]") {
    ImageNormalizer normalizer;

    SECTION("color PNG") {
        cv::Mat image(40, 60, CV_8UC3, cv::Scalar(10, 20, 30));
        std::vector<uint8_t> png = encodePng(image);

        NormalizedImage result = normalizer.decode(png.data(), png.size());
        REQUIRE(result.success);
        REQUIRE(result.width() == 60);
        REQUIRE(result.height() == 40);
        REQUIRE(result.image.type() == CV_8UC3);
        REQUIRE(result.color_mode == "BGR");
        REQUIRE(result.image.at<cv::Vec3b>(0, 0) == cv::Vec3b(10, 20, 30));
    }

    SECTION("grayscale PNG becomes BGR") {
        cv::Mat gray(20, 20, CV_8UC1, cv::Scalar(200));
        std::vector<uint8_t> png = encodePng(gray);

        NormalizedImage result = normalizer.decode(png.data(), png.size());
        REQUIRE(result.success);
        REQUIRE(result.color_mode == "L");
        REQUIRE(result.image.channels() == 3);
        REQUIRE(result.image.at<cv::Vec3b>(5, 5) == cv::Vec3b(200, 200, 200));
    }

    SECTION("corrupt bytes") {
        const uint8_t garbage[] = {0x00, 0x13, 0x37, 0x42, 0xFF, 0xD8, 0x01, 0x02};
        NormalizedImage result = normalizer.decode(garbage, sizeof(garbage));
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.error_message.empty());
    }

    SECTION("no data") {
        REQUIRE_FALSE(normalizer.decode(nullptr, 10).success);
        const uint8_t one[] = {0x89};
        REQUIRE_FALSE(normalizer.decode(one, 0).success);
    }
}

TEST_CASE("Raw pixel buffers", "[normalizer]") {
    ImageNormalizer normalizer;

    SECTION("RGB is swapped to BGR") {
        std::vector<uint8_t> rgb(4 * 3 * 3, 0);
        rgb[0] = 255;  // R of the first pixel
        NormalizedImage result = normalizer.fromBuffer(rgb.data(), 4, 3, PIXEL_FORMAT_RGB);
        REQUIRE(result.success);
        REQUIRE(result.color_mode == "RGB");
        REQUIRE(result.image.at<cv::Vec3b>(0, 0) == cv::Vec3b(0, 0, 255));
    }

    SECTION("BGRA drops alpha") {
        std::vector<uint8_t> bgra(5 * 5 * 4, 128);
        NormalizedImage result = normalizer.fromBuffer(bgra.data(), 5, 5, PIXEL_FORMAT_BGRA);
        REQUIRE(result.success);
        REQUIRE(result.image.type() == CV_8UC3);
    }

    SECTION("invalid arguments") {
        std::vector<uint8_t> bgr(3 * 3 * 3, 0);
        REQUIRE_FALSE(normalizer.fromBuffer(nullptr, 3, 3, PIXEL_FORMAT_BGR).success);
        REQUIRE_FALSE(normalizer.fromBuffer(bgr.data(), 0, 3, PIXEL_FORMAT_BGR).success);
        REQUIRE_FALSE(normalizer.fromBuffer(bgr.data(), 3, 3, 7).success);
    }
}

TEST_CASE("Foreign Mats", "[normalizer]") {
    ImageNormalizer normalizer;

    cv::Mat deep(4, 4, CV_16UC1, cv::Scalar(65535));
    NormalizedImage result = normalizer.fromMat(deep);
    REQUIRE(result.success);
    REQUIRE(result.image.type() == CV_8UC3);
    REQUIRE(result.image.at<cv::Vec3b>(1, 1) == cv::Vec3b(255, 255, 255));

    REQUIRE_FALSE(normalizer.fromMat(cv::Mat()).success);
}
