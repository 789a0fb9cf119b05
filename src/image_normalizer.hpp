#ifndef IMAGE_NORMALIZER_HPP
#define IMAGE_NORMALIZER_HPP

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <string>

// Raw pixel buffer layouts accepted from host applications
enum PixelFormat {
    PIXEL_FORMAT_BGRA = 0,
    PIXEL_FORMAT_BGR = 1,
    PIXEL_FORMAT_RGB = 2
};

struct NormalizedImage {
    bool success;
    cv::Mat image;             // 8-bit BGR, owned by this result
    std::string color_mode;    // mode of the input before conversion
    std::string error_message;

    NormalizedImage() : success(false) {}

    int width() const { return image.cols; }
    int height() const { return image.rows; }
};

// Turns encoded bytes, raw buffers or foreign Mats into the canonical
// 3-channel 8-bit BGR image the rest of the engine works on.
class ImageNormalizer {
public:
    ImageNormalizer();
    ~ImageNormalizer();

    // Encoded image file contents (PNG, JPEG, TIFF, ...)
    NormalizedImage decode(const uint8_t* data, size_t length);

    // Uncompressed pixels, format is a PixelFormat value
    NormalizedImage fromBuffer(const uint8_t* data, int width, int height, int format);

    NormalizedImage fromMat(const cv::Mat& input);

private:
    cv::Mat bufferToMat(const uint8_t* data, int width, int height, int format);
};

#endif // IMAGE_NORMALIZER_HPP
