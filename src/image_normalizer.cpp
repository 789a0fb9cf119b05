#include "image_normalizer.hpp"

#define LOG_TAG "ImageNormalizer"
#include "log.hpp"

namespace {

NormalizedImage failure(const std::string& message) {
    NormalizedImage result;
    result.error_message = message;
    return result;
}

const char* colorModeOf(const cv::Mat& mat) {
    switch (mat.channels()) {
        case 1: return "L";
        case 3: return "BGR";
        case 4: return "BGRA";
        default: return "unknown";
    }
}

}  // namespace

ImageNormalizer::ImageNormalizer() {}

ImageNormalizer::~ImageNormalizer() {}

cv::Mat ImageNormalizer::bufferToMat(const uint8_t* data, int width, int height, int format) {
    cv::Mat result;

    switch (format) {
        case PIXEL_FORMAT_BGRA:
            {
                cv::Mat bgra(height, width, CV_8UC4, const_cast<uint8_t*>(data));
                cv::cvtColor(bgra, result, cv::COLOR_BGRA2BGR);
            }
            break;
        case PIXEL_FORMAT_BGR:
            result = cv::Mat(height, width, CV_8UC3, const_cast<uint8_t*>(data)).clone();
            break;
        case PIXEL_FORMAT_RGB:
            {
                cv::Mat rgb(height, width, CV_8UC3, const_cast<uint8_t*>(data));
                cv::cvtColor(rgb, result, cv::COLOR_RGB2BGR);
            }
            break;
        default:
            break;
    }

    return result;
}

NormalizedImage ImageNormalizer::decode(const uint8_t* data, size_t length) {
    if (!data || length == 0) {
        return failure("Empty image data");
    }

    cv::Mat decoded;
    try {
        cv::Mat buffer(1, static_cast<int>(length), CV_8UC1, const_cast<uint8_t*>(data));
        decoded = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    } catch (const std::exception& e) {
        LOGE("imdecode failed: %s", e.what());
        return failure(std::string("Cannot decode image: ") + e.what());
    }

    if (decoded.empty()) {
        LOGE("imdecode returned an empty image (%zu bytes)", length);
        return failure("Cannot decode image: unsupported or corrupt data");
    }

    return fromMat(decoded);
}

NormalizedImage ImageNormalizer::fromBuffer(const uint8_t* data, int width, int height, int format) {
    if (!data || width <= 0 || height <= 0) {
        return failure("Invalid image data");
    }

    cv::Mat frame;
    try {
        frame = bufferToMat(data, width, height, format);
    } catch (const std::exception& e) {
        LOGE("bufferToMat failed: %s", e.what());
        return failure(std::string("Failed to create image from buffer: ") + e.what());
    }

    if (frame.empty()) {
        return failure("Unsupported pixel format");
    }

    NormalizedImage result;
    result.success = true;
    result.image = frame;
    result.color_mode = format == PIXEL_FORMAT_BGRA ? "BGRA" : (format == PIXEL_FORMAT_RGB ? "RGB" : "BGR");
    return result;
}

NormalizedImage ImageNormalizer::fromMat(const cv::Mat& input) {
    if (input.empty()) {
        return failure("Empty image");
    }

    NormalizedImage result;
    result.color_mode = colorModeOf(input);

    try {
        cv::Mat eightBit;
        if (input.depth() == CV_8U) {
            eightBit = input;
        } else if (input.depth() == CV_16U) {
            input.convertTo(eightBit, CV_8U, 1.0 / 257.0);
        } else {
            input.convertTo(eightBit, CV_8U);
        }

        switch (eightBit.channels()) {
            case 1:
                cv::cvtColor(eightBit, result.image, cv::COLOR_GRAY2BGR);
                break;
            case 3:
                result.image = eightBit.clone();
                break;
            case 4:
                cv::cvtColor(eightBit, result.image, cv::COLOR_BGRA2BGR);
                break;
            default:
                return failure("Unsupported channel count");
        }
    } catch (const std::exception& e) {
        LOGE("Color conversion failed: %s", e.what());
        return failure(std::string("Cannot convert image: ") + e.what());
    }

    LOGD("Normalized %dx%d image from %s", result.image.cols, result.image.rows, result.color_mode.c_str());
    result.success = true;
    return result;
}
