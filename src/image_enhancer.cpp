#include "image_enhancer.hpp"
#include <algorithm>

PageEnhanceConfig PageEnhanceConfig::aggressive() {
    PageEnhanceConfig config;
    config.apply_autocontrast = true;
    config.apply_sharpening = true;
    config.contrast_factor = 1.5f;
    config.min_dimension = 1000;
    return config;
}

PageEnhanceConfig PageEnhanceConfig::simple() {
    return PageEnhanceConfig();
}

ImageEnhancer::ImageEnhancer() {}

ImageEnhancer::~ImageEnhancer() {}

int ImageEnhancer::regionScale(const cv::Size& size, const RegionEnhanceConfig& config) {
    int smallest = std::min(size.width, size.height);
    if (smallest <= 0) {
        return config.min_scale;
    }
    return std::max(config.min_scale, config.target_dimension / smallest);
}

cv::Mat ImageEnhancer::enhanceRegion(const cv::Mat& crop, const RegionEnhanceConfig& config) {
    if (crop.empty()) {
        return crop;
    }

    cv::Mat result = toGray(crop);
    result = adjustContrast(result, config.contrast_factor);
    result = upscale(result, regionScale(result.size(), config));

    return result;
}

cv::Mat ImageEnhancer::enhancePage(const cv::Mat& page, const PageEnhanceConfig& config) {
    if (page.empty()) {
        return page;
    }

    cv::Mat result = page;

    // Resize if too small, both sides end up >= min_dimension
    if (config.min_dimension > 0 &&
        (result.cols < config.min_dimension || result.rows < config.min_dimension)) {
        double scale = std::max(static_cast<double>(config.min_dimension) / result.cols,
                                static_cast<double>(config.min_dimension) / result.rows);
        result = upscale(result, scale);
    }

    result = toGray(result);

    if (config.apply_autocontrast) {
        result = stretchContrast(result);
    }

    result = adjustContrast(result, config.contrast_factor);

    if (config.apply_sharpening) {
        result = sharpen(result, config.sharpening_strength);
    }

    return result;
}

cv::Mat ImageEnhancer::toGray(const cv::Mat& input) {
    if (input.empty()) {
        return input;
    }

    cv::Mat gray;
    if (input.channels() == 3) {
        cv::cvtColor(input, gray, cv::COLOR_BGR2GRAY);
    } else if (input.channels() == 4) {
        cv::cvtColor(input, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = input.clone();
    }

    return gray;
}

cv::Mat ImageEnhancer::adjustContrast(const cv::Mat& input, float factor) {
    if (input.empty() || factor == 1.0f) {
        return input.clone();
    }

    // Blend against the mean gray level: out = mean + factor * (in - mean)
    float mean = calculateMean(input);

    cv::Mat result;
    input.convertTo(result, -1, factor, mean * (1.0f - factor));

    return result;
}

cv::Mat ImageEnhancer::sharpen(const cv::Mat& input, float strength) {
    if (input.empty() || strength <= 0) {
        return input.clone();
    }

    // Unsharp masking
    cv::Mat blurred;
    cv::GaussianBlur(input, blurred, cv::Size(0, 0), 3);

    cv::Mat result;
    // sharpened = original + strength * (original - blurred)
    cv::addWeighted(input, 1.0 + strength, blurred, -strength, 0, result);

    return result;
}

cv::Mat ImageEnhancer::upscale(const cv::Mat& input, double scale) {
    if (input.empty() || scale <= 1.0) {
        return input;
    }

    int width = std::max(1, static_cast<int>(input.cols * scale));
    int height = std::max(1, static_cast<int>(input.rows * scale));

    cv::Mat result;
    cv::resize(input, result, cv::Size(width, height), 0, 0, cv::INTER_LANCZOS4);

    return result;
}

float ImageEnhancer::calculateMean(const cv::Mat& input) {
    if (input.empty()) {
        return 128.0f;
    }

    cv::Mat gray;
    if (input.channels() == 1) {
        gray = input;
    } else {
        gray = toGray(input);
    }

    cv::Scalar mean = cv::mean(gray);
    return static_cast<float>(mean[0]);
}

cv::Mat ImageEnhancer::stretchContrast(const cv::Mat& input) {
    if (input.empty()) {
        return input;
    }

    cv::Mat result;
    cv::normalize(toGray(input), result, 0, 255, cv::NORM_MINMAX);
    return result;
}
