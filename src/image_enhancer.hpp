#ifndef IMAGE_ENHANCER_HPP
#define IMAGE_ENHANCER_HPP

#include <opencv2/opencv.hpp>

// Crop enhancement for single-field recognition on identity cards
struct RegionEnhanceConfig {
    float contrast_factor;   // 1.0 = unchanged
    int target_dimension;    // smallest side is scaled towards this many pixels
    int min_scale;           // never upscale by less than this

    RegionEnhanceConfig() {
        contrast_factor = 2.0f;
        target_dimension = 100;
        min_scale = 3;
    }
};

// Whole-page preprocessing for full-document recognition
struct PageEnhanceConfig {
    bool apply_autocontrast;
    bool apply_sharpening;
    float contrast_factor;
    float sharpening_strength;
    int min_dimension;       // 0 = no upscaling

    PageEnhanceConfig() {
        apply_autocontrast = false;
        apply_sharpening = false;
        contrast_factor = 2.0f;
        sharpening_strength = 0.5f;
        min_dimension = 0;
    }

    // Upscale to >= 1000 px, autocontrast, contrast 1.5, sharpen
    static PageEnhanceConfig aggressive();
    // Contrast 2.0 only
    static PageEnhanceConfig simple();
};

class ImageEnhancer {
public:
    ImageEnhancer();
    ~ImageEnhancer();

    // Single-channel result, input may be gray, BGR or BGRA
    cv::Mat enhanceRegion(const cv::Mat& crop, const RegionEnhanceConfig& config = RegionEnhanceConfig());
    cv::Mat enhancePage(const cv::Mat& page, const PageEnhanceConfig& config);

    // Individual enhancement functions
    cv::Mat toGray(const cv::Mat& input);
    cv::Mat adjustContrast(const cv::Mat& input, float factor);
    cv::Mat stretchContrast(const cv::Mat& input);
    cv::Mat sharpen(const cv::Mat& input, float strength = 0.5f);
    cv::Mat upscale(const cv::Mat& input, double scale);

    // Integer scale factor used by enhanceRegion for a crop of the given size
    static int regionScale(const cv::Size& size, const RegionEnhanceConfig& config);

private:
    float calculateMean(const cv::Mat& gray);
};

#endif // IMAGE_ENHANCER_HPP
