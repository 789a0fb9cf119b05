#ifndef LAYOUT_CLASSIFIER_HPP
#define LAYOUT_CLASSIFIER_HPP

#include <opencv2/opencv.hpp>

#include "processing_result.hpp"

struct ClassifierConfig {
    float photo_strip_ratio;        // left strip searched for a photo
    int dark_threshold;             // luminance below this is dark
    float strong_edge_threshold;    // Sobel magnitude above this is an edge
    float photo_dark_ratio;         // has_photo when dark fraction exceeds this
    float photo_edge_ratio;         // ... or edge fraction exceeds this
    float row_edge_density;         // a row is text-like above this edge fraction
    int min_text_rows;              // structured text needs more rows than this
    float min_card_aspect;
    float max_card_aspect;
    float subtype_search_ratio;     // left part searched for the photo component
    float electronic_photo_ratio;   // photo bbox / image area above this: electronic card
    float standard_photo_ratio;     // above this: standard card

    ClassifierConfig() {
        photo_strip_ratio = 0.30f;
        dark_threshold = 100;
        strong_edge_threshold = 50.0f;
        photo_dark_ratio = 0.15f;
        photo_edge_ratio = 0.03f;
        row_edge_density = 0.10f;
        min_text_rows = 3;
        min_card_aspect = 1.3f;
        max_card_aspect = 1.9f;
        subtype_search_ratio = 0.60f;
        electronic_photo_ratio = 0.235f;
        standard_photo_ratio = 0.15f;
    }
};

// Decides the document category from pixel statistics alone, before any
// text recognition runs. Never throws.
class LayoutClassifier {
public:
    explicit LayoutClassifier(const ClassifierConfig& config = ClassifierConfig());
    ~LayoutClassifier();

    LayoutDecision classify(const cv::Mat& image);

    const ClassifierConfig& config() const { return config_; }

private:
    LayoutDecision analyze(const cv::Mat& gray);
    cv::Mat strongEdgeMask(const cv::Mat& gray);
    void measurePhotoStrip(const cv::Mat& gray, const cv::Mat& edges, LayoutDecision& decision);
    int countTextRows(const cv::Mat& edges);
    std::string detectSubtype(const cv::Mat& gray, float& photoAreaRatio);
    bool detectLabHeader(const cv::Mat& gray);

    ClassifierConfig config_;
};

#endif // LAYOUT_CLASSIFIER_HPP
