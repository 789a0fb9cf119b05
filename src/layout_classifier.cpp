#include "layout_classifier.hpp"
#include "document_templates.hpp"

#include <algorithm>

#define LOG_TAG "LayoutClassifier"
#include "log.hpp"

LayoutClassifier::LayoutClassifier(const ClassifierConfig& config) : config_(config) {}

LayoutClassifier::~LayoutClassifier() {}

LayoutDecision LayoutClassifier::classify(const cv::Mat& image) {
    if (image.empty()) {
        LOGE("Empty image, layout unknown");
        return LayoutDecision();
    }

    try {
        cv::Mat gray;
        if (image.channels() == 3) {
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        } else if (image.channels() == 4) {
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = image;
        }
        return analyze(gray);
    } catch (const std::exception& e) {
        LOGE("Layout analysis failed: %s", e.what());
        return LayoutDecision();
    }
}

LayoutDecision LayoutClassifier::analyze(const cv::Mat& gray) {
    LayoutDecision decision;
    decision.aspect_ratio = static_cast<float>(gray.cols) / static_cast<float>(gray.rows);

    cv::Mat edges = strongEdgeMask(gray);

    measurePhotoStrip(gray, edges, decision);
    decision.has_photo = decision.dark_ratio > config_.photo_dark_ratio ||
                         decision.edge_ratio > config_.photo_edge_ratio;

    decision.text_rows = countTextRows(edges);
    decision.has_structured_text = decision.text_rows > config_.min_text_rows;

    decision.card_shape = decision.aspect_ratio > config_.min_card_aspect &&
                          decision.aspect_ratio < config_.max_card_aspect;

    LOGD("aspect=%.3f dark=%.3f edge=%.3f rows=%d",
         decision.aspect_ratio, decision.dark_ratio, decision.edge_ratio, decision.text_rows);

    if (decision.card_shape && decision.has_photo && decision.has_structured_text) {
        decision.layout = DocumentLayout::IdentityCard;
        decision.subtype = detectSubtype(gray, decision.photo_area_ratio);
        LOGI("Identity card layout, subtype=%s, photo ratio=%.3f",
             decision.subtype.empty() ? "unresolved" : decision.subtype.c_str(),
             decision.photo_area_ratio);
        return decision;
    }

    decision.has_lab_header = detectLabHeader(gray);
    if (decision.has_lab_header) {
        decision.layout = DocumentLayout::LabResult;
        LOGI("Lab result layout");
        return decision;
    }

    LOGI("Layout unknown (card_shape=%d photo=%d text=%d)",
         decision.card_shape, decision.has_photo, decision.has_structured_text);
    return decision;
}

cv::Mat LayoutClassifier::strongEdgeMask(const cv::Mat& gray) {
    cv::Mat gradX, gradY, magnitude;
    cv::Sobel(gray, gradX, CV_32F, 1, 0, 3);
    cv::Sobel(gray, gradY, CV_32F, 0, 1, 3);
    cv::magnitude(gradX, gradY, magnitude);

    cv::Mat mask = magnitude > config_.strong_edge_threshold;
    return mask;
}

void LayoutClassifier::measurePhotoStrip(const cv::Mat& gray, const cv::Mat& edges, LayoutDecision& decision) {
    int stripWidth = std::max(1, static_cast<int>(gray.cols * config_.photo_strip_ratio));
    cv::Rect strip(0, 0, std::min(stripWidth, gray.cols), gray.rows);

    double total = static_cast<double>(strip.area());
    cv::Mat dark = gray(strip) < config_.dark_threshold;

    decision.dark_ratio = static_cast<float>(cv::countNonZero(dark) / total);
    decision.edge_ratio = static_cast<float>(cv::countNonZero(edges(strip)) / total);
}

int LayoutClassifier::countTextRows(const cv::Mat& edges) {
    cv::Mat edgeFloat;
    edges.convertTo(edgeFloat, CV_32F, 1.0 / 255.0);

    // Column vector holding the edge fraction of each row
    cv::Mat rowDensity;
    cv::reduce(edgeFloat, rowDensity, 1, cv::REDUCE_AVG, CV_32F);

    int rows = 0;
    for (int y = 0; y < rowDensity.rows; y++) {
        if (rowDensity.at<float>(y, 0) > config_.row_edge_density) {
            rows++;
        }
    }
    return rows;
}

std::string LayoutClassifier::detectSubtype(const cv::Mat& gray, float& photoAreaRatio) {
    photoAreaRatio = 0;

    int searchWidth = std::max(1, static_cast<int>(gray.cols * config_.subtype_search_ratio));
    cv::Rect searchArea(0, 0, std::min(searchWidth, gray.cols), gray.rows);

    cv::Mat dark = gray(searchArea) < config_.dark_threshold;

    cv::Mat labels, stats, centroids;
    int count = cv::connectedComponentsWithStats(dark, labels, stats, centroids, 8, CV_32S);

    // Label 0 is the background
    int largest = -1;
    int largestArea = 0;
    for (int i = 1; i < count; i++) {
        int area = stats.at<int>(i, cv::CC_STAT_AREA);
        if (area > largestArea) {
            largestArea = area;
            largest = i;
        }
    }

    if (largest < 0) {
        return "";
    }

    double boxArea = static_cast<double>(stats.at<int>(largest, cv::CC_STAT_WIDTH)) *
                     stats.at<int>(largest, cv::CC_STAT_HEIGHT);
    photoAreaRatio = static_cast<float>(boxArea / (static_cast<double>(gray.cols) * gray.rows));

    if (photoAreaRatio > config_.electronic_photo_ratio) {
        return kSubtypeElectronic;
    }
    if (photoAreaRatio > config_.standard_photo_ratio) {
        return kSubtypeStandard;
    }
    return "";
}

bool LayoutClassifier::detectLabHeader(const cv::Mat& gray) {
    // No pixel-level lab header detector yet; lab reports are found by
    // template matching on the recognized text.
    (void)gray;
    return false;
}
