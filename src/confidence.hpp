#ifndef CONFIDENCE_HPP
#define CONFIDENCE_HPP

#include <string>
#include <vector>

// Final 0-100 confidence for the full-document path:
//   ocr + min(template * 0.3, 20) + min(fields * 2, 15) + min(terms * 3, 10)
// Non-decreasing in every input, clamped, truncated toward zero.
int computeFinalConfidence(float ocrConfidence, float templateConfidence,
                           int fieldCount, int medicalTermCount);

// Region path: mean of per-field confidences, truncated and clamped
int computeRegionConfidence(const std::vector<float>& fieldConfidences);

// Heuristic 0-100 score of how plausible recognized text is
int estimateTextQuality(const std::string& text);

// Mean of the strictly positive values, 0 when there are none
float meanPositive(const std::vector<float>& values);

#endif // CONFIDENCE_HPP
