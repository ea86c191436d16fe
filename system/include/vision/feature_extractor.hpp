// ============= include/vision/feature_extractor.hpp =============
/*
 * Feature Extractor - frontera con el modelo de rostros
 *
 * Dada una imagen BGR devuelve 0..N rostros, cada uno con su embedding
 * de longitud fija. Desde fuera se trata como funcion pura.
 *
 * Un embedding vacio significa que el rostro se detecto pero no se pudo
 * codificar.
 */

#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace facegate {

struct DetectedFace {
    cv::Rect bbox;
    float score = 0.0f;
    std::vector<float> embedding;
};

class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    virtual std::vector<DetectedFace> extract(const cv::Mat& bgr) = 0;
};

}  // namespace facegate
