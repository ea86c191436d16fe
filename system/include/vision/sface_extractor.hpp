// ============= include/vision/sface_extractor.hpp =============
/*
 * SFace Feature Extractor - OpenCV DNN (CPU)
 *
 * PIPELINE:
 * - Deteccion: YuNet (cv::FaceDetectorYN), input ajustado al tamaño del frame
 * - Alineacion: alignCrop con los 5 landmarks de YuNet
 * - Embedding: SFace (cv::FaceRecognizerSF), 128 floats
 * - L2 normalize: distancias euclideas en [0, 2]
 *
 * MODELOS (OpenCV zoo):
 * - face_detection_yunet_2023mar.onnx
 * - face_recognition_sface_2021dec.onnx
 *
 * Las redes de cv::dnn no son thread-safe: extract() serializa con un mutex.
 */

#pragma once
#include "vision/feature_extractor.hpp"
#include <opencv2/objdetect.hpp>
#include <mutex>
#include <string>

namespace facegate {

class SFaceExtractor : public FeatureExtractor {
private:
    cv::Ptr<cv::FaceDetectorYN> detector;
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
    std::mutex model_mutex;

public:
    // Lanza std::runtime_error si algun modelo no carga
    SFaceExtractor(const std::string& detector_model,
                   const std::string& recognizer_model,
                   float score_threshold = 0.9f,
                   float nms_threshold = 0.3f);

    std::vector<DetectedFace> extract(const cv::Mat& bgr) override;

    static void l2_normalize(std::vector<float>& embedding);
};

}  // namespace facegate
