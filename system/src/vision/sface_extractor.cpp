// ============= src/vision/sface_extractor.cpp =============
#include "vision/sface_extractor.hpp"
#include <spdlog/spdlog.h>
#include <opencv2/dnn.hpp>
#include <chrono>
#include <cmath>
#include <filesystem>

namespace facegate {

// ==================== CONSTRUCTOR ====================

SFaceExtractor::SFaceExtractor(const std::string& detector_model,
                               const std::string& recognizer_model,
                               float score_threshold,
                               float nms_threshold)
{
    spdlog::info("🎭 Inicializando SFace Feature Extractor");
    spdlog::info("   Detector  : {}", detector_model);
    spdlog::info("   Recognizer: {}", recognizer_model);

    for (const auto& path : {detector_model, recognizer_model}) {
        if (!std::filesystem::exists(path)) {
            spdlog::error("Modelo no encontrado: {}", path);
            throw std::runtime_error("Modelo no encontrado: " + path);
        }
    }

    try {
        detector = cv::FaceDetectorYN::create(
            detector_model, "", cv::Size(320, 320),
            score_threshold, nms_threshold, 5000,
            cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);

        recognizer = cv::FaceRecognizerSF::create(
            recognizer_model, "",
            cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);
    } catch (const cv::Exception& e) {
        spdlog::error("Error cargando modelos: {}", e.what());
        throw std::runtime_error(std::string("No se pudieron cargar los modelos: ") + e.what());
    }

    spdlog::info("✓ SFace Extractor listo (score={:.2f}, nms={:.2f})", score_threshold, nms_threshold);
}

// ==================== EXTRACT ====================

std::vector<DetectedFace> SFaceExtractor::extract(const cv::Mat& bgr) {
    std::vector<DetectedFace> result;
    if (bgr.empty()) {
        spdlog::warn("Empty image");
        return result;
    }

    std::lock_guard<std::mutex> lock(model_mutex);

    auto t0 = std::chrono::high_resolution_clock::now();

    cv::Mat faces;
    detector->setInputSize(bgr.size());
    detector->detect(bgr, faces);

    auto t1 = std::chrono::high_resolution_clock::now();

    // Cada fila: x, y, w, h, 5 landmarks (x,y), score
    for (int i = 0; i < faces.rows; i++) {
        DetectedFace face;
        face.bbox = cv::Rect(static_cast<int>(faces.at<float>(i, 0)),
                             static_cast<int>(faces.at<float>(i, 1)),
                             static_cast<int>(faces.at<float>(i, 2)),
                             static_cast<int>(faces.at<float>(i, 3)));
        face.score = faces.at<float>(i, 14);

        try {
            cv::Mat aligned, feature;
            recognizer->alignCrop(bgr, faces.row(i), aligned);
            recognizer->feature(aligned, feature);

            cv::Mat flat = feature.reshape(1, 1);
            flat.convertTo(flat, CV_32F);
            face.embedding.assign(flat.ptr<float>(0), flat.ptr<float>(0) + flat.cols);
            l2_normalize(face.embedding);
        } catch (const cv::Exception& e) {
            // embedding vacio = rostro detectado pero no codificable
            spdlog::warn("No se pudo codificar el rostro {}: {}", i, e.what());
            face.embedding.clear();
        }

        result.push_back(std::move(face));
    }

    auto t2 = std::chrono::high_resolution_clock::now();

    double detect_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    double embed_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    spdlog::debug("Extract: {} rostros en {:.1f}ms (detect={:.1f}, embed={:.1f})",
                  result.size(), detect_ms + embed_ms, detect_ms, embed_ms);

    return result;
}

void SFaceExtractor::l2_normalize(std::vector<float>& embedding) {
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
}

}  // namespace facegate
