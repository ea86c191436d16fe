// ============= include/vision/image_decoder.hpp =============
#pragma once
#include <opencv2/core.hpp>
#include <string>

namespace facegate {

// Decodifica "data:image/...;base64,XXXX" o base64 plano a una imagen BGR.
// Lanza FaceGateError(DecodeFailure) si el base64 o la imagen son invalidos.
cv::Mat decode_image_payload(const std::string& payload);

// Quita el prefijo data-URL (todo hasta "base64,") si existe
std::string strip_data_url(const std::string& payload);

}  // namespace facegate
