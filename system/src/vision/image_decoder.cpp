#include "vision/image_decoder.hpp"
#include "core/errors.hpp"
#include "core/utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <vector>

namespace facegate {

std::string strip_data_url(const std::string& payload) {
    static const std::string marker = "base64,";
    auto pos = payload.find(marker);
    if (pos == std::string::npos) return payload;
    return payload.substr(pos + marker.size());
}

cv::Mat decode_image_payload(const std::string& payload) {
    std::vector<unsigned char> bytes;
    if (!base64_decode(strip_data_url(payload), bytes) || bytes.empty()) {
        throw FaceGateError(ErrorKind::DecodeFailure, "Image decoding error: invalid base64 data");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw FaceGateError(ErrorKind::DecodeFailure, std::string("Image decoding error: ") + e.what());
    }

    if (image.empty()) {
        throw FaceGateError(ErrorKind::DecodeFailure, "Failed to decode image. Please try capturing again.");
    }
    return image;
}

}  // namespace facegate
