#include "core/errors.hpp"

namespace facegate {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:          return "InvalidInput";
        case ErrorKind::DecodeFailure:         return "DecodeFailure";
        case ErrorKind::NoFaceDetected:        return "NoFaceDetected";
        case ErrorKind::MultipleFacesDetected: return "MultipleFacesDetected";
        case ErrorKind::EncodingFailure:       return "EncodingFailure";
        case ErrorKind::MissingCapture:        return "MissingCapture";
        case ErrorKind::DuplicateIdentity:     return "DuplicateIdentity";
        case ErrorKind::NotFound:              return "NotFound";
        case ErrorKind::NoMatch:               return "NoMatch";
        case ErrorKind::Unauthorized:          return "Unauthorized";
        case ErrorKind::StorageUnavailable:    return "StorageUnavailable";
    }
    return "Unknown";
}

}  // namespace facegate
