#include "dlqueue/errors.hpp"

namespace dlqueue {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::MetadataResolutionFailed:
        return "MetadataResolutionFailed";
    case ErrorCode::TransferOpenFailed:
        return "TransferOpenFailed";
    case ErrorCode::TransferFailed:
        return "TransferFailed";
    case ErrorCode::ResumeImpossible:
        return "ResumeImpossible";
    case ErrorCode::RecordNotFound:
        return "RecordNotFound";
    case ErrorCode::DuplicateIdentity:
        return "DuplicateIdentity";
    }
    return "Unknown";
}

DownloadError::DownloadError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

} // namespace dlqueue
