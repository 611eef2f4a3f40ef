#pragma once

#include <stdexcept>
#include <string>

namespace dlqueue {

enum class ErrorCode {
    MetadataResolutionFailed,
    TransferOpenFailed,
    TransferFailed,
    ResumeImpossible,
    RecordNotFound,
    DuplicateIdentity,
};

[[nodiscard]] const char* errorCodeName(ErrorCode code);

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace dlqueue
