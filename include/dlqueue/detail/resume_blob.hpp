#pragma once

#include "dlqueue/download_record.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dlqueue::detail {

// What CurlTransferClient needs to continue an interrupted transfer.
struct ResumePoint {
    std::string url;
    std::string path;
    std::uint64_t offset{0};
};

[[nodiscard]] ResumeData encodeResumePoint(const ResumePoint& point);
[[nodiscard]] std::optional<ResumePoint> decodeResumePoint(const ResumeData& data);

} // namespace dlqueue::detail
