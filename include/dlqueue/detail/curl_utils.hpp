#pragma once

#include <optional>
#include <string>

namespace dlqueue::detail {

void ensureCurlInitialized();

// Last non-empty path segment of `url`, percent-decoded, without query or
// fragment. Falls back to "download".
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

// Value of the filename parameter of a Content-Disposition header line.
[[nodiscard]] std::optional<std::string> filenameFromContentDisposition(const std::string& header);

} // namespace dlqueue::detail
