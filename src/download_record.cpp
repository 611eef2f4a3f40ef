#include "dlqueue/download_record.hpp"
#include "dlqueue/detail/curl_utils.hpp"

#include <atomic>

namespace dlqueue {

DownloadId DownloadId::generate() {
    static std::atomic<std::uint64_t> next{1};
    return DownloadId{next.fetch_add(1, std::memory_order_relaxed)};
}

std::string DownloadRecord::displayName() const {
    if (filename && !filename->empty()) {
        return *filename;
    }
    return detail::filenameFromUrl(source_url);
}

} // namespace dlqueue
