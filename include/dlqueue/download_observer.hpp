#pragma once

#include "download_record.hpp"

#include <cstddef>

namespace dlqueue {

// Receives one call per lifecycle transition. `index` is the record's position
// in DownloadManager::list() at the time of the call and may be stale by the
// time it is used. Calls can arrive concurrently from transport threads.
class DownloadObserver {
public:
    virtual ~DownloadObserver() = default;

    virtual void downloadStarted(const DownloadRecord& record, std::size_t index) = 0;
    virtual void downloadProgress(const DownloadRecord& record, std::size_t index) = 0;
    virtual void downloadPaused(const DownloadRecord& record, std::size_t index) = 0;
    virtual void downloadResumed(const DownloadRecord& record, std::size_t index) = 0;
    virtual void downloadFinishedSuccess(const DownloadRecord& record, std::size_t index) = 0;
    virtual void downloadFinishedError(const DownloadRecord& record, std::size_t index) = 0;
    virtual void downloadCancelled(const DownloadRecord& record, std::size_t index) = 0;

    // `index` is the position the record had before it was removed.
    virtual void downloadRemoved(const DownloadRecord& record, std::size_t index) = 0;
};

} // namespace dlqueue
