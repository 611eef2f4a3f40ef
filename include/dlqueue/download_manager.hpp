#pragma once

#include "download_observer.hpp"
#include "download_record.hpp"
#include "transfer_client.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dlqueue {

class DownloadManager {
public:
    explicit DownloadManager(TransferClientPtr client);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Not owned; notifications are dropped once the observer is gone.
    void setObserver(std::weak_ptr<DownloadObserver> observer);

    // Registers a Pending record and returns without waiting on the network.
    DownloadId start(std::string url, std::string destination_folder);

    // Registers a Paused record that only owns saved resume state, e.g. after
    // a restart. resume() re-opens it through the transfer client.
    DownloadId restore(std::string url, std::string destination_folder, ResumeData resume_data,
                       double progress = 0.0);

    void pause(DownloadId id);

    // Throws DownloadError(ResumeImpossible) when the record is paused but has
    // neither a suspended transfer nor resume state.
    void resume(DownloadId id);

    void cancel(DownloadId id);
    void remove(DownloadId id);

    // Trades the suspended transfer of a paused record for resume state.
    void releaseTransfer(DownloadId id);

    [[nodiscard]] std::vector<DownloadRecord> list() const;
    [[nodiscard]] std::optional<DownloadRecord> find(DownloadId id) const;
    [[nodiscard]] std::optional<DownloadId> idAt(std::size_t index) const;

private:
    // Callbacks hold a weak_ptr to Impl so they outlive the manager safely.
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace dlqueue
