#pragma once

#include "transfer_client.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace dlqueue {

struct CurlClientOptions {
    long connect_timeout_seconds{30};
    // Abort when slower than low_speed_limit bytes/s for low_speed_time seconds.
    long low_speed_limit{1};
    long low_speed_time_seconds{60};
    bool follow_redirects{true};
    std::string user_agent{"dlqueue/1.0"};
};

// TransferClient backed by libcurl. Every request runs on its own thread;
// callbacks are delivered on those threads.
class CurlTransferClient final : public TransferClient {
public:
    explicit CurlTransferClient(CurlClientOptions options = {});
    ~CurlTransferClient() override;

    CurlTransferClient(const CurlTransferClient&) = delete;
    CurlTransferClient& operator=(const CurlTransferClient&) = delete;

    void resolveMetadata(const std::string& url, MetadataCallback callback) override;
    void openTransfer(const std::string& url, const std::string& destination_folder, const std::string& filename,
                      OpenCallback callback) override;
    void resumeTransfer(const ResumeData& resume_data, const std::string& destination_folder,
                        OpenCallback callback) override;

    // Joins workers that already finished and returns how many are still
    // running. Requests reap finished workers on their own as well.
    std::size_t reapFinishedWorkers();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dlqueue
