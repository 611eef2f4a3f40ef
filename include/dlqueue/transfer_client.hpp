#pragma once

#include "download_record.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace dlqueue {

struct Metadata {
    std::string filename;
    std::string content_type;
};

struct MetadataResult {
    Metadata metadata;
    bool has_error{false};
    std::string error_message;
};

struct TransferResult {
    bool success{false};
    std::string error_message;
};

struct OpenResult {
    TransferHandlePtr handle;
    std::string error_message;

    [[nodiscard]] bool hasError() const { return handle == nullptr; }
};

using ProgressCallback = std::function<void(double fraction)>;
using CompletionCallback = std::function<void(const TransferResult& result)>;

// One live network transfer. Control methods return promptly and never invoke
// the progress or completion callbacks on the calling thread.
class TransferHandle {
public:
    virtual ~TransferHandle() = default;

    virtual void suspend() = 0;
    virtual void resume() = 0;
    virtual void cancel() = 0;
    [[nodiscard]] virtual bool isSuspended() const = 0;

    // Cancels the transfer and returns state that lets resumeTransfer continue
    // where it stopped, if the transport supports it.
    virtual std::optional<ResumeData> cancelProducingResumeData() = 0;

    virtual void onProgress(ProgressCallback callback) = 0;

    // Fires at most once. Registering after the transfer already finished
    // delivers the stored result.
    virtual void onCompletion(CompletionCallback callback) = 0;
};

class TransferClient {
public:
    using MetadataCallback = std::function<void(const MetadataResult& result)>;
    using OpenCallback = std::function<void(OpenResult result)>;

    virtual ~TransferClient() = default;

    virtual void resolveMetadata(const std::string& url, MetadataCallback callback) = 0;
    // `filename` is the name resolved by resolveMetadata; empty lets the
    // client derive one from the URL.
    virtual void openTransfer(const std::string& url, const std::string& destination_folder,
                              const std::string& filename, OpenCallback callback) = 0;
    virtual void resumeTransfer(const ResumeData& resume_data, const std::string& destination_folder,
                                OpenCallback callback) = 0;
};

using TransferClientPtr = std::shared_ptr<TransferClient>;

} // namespace dlqueue
