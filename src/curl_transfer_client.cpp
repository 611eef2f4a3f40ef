#include "dlqueue/curl_transfer_client.hpp"
#include "dlqueue/detail/curl_utils.hpp"
#include "dlqueue/detail/resume_blob.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace dlqueue {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Progress is reported in steps of at least this fraction.
constexpr double kProgressStep = 0.005;

void applyCommonOptions(CURL* curl, const std::string& url, const CurlClientOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (options.low_speed_limit > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options.low_speed_time_seconds);
    }
}

bool startsWithNoCase(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

class CurlTransfer final : public TransferHandle {
public:
    CurlTransfer(std::string url, std::string path, std::uint64_t offset, const CurlClientOptions& options)
        : url_(std::move(url)), path_(std::move(path)), offset_(offset), options_(options) {}

    void suspend() override {
        std::lock_guard<std::mutex> lock(mutex_);
        suspended_ = true;
    }

    void resume() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            suspended_ = false;
        }
        resume_cv_.notify_all();
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        resume_cv_.notify_all();
    }

    [[nodiscard]] bool isSuspended() const override { return suspended_.load(); }

    std::optional<ResumeData> cancelProducingResumeData() override {
        const detail::ResumePoint point{url_, path_, offset_ + written_.load()};
        cancel();
        return detail::encodeResumePoint(point);
    }

    void onProgress(ProgressCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_callback_ = std::move(callback);
    }

    void onCompletion(CompletionCallback callback) override {
        std::optional<TransferResult> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (result_ && !delivered_) {
                delivered_ = true;
                ready = result_;
            } else if (!result_) {
                completion_callback_ = std::move(callback);
            }
        }
        if (ready && callback) {
            callback(*ready);
        }
    }

    // Creates the destination and positions it at the resume offset.
    bool prepare(std::string& error) {
        const std::filesystem::path path{path_};
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                error = "Cannot create destination folder: " + ec.message();
                return false;
            }
        }

        if (offset_ > 0) {
            const auto size = std::filesystem::file_size(path, ec);
            if (ec || size < offset_) {
                error = "Partial file does not match resume state: " + path_;
                return false;
            }
            std::filesystem::resize_file(path, offset_, ec);
            if (ec) {
                error = "Cannot truncate partial file: " + ec.message();
                return false;
            }
        }

        file_.reset(std::fopen(path_.c_str(), offset_ > 0 ? "ab" : "wb"));
        if (!file_) {
            error = "Cannot create destination file: " + path_;
            return false;
        }
        return true;
    }

    void run() {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            file_.reset();
            finish({false, "Failed to allocate curl handle"});
            return;
        }

        applyCommonOptions(curl.get(), url_, options_);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &CurlTransfer::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &CurlTransfer::transferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, this);
        if (offset_ > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset_));
        }

        const CURLcode res = curl_easy_perform(curl.get());

        bool write_failed = false;
        if (file_) {
            write_failed = std::fflush(file_.get()) != 0;
            file_.reset();
        }

        if (cancelled_) {
            finish({false, "cancelled"});
        } else if (res != CURLE_OK) {
            finish({false, std::string{"curl error: "} + curl_easy_strerror(res)});
        } else if (write_failed) {
            finish({false, "Failed to write output file"});
        } else {
            reportProgress(1.0);
            finish({true, {}});
        }
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlTransfer*>(userdata);
        const size_t total = size * nmemb;
        if (!self || self->cancelled_ || !self->file_) {
            return 0;
        }

        const size_t written = std::fwrite(ptr, 1, total, self->file_.get());
        self->written_ += written;
        return written;
    }

    // Doubles as the suspension point: a suspended transfer parks its thread
    // here until resumed or cancelled.
    static int transferInfoCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t,
                                    curl_off_t) {
        auto* self = static_cast<CurlTransfer*>(clientp);
        {
            std::unique_lock<std::mutex> lock(self->mutex_);
            self->resume_cv_.wait(lock, [self] { return !self->suspended_ || self->cancelled_; });
        }
        if (self->cancelled_) {
            return 1;
        }

        if (dltotal > 0) {
            const auto offset = static_cast<double>(self->offset_);
            self->reportProgress((offset + static_cast<double>(dlnow)) / (offset + static_cast<double>(dltotal)));
        }
        return 0;
    }

    void reportProgress(double fraction) {
        ProgressCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fraction < 1.0 && fraction - last_reported_ < kProgressStep) {
                return;
            }
            last_reported_ = fraction;
            callback = progress_callback_;
        }
        if (callback) {
            callback(fraction);
        }
    }

    void finish(TransferResult result) {
        CompletionCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result_ = result;
            if (completion_callback_) {
                callback = std::move(completion_callback_);
                completion_callback_ = nullptr;
                delivered_ = true;
            }
        }
        if (callback) {
            callback(result);
        }
    }

    std::string url_;
    std::string path_;
    std::uint64_t offset_;
    CurlClientOptions options_;

    std::unique_ptr<FILE, FileDeleter> file_{};
    std::atomic<std::uint64_t> written_{0};

    std::atomic<bool> suspended_{false};
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    std::condition_variable resume_cv_;
    double last_reported_{0.0};
    ProgressCallback progress_callback_;
    CompletionCallback completion_callback_;
    std::optional<TransferResult> result_;
    bool delivered_{false};
};

} // namespace

class CurlTransferClient::Impl {
public:
    explicit Impl(CurlClientOptions options) : options_(std::move(options)) { detail::ensureCurlInitialized(); }

    ~Impl() {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            for (auto& weak : transfers_) {
                if (auto transfer = weak.lock()) {
                    transfer->cancel();
                }
            }
            workers.swap(workers_);
        }

        // A callback on one of our own workers may drop the last reference to
        // the client; that thread cannot join itself.
        const auto self = std::this_thread::get_id();
        for (auto& worker : workers) {
            if (!worker.thread.joinable()) {
                continue;
            }
            if (worker.thread.get_id() == self) {
                worker.thread.detach();
            } else {
                worker.thread.join();
            }
        }
    }

    std::size_t reapFinishedWorkers() {
        std::vector<Worker> finished;
        std::size_t running = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished = takeFinishedLocked();
            running = workers_.size();
        }
        joinAll(finished);
        return running;
    }

    void resolveMetadata(const std::string& url, MetadataCallback callback) {
        spawn([this, url, callback]() { callback(fetchMetadata(url)); },
              [callback]() { callback(MetadataResult{{}, true, "client is shutting down"}); });
    }

    void openTransfer(const std::string& url, const std::string& destination_folder, const std::string& filename,
                      OpenCallback callback) {
        // Only the last component is used, whatever the metadata said.
        auto name = std::filesystem::path{filename}.filename().string();
        if (name.empty() || name == "." || name == "..") {
            name = detail::filenameFromUrl(url);
        }
        const auto path = std::filesystem::path{destination_folder} / name;
        startTransfer(url, path.string(), 0, std::move(callback));
    }

    void resumeTransfer(const ResumeData& resume_data, const std::string& destination_folder,
                        OpenCallback callback) {
        const auto point = detail::decodeResumePoint(resume_data);
        if (!point) {
            spawn([callback]() { callback(OpenResult{nullptr, "unrecognised resume state"}); },
                  [callback]() { callback(OpenResult{nullptr, "client is shutting down"}); });
            return;
        }

        const auto path = std::filesystem::path{destination_folder} / std::filesystem::path{point->path}.filename();
        spdlog::debug("resuming {} at byte {}", point->url, point->offset);
        startTransfer(point->url, path.string(), point->offset, std::move(callback));
    }

private:
    void startTransfer(const std::string& url, const std::string& path, std::uint64_t offset,
                       OpenCallback callback) {
        auto transfer = std::make_shared<CurlTransfer>(url, path, offset, options_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transfers_.push_back(transfer);
        }

        spawn(
            [transfer, callback]() {
                std::string error;
                if (!transfer->prepare(error)) {
                    callback(OpenResult{nullptr, error});
                    return;
                }
                callback(OpenResult{transfer, {}});
                transfer->run();
            },
            [callback]() { callback(OpenResult{nullptr, "client is shutting down"}); });
    }

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Runs `work` on a new thread, or `rejected` inline once shutdown began.
    template <typename Work, typename Rejected>
    void spawn(Work work, Rejected rejected) {
        std::vector<Worker> finished;
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished = takeFinishedLocked();
            if (!stopping_) {
                auto done = std::make_shared<std::atomic<bool>>(false);
                workers_.push_back({std::thread([work = std::move(work), done]() mutable {
                                        work();
                                        *done = true;
                                    }),
                                    done});
                accepted = true;
            }
        }
        joinAll(finished);
        if (!accepted) {
            rejected();
        }
    }

    // Moves finished workers out and forgets transfers nobody holds any more.
    std::vector<Worker> takeFinishedLocked() {
        std::vector<Worker> finished;
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (*it->done) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
        transfers_.erase(std::remove_if(transfers_.begin(), transfers_.end(),
                                        [](const std::weak_ptr<CurlTransfer>& weak) { return weak.expired(); }),
                         transfers_.end());
        return finished;
    }

    static void joinAll(std::vector<Worker>& workers) {
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }

    [[nodiscard]] MetadataResult fetchMetadata(const std::string& url) const {
        MetadataResult result;
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            result.has_error = true;
            result.error_message = "Failed to allocate curl handle";
            return result;
        }

        applyCommonOptions(curl.get(), url, options_);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

        std::vector<std::string> headers;
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION,
                         +[](char* ptr, size_t size, size_t nmemb, std::vector<std::string>* out) -> size_t {
                             if (!out) {
                                 return 0;
                             }
                             out->emplace_back(ptr, size * nmemb);
                             return size * nmemb;
                         });
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            result.has_error = true;
            result.error_message = std::string{"curl error: "} + curl_easy_strerror(res);
            return result;
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);

        char* effective_url = nullptr;
        curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url);
        result.metadata.filename = detail::filenameFromUrl(effective_url ? effective_url : url);

        // Servers that reject HEAD still get a name derived from the URL.
        if (code >= 400) {
            spdlog::debug("HEAD {} returned {}, using URL derived metadata", url, code);
            return result;
        }

        for (const auto& header : headers) {
            if (startsWithNoCase(header, "content-disposition:")) {
                if (auto name = detail::filenameFromContentDisposition(header)) {
                    result.metadata.filename = *name;
                }
            }
        }

        char* content_type = nullptr;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
        if (content_type) {
            result.metadata.content_type = content_type;
        }
        return result;
    }

    CurlClientOptions options_;

    std::mutex mutex_;
    bool stopping_{false};
    std::vector<Worker> workers_;
    std::vector<std::weak_ptr<CurlTransfer>> transfers_;
};

CurlTransferClient::CurlTransferClient(CurlClientOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransferClient::~CurlTransferClient() = default;

void CurlTransferClient::resolveMetadata(const std::string& url, MetadataCallback callback) {
    impl_->resolveMetadata(url, std::move(callback));
}

void CurlTransferClient::openTransfer(const std::string& url, const std::string& destination_folder,
                                      const std::string& filename, OpenCallback callback) {
    impl_->openTransfer(url, destination_folder, filename, std::move(callback));
}

void CurlTransferClient::resumeTransfer(const ResumeData& resume_data, const std::string& destination_folder,
                                        OpenCallback callback) {
    impl_->resumeTransfer(resume_data, destination_folder, std::move(callback));
}

std::size_t CurlTransferClient::reapFinishedWorkers() {
    return impl_->reapFinishedWorkers();
}

} // namespace dlqueue
