#include "dlqueue/download_manager.hpp"
#include "dlqueue/errors.hpp"
#include "dlqueue/registry.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dlqueue {

namespace {

enum class OpenKind { Start, Resume };

double clampProgress(double fraction) {
    return std::clamp(fraction, 0.0, 1.0);
}

// A transfer opened for `kind` may only be attached while the record is still
// waiting for it; anything else means the record was cancelled meanwhile.
bool awaitingTransfer(const DownloadRecord& record, OpenKind kind) {
    if (record.transfer) {
        return false;
    }
    if (kind == OpenKind::Start) {
        return holds<Pending>(record.state);
    }
    return holds<Paused>(record.state) && record.reopening;
}

bool ownsTransfer(const DownloadRecord& record, const std::weak_ptr<TransferHandle>& token) {
    return record.transfer && record.transfer == token.lock();
}

} // namespace

class DownloadManager::Impl : public std::enable_shared_from_this<DownloadManager::Impl> {
public:
    explicit Impl(TransferClientPtr client) : client_(std::move(client)) {
        if (!client_) {
            throw std::invalid_argument("DownloadManager requires a transfer client");
        }
    }

    void setObserver(std::weak_ptr<DownloadObserver> observer) {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer_ = std::move(observer);
    }

    DownloadId start(std::string url, std::string destination_folder) {
        DownloadRecord record;
        record.id = DownloadId::generate();
        record.source_url = url;
        record.destination_folder = std::move(destination_folder);

        const auto id = record.id;
        registry_.insert(std::move(record));
        spdlog::info("[{}] queued {}", id.value(), url);

        client_->resolveMetadata(url, [weak = weak_from_this(), id](const MetadataResult& result) {
            if (auto self = weak.lock()) {
                self->handleMetadata(id, result);
            }
        });
        return id;
    }

    DownloadId restore(std::string url, std::string destination_folder, ResumeData resume_data,
                       double progress) {
        const double clamped = clampProgress(progress);

        DownloadRecord record;
        record.id = DownloadId::generate();
        record.source_url = std::move(url);
        record.destination_folder = std::move(destination_folder);
        record.state = Paused{clamped};
        record.resume_state = std::move(resume_data);
        record.temporary_progress = clamped;

        const auto id = record.id;
        spdlog::info("[{}] restored paused download of {}", id.value(), record.source_url);
        registry_.insert(std::move(record));
        return id;
    }

    // Handle control calls are made inside the registry update so the
    // transport sees them in the same order as the state changes.
    void pause(DownloadId id) {
        bool paused = false;
        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            const auto* downloading = std::get_if<Downloading>(&record.state);
            if (!downloading) {
                return;
            }
            const double progress = downloading->progress;
            if (record.transfer) {
                record.transfer->suspend();
            }
            record.state = Paused{progress};
            paused = true;
        });
        if (!paused) {
            return;
        }

        spdlog::info("[{}] paused", id.value());
        notify(&DownloadObserver::downloadPaused, *entry);
    }

    void resume(DownloadId id) {
        enum class Action { None, InPlace, Reopen, Impossible };

        Action action = Action::None;
        ResumeData resume_data;
        std::string destination_folder;

        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            const auto* paused = std::get_if<Paused>(&record.state);
            if (!paused || record.reopening) {
                return;
            }
            const double progress = paused->progress;
            if (record.transfer) {
                record.transfer->resume();
                record.state = Downloading{progress};
                action = Action::InPlace;
            } else if (record.resume_state) {
                resume_data = std::move(*record.resume_state);
                record.resume_state.reset();
                record.reopening = true;
                destination_folder = record.destination_folder;
                action = Action::Reopen;
            } else {
                action = Action::Impossible;
            }
        });

        switch (action) {
        case Action::None:
            return;
        case Action::InPlace:
            spdlog::info("[{}] resumed", id.value());
            notify(&DownloadObserver::downloadResumed, *entry);
            return;
        case Action::Reopen:
            spdlog::info("[{}] re-opening transfer from resume state", id.value());
            client_->resumeTransfer(resume_data, destination_folder,
                                    [weak = weak_from_this(), id](OpenResult result) {
                                        if (auto self = weak.lock()) {
                                            self->handleOpened(id, std::move(result), OpenKind::Resume);
                                        }
                                    });
            return;
        case Action::Impossible:
            throw DownloadError(ErrorCode::ResumeImpossible,
                                fmt::format("Download {} has neither a suspended transfer nor resume state",
                                            id.value()));
        }
    }

    void cancel(DownloadId id) {
        bool cancelled = false;
        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            if (isTerminal(record.state)) {
                return;
            }
            if (record.transfer) {
                record.transfer->cancel();
            }
            record.transfer.reset();
            record.resume_state.reset();
            record.reopening = false;
            record.temporary_progress.reset();
            record.ended_at = Clock::now();
            record.state = Cancelled{};
            cancelled = true;
        });
        if (!cancelled) {
            return;
        }

        spdlog::info("[{}] cancelled", id.value());
        notify(&DownloadObserver::downloadCancelled, *entry);
    }

    void remove(DownloadId id) {
        auto removed = registry_.remove(id);
        if (!removed) {
            return;
        }

        if (auto handle = std::move(removed->record.transfer)) {
            handle->cancel();
        }
        spdlog::info("[{}] removed", id.value());
        notify(&DownloadObserver::downloadRemoved, *removed);
    }

    void releaseTransfer(DownloadId id) {
        bool released = false;
        bool captured = false;
        registry_.update(id, [&](DownloadRecord& record) {
            if (!holds<Paused>(record.state) || !record.transfer) {
                return;
            }
            record.resume_state = record.transfer->cancelProducingResumeData();
            record.transfer.reset();
            released = true;
            captured = record.resume_state.has_value();
        });
        if (!released) {
            return;
        }

        if (captured) {
            spdlog::info("[{}] released transfer, resume state saved", id.value());
        } else {
            spdlog::warn("[{}] released transfer without resume state; it cannot be resumed", id.value());
        }
    }

    [[nodiscard]] std::vector<DownloadRecord> list() const { return registry_.list(); }

    [[nodiscard]] std::optional<DownloadRecord> find(DownloadId id) const { return registry_.lookup(id); }

    [[nodiscard]] std::optional<DownloadId> idAt(std::size_t index) const {
        const auto record = registry_.lookupByPosition(index);
        if (!record) {
            return std::nullopt;
        }
        return record->id;
    }

private:
    using Notification = void (DownloadObserver::*)(const DownloadRecord&, std::size_t);

    void handleMetadata(DownloadId id, const MetadataResult& result) {
        if (result.has_error) {
            failOpening(id, OpenKind::Start, "metadata resolution failed: " + result.error_message);
            return;
        }

        bool still_pending = false;
        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            if (!result.metadata.filename.empty()) {
                record.filename = result.metadata.filename;
            }
            if (!result.metadata.content_type.empty()) {
                record.content_type = result.metadata.content_type;
            }
            still_pending = holds<Pending>(record.state);
        });
        if (!entry) {
            spdlog::debug("[{}] metadata arrived after removal", id.value());
            return;
        }
        if (!still_pending) {
            return;
        }

        spdlog::debug("[{}] resolved {} ({})", id.value(), result.metadata.filename,
                      result.metadata.content_type);
        client_->openTransfer(entry->record.source_url, entry->record.destination_folder,
                              entry->record.filename.value_or(std::string{}),
                              [weak = weak_from_this(), id](OpenResult opened) {
                                  if (auto self = weak.lock()) {
                                      self->handleOpened(id, std::move(opened), OpenKind::Start);
                                  }
                              });
    }

    void handleOpened(DownloadId id, OpenResult result, OpenKind kind) {
        if (result.hasError()) {
            failOpening(id, kind, "transfer open failed: " + result.error_message);
            return;
        }

        TransferHandlePtr handle = std::move(result.handle);
        bool attached = false;
        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            if (!awaitingTransfer(record, kind)) {
                return;
            }
            const double progress = progressOf(record.state).value_or(0.0);
            record.transfer = handle;
            if (!record.started_at) {
                record.started_at = Clock::now();
            }
            if (kind == OpenKind::Resume) {
                record.reopening = false;
                record.temporary_progress = progress;
            }
            record.state = Downloading{progress};
            attached = true;
        });

        if (!attached) {
            spdlog::debug("[{}] discarding transfer opened for a removed or cancelled download", id.value());
            handle->cancel();
            return;
        }

        if (kind == OpenKind::Start) {
            spdlog::info("[{}] started", id.value());
            notify(&DownloadObserver::downloadStarted, *entry);
        } else {
            spdlog::info("[{}] resumed from saved state", id.value());
            notify(&DownloadObserver::downloadResumed, *entry);
        }
        subscribe(id, handle);
    }

    void failOpening(DownloadId id, OpenKind kind, const std::string& reason) {
        bool failed = false;
        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            if (!awaitingTransfer(record, kind)) {
                return;
            }
            record.reopening = false;
            record.temporary_progress.reset();
            record.ended_at = Clock::now();
            record.state = Failed{reason};
            failed = true;
        });
        if (!failed) {
            spdlog::debug("[{}] ignoring late error: {}", id.value(), reason);
            return;
        }

        spdlog::warn("[{}] {}", id.value(), reason);
        notify(&DownloadObserver::downloadFinishedError, *entry);
    }

    void subscribe(DownloadId id, const TransferHandlePtr& handle) {
        const std::weak_ptr<TransferHandle> token = handle;

        handle->onProgress([weak = weak_from_this(), id, token](double fraction) {
            if (auto self = weak.lock()) {
                self->handleProgress(id, token, fraction);
            }
        });
        handle->onCompletion([weak = weak_from_this(), id, token](const TransferResult& result) {
            if (auto self = weak.lock()) {
                self->handleCompletion(id, token, result);
            }
        });
    }

    void handleProgress(DownloadId id, const std::weak_ptr<TransferHandle>& token, double fraction) {
        bool accepted = false;
        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            if (!ownsTransfer(record, token)) {
                return;
            }
            // A suspended transport can still flush progress it measured
            // before the pause.
            if (!holds<Downloading>(record.state) || record.transfer->isSuspended()) {
                return;
            }
            record.temporary_progress.reset();
            record.state = Downloading{clampProgress(fraction)};
            accepted = true;
        });
        if (accepted) {
            notify(&DownloadObserver::downloadProgress, *entry);
        }
    }

    void handleCompletion(DownloadId id, const std::weak_ptr<TransferHandle>& token,
                          const TransferResult& result) {
        bool finished = false;
        const auto entry = registry_.update(id, [&](DownloadRecord& record) {
            if (!ownsTransfer(record, token)) {
                return;
            }
            record.ended_at = Clock::now();
            record.transfer.reset();
            record.temporary_progress.reset();
            if (result.success) {
                record.state = Completed{};
            } else {
                record.state = Failed{result.error_message.empty() ? "transfer failed" : result.error_message};
            }
            finished = true;
        });
        if (!finished) {
            spdlog::debug("[{}] dropping completion from a detached transfer", id.value());
            return;
        }

        if (result.success) {
            spdlog::info("[{}] finished", id.value());
            notify(&DownloadObserver::downloadFinishedSuccess, *entry);
        } else {
            spdlog::warn("[{}] failed: {}", id.value(), std::get<Failed>(entry->record.state).reason);
            notify(&DownloadObserver::downloadFinishedError, *entry);
        }
    }

    void notify(Notification notification, const RegistryEntry& entry) const {
        std::shared_ptr<DownloadObserver> observer;
        {
            std::lock_guard<std::mutex> lock(observer_mutex_);
            observer = observer_.lock();
        }
        if (!observer) {
            return;
        }

        try {
            ((*observer).*notification)(entry.record, entry.index);
        } catch (const std::exception& ex) {
            spdlog::error("[{}] observer failed: {}", entry.record.id.value(), ex.what());
        }
    }

    TransferClientPtr client_;
    Registry registry_;

    mutable std::mutex observer_mutex_;
    std::weak_ptr<DownloadObserver> observer_;
};

DownloadManager::DownloadManager(TransferClientPtr client)
    : impl_(std::make_shared<Impl>(std::move(client))) {}

DownloadManager::~DownloadManager() = default;

void DownloadManager::setObserver(std::weak_ptr<DownloadObserver> observer) {
    impl_->setObserver(std::move(observer));
}

DownloadId DownloadManager::start(std::string url, std::string destination_folder) {
    return impl_->start(std::move(url), std::move(destination_folder));
}

DownloadId DownloadManager::restore(std::string url, std::string destination_folder, ResumeData resume_data,
                                    double progress) {
    return impl_->restore(std::move(url), std::move(destination_folder), std::move(resume_data), progress);
}

void DownloadManager::pause(DownloadId id) { impl_->pause(id); }

void DownloadManager::resume(DownloadId id) { impl_->resume(id); }

void DownloadManager::cancel(DownloadId id) { impl_->cancel(id); }

void DownloadManager::remove(DownloadId id) { impl_->remove(id); }

void DownloadManager::releaseTransfer(DownloadId id) { impl_->releaseTransfer(id); }

std::vector<DownloadRecord> DownloadManager::list() const { return impl_->list(); }

std::optional<DownloadRecord> DownloadManager::find(DownloadId id) const { return impl_->find(id); }

std::optional<DownloadId> DownloadManager::idAt(std::size_t index) const { return impl_->idAt(index); }

} // namespace dlqueue
