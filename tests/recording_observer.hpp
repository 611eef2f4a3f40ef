#pragma once

#include "dlqueue/download_observer.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace dlqueue::fakes {

struct ObservedEvent {
    std::string kind;
    DownloadRecord record;
    std::size_t index{0};
};

class RecordingObserver : public DownloadObserver {
public:
    void downloadStarted(const DownloadRecord& record, std::size_t index) override {
        add("started", record, index);
    }
    void downloadProgress(const DownloadRecord& record, std::size_t index) override {
        add("progress", record, index);
    }
    void downloadPaused(const DownloadRecord& record, std::size_t index) override {
        add("paused", record, index);
    }
    void downloadResumed(const DownloadRecord& record, std::size_t index) override {
        add("resumed", record, index);
    }
    void downloadFinishedSuccess(const DownloadRecord& record, std::size_t index) override {
        add("success", record, index);
    }
    void downloadFinishedError(const DownloadRecord& record, std::size_t index) override {
        add("error", record, index);
    }
    void downloadCancelled(const DownloadRecord& record, std::size_t index) override {
        add("cancelled", record, index);
    }
    void downloadRemoved(const DownloadRecord& record, std::size_t index) override {
        add("removed", record, index);
    }

    [[nodiscard]] std::vector<ObservedEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    [[nodiscard]] std::vector<std::string> kinds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> kinds;
        kinds.reserve(events_.size());
        for (const auto& event : events_) {
            kinds.push_back(event.kind);
        }
        return kinds;
    }

    [[nodiscard]] std::size_t count(const std::string& kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(
            events_.begin(), events_.end(), [&kind](const ObservedEvent& event) { return event.kind == kind; }));
    }

    [[nodiscard]] ObservedEvent last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            throw std::logic_error("no events recorded");
        }
        return events_.back();
    }

protected:
    virtual void add(const std::string& kind, const DownloadRecord& record, std::size_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back({kind, record, index});
    }

private:
    mutable std::mutex mutex_;
    std::vector<ObservedEvent> events_;
};

} // namespace dlqueue::fakes
