#pragma once

#include "download_state.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dlqueue {

class TransferHandle;
using TransferHandlePtr = std::shared_ptr<TransferHandle>;

// Opaque transport state; produced and consumed only by a TransferClient.
using ResumeData = std::vector<std::uint8_t>;

using Clock = std::chrono::system_clock;

class DownloadId {
public:
    DownloadId() = default;
    explicit DownloadId(std::uint64_t value) : value_(value) {}

    // Process-wide, never returns the same value twice.
    static DownloadId generate();

    [[nodiscard]] std::uint64_t value() const { return value_; }

    friend bool operator==(DownloadId lhs, DownloadId rhs) { return lhs.value_ == rhs.value_; }
    friend bool operator!=(DownloadId lhs, DownloadId rhs) { return lhs.value_ != rhs.value_; }

private:
    std::uint64_t value_{0};
};

struct DownloadRecord {
    DownloadId id;
    std::string source_url;
    std::string destination_folder;

    std::optional<std::string> filename;
    std::optional<std::string> content_type;

    DownloadState state{Pending{}};

    // Owned by DownloadManager; set only while Downloading, or Paused with a
    // suspended transfer that can be resumed in place.
    TransferHandlePtr transfer;
    std::optional<ResumeData> resume_state;
    bool reopening{false};

    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> ended_at;
    std::optional<double> temporary_progress;

    [[nodiscard]] std::string displayName() const;
};

} // namespace dlqueue

namespace std {

template <>
struct hash<dlqueue::DownloadId> {
    size_t operator()(dlqueue::DownloadId id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value());
    }
};

} // namespace std
