#pragma once

#include "download_record.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace dlqueue {

struct RegistryEntry {
    DownloadRecord record;
    std::size_t index{0};
};

// Ordered, thread-safe store of download records keyed by DownloadId.
// Positions shift on insert/remove; asynchronous code must resolve by id.
class Registry {
public:
    using Mutator = std::function<void(DownloadRecord&)>;

    // Throws DownloadError(DuplicateIdentity) if the id is already present.
    void insert(DownloadRecord record);

    [[nodiscard]] std::optional<DownloadRecord> lookup(DownloadId id) const;
    [[nodiscard]] std::optional<DownloadRecord> lookupByPosition(std::size_t index) const;
    [[nodiscard]] std::optional<std::size_t> indexOf(DownloadId id) const;

    // Applies `mutator` under the lock and returns the updated record with its
    // current index. Absent ids are not an error.
    std::optional<RegistryEntry> update(DownloadId id, const Mutator& mutator);

    std::optional<RegistryEntry> remove(DownloadId id);

    [[nodiscard]] std::vector<DownloadRecord> list() const;
    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] std::optional<std::size_t> findLocked(DownloadId id) const;

    mutable std::mutex mutex_;
    std::vector<DownloadRecord> records_;
};

} // namespace dlqueue
