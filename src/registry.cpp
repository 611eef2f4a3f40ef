#include "dlqueue/registry.hpp"
#include "dlqueue/errors.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace dlqueue {

void Registry::insert(DownloadRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (findLocked(record.id)) {
        throw DownloadError(ErrorCode::DuplicateIdentity,
                            "Download id already registered: " + std::to_string(record.id.value()));
    }
    records_.push_back(std::move(record));
}

std::optional<DownloadRecord> Registry::lookup(DownloadId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = findLocked(id);
    if (!index) {
        return std::nullopt;
    }
    return records_[*index];
}

std::optional<DownloadRecord> Registry::lookupByPosition(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= records_.size()) {
        return std::nullopt;
    }
    return records_[index];
}

std::optional<std::size_t> Registry::indexOf(DownloadId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findLocked(id);
}

std::optional<RegistryEntry> Registry::update(DownloadId id, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = findLocked(id);
    if (!index) {
        return std::nullopt;
    }
    auto& record = records_[*index];
    mutator(record);
    return RegistryEntry{record, *index};
}

std::optional<RegistryEntry> Registry::remove(DownloadId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = findLocked(id);
    if (!index) {
        return std::nullopt;
    }
    const auto it = records_.begin() + static_cast<std::ptrdiff_t>(*index);
    RegistryEntry removed{std::move(*it), *index};
    records_.erase(it);
    return removed;
}

std::vector<DownloadRecord> Registry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::optional<std::size_t> Registry::findLocked(DownloadId id) const {
    const auto it = std::find_if(records_.begin(), records_.end(),
                                 [id](const DownloadRecord& record) { return record.id == id; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(records_.begin(), it));
}

} // namespace dlqueue
