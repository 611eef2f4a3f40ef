#pragma once

#include "download_record.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace dlqueue {

class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out) : out_(out) {}

    [[nodiscard]] static std::string build(const std::vector<DownloadRecord>& records);
    [[nodiscard]] static std::string formatRecordLine(const DownloadRecord& record);
    [[nodiscard]] static bool hasActiveDownloads(const std::vector<DownloadRecord>& records);

    // Replaces the previously drawn panel in place.
    void redraw(const std::vector<DownloadRecord>& records);

private:
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace dlqueue
