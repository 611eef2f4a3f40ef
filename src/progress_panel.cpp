#include "dlqueue/progress_panel.hpp"

#include <algorithm>
#include <variant>

#include <fmt/format.h>

namespace dlqueue {

namespace {

constexpr std::size_t kNameWidth = 20;
constexpr int kBarWidth = 30;

std::string progressBar(double ratio) {
    const int bar_pos = static_cast<int>(ratio * kBarWidth);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }
    return bar;
}

} // namespace

std::string ProgressPanel::build(const std::vector<DownloadRecord>& records) {
    std::string panel;
    panel.reserve(records.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Download Queue ({} downloads)\n", records.size());
    panel.append("--------------------------------------------------\n");

    double progress_sum = 0.0;
    std::size_t measured = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        panel += fmt::format("{:>2}. ", i);
        panel += formatRecordLine(records[i]);
        panel.push_back('\n');

        if (const auto progress = progressOf(records[i].state)) {
            progress_sum += *progress;
            ++measured;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (measured > 0) {
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(progress_sum / static_cast<double>(measured) * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressPanel::formatRecordLine(const DownloadRecord& record) {
    std::string display_name = record.displayName();
    if (display_name.size() > kNameWidth) {
        display_name = display_name.substr(0, kNameWidth);
    }

    const auto authoritative = progressOf(record.state);
    const auto shown = record.temporary_progress ? record.temporary_progress : authoritative;
    if (!shown) {
        if (const auto* failed = std::get_if<Failed>(&record.state)) {
            return fmt::format("{:<20} [Failed] {}", display_name, failed->reason);
        }
        return fmt::format("{:<20} [{}]", display_name,
                           holds<Cancelled>(record.state) ? "Cancelled" : "Initializing...");
    }

    const double ratio = std::clamp(*shown, 0.0, 1.0);
    std::string line = fmt::format("{:<20} [{}] {:>3}%", display_name, progressBar(ratio),
                                   static_cast<int>(ratio * 100.0));
    if (holds<Completed>(record.state)) {
        line.append("  Done");
    } else if (holds<Paused>(record.state)) {
        line.append("  Paused");
    }
    return line;
}

bool ProgressPanel::hasActiveDownloads(const std::vector<DownloadRecord>& records) {
    return std::any_of(records.begin(), records.end(), [](const DownloadRecord& record) {
        return holds<Pending>(record.state) || holds<Downloading>(record.state) || record.reopening;
    });
}

void ProgressPanel::redraw(const std::vector<DownloadRecord>& records) {
    const auto panel = build(records);
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace dlqueue
