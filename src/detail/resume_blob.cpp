#include "dlqueue/detail/resume_blob.hpp"

#include <charconv>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace dlqueue::detail {

namespace {

constexpr std::string_view kMagic = "dlqueue-resume/1";

bool nextLine(std::string_view& text, std::string_view& line) {
    const auto end = text.find('\n');
    if (end == std::string_view::npos) {
        return false;
    }
    line = text.substr(0, end);
    text.remove_prefix(end + 1);
    return true;
}

} // namespace

ResumeData encodeResumePoint(const ResumePoint& point) {
    const std::string text = fmt::format("{}\n{}\n{}\n{}\n", kMagic, point.url, point.path, point.offset);
    return ResumeData(text.begin(), text.end());
}

std::optional<ResumePoint> decodeResumePoint(const ResumeData& data) {
    std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());

    std::string_view magic;
    std::string_view url;
    std::string_view path;
    std::string_view offset;
    if (!nextLine(text, magic) || magic != kMagic || !nextLine(text, url) || !nextLine(text, path) ||
        !nextLine(text, offset) || !text.empty()) {
        return std::nullopt;
    }
    if (url.empty() || path.empty()) {
        return std::nullopt;
    }

    ResumePoint point{std::string(url), std::string(path), 0};
    const auto [end, ec] = std::from_chars(offset.data(), offset.data() + offset.size(), point.offset);
    if (ec != std::errc{} || end != offset.data() + offset.size()) {
        return std::nullopt;
    }
    return point;
}

} // namespace dlqueue::detail
