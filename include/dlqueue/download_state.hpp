#pragma once

#include <optional>
#include <string>
#include <variant>

namespace dlqueue {

struct Pending {};

struct Downloading {
    double progress{0.0};
};

// Keeps the last authoritative progress so a paused record still shows it.
struct Paused {
    double progress{0.0};
};

struct Completed {};

struct Failed {
    std::string reason;
};

struct Cancelled {};

using DownloadState = std::variant<Pending, Downloading, Paused, Completed, Failed, Cancelled>;

[[nodiscard]] const char* stateName(const DownloadState& state);

// Completed, Failed and Cancelled admit no further transitions.
[[nodiscard]] bool isTerminal(const DownloadState& state);

[[nodiscard]] std::optional<double> progressOf(const DownloadState& state);

template <typename T>
[[nodiscard]] bool holds(const DownloadState& state) {
    return std::holds_alternative<T>(state);
}

} // namespace dlqueue
