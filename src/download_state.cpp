#include "dlqueue/download_state.hpp"

#include <type_traits>

namespace dlqueue {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

const char* stateName(const DownloadState& state) {
    return std::visit(Overloaded{
                          [](const Pending&) { return "pending"; },
                          [](const Downloading&) { return "downloading"; },
                          [](const Paused&) { return "paused"; },
                          [](const Completed&) { return "completed"; },
                          [](const Failed&) { return "failed"; },
                          [](const Cancelled&) { return "cancelled"; },
                      },
                      state);
}

bool isTerminal(const DownloadState& state) {
    return holds<Completed>(state) || holds<Failed>(state) || holds<Cancelled>(state);
}

std::optional<double> progressOf(const DownloadState& state) {
    if (const auto* downloading = std::get_if<Downloading>(&state)) {
        return downloading->progress;
    }
    if (const auto* paused = std::get_if<Paused>(&state)) {
        return paused->progress;
    }
    if (holds<Completed>(state)) {
        return 1.0;
    }
    return std::nullopt;
}

} // namespace dlqueue
