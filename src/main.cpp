#include "dlqueue/curl_transfer_client.hpp"
#include "dlqueue/download_manager.hpp"
#include "dlqueue/errors.hpp"
#include "dlqueue/progress_panel.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [-d <directory>] [-i] [-v] <url> [<url> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -i               Interactive mode, read commands from stdin\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

void printCommands() {
    std::cout << "Commands:\n"
              << "  add <url>\n"
              << "  pause <n> | resume <n> | cancel <n> | remove <n> | release <n>\n"
              << "  list\n"
              << "  quit" << std::endl;
}

class LoggingObserver final : public dlqueue::DownloadObserver {
public:
    void downloadStarted(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::info("#{} {} started", index, record.displayName());
    }

    void downloadProgress(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::debug("#{} {} at {:.1f}%", index, record.displayName(),
                      dlqueue::progressOf(record.state).value_or(0.0) * 100.0);
    }

    void downloadPaused(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::info("#{} {} paused", index, record.displayName());
    }

    void downloadResumed(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::info("#{} {} resumed", index, record.displayName());
    }

    void downloadFinishedSuccess(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::info("#{} {} finished", index, record.displayName());
    }

    void downloadFinishedError(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::error("#{} {} failed: {}", index, record.displayName(),
                      std::get<dlqueue::Failed>(record.state).reason);
    }

    void downloadCancelled(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::info("#{} {} cancelled", index, record.displayName());
    }

    void downloadRemoved(const dlqueue::DownloadRecord& record, std::size_t index) override {
        spdlog::info("#{} {} removed", index, record.displayName());
    }
};

std::size_t parsePosition(const std::string& text) {
    std::size_t consumed = 0;
    std::size_t value = 0;
    try {
        value = std::stoul(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid position: " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("Invalid position: " + text);
    }
    return value;
}

void runCommand(dlqueue::DownloadManager& manager, const std::string& command, const std::string& argument,
                const std::filesystem::path& download_dir) {
    if (command == "add") {
        if (argument.empty()) {
            throw std::invalid_argument("add needs a url");
        }
        manager.start(argument, download_dir.string());
        return;
    }
    if (command == "list") {
        std::cout << dlqueue::ProgressPanel::build(manager.list()) << std::flush;
        return;
    }

    const auto id = manager.idAt(parsePosition(argument));
    if (!id) {
        throw dlqueue::DownloadError(dlqueue::ErrorCode::RecordNotFound, "No download at position " + argument);
    }

    if (command == "pause") {
        manager.pause(*id);
    } else if (command == "resume") {
        manager.resume(*id);
    } else if (command == "cancel") {
        manager.cancel(*id);
    } else if (command == "remove") {
        manager.remove(*id);
    } else if (command == "release") {
        manager.releaseTransfer(*id);
    } else {
        throw std::invalid_argument("Unknown command: " + command);
    }
}

void runInteractive(dlqueue::DownloadManager& manager, const std::filesystem::path& download_dir) {
    printCommands();
    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream input(line);
        std::string command;
        std::string argument;
        input >> command >> argument;
        if (command.empty()) {
            continue;
        }
        if (command == "quit" || command == "exit") {
            break;
        }

        try {
            runCommand(manager, command, argument, download_dir);
        } catch (const dlqueue::DownloadError& ex) {
            std::cerr << dlqueue::errorCodeName(ex.code()) << ": " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << ex.what() << std::endl;
        }
    }
}

bool runUntilDone(dlqueue::DownloadManager& manager) {
    dlqueue::ProgressPanel panel(std::cout);
    while (true) {
        const auto records = manager.list();
        panel.redraw(records);

        if (!dlqueue::ProgressPanel::hasActiveDownloads(records)) {
            for (const auto& record : records) {
                if (!dlqueue::holds<dlqueue::Completed>(record.state)) {
                    return false;
                }
            }
            return true;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::filesystem::path download_dir = std::filesystem::current_path();
        bool interactive = false;
        bool verbose = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                download_dir = argv[arg_index + 1];
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: " + download_dir.string() + " - " +
                                             ec.message());
                }
                arg_index += 2;
            } else if (option == "-i") {
                interactive = true;
                ++arg_index;
            } else if (option == "-v") {
                verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (!interactive && arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }

        // Keep the panel readable unless asked otherwise.
        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (!interactive) {
            spdlog::set_level(spdlog::level::warn);
        }

        auto client = std::make_shared<dlqueue::CurlTransferClient>();
        auto observer = std::make_shared<LoggingObserver>();
        bool all_succeeded = true;
        {
            dlqueue::DownloadManager manager(client);
            if (interactive) {
                manager.setObserver(observer);
            }

            for (int i = arg_index; i < argc; ++i) {
                manager.start(argv[i], download_dir.string());
            }

            if (interactive) {
                runInteractive(manager, download_dir);
            } else {
                all_succeeded = runUntilDone(manager);
            }
        }
        return all_succeeded ? 0 : 1;

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
