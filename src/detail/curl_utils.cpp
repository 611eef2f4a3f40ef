#include "dlqueue/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace dlqueue::detail {

namespace {

constexpr const char* kFallbackFilename = "download";

std::string percentDecode(const std::string& value) {
    ensureCurlInitialized();

    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return value;
    }

    int length = 0;
    char* decoded = curl_easy_unescape(curl.get(), value.c_str(), static_cast<int>(value.size()), &length);
    if (!decoded) {
        return value;
    }
    std::string result(decoded, static_cast<std::size_t>(length));
    curl_free(decoded);
    return result;
}

// Path separators in a server supplied name must not escape the destination.
std::string sanitize(std::string name) {
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    if (name.empty() || name == "." || name == "..") {
        return kFallbackFilename;
    }
    return name;
}

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string filenameFromUrl(const std::string& url) {
    std::string path = url;
    const auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }

    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto path_start = path.find('/', scheme + 3);
        if (path_start == std::string::npos) {
            return kFallbackFilename;
        }
        path.erase(0, path_start);
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    const std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    if (segment.empty()) {
        return kFallbackFilename;
    }
    return sanitize(percentDecode(segment));
}

std::optional<std::string> filenameFromContentDisposition(const std::string& header) {
    std::string lowered;
    lowered.reserve(header.size());
    for (const char c : header) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    const auto key = lowered.find("filename=");
    if (key == std::string::npos) {
        return std::nullopt;
    }

    std::string value = trim(header.substr(key + 9));
    if (!value.empty() && value.front() == '"') {
        const auto closing = value.find('"', 1);
        value = value.substr(1, closing == std::string::npos ? std::string::npos : closing - 1);
    } else {
        const auto end = value.find(';');
        if (end != std::string::npos) {
            value.erase(end);
        }
        value = trim(value);
    }

    if (value.empty()) {
        return std::nullopt;
    }
    return sanitize(value);
}

} // namespace dlqueue::detail
