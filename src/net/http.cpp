#include "../../include/guardian/net/http.hpp"
#include "../../include/guardian/errors.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

class CurlGlobal {
public:
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw guardian::GenerationError("curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

std::string read_environment_variable(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0 || !buffer) {
        return {};
    }
    std::string value(buffer);
    std::free(buffer);
    return value;
#else
    if (const char* raw = std::getenv(name)) {
        return std::string(raw);
    }
    return {};
#endif
}

long resolve_timeout(long timeout_ms) {
    if (timeout_ms > 0) {
        return timeout_ms;
    }

    long resolved = 60000;
    const std::string raw = read_environment_variable("GUARDIAN_HTTP_TIMEOUT_MS");
    if (!raw.empty()) {
        char* end = nullptr;
        const long candidate = std::strtol(raw.c_str(), &end, 10);
        if (end != raw.c_str() && candidate > 0) {
            resolved = candidate;
        }
    }
    return resolved;
}

struct EasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

} // namespace

namespace guardian::net {

std::string post_json(const std::string& url,
                      const std::string& body,
                      const std::vector<std::pair<std::string, std::string>>& headers,
                      long timeout_ms) {
    static CurlGlobal global_guard;

    const long resolved_timeout = resolve_timeout(timeout_ms);

    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        throw GenerationError("curl_easy_init failed");
    }

    std::string response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    curl_slist* raw_list = curl_slist_append(nullptr, "Content-Type: application/json");
    for (const auto& header : headers) {
        const std::string line = header.first + ": " + header.second;
        raw_list = curl_slist_append(raw_list, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());

    const CURLcode code = curl_easy_perform(handle.get());
    if (code == CURLE_OPERATION_TIMEDOUT) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " timed out after " << resolved_timeout << " ms";
        throw GenerationTimeoutError(oss.str());
    }
    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << curl_easy_strerror(code);
        throw GenerationError(oss.str());
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << status;
        throw GenerationError(oss.str());
    }

    return response;
}

} // namespace guardian::net
