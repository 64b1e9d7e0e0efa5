#include "../../include/patchwise/net/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using patchwise::net::Headers;
using patchwise::net::HttpError;
using patchwise::net::LineHandler;

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

// Splits the incoming byte stream into lines; the raw text is kept too for error bodies.
struct StreamState {
    const LineHandler* on_line = nullptr;
    std::string pending;
    std::string raw;
    bool failed = false;
    std::string failure;
};

size_t stream_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* state = static_cast<StreamState*>(userdata);
    state->raw.append(ptr, total);
    state->pending.append(ptr, total);
    std::size_t start = 0;
    std::size_t newline = state->pending.find('\n', start);
    try {
        while (newline != std::string::npos) {
            std::string_view line(state->pending.data() + start, newline - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            (*state->on_line)(line);
            start = newline + 1;
            newline = state->pending.find('\n', start);
        }
    } catch (const std::exception& ex) {
        // Returning a short count aborts the transfer; the error is rethrown after perform.
        state->failed = true;
        state->failure = ex.what();
        return 0;
    }
    state->pending.erase(0, start);
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

    long resolved = 300000; // local servers can take minutes to produce a long completion
    const std::string raw = read_environment_variable("PATCHWISE_HTTP_TIMEOUT_MS");
    if (!raw.empty()) {
        char* end = nullptr;
        const long candidate = std::strtol(raw.c_str(), &end, 10);
        if (end != raw.c_str() && candidate > 0) {
            resolved = candidate;
        }
    }
    return resolved;
}

HeaderList build_headers(const Headers& headers, bool event_stream) {
    curl_slist* list = nullptr;
    list = curl_slist_append(list, "Content-Type: application/json");
    if (event_stream) {
        list = curl_slist_append(list, "Accept: text/event-stream");
    }
    for (const auto& header : headers) {
        const std::string line = header.first + ": " + header.second;
        list = curl_slist_append(list, line.c_str());
    }
    return HeaderList(list);
}

EasyHandle prepare(const std::string& url, const std::string& body, curl_slist* headers, long timeout_ms) {
    EasyHandle handle(curl_easy_init());
    if (!handle) {
        throw std::runtime_error("curl_easy_init failed");
    }
    const long resolved_timeout = resolve_timeout(timeout_ms);
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(resolved_timeout, 10000L));
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers);
    return handle;
}

void check_result(CURL* handle, CURLcode code, const std::string& url, const std::string& body) {
    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << curl_easy_strerror(code);
        throw HttpError(oss.str(), 0, body);
    }
    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << status;
        if (!body.empty()) {
            oss << ": " << body;
        }
        throw HttpError(oss.str(), status, body);
    }
}

} // namespace

namespace patchwise::net {

std::string post_json(const std::string& url,
                      const std::string& body,
                      const Headers& headers,
                      long timeout_ms) {
    CurlGlobal global_guard;

    HeaderList header_list = build_headers(headers, false);
    EasyHandle handle = prepare(url, body, header_list.get(), timeout_ms);

    std::string response;
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);

    const CURLcode code = curl_easy_perform(handle.get());
    check_result(handle.get(), code, url, response);
    return response;
}

void post_json_stream(const std::string& url,
                      const std::string& body,
                      const Headers& headers,
                      const LineHandler& on_line,
                      long timeout_ms) {
    CurlGlobal global_guard;

    HeaderList header_list = build_headers(headers, true);
    EasyHandle handle = prepare(url, body, header_list.get(), timeout_ms);

    StreamState state;
    state.on_line = &on_line;
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, stream_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &state);

    const CURLcode code = curl_easy_perform(handle.get());
    if (state.failed) {
        throw std::runtime_error(state.failure);
    }
    check_result(handle.get(), code, url, state.raw);
    if (!state.pending.empty()) {
        on_line(state.pending);
    }
}

} // namespace patchwise::net
