/*
 * libcurl-backed HTTP transport implementation
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpTransport.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

#include <exception>
#include <string>

namespace {

struct TransferState {
    CURL* curl{nullptr};
    const HttpRequest* request{nullptr};
    HttpResponse* response{nullptr};
    std::string sink_error;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp)
{
    auto* state = static_cast<TransferState*>(userp);
    const size_t total_size = size * nmemb;
    std::string data(static_cast<const char*>(contents), total_size);

    long status = 0;
    curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);

    if (!state->request->on_data || status < 200 || status >= 300) {
        state->response->body.append(data);
        return total_size;
    }

    // Exceptions must not unwind through libcurl
    try {
        if (!state->request->on_data(data)) {
            state->response->aborted_by_sink = true;
            return 0;
        }
    } catch (const std::exception& ex) {
        state->sink_error = ex.what();
        return 0;
    } catch (...) {
        state->sink_error = "unknown exception";
        return 0;
    }
    return total_size;
}

int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto* state = static_cast<TransferState*>(userp);
    if (state->request->cancel.is_cancelled()) {
        state->response->cancelled = true;
        return 1;
    }
    return 0;
}

} // namespace

HttpResponse curl_http_client(const HttpRequest& request)
{
    HttpResponse result;

    if (request.cancel.is_cancelled()) {
        result.cancelled = true;
        result.error = "request cancelled";
        return result;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    TransferState state{curl, &request, &result};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header.c_str());
    }

    if (curl_headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    result.status_code = static_cast<int>(status);

    if (result.cancelled) {
        result.error = "request cancelled";
    } else if (!state.sink_error.empty()) {
        result.error = "receiver failed: " + state.sink_error;
    } else if (result.aborted_by_sink) {
        result.error = "transfer aborted by receiver";
    } else if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
    }

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    if (!result.error.empty()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("HTTP {} {} failed: {}", request.method, request.url, result.error);
        }
    }

    return result;
}

CurlGlobal::CurlGlobal()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

bool LineSplitter::feed(const std::string& data, const std::function<bool(const std::string&)>& on_line)
{
    pending_.append(data);

    std::string::size_type start = 0;
    std::string::size_type newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        std::string line = pending_.substr(start, newline - start);
        start = newline + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!on_line(line)) {
            pending_.erase(0, start);
            return false;
        }
    }
    pending_.erase(0, start);
    return true;
}

bool LineSplitter::finish(const std::function<bool(const std::string&)>& on_line)
{
    if (pending_.empty()) {
        return true;
    }
    std::string line;
    line.swap(pending_);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return on_line(line);
}
