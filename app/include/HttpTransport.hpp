/*
 * libcurl-backed HTTP transport shared by the backend providers
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include "CancellationToken.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * Receives response body data as it arrives. Return false to abort the transfer.
 */
using HttpBodySink = std::function<bool(const std::string& data)>;

struct HttpRequest {
    std::string url;
    std::string method{"GET"};
    std::string body;
    HttpHeaders headers;
    long timeout_ms{30000};
    CancellationToken cancel;
    HttpBodySink on_data;                    // Optional; 2xx bodies bypass `body` when set
};

struct HttpResponse {
    int status_code{0};
    std::string body;
    std::string error;                       // Transport error, empty on success
    bool cancelled{false};
    bool aborted_by_sink{false};

    bool transport_ok() const { return error.empty(); }
    bool success() const { return transport_ok() && status_code >= 200 && status_code < 300; }
};

/**
 * HTTP client function type; providers accept one for testability
 */
using HttpClient = std::function<HttpResponse(const HttpRequest&)>;

/**
 * Perform a request with libcurl's easy interface
 *
 * Bodies of non-2xx responses are always collected into HttpResponse::body,
 * even when a sink is installed, so callers can report them.
 */
HttpResponse curl_http_client(const HttpRequest& request);

/**
 * Owns curl_global_init()/curl_global_cleanup() for the process lifetime
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/**
 * Reassembles newline-delimited records from arbitrarily split chunks
 */
class LineSplitter {
public:
    /**
     * Feed data and invoke `on_line` for every complete line (without the
     * trailing newline or carriage return). Stops early and returns false
     * when `on_line` returns false.
     */
    bool feed(const std::string& data, const std::function<bool(const std::string&)>& on_line);

    /**
     * Flush a trailing line that had no newline
     */
    bool finish(const std::function<bool(const std::string&)>& on_line);

private:
    std::string pending_;
};

#endif // HTTP_TRANSPORT_HPP
