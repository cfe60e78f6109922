/*
 * HTTP transport seam shared by every backend-facing component
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * Receives body bytes of a 2xx response as they arrive.
 * Return false to abandon the transfer.
 */
using BodySink = std::function<bool(const char* data, std::size_t size)>;

struct HttpRequest {
    std::string url;
    std::string method{"GET"};
    std::string body;
    HttpHeaders headers;
    int timeout_ms{0};                       // 0 = no limit

    // When set, a 2xx body is streamed here instead of being buffered.
    // Error bodies are always buffered in HttpResponse::body.
    BodySink on_body;
};

struct HttpResponse {
    int status_code{0};
    std::string body;
    std::string error;                       // transport failure description
    bool aborted{false};                     // the body sink stopped the transfer

    bool success() const { return status_code >= 200 && status_code < 300; }
    bool transport_failed() const { return status_code == 0 && !aborted; }
};

/**
 * HTTP client function type for testability
 */
using HttpClient = std::function<HttpResponse(const HttpRequest& request)>;

/**
 * Perform a request with libcurl.
 */
HttpResponse perform_curl_request(const HttpRequest& request);

/**
 * Return the libcurl-backed client used when no client is injected.
 */
HttpClient make_curl_http_client();

/**
 * Join a base address and an absolute path without doubling the slash.
 */
std::string join_url(const std::string& base, const std::string& path);

/**
 * Standard JSON headers plus "Authorization: Bearer <token>" when a
 * non-empty credential is given.
 */
HttpHeaders json_headers(const std::optional<std::string>& bearer_token);

#endif // HTTP_CLIENT_HPP
