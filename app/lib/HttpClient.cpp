/*
 * libcurl implementation of the HTTP transport
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpClient.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <mutex>

namespace {

struct TransferContext {
    CURL* curl{nullptr};
    const HttpRequest* request{nullptr};
    HttpResponse* response{nullptr};
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userdata)
{
    const size_t total_size = size * nmemb;
    auto* context = static_cast<TransferContext*>(userdata);

    long status = 0;
    curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);
    const bool ok = status >= 200 && status < 300;

    if (ok && context->request->on_body) {
        if (!context->request->on_body(static_cast<const char*>(contents), total_size)) {
            context->response->aborted = true;
            return 0;
        }
        return total_size;
    }

    context->response->body.append(static_cast<const char*>(contents), total_size);
    return total_size;
}

void ensure_curl_initialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

HttpResponse perform_curl_request(const HttpRequest& request)
{
    ensure_curl_initialized();

    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    TransferContext context{curl, &request, &result};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }

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
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        logger->debug("{} {}", request.method, request.url);
    }

    const CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    if (res == CURLE_OK || (res == CURLE_WRITE_ERROR && result.aborted)) {
        result.status_code = static_cast<int>(status);
    } else {
        result.error = curl_easy_strerror(res);
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->warn("{} {} failed: {}", request.method, request.url, result.error);
        }
    }

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    return result;
}

HttpClient make_curl_http_client()
{
    return [](const HttpRequest& request) { return perform_curl_request(request); };
}

std::string join_url(const std::string& base, const std::string& path)
{
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        url += '/';
    }
    url += path;
    return url;
}

HttpHeaders json_headers(const std::optional<std::string>& bearer_token)
{
    HttpHeaders headers;
    headers.emplace_back("Content-Type", "application/json");
    if (bearer_token && !bearer_token->empty()) {
        headers.emplace_back("Authorization", "Bearer " + *bearer_token);
    }
    return headers;
}
