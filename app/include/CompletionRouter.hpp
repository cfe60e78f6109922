/*
 * Routes chat completions to the backend that owns the requested model
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef COMPLETION_ROUTER_HPP
#define COMPLETION_ROUTER_HPP

#include "HttpClient.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class BackendRegistry;
class ModelCatalog;
class UsageTracker;

namespace Json { class Value; }

/**
 * Why a completion failed
 */
enum class CompletionError {
    None,
    ModelNotFound,       // model absent from the current catalog
    QuotaExceeded,       // HTTP 429
    Unauthorized,        // HTTP 401
    BackendUnreachable,  // transport failure
    MalformedResponse,   // unexpected response shape
    BackendError,        // any other non-2xx status
    Cancelled,           // caller abandoned the stream
};

const char* to_string(CompletionError error);

/**
 * Receives streamed text fragments, in order, one frame at a time
 */
using ChunkCallback = std::function<void(const std::string& chunk)>;

/**
 * Single-turn chat request
 */
struct CompletionRequest {
    std::string model;
    std::string prompt;
    std::vector<std::string> images;         // base64 PNG payloads, in order
    std::optional<std::string> session_token; // used only for the cloud backend
    bool stream{false};
    ChunkCallback on_chunk;

    // Checked between body chunks; setting it abandons the transfer.
    const std::atomic<bool>* cancel_flag{nullptr};
};

struct CompletionResponse {
    bool success{false};
    std::string text;
    std::string server;                      // backend that served the request
    std::string model_used;
    std::chrono::milliseconds latency{0};

    CompletionError error{CompletionError::None};
    int http_status{0};
    std::string error_message;
};

/**
 * Resolves a model through the catalog and dispatches
 * POST {address}/v1/chat/completions to its backend.
 *
 * Exactly one attempt is made per call; failures are returned, never
 * retried on another backend.
 */
class CompletionRouter {
public:
    static constexpr std::size_t kErrorBodyExcerpt = 200;

    CompletionRouter(const ModelCatalog& catalog,
                     const BackendRegistry& registry,
                     UsageTracker* usage_tracker = nullptr,
                     HttpClient http_client = nullptr);

    CompletionResponse send(const CompletionRequest& request) const;

    /**
     * Dispatch to a known address without consulting the catalog.
     * @param messages JSON array of {role, content} messages
     */
    CompletionResponse dispatch(const std::string& address,
                                const std::string& model,
                                const Json::Value& messages,
                                const std::optional<std::string>& session_token,
                                bool stream,
                                const ChunkCallback& on_chunk,
                                const std::atomic<bool>* cancel_flag = nullptr) const;

    /**
     * One user message; content becomes [text, image...] parts when
     * images are present.
     */
    static Json::Value build_messages(const std::string& prompt,
                                      const std::vector<std::string>& images);

    static std::string build_payload(const std::string& model,
                                     const Json::Value& messages,
                                     bool stream);

    /**
     * "API error: <status>" plus the JSON detail field or a body excerpt.
     */
    static std::string describe_error_body(int status_code, const std::string& body);

private:
    static constexpr const char* kChatEndpoint = "/v1/chat/completions";

    std::optional<std::string> credential_for(const std::string& address,
                                              const std::optional<std::string>& session_token) const;
    bool is_cloud(const std::string& address) const;
    CompletionResponse parse_buffered_response(const HttpResponse& http_response,
                                               CompletionResponse response) const;

    const ModelCatalog& catalog_;
    const BackendRegistry& registry_;
    UsageTracker* usage_tracker_;
    HttpClient http_client_;
};

#endif // COMPLETION_ROUTER_HPP
