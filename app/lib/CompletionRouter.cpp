/*
 * Completion router implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CompletionRouter.hpp"
#include "BackendRegistry.hpp"
#include "Logger.hpp"
#include "ModelCatalog.hpp"
#include "SseDecoder.hpp"
#include "UsageTracker.hpp"

#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

CompletionResponse make_error(CompletionResponse response, CompletionError error,
                              int http_status, std::string message)
{
    response.success = false;
    response.error = error;
    response.http_status = http_status;
    response.error_message = std::move(message);
    return response;
}

} // namespace

const char* to_string(CompletionError error)
{
    switch (error) {
        case CompletionError::None: return "none";
        case CompletionError::ModelNotFound: return "model-not-found";
        case CompletionError::QuotaExceeded: return "quota-exceeded";
        case CompletionError::Unauthorized: return "unauthorized";
        case CompletionError::BackendUnreachable: return "backend-unreachable";
        case CompletionError::MalformedResponse: return "malformed-response";
        case CompletionError::BackendError: return "backend-error";
        case CompletionError::Cancelled: return "cancelled";
    }
    return "unknown";
}

CompletionRouter::CompletionRouter(const ModelCatalog& catalog,
                                   const BackendRegistry& registry,
                                   UsageTracker* usage_tracker,
                                   HttpClient http_client)
    : catalog_(catalog)
    , registry_(registry)
    , usage_tracker_(usage_tracker)
    , http_client_(http_client ? std::move(http_client) : make_curl_http_client())
{}

bool CompletionRouter::is_cloud(const std::string& address) const
{
    return BackendRegistry::normalize_address(address) == registry_.cloud_address();
}

std::optional<std::string> CompletionRouter::credential_for(
    const std::string& address,
    const std::optional<std::string>& session_token) const
{
    if (is_cloud(address)) {
        return session_token;
    }
    if (auto backend = registry_.find(address)) {
        return backend->credential;
    }
    return std::nullopt;
}

Json::Value CompletionRouter::build_messages(const std::string& prompt,
                                             const std::vector<std::string>& images)
{
    Json::Value message(Json::objectValue);
    message["role"] = "user";

    if (images.empty()) {
        message["content"] = prompt;
    } else {
        Json::Value parts(Json::arrayValue);

        Json::Value text_part(Json::objectValue);
        text_part["type"] = "text";
        text_part["text"] = prompt;
        parts.append(text_part);

        for (const auto& image : images) {
            Json::Value image_part(Json::objectValue);
            image_part["type"] = "image_url";
            image_part["image_url"]["url"] = "data:image/png;base64," + image;
            parts.append(image_part);
        }
        message["content"] = parts;
    }

    Json::Value messages(Json::arrayValue);
    messages.append(message);
    return messages;
}

std::string CompletionRouter::build_payload(const std::string& model,
                                            const Json::Value& messages,
                                            bool stream)
{
    Json::Value payload(Json::objectValue);
    payload["model"] = model;
    payload["messages"] = messages;
    payload["stream"] = stream;

    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "";
    return Json::writeString(writer_builder, payload);
}

std::string CompletionRouter::describe_error_body(int status_code, const std::string& body)
{
    std::string message = "API error: " + std::to_string(status_code);

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream body_stream(body);
    std::string errors;
    if (!body.empty() && Json::parseFromStream(reader_builder, body_stream, &root, &errors)) {
        if (root.isObject() && root.isMember("detail")) {
            const Json::Value& detail = root["detail"];
            if (detail.isString()) {
                message += " - " + detail.asString();
            } else {
                Json::StreamWriterBuilder writer_builder;
                writer_builder["indentation"] = "";
                message += " - " + Json::writeString(writer_builder, detail);
            }
        }
        return message;
    }

    if (!body.empty()) {
        message += " - " + body.substr(0, kErrorBodyExcerpt);
    }
    return message;
}

CompletionResponse CompletionRouter::parse_buffered_response(const HttpResponse& http_response,
                                                             CompletionResponse response) const
{
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream response_stream(http_response.body);
    std::string errors;

    if (!Json::parseFromStream(reader_builder, response_stream, &root, &errors)) {
        return make_error(std::move(response), CompletionError::MalformedResponse,
                          http_response.status_code, "Failed to parse JSON response: " + errors);
    }

    if (!root.isObject() || !root["choices"].isArray() || root["choices"].empty() ||
        !root["choices"][0].isObject() || !root["choices"][0]["message"].isObject() ||
        !root["choices"][0]["message"].isMember("content")) {
        return make_error(std::move(response), CompletionError::MalformedResponse,
                          http_response.status_code, "Unexpected API response structure");
    }

    const Json::Value& content = root["choices"][0]["message"]["content"];
    if (content.isString()) {
        response.text = content.asString();
    } else if (!content.isNull()) {
        return make_error(std::move(response), CompletionError::MalformedResponse,
                          http_response.status_code, "Message content is not text");
    }

    response.success = true;
    response.http_status = http_response.status_code;
    return response;
}

CompletionResponse CompletionRouter::dispatch(const std::string& address,
                                              const std::string& model,
                                              const Json::Value& messages,
                                              const std::optional<std::string>& session_token,
                                              bool stream,
                                              const ChunkCallback& on_chunk,
                                              const std::atomic<bool>* cancel_flag) const
{
    CompletionResponse response;
    response.server = address;
    response.model_used = model;

    const auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&start_time] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
    };

    HttpRequest request;
    request.url = join_url(address, kChatEndpoint);
    request.method = "POST";
    request.body = build_payload(model, messages, stream);
    request.headers = json_headers(credential_for(address, session_token));

    bool cancelled = false;
    SseDecoder decoder(on_chunk);
    if (stream) {
        request.on_body = [&decoder, &cancelled, cancel_flag](const char* data, std::size_t size) {
            if (cancel_flag && cancel_flag->load()) {
                cancelled = true;
                return false;
            }
            return decoder.feed(data, size);
        };
    }

    if (cancel_flag && cancel_flag->load()) {
        return make_error(std::move(response), CompletionError::Cancelled, 0, "Request cancelled");
    }

    const HttpResponse http_response = http_client_(request);
    response.latency = elapsed();

    if (cancelled) {
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->info("Stream from {} cancelled after {} fragments", address, decoder.fragment_count());
        }
        return make_error(std::move(response), CompletionError::Cancelled,
                          http_response.status_code, "Request cancelled");
    }

    if (http_response.transport_failed()) {
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->error("Completion request to {} failed: {}", address, http_response.error);
        }
        return make_error(std::move(response), CompletionError::BackendUnreachable, 0,
                          "HTTP request failed: " + http_response.error);
    }

    if (http_response.status_code == 429) {
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->warn("Completion rejected by {} with 429", address);
        }
        return make_error(std::move(response), CompletionError::QuotaExceeded, 429,
                          "Access denied. Quota may be exceeded.");
    }

    if (!http_response.success()) {
        const std::string message = describe_error_body(http_response.status_code, http_response.body);
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->error("Completion request to {} failed: {}", address, message);
        }
        const CompletionError error = http_response.status_code == 401
            ? CompletionError::Unauthorized
            : CompletionError::BackendError;
        return make_error(std::move(response), error, http_response.status_code, message);
    }

    if (stream) {
        decoder.finish();
        response.text = decoder.text();
        response.success = true;
        response.http_status = http_response.status_code;
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->info("Streamed {} fragments from {} in {}ms ({} malformed frames skipped)",
                         decoder.fragment_count(), address, response.latency.count(),
                         decoder.skipped_frames());
        }
        return response;
    }

    response = parse_buffered_response(http_response, std::move(response));
    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        if (response.success) {
            logger->info("Completion from {} in {}ms", address, response.latency.count());
        } else {
            logger->error("Completion from {} unusable: {}", address, response.error_message);
        }
    }
    return response;
}

CompletionResponse CompletionRouter::send(const CompletionRequest& request) const
{
    const auto model = catalog_.find(request.model);
    if (!model) {
        CompletionResponse response;
        response.model_used = request.model;
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("Model '{}' not found in available models", request.model);
        }
        return make_error(std::move(response), CompletionError::ModelNotFound, 0,
                          "Model '" + request.model + "' not found in available models");
    }

    if (request.cancel_flag && request.cancel_flag->load()) {
        CompletionResponse response;
        response.server = model->server;
        response.model_used = model->name;
        return make_error(std::move(response), CompletionError::Cancelled, 0, "Request cancelled");
    }

    const Json::Value messages = build_messages(request.prompt, request.images);

    const bool has_session_token = request.session_token && !request.session_token->empty();
    if (usage_tracker_ && has_session_token && is_cloud(model->server)) {
        usage_tracker_->optimistic_decrement();
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->debug("Routing '{}' to {} (stream: {}, images: {})",
                      model->name, model->server, request.stream, request.images.size());
    }

    return dispatch(model->server, model->name, messages, request.session_token,
                    request.stream, request.on_chunk, request.cancel_flag);
}
