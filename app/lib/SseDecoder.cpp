/*
 * SSE decoder implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "SseDecoder.hpp"
#include "Logger.hpp"

#include <cstring>
#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

SseDecoder::SseDecoder(FragmentCallback on_fragment)
    : on_fragment_(std::move(on_fragment))
{}

bool SseDecoder::feed(const char* data, std::size_t size)
{
    if (done_) {
        return false;
    }

    pending_.append(data, size);

    std::size_t start = 0;
    std::size_t newline = pending_.find('\n', start);
    while (newline != std::string::npos) {
        process_line(pending_.substr(start, newline - start));
        start = newline + 1;
        if (done_) {
            pending_.clear();
            return false;
        }
        newline = pending_.find('\n', start);
    }
    pending_.erase(0, start);
    return true;
}

void SseDecoder::finish()
{
    if (done_ || pending_.empty()) {
        pending_.clear();
        return;
    }
    std::string line;
    line.swap(pending_);
    process_line(std::move(line));
}

void SseDecoder::process_line(std::string line)
{
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    const std::size_t prefix_length = std::strlen(kDataPrefix);
    if (line.compare(0, prefix_length, kDataPrefix) != 0) {
        return;
    }

    const std::string payload = line.substr(prefix_length);
    if (payload == kDoneSentinel) {
        done_ = true;
        return;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream payload_stream(payload);
    std::string errors;
    if (!Json::parseFromStream(reader_builder, payload_stream, &root, &errors)) {
        ++skipped_frames_;
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->debug("Skipping malformed stream frame: {}", payload);
        }
        return;
    }

    if (!root.isObject() || !root["choices"].isArray() || root["choices"].empty()) {
        return;
    }
    const Json::Value& first = root["choices"][0];
    if (!first.isObject() || !first["delta"].isObject()) {
        return;
    }
    const Json::Value& content = first["delta"]["content"];
    if (!content.isString()) {
        return;
    }

    const std::string fragment = content.asString();
    if (fragment.empty()) {
        return;
    }

    text_ += fragment;
    ++fragment_count_;
    if (on_fragment_) {
        on_fragment_(fragment);
    }
}
