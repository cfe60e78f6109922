/*
 * Incremental decoder for streamed chat-completion responses
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SSE_DECODER_HPP
#define SSE_DECODER_HPP

#include <cstddef>
#include <functional>
#include <string>

/**
 * Splits a byte stream into newline-delimited Server-Sent-Event lines and
 * extracts choices[0].delta.content from each "data: " frame.
 *
 * Bytes may arrive in arbitrary chunks; a frame split across chunks is
 * held until its newline arrives. Fragments are handed to the callback one
 * frame at a time, in order, before the next frame is looked at. Frames
 * that are not valid JSON are skipped.
 */
class SseDecoder {
public:
    using FragmentCallback = std::function<void(const std::string& fragment)>;

    explicit SseDecoder(FragmentCallback on_fragment = nullptr);

    /**
     * Feed raw bytes.
     * @return false once the [DONE] sentinel has been seen
     */
    bool feed(const char* data, std::size_t size);
    bool feed(const std::string& data) { return feed(data.data(), data.size()); }

    /**
     * Process a trailing line that had no newline. Call at end of body.
     */
    void finish();

    bool done() const { return done_; }
    const std::string& text() const { return text_; }
    std::size_t fragment_count() const { return fragment_count_; }
    std::size_t skipped_frames() const { return skipped_frames_; }

private:
    static constexpr const char* kDataPrefix = "data: ";
    static constexpr const char* kDoneSentinel = "[DONE]";

    void process_line(std::string line);

    FragmentCallback on_fragment_;
    std::string pending_;
    std::string text_;
    bool done_{false};
    std::size_t fragment_count_{0};
    std::size_t skipped_frames_{0};
};

#endif // SSE_DECODER_HPP
