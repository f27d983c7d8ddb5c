#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <cstddef>
#include <functional>

namespace lanbridge::network {

/**
 * MessageCodec - Length-prefixed framing for the tunnel byte stream.
 *
 * Frame format:
 * - Length (2 bytes, big-endian)
 * - Payload (Length bytes)
 *
 * The decoder is resumable: it keeps a partially received header or payload
 * across calls, so the stream may be fed in arbitrary chunks. Each tunnel
 * link owns its own instance.
 */
class MessageCodec {
public:
    static constexpr size_t kHeaderSize = 2;
    static constexpr size_t kMaxPayloadSize = 0xFFFF;

    using MessageHandler = std::function<void(const QByteArray&)>;

    /**
     * Prefix `payload` with its length.
     * Fails with PayloadTooLarge above kMaxPayloadSize bytes.
     */
    [[nodiscard]] static Result<QByteArray> encode(const QByteArray& payload);

    /**
     * Consume `chunk`, invoking `on_message` once per completed frame.
     *
     * A single call may complete zero, one or many frames. The handler gets
     * a copy that does not share storage with the decoder.
     */
    void decode(const QByteArray& chunk, const MessageHandler& on_message);

    /**
     * Drop any partial frame and return to the initial state.
     */
    void reset();

    [[nodiscard]] size_t header_bytes_remaining() const { return header_remaining_; }
    [[nodiscard]] size_t payload_bytes_remaining() const { return payload_remaining_; }
    [[nodiscard]] size_t buffered_bytes() const { return static_cast<size_t>(buffer_.size()); }

    /**
     * True when no partial frame is held (same state as a new decoder).
     */
    [[nodiscard]] bool is_idle() const {
        return header_remaining_ == kHeaderSize && payload_remaining_ == 0 && buffer_.isEmpty();
    }

private:
    QByteArray buffer_;
    size_t header_remaining_ = kHeaderSize;
    size_t payload_remaining_ = 0;
};

} // namespace lanbridge::network
