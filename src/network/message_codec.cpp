#include "network/message_codec.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace lanbridge::network {

Result<QByteArray> MessageCodec::encode(const QByteArray& payload) {
    const auto size = static_cast<size_t>(payload.size());
    if (size > kMaxPayloadSize) {
        return Result<QByteArray>::err(Error{
            "frame payload of " + std::to_string(size) + " bytes exceeds " +
                std::to_string(kMaxPayloadSize),
            ErrorCode::PayloadTooLarge});
    }

    QByteArray frame;
    frame.reserve(static_cast<int>(kHeaderSize + size));
    frame.append(static_cast<char>((size >> 8) & 0xFF));
    frame.append(static_cast<char>(size & 0xFF));
    frame.append(payload);
    return Result<QByteArray>::ok(std::move(frame));
}

void MessageCodec::decode(const QByteArray& chunk, const MessageHandler& on_message) {
    const auto* data = reinterpret_cast<const uint8_t*>(chunk.constData());
    const auto size = static_cast<size_t>(chunk.size());
    size_t i = 0;

    while (true) {
        // Length header, most significant byte first.
        while (header_remaining_ > 0) {
            if (i >= size) {
                return;
            }
            --header_remaining_;
            payload_remaining_ |= static_cast<size_t>(data[i]) << (header_remaining_ * 8);
            ++i;
        }

        if (payload_remaining_ > 0) {
            const size_t available = size - i;
            if (available == 0) {
                return;
            }

            const size_t take = std::min(available, payload_remaining_);
            buffer_.append(chunk.constData() + i, static_cast<int>(take));
            payload_remaining_ -= take;
            i += take;

            if (payload_remaining_ > 0) {
                return;
            }
        }

        QByteArray message = std::move(buffer_);
        buffer_ = QByteArray();
        header_remaining_ = kHeaderSize;
        payload_remaining_ = 0;

        qCDebug(lanbridgeCodecLog) << "Decoded frame of" << message.size() << "bytes";
        if (on_message) {
            on_message(message);
        }
    }
}

void MessageCodec::reset() {
    buffer_.clear();
    header_remaining_ = kHeaderSize;
    payload_remaining_ = 0;
}

} // namespace lanbridge::network
