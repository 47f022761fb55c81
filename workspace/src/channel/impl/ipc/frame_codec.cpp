#include "ipc/frame_codec.h"
#include "utils/log.h"
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace vtctl {
namespace ipc {

std::vector<uint8_t> FrameCodec::encode(const std::string& payload) {
    if (payload.size() > UINT32_MAX) {
        throw std::length_error("Payload does not fit a 32-bit frame length");
    }

    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + payload.size());
    writeLength(static_cast<uint32_t>(payload.size()), frame.data());
    std::copy(payload.begin(), payload.end(), frame.begin() + FRAME_HEADER_SIZE);
    return frame;
}

FrameCodec::DecodeResult FrameCodec::decode(const uint8_t* data, size_t size, uint32_t max_frame_size) {
    DecodeResult result;
    size_t offset = 0;

    while (size - offset >= FRAME_HEADER_SIZE) {
        uint32_t length = readLength(data + offset);
        if (length >= max_frame_size) {
            result.corrupted = true;
            result.corrupted_length = length;
            break;
        }

        if (size - offset - FRAME_HEADER_SIZE < length) {
            break;
        }

        const char* body = reinterpret_cast<const char*>(data + offset + FRAME_HEADER_SIZE);
        result.frames.emplace_back(body, length);
        offset += FRAME_HEADER_SIZE + length;
    }

    result.consumed = offset;
    return result;
}

uint32_t FrameCodec::readLength(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

void FrameCodec::writeLength(uint32_t length, uint8_t* out) {
    out[0] = static_cast<uint8_t>(length >> 24);
    out[1] = static_cast<uint8_t>(length >> 16);
    out[2] = static_cast<uint8_t>(length >> 8);
    out[3] = static_cast<uint8_t>(length);
}

FrameDecoder::FrameDecoder(uint32_t max_frame_size, size_t max_buffer_size)
    : max_frame_size_(max_frame_size)
    , max_buffer_size_(max_buffer_size) {
}

FrameDecoder::Result FrameDecoder::append(const uint8_t* data, size_t size) {
    Result result;
    buffer_.insert(buffer_.end(), data, data + size);

    auto decoded = FrameCodec::decode(buffer_.data(), buffer_.size(), max_frame_size_);
    result.frames = std::move(decoded.frames);

    if (decoded.corrupted) {
        LOGE_FMT("Invalid frame length " << decoded.corrupted_length
                 << ", discarding " << (buffer_.size() - decoded.consumed) << " buffered bytes");
        buffer_.clear();
        result.corrupted = true;
        return result;
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + decoded.consumed);

    if (buffer_.size() > max_buffer_size_) {
        LOGE_FMT("Receive buffer exceeded " << max_buffer_size_ << " bytes, clearing");
        buffer_.clear();
        result.overflowed = true;
    }

    return result;
}

void FrameDecoder::clear() {
    buffer_.clear();
}

} // namespace ipc
} // namespace vtctl
