/**
 * @file frame_codec.h
 * @brief Length-prefixed framing of control channel payloads
 *
 * Wire format of one frame:
 *
 *   +----------------------------+---------------------+
 *   | length (uint32 big-endian) | body (length bytes) |
 *   +----------------------------+---------------------+
 *
 * The body is a UTF-8 JSON document. There is no version byte or checksum.
 */

#ifndef VTCTL_IPC_FRAME_CODEC_H
#define VTCTL_IPC_FRAME_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vtctl {
namespace ipc {

/** Size of the length prefix */
constexpr size_t FRAME_HEADER_SIZE = 4;

/** Frame bodies must be strictly shorter than this */
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 10000000;

/** A receive buffer growing past this without completing a frame is discarded */
constexpr size_t DEFAULT_MAX_BUFFER_SIZE = 10 * 1024 * 1024;

/**
 * @brief Stateless frame encoding and decoding
 */
class FrameCodec {
public:
    /**
     * @brief Outcome of scanning a byte buffer for frames
     */
    struct DecodeResult {
        /** Complete frame bodies, in stream order */
        std::vector<std::string> frames;

        /** Bytes of the input covered by the returned frames */
        size_t consumed = 0;

        /** A header declared a length >= the maximum; the input is unusable */
        bool corrupted = false;

        /** Declared length of the corrupt header (0 if none) */
        uint32_t corrupted_length = 0;
    };

    /**
     * @brief Prefix a payload with its big-endian length
     * @param payload Frame body
     * @return Encoded frame
     */
    static std::vector<uint8_t> encode(const std::string& payload);

    /**
     * @brief Scan a buffer for complete frames
     *
     * Stops at the first incomplete frame or at a corrupt header. Frames
     * preceding a corrupt header are still returned.
     *
     * @param data Buffered bytes
     * @param size Number of buffered bytes
     * @param max_frame_size Exclusive upper bound of a frame length
     */
    static DecodeResult decode(const uint8_t* data, size_t size,
                               uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

    /** Read a big-endian uint32 */
    static uint32_t readLength(const uint8_t* data);

    /** Write a big-endian uint32 */
    static void writeLength(uint32_t length, uint8_t* out);
};

/**
 * @brief Receive buffer accumulating stream bytes into frames
 *
 * Not thread-safe; owned by the single receive path.
 */
class FrameDecoder {
public:
    struct Result {
        std::vector<std::string> frames;

        /** The buffer was cleared because of a corrupt header */
        bool corrupted = false;

        /** The buffer was cleared because it grew past the limit */
        bool overflowed = false;
    };

    explicit FrameDecoder(uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE,
                          size_t max_buffer_size = DEFAULT_MAX_BUFFER_SIZE);

    /**
     * @brief Append received bytes and extract every complete frame
     */
    Result append(const uint8_t* data, size_t size);

    /** Drop everything buffered */
    void clear();

    size_t bufferedBytes() const { return buffer_.size(); }

private:
    uint32_t max_frame_size_;
    size_t max_buffer_size_;
    std::vector<uint8_t> buffer_;
};

} // namespace ipc
} // namespace vtctl

#endif // VTCTL_IPC_FRAME_CODEC_H
