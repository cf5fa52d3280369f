#pragma once

#include <nmbridge/core/types.h>

#include <bit>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace nmbridge::native {

// Native messaging framing: a 4-byte little-endian payload length followed by UTF-8 JSON.
class NativeFramer {
public:
    static constexpr size_t HEADER_SIZE = 4;
    // Browser-imposed limits: host -> companion 1 MiB, companion -> host 64 MiB
    static constexpr size_t MAX_OUTBOUND_SIZE = 1024 * 1024;
    static constexpr size_t MAX_INBOUND_SIZE = 64 * 1024 * 1024;

    struct FrameHeader {
        uint32_t payload_size = 0;

        // Wire order is little endian regardless of host order
        void to_wire() noexcept {
            if constexpr (std::endian::native == std::endian::big) {
                payload_size = __builtin_bswap32(payload_size);
            }
        }

        void from_wire() noexcept {
            if constexpr (std::endian::native == std::endian::big) {
                payload_size = __builtin_bswap32(payload_size);
            }
        }
    };

    static_assert(HEADER_SIZE == sizeof(FrameHeader),
                  "HEADER_SIZE constant must match actual struct size");
    static_assert(std::is_trivially_copyable_v<FrameHeader>,
                  "FrameHeader must be trivially copyable for memcpy");

    explicit NativeFramer(size_t max_message_size = MAX_OUTBOUND_SIZE)
        : max_message_size_(max_message_size) {}

    // Frame a serialized payload; rejects payloads above the outbound limit before any byte is
    // produced.
    [[nodiscard]] Result<std::vector<uint8_t>> frame(std::string_view payload) const;

    // Append framed bytes into the provided buffer, preserving existing contents.
    Result<void> frame_into(std::string_view payload, std::vector<uint8_t>& buffer) const;

    // Parse frame header
    [[nodiscard]] static Result<FrameHeader> parse_header(std::span<const uint8_t> data);

    size_t max_message_size() const noexcept { return max_message_size_; }

private:
    size_t max_message_size_;
};

// Buffered frame reader for the inbound byte stream. Bytes arrive in arbitrary chunks; complete
// payloads are popped in arrival order.
class FrameReader {
public:
    enum class FrameStatus { NeedMoreData, FrameComplete, FrameTooLarge };

    explicit FrameReader(size_t max_frame_size = NativeFramer::MAX_INBOUND_SIZE)
        : max_frame_size_(max_frame_size) {}

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;

    // Add data to buffer
    void append(std::span<const uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    // Status of the frame at the head of the buffer
    [[nodiscard]] FrameStatus status() const;

    // Extract the next complete payload
    [[nodiscard]] Result<std::string> try_read_frame();

    [[nodiscard]] bool has_data() const noexcept { return !buffer_.empty(); }
    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size(); }

    void reset() noexcept { buffer_.clear(); }

private:
    size_t max_frame_size_;
    std::vector<uint8_t> buffer_;
};

} // namespace nmbridge::native
