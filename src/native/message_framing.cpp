#include <nmbridge/native/message_framing.h>

#include <spdlog/spdlog.h>

namespace nmbridge::native {

Result<std::vector<uint8_t>> NativeFramer::frame(std::string_view payload) const {
    std::vector<uint8_t> buffer;
    buffer.reserve(HEADER_SIZE + payload.size());
    auto r = frame_into(payload, buffer);
    if (!r) {
        return r.error();
    }
    return buffer;
}

Result<void> NativeFramer::frame_into(std::string_view payload,
                                      std::vector<uint8_t>& buffer) const {
    if (payload.size() > max_message_size_) {
        return Error{ErrorCode::InvalidArgument, "Message size " + std::to_string(payload.size()) +
                                                     " exceeds maximum " +
                                                     std::to_string(max_message_size_)};
    }

    FrameHeader header;
    header.payload_size = static_cast<uint32_t>(payload.size());
    header.to_wire();

    const auto base = buffer.size();
    buffer.resize(base + HEADER_SIZE + payload.size());
    std::memcpy(buffer.data() + base, &header, sizeof(header));
    if (!payload.empty()) {
        std::memcpy(buffer.data() + base + HEADER_SIZE, payload.data(), payload.size());
    }
    return Result<void>();
}

Result<NativeFramer::FrameHeader> NativeFramer::parse_header(std::span<const uint8_t> data) {
    if (data.size() < HEADER_SIZE) {
        return Error{ErrorCode::InvalidData, "Insufficient data for frame header"};
    }
    FrameHeader header;
    std::memcpy(&header, data.data(), sizeof(header));
    header.from_wire();
    return header;
}

FrameReader::FrameStatus FrameReader::status() const {
    auto header = NativeFramer::parse_header(buffer_);
    if (!header) {
        return FrameStatus::NeedMoreData;
    }
    const size_t payload_size = header.value().payload_size;
    if (payload_size > max_frame_size_) {
        return FrameStatus::FrameTooLarge;
    }
    if (buffer_.size() < NativeFramer::HEADER_SIZE + payload_size) {
        return FrameStatus::NeedMoreData;
    }
    return FrameStatus::FrameComplete;
}

Result<std::string> FrameReader::try_read_frame() {
    switch (status()) {
        case FrameStatus::NeedMoreData:
            return Error{ErrorCode::InvalidState, "Incomplete frame"};
        case FrameStatus::FrameTooLarge: {
            auto header = NativeFramer::parse_header(buffer_);
            spdlog::error("Native frame of {} bytes exceeds inbound limit {}",
                          header.value().payload_size, max_frame_size_);
            return Error{ErrorCode::ResourceExhausted, "Frame too large"};
        }
        case FrameStatus::FrameComplete:
            break;
    }

    const size_t payload_size = NativeFramer::parse_header(buffer_).value().payload_size;
    const auto begin = buffer_.begin() + NativeFramer::HEADER_SIZE;
    std::string payload(begin, begin + static_cast<std::ptrdiff_t>(payload_size));
    buffer_.erase(buffer_.begin(), begin + static_cast<std::ptrdiff_t>(payload_size));
    return payload;
}

} // namespace nmbridge::native
