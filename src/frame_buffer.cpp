#include "frame_buffer.hpp"

#include "ber_codec.hpp"

#include <string>

namespace ber {

FrameBuffer::FrameBuffer(size_t max_frame) : max_frame_(max_frame) {}

void FrameBuffer::append(const uint8_t* data, size_t n) {
    // drop consumed frames before growing
    if (start_ > 0 && start_ == buf_.size()) {
        buf_.clear();
        start_ = 0;
    } else if (start_ > 4096 && start_ > buf_.size() / 2) {
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(start_));
        start_ = 0;
    }
    buf_.insert(buf_.end(), data, data + n);
}

std::optional<Bytes> FrameBuffer::next_frame() {
    std::optional<size_t> size = frame_size(buf_.data() + start_, buffered());
    if (!size) return std::nullopt;
    if (*size > max_frame_) {
        throw Asn1Error(Asn1Errc::MessageTooLarge,
                        "frame of " + std::to_string(*size) + " bytes, limit " + std::to_string(max_frame_));
    }
    if (*size > buffered()) return std::nullopt;
    auto first = buf_.begin() + static_cast<std::ptrdiff_t>(start_);
    Bytes frame(first, first + static_cast<std::ptrdiff_t>(*size));
    start_ += *size;
    return frame;
}

void FrameBuffer::clear() {
    buf_.clear();
    start_ = 0;
}

} // namespace ber
