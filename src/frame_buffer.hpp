#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "ber_types.hpp"

namespace ber {

// Reassembles a byte stream into whole top-level TLVs. A read may deliver
// part of a message or several messages; next_frame() hands them out one
// at a time and keeps the rest.
class FrameBuffer {
public:
    static constexpr size_t kDefaultMaxFrame = 1024 * 1024;

    explicit FrameBuffer(size_t max_frame = kDefaultMaxFrame);

    void append(const uint8_t* data, size_t n);
    void append(const Bytes& b) { append(b.data(), b.size()); }

    // Empty optional: need more bytes. Throws Asn1Error on a malformed
    // header or a frame larger than the limit.
    std::optional<Bytes> next_frame();

    size_t buffered() const { return buf_.size() - start_; }
    size_t max_frame() const { return max_frame_; }
    void clear();

private:
    Bytes buf_;
    size_t start_ = 0;
    size_t max_frame_;
};

} // namespace ber
