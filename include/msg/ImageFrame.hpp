#pragma once
#include <cassert>
#include <cstddef>
#include <cstdint>

namespace msg {

struct ImageFrame {
    // Non-owning pointer to the first byte of a contiguous GRAY8 buffer
    // const to prevent modification
    const uint8_t* data = nullptr;

    // Image dimensions in pixels
    uint32_t width = 0;         // pixels
    uint32_t height = 0;        // pixels

    // Stride = number of BYTES between the start of row y and the start of row y+1.
    // For tightly packed images: stride == width.
    // For aligned/padded images: stride may be larger
    uint32_t stride = 0;        // bytes per row

    uint64_t t_us = 0;          // capture timestamp (monotonic, us)
    uint32_t frame_id = 0;      // increasing counter, set by the producer

    constexpr uint32_t byteSize() const { return stride * height; }

    // Usable as a conversion input
    constexpr bool valid() const {
        return data != nullptr && width > 0 && height > 0 && stride >= width;
    }

    // Caller must stay inside [0,width) x [0,height).
    uint8_t at(uint32_t x, uint32_t y) const {
        assert(x < width && y < height);
        return data[static_cast<std::size_t>(y) * stride + x];
    }
};

} // namespace msg
