#include "apps/convert/FloydSteinbergConverter.hpp"

#include <algorithm>
#include <array>

namespace dith {

void FloydSteinbergConverter::binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const {
    const uint32_t w = img.width;
    const uint32_t h = img.height;

    binary.assign(static_cast<std::size_t>(w) * h, 0);

    std::array<std::vector<int32_t>, ERR_ROWS> err;
    for (auto& r : err) r.assign(w, 0);

    const int32_t threshold = m_cfg.threshold;

    for (uint32_t y = 0; y < h; ++y) {
        std::vector<int32_t>& cur  = err[y % ERR_ROWS];
        std::vector<int32_t>& next = err[(y + 1) % ERR_ROWS];
        const bool has_next = (y + 1 < h);

        const uint8_t* src = img.data + static_cast<std::size_t>(y) * img.stride;
        uint8_t* dst = binary.data() + static_cast<std::size_t>(y) * w;

        for (uint32_t x = 0; x < w; ++x) {
            const int32_t value  = static_cast<int32_t>(src[x]) + cur[x];
            const int32_t output = (value >= threshold) ? 255 : 0;
            dst[x] = static_cast<uint8_t>(output);

            const int32_t e = value - output;

            if (x + 1 < w) cur[x + 1] += e * W_RIGHT / W_DIV;

            if (has_next) {
                if (x > 0) next[x - 1] += e * W_DOWN_LEFT / W_DIV;
                next[x] += e * W_DOWN / W_DIV;
                if (x + 1 < w) next[x + 1] += e * W_DOWN_RIGHT / W_DIV;
            }
        }

        // Row y is done; its slot is reused for row y+2.
        std::fill(cur.begin(), cur.end(), 0);
    }
}

} // namespace dith
