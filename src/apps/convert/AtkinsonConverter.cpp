#include "apps/convert/AtkinsonConverter.hpp"

#include <algorithm>
#include <array>

namespace dith {

void AtkinsonConverter::binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const {
    const uint32_t w = img.width;
    const uint32_t h = img.height;

    binary.assign(static_cast<std::size_t>(w) * h, 0);

    // Accumulated error for rows y, y+1, y+2 lives in err[(y+k) % ERR_ROWS].
    std::array<std::vector<int32_t>, ERR_ROWS> err;
    for (auto& r : err) r.assign(w, 0);

    const int32_t threshold = m_cfg.threshold;

    for (uint32_t y = 0; y < h; ++y) {
        std::vector<int32_t>& cur   = err[y % ERR_ROWS];
        std::vector<int32_t>& next1 = err[(y + 1) % ERR_ROWS];
        std::vector<int32_t>& next2 = err[(y + 2) % ERR_ROWS];

        const bool has_next1 = (y + 1 < h);
        const bool has_next2 = (y + 2 < h);

        const uint8_t* src = img.data + static_cast<std::size_t>(y) * img.stride;
        uint8_t* dst = binary.data() + static_cast<std::size_t>(y) * w;

        for (uint32_t x = 0; x < w; ++x) {
            const int32_t value  = static_cast<int32_t>(src[x]) + cur[x];
            const int32_t output = (value >= threshold) ? 255 : 0;
            dst[x] = static_cast<uint8_t>(output);

            // Truncating division: negative errors round toward zero too
            const int32_t share = (value - output) / SHARE_DIV;
            if (share == 0) continue;

            if (x + 1 < w) cur[x + 1] += share;
            if (x + 2 < w) cur[x + 2] += share;

            if (has_next1) {
                if (x > 0) next1[x - 1] += share;
                next1[x] += share;
                if (x + 1 < w) next1[x + 1] += share;
            }

            if (has_next2) next2[x] += share;
        }

        // Row y is done; its slot is reused for row y+3.
        std::fill(cur.begin(), cur.end(), 0);
    }
}

} // namespace dith
