#include "apps/convert/BayerConverter.hpp"

#include <vector>

namespace {

// One doubling step of the recursive Bayer construction:
// each entry v of the n x n matrix becomes the 2x2 block
//   4v+0  4v+2
//   4v+3  4v+1
static std::vector<uint8_t> expand(const std::vector<uint8_t>& m, uint32_t n) {
    const uint32_t n2 = n * 2;
    std::vector<uint8_t> out(n2 * n2, 0);

    for (uint32_t y = 0; y < n; ++y) {
        for (uint32_t x = 0; x < n; ++x) {
            const uint8_t base = static_cast<uint8_t>(m[y * n + x] * 4);
            const uint32_t bx = x * 2;
            const uint32_t by = y * 2;
            out[(by + 0) * n2 + (bx + 0)] = static_cast<uint8_t>(base + 0);
            out[(by + 0) * n2 + (bx + 1)] = static_cast<uint8_t>(base + 2);
            out[(by + 1) * n2 + (bx + 0)] = static_cast<uint8_t>(base + 3);
            out[(by + 1) * n2 + (bx + 1)] = static_cast<uint8_t>(base + 1);
        }
    }
    return out;
}

static dith::BayerConverter::Matrix buildMatrix() {
    std::vector<uint8_t> m = {0, 2, 3, 1};   // 2x2 base
    uint32_t n = 2;
    while (n < dith::BayerConverter::MATRIX_SIZE) {
        m = expand(m, n);
        n *= 2;
    }

    // 0..63 -> 2..254
    dith::BayerConverter::Matrix out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(m[i] * 4 + 2);
    }
    return out;
}

} // anonymous namespace

namespace dith {

const BayerConverter::Matrix& BayerConverter::matrix() {
    static const Matrix M = buildMatrix();
    return M;
}

void BayerConverter::binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const {
    const uint32_t w = img.width;
    const uint32_t h = img.height;
    binary.assign(static_cast<std::size_t>(w) * h, 0);

    const Matrix& M = matrix();
    const int32_t offset = static_cast<int32_t>(m_cfg.threshold) - 128;

    for (uint32_t y = 0; y < h; ++y) {
        const uint8_t* src = img.data + static_cast<std::size_t>(y) * img.stride;
        uint8_t* dst = binary.data() + static_cast<std::size_t>(y) * w;
        const uint32_t ty = (y % MATRIX_SIZE) * MATRIX_SIZE;

        for (uint32_t x = 0; x < w; ++x) {
            int32_t t = static_cast<int32_t>(M[ty + (x % MATRIX_SIZE)]) + offset;
            if (t < 0) t = 0;
            if (t > 255) t = 255;

            dst[x] = (static_cast<int32_t>(src[x]) > t) ? 255 : 0;
        }
    }
}

} // namespace dith
