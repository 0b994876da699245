#include "apps/convert/BlueNoiseConverter.hpp"

#include <cmath>

namespace {

static inline float fract(float v) {
    return v - std::floor(v);
}

// Interleaved gradient noise (Jimenez):
//   fract(52.9829189 * fract(0.06711056*x + 0.00583715*y))
static dith::BlueNoiseConverter::Texture buildTexture() {
    constexpr uint32_t N = dith::BlueNoiseConverter::TEXTURE_SIZE;
    dith::BlueNoiseConverter::Texture out{};

    for (uint32_t y = 0; y < N; ++y) {
        for (uint32_t x = 0; x < N; ++x) {
            const float dot = 0.06711056f * static_cast<float>(x) + 0.00583715f * static_cast<float>(y);
            const float noise = fract(52.9829189f * fract(dot));
            out[y * N + x] = static_cast<uint8_t>(noise * 255.0f);
        }
    }
    return out;
}

} // anonymous namespace

namespace dith {

const BlueNoiseConverter::Texture& BlueNoiseConverter::texture() {
    static const Texture T = buildTexture();
    return T;
}

void BlueNoiseConverter::binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const {
    const uint32_t w = img.width;
    const uint32_t h = img.height;
    binary.assign(static_cast<std::size_t>(w) * h, 0);

    const Texture& T = texture();
    const int32_t offset = static_cast<int32_t>(m_cfg.threshold) - 128;

    for (uint32_t y = 0; y < h; ++y) {
        const uint8_t* src = img.data + static_cast<std::size_t>(y) * img.stride;
        uint8_t* dst = binary.data() + static_cast<std::size_t>(y) * w;
        const uint32_t ty = (y % TEXTURE_SIZE) * TEXTURE_SIZE;

        for (uint32_t x = 0; x < w; ++x) {
            int32_t t = static_cast<int32_t>(T[ty + (x % TEXTURE_SIZE)]) + offset;
            if (t < 0) t = 0;
            if (t > 255) t = 255;

            dst[x] = (static_cast<int32_t>(src[x]) > t) ? 255 : 0;
        }
    }
}

} // namespace dith
