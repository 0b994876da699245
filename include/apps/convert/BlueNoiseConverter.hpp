#pragma once
#include <array>

#include "apps/convert/Converter.hpp"

namespace dith {

// ---------------------------------------------------------------------------
// BlueNoiseConverter: ordered dithering against a tiled 64x64 texture built
// from interleaved gradient noise. No low-frequency structure, so no Bayer
// crosshatch. Same per-pixel rule as BayerConverter.
// ---------------------------------------------------------------------------
class BlueNoiseConverter : public ThresholdConverter {
public:
    static constexpr uint32_t TEXTURE_SIZE = 64;
    using Texture = std::array<uint8_t, TEXTURE_SIZE * TEXTURE_SIZE>;

    explicit BlueNoiseConverter(const ConverterConfig& cfg = {})
    : ThresholdConverter(cfg) {}

    void binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const override;

    ConverterType type() const override { return ConverterType::BLUE_NOISE; }

    // Row-major 64x64 texture. Built once per process.
    static const Texture& texture();
};

} // namespace dith
