#pragma once
#include <array>

#include "apps/convert/Converter.hpp"

namespace dith {

// ---------------------------------------------------------------------------
// BayerConverter: ordered dithering against a tiled 8x8 threshold matrix.
// O(1) per pixel. Gives the characteristic crosshatch texture.
// threshold shifts the whole matrix: effective = clamp(M + threshold - 128).
// ---------------------------------------------------------------------------
class BayerConverter : public ThresholdConverter {
public:
    static constexpr uint32_t MATRIX_SIZE = 8;
    using Matrix = std::array<uint8_t, MATRIX_SIZE * MATRIX_SIZE>;

    explicit BayerConverter(const ConverterConfig& cfg = {})
    : ThresholdConverter(cfg) {}

    void binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const override;

    ConverterType type() const override { return ConverterType::BAYER; }

    // Row-major 8x8 matrix, values spread over 2..254. Built once per process.
    static const Matrix& matrix();
};

} // namespace dith
