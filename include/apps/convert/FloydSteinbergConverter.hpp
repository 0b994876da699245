#pragma once
#include "apps/convert/Converter.hpp"

namespace dith {

// ---------------------------------------------------------------------------
// FloydSteinbergConverter: classic full error diffusion.
//
//          X   7
//      3   5   1      (/16)
//
// Each share is computed from the full error (err * k / 16), not by
// subtracting the shares already handed out. 2-row error ring.
// ---------------------------------------------------------------------------
class FloydSteinbergConverter : public ThresholdConverter {
public:
    static constexpr uint32_t ERR_ROWS = 2;

    static constexpr int32_t W_RIGHT      = 7;
    static constexpr int32_t W_DOWN_LEFT  = 3;
    static constexpr int32_t W_DOWN       = 5;
    static constexpr int32_t W_DOWN_RIGHT = 1;
    static constexpr int32_t W_DIV        = 16;

    explicit FloydSteinbergConverter(const ConverterConfig& cfg = {})
    : ThresholdConverter(cfg) {}

    void binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const override;

    ConverterType type() const override { return ConverterType::FLOYD_STEINBERG; }
};

} // namespace dith
