#pragma once
#include "apps/convert/Converter.hpp"

namespace dith {

// ---------------------------------------------------------------------------
// AtkinsonConverter: error diffusion as used on the classic Macintosh.
//
//        X   1   1
//    1   1   1
//        1            (each share = error / 8)
//
// Only 6/8 of the quantisation error is passed on, so highlights and
// shadows saturate sooner than with Floyd-Steinberg.
// Error state is a 3-row ring, O(width) memory.
// ---------------------------------------------------------------------------
class AtkinsonConverter : public ThresholdConverter {
public:
    static constexpr uint32_t ERR_ROWS = 3;
    static constexpr int32_t  SHARE_DIV = 8;

    explicit AtkinsonConverter(const ConverterConfig& cfg = {})
    : ThresholdConverter(cfg) {}

    void binarize(const msg::ImageFrame& img, std::vector<uint8_t>& binary) const override;

    ConverterType type() const override { return ConverterType::ATKINSON; }
};

} // namespace dith
