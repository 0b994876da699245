#pragma once
#include "apps/convert/Converter.hpp"

namespace dith {

// ---------------------------------------------------------------------------
// EdgeConverter: places a dot where the local gradient is strong.
// Works on the grayscale image directly (no binarization pass).
// threshold = minimum mean |center - neighbour| for a dot to be on.
// ---------------------------------------------------------------------------
class EdgeConverter : public Converter {
public:
    explicit EdgeConverter(const ConverterConfig& cfg = {DefaultThreshold(ConverterType::EDGE), false})
    : Converter(cfg) {}

    bool convert(const msg::ImageFrame& img,
                 const braille::GridSize& grid,
                 std::string& out) const override;

    ConverterType type() const override { return ConverterType::EDGE; }

    // Mean absolute difference to the in-bounds 4-connected neighbours of (x,y).
    // Returns 0 for a 1x1 image.
    static uint32_t meanGradient(const msg::ImageFrame& img, uint32_t x, uint32_t y);

private:
    bool dotOn(const msg::ImageFrame& img, uint32_t x, uint32_t y) const;
};

} // namespace dith
