#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "braille/Geometry.hpp"
#include "msg/ImageFrame.hpp"

namespace dith {

enum class ConverterType : uint8_t {
    EDGE = 0,
    ATKINSON,
    FLOYD_STEINBERG,
    BAYER,
    BLUE_NOISE,
};

// CLI names: edge, atkinson, floyd_steinberg, bayer, blue_noise
const char* TypeStr(ConverterType t);
bool ParseConverterType(const std::string& name, ConverterType& out);

// Edge compares against a gradient (small values); everything else against gray level.
uint8_t DefaultThreshold(ConverterType t);

// ---------------------------------------------------------------------------
// Configuration for a converter (fixed for the converter's lifetime).
// ---------------------------------------------------------------------------
struct ConverterConfig {
    uint8_t threshold = 128;    // 0..255, meaning depends on the algorithm
    bool    invert    = false;  // flip every sampled dot
};

// ---------------------------------------------------------------------------
// Converter: grayscale image -> Braille text.
// No state is carried between calls, so one instance may be shared or swapped
// at any frame boundary.
// ---------------------------------------------------------------------------
class Converter {
public:
    explicit Converter(const ConverterConfig& cfg) : m_cfg(cfg) {}
    virtual ~Converter() = default;

    // Core API: consume one ImageFrame, produce grid.rows lines of grid.cols glyphs.
    // Returns false (and clears 'out') if img is not a usable GRAY8 view.
    virtual bool convert(const msg::ImageFrame& img,
                         const braille::GridSize& grid,
                         std::string& out) const = 0;

    virtual ConverterType type() const = 0;

    const ConverterConfig& config() const { return m_cfg; }

protected:
    ConverterConfig m_cfg{};
};

// ---------------------------------------------------------------------------
// ThresholdConverter: binarizes the full image, then samples the 0/255 buffer
// through braille::renderBinary. Dithering algorithms only implement binarize().
// ---------------------------------------------------------------------------
class ThresholdConverter : public Converter {
public:
    using Converter::Converter;

    bool convert(const msg::ImageFrame& img,
                 const braille::GridSize& grid,
                 std::string& out) const override;

    // Fills 'binary' with img.width*img.height packed bytes (0 or 255).
    // img must be valid().
    virtual void binarize(const msg::ImageFrame& img,
                          std::vector<uint8_t>& binary) const = 0;
};

std::unique_ptr<Converter> MakeConverter(ConverterType type, const ConverterConfig& cfg);

} // namespace dith
