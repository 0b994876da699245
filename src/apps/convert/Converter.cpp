#include "apps/convert/Converter.hpp"
#include "apps/convert/EdgeConverter.hpp"
#include "apps/convert/AtkinsonConverter.hpp"
#include "apps/convert/FloydSteinbergConverter.hpp"
#include "apps/convert/BayerConverter.hpp"
#include "apps/convert/BlueNoiseConverter.hpp"

#include "braille/BinaryRenderer.hpp"

namespace dith {

const char* TypeStr(ConverterType t) {
    switch (t) {
        case ConverterType::EDGE:            return "edge";
        case ConverterType::ATKINSON:        return "atkinson";
        case ConverterType::FLOYD_STEINBERG: return "floyd_steinberg";
        case ConverterType::BAYER:           return "bayer";
        case ConverterType::BLUE_NOISE:      return "blue_noise";
        default:                             return "unknown";
    }
}

bool ParseConverterType(const std::string& name, ConverterType& out) {
    static constexpr ConverterType ALL[] = {
        ConverterType::EDGE,
        ConverterType::ATKINSON,
        ConverterType::FLOYD_STEINBERG,
        ConverterType::BAYER,
        ConverterType::BLUE_NOISE,
    };
    for (ConverterType t : ALL) {
        if (name == TypeStr(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

uint8_t DefaultThreshold(ConverterType t) {
    return (t == ConverterType::EDGE) ? 2 : 128;
}

bool ThresholdConverter::convert(const msg::ImageFrame& img,
                                 const braille::GridSize& grid,
                                 std::string& out) const {
    out.clear();
    if (!img.valid()) return false;

    std::vector<uint8_t> binary;
    binarize(img, binary);

    braille::renderBinary(binary, img.width, img.height, grid, m_cfg.invert, out);
    return true;
}

std::unique_ptr<Converter> MakeConverter(ConverterType type, const ConverterConfig& cfg) {
    switch (type) {
        case ConverterType::EDGE:            return std::make_unique<EdgeConverter>(cfg);
        case ConverterType::ATKINSON:        return std::make_unique<AtkinsonConverter>(cfg);
        case ConverterType::FLOYD_STEINBERG: return std::make_unique<FloydSteinbergConverter>(cfg);
        case ConverterType::BAYER:           return std::make_unique<BayerConverter>(cfg);
        case ConverterType::BLUE_NOISE:      return std::make_unique<BlueNoiseConverter>(cfg);
        default:                             return nullptr;
    }
}

} // namespace dith
