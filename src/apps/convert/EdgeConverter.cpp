#include "apps/convert/EdgeConverter.hpp"
#include "braille/BrailleCodec.hpp"

namespace {

static inline uint32_t absDiff(uint8_t a, uint8_t b) {
    return (a > b) ? uint32_t(a - b) : uint32_t(b - a);
}

} // anonymous namespace

namespace dith {

uint32_t EdgeConverter::meanGradient(const msg::ImageFrame& img, uint32_t x, uint32_t y) {
    const uint8_t center = img.at(x, y);

    uint32_t gradient = 0;
    uint32_t count = 0;

    // 4-connected neighbours, border pixels simply have fewer of them
    if (x > 0) {
        gradient += absDiff(center, img.at(x - 1, y));
        count++;
    }
    if (x + 1 < img.width) {
        gradient += absDiff(center, img.at(x + 1, y));
        count++;
    }
    if (y > 0) {
        gradient += absDiff(center, img.at(x, y - 1));
        count++;
    }
    if (y + 1 < img.height) {
        gradient += absDiff(center, img.at(x, y + 1));
        count++;
    }

    if (count == 0) return 0;
    return gradient / count;
}

bool EdgeConverter::dotOn(const msg::ImageFrame& img, uint32_t x, uint32_t y) const {
    const bool edge = meanGradient(img, x, y) > m_cfg.threshold;
    return edge != m_cfg.invert;
}

bool EdgeConverter::convert(const msg::ImageFrame& img,
                            const braille::GridSize& grid,
                            std::string& out) const {
    out.clear();
    if (!img.valid()) return false;

    const braille::GridSize g{grid.cols == 0 ? 1u : grid.cols, grid.rows == 0 ? 1u : grid.rows};
    const braille::SampleMap map = braille::SampleMap::For(img.width, img.height, g);

    out.reserve(braille::textSize(g.cols, g.rows));

    for (uint32_t row = 0; row < g.rows; ++row) {
        for (uint32_t col = 0; col < g.cols; ++col) {
            uint8_t pattern = 0;

            for (uint32_t i = 0; i < braille::DOTS_PER_CELL; ++i) {
                const uint32_t sx = map.srcX(col * braille::CELL_W + braille::DOT_OFFSETS[i].dx);
                const uint32_t sy = map.srcY(row * braille::CELL_H + braille::DOT_OFFSETS[i].dy);

                if (sx >= img.width || sy >= img.height) continue;

                if (dotOn(img, sx, sy)) {
                    pattern |= static_cast<uint8_t>(1u << i);
                }
            }

            braille::append(out, pattern);
        }
        out.push_back('\n');
    }

    return true;
}

} // namespace dith
