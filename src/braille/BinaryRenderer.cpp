#include "braille/BinaryRenderer.hpp"
#include "braille/BrailleCodec.hpp"

namespace braille {

void renderBinary(const std::vector<uint8_t>& binary,
                  uint32_t width, uint32_t height,
                  const GridSize& grid, bool invert,
                  std::string& out) {
    const GridSize g{grid.cols == 0 ? 1u : grid.cols, grid.rows == 0 ? 1u : grid.rows};
    const SampleMap map = SampleMap::For(width, height, g);

    out.clear();
    out.reserve(textSize(g.cols, g.rows));

    for (uint32_t row = 0; row < g.rows; ++row) {
        const uint32_t base_y = row * CELL_H;

        for (uint32_t col = 0; col < g.cols; ++col) {
            const uint32_t base_x = col * CELL_W;
            uint8_t pattern = 0;

            for (uint32_t i = 0; i < DOTS_PER_CELL; ++i) {
                const uint32_t sx = map.srcX(base_x + DOT_OFFSETS[i].dx);
                const uint32_t sy = map.srcY(base_y + DOT_OFFSETS[i].dy);

                if (sx >= width || sy >= height) continue;

                const std::size_t idx = static_cast<std::size_t>(sy) * width + sx;
                if (idx >= binary.size()) continue;

                const bool on = (binary[idx] != 0) != invert;
                if (on) pattern |= static_cast<uint8_t>(1u << i);
            }

            append(out, pattern);
        }
        out.push_back('\n');
    }
}

} // namespace braille
