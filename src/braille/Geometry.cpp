#include "braille/Geometry.hpp"
#include "braille/BrailleCodec.hpp"

namespace braille {

GridSize dimensionsToFit(uint32_t src_w, uint32_t src_h,
                         uint32_t bound_cols, uint32_t bound_rows) {
    GridSize out{};
    if (src_w == 0 || src_h == 0 || bound_cols == 0 || bound_rows == 0) {
        return out; // degenerate -> 1x1
    }

    const float scale_w = static_cast<float>(src_w) / static_cast<float>(bound_cols * CELL_W);
    const float scale_h = static_cast<float>(src_h) / static_cast<float>(bound_rows * CELL_H);

    // The larger scale gives the smaller output, so both bounds hold.
    const float scale = (scale_w > scale_h) ? scale_w : scale_h;

    const uint32_t out_px_w = static_cast<uint32_t>(static_cast<float>(src_w) / scale);
    const uint32_t out_px_h = static_cast<uint32_t>(static_cast<float>(src_h) / scale);

    const uint32_t cols = out_px_w / CELL_W;
    const uint32_t rows = out_px_h / CELL_H;

    out.cols = (cols == 0) ? 1 : cols;
    out.rows = (rows == 0) ? 1 : rows;
    return out;
}

uint32_t rowsForCols(uint32_t src_w, uint32_t src_h, uint32_t target_cols) {
    if (src_w == 0 || src_h == 0 || target_cols == 0) return 1;

    const float scale = static_cast<float>(src_w) / static_cast<float>(target_cols * CELL_W);

    // Same scale on both axes (1:1 pixel aspect)
    const float out_px_h = static_cast<float>(src_h) / scale;
    const uint32_t rows = static_cast<uint32_t>(out_px_h) / CELL_H;

    return (rows == 0) ? 1 : rows;
}

SampleMap SampleMap::For(uint32_t src_w, uint32_t src_h, const GridSize& grid) {
    SampleMap m{};
    const uint32_t cols = (grid.cols == 0) ? 1 : grid.cols;
    const uint32_t rows = (grid.rows == 0) ? 1 : grid.rows;
    m.scale_x = static_cast<float>(src_w) / static_cast<float>(cols * CELL_W);
    m.scale_y = static_cast<float>(src_h) / static_cast<float>(rows * CELL_H);
    return m;
}

} // namespace braille
