#pragma once
#include <cstdint>

namespace braille {

// Output grid in Braille cells. Always at least 1x1.
struct GridSize {
    uint32_t cols = 1;
    uint32_t rows = 1;
};

// Largest grid that fits inside bound_cols x bound_rows while keeping the
// source aspect ratio (one cell = 2x4 source pixels at 1:1 scale).
GridSize dimensionsToFit(uint32_t src_w, uint32_t src_h,
                         uint32_t bound_cols, uint32_t bound_rows);

// Rows needed to show the whole source when its width is mapped to target_cols.
uint32_t rowsForCols(uint32_t src_w, uint32_t src_h, uint32_t target_cols);

// ---------------------------------------------------------------------------
// SampleMap: output-pixel -> source-pixel mapping for one conversion.
// One scale per axis per call; coordinates are truncated (nearest-floor),
// never interpolated.
// ---------------------------------------------------------------------------
struct SampleMap {
    float scale_x = 1.0f;
    float scale_y = 1.0f;

    static SampleMap For(uint32_t src_w, uint32_t src_h, const GridSize& grid);

    uint32_t srcX(uint32_t out_x) const {
        return static_cast<uint32_t>(static_cast<float>(out_x) * scale_x);
    }
    uint32_t srcY(uint32_t out_y) const {
        return static_cast<uint32_t>(static_cast<float>(out_y) * scale_y);
    }
};

} // namespace braille
