#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace braille {

// ---------------------------------------------------------------------------
// Braille cell layout (2 wide x 4 tall). Bit i of a dot pattern is dot i:
//
//   0 3      (0x01 0x08)
//   1 4      (0x02 0x10)
//   2 5      (0x04 0x20)
//   6 7      (0x40 0x80)
//
// Every converter samples the cell through this table so the glyphs agree.
// ---------------------------------------------------------------------------
static constexpr uint32_t CELL_W = 2;
static constexpr uint32_t CELL_H = 4;
static constexpr uint32_t DOTS_PER_CELL = 8;

struct DotOffset {
    uint8_t dx;
    uint8_t dy;
};

static constexpr std::array<DotOffset, DOTS_PER_CELL> DOT_OFFSETS = {{
    {0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 1}, {1, 2}, {0, 3}, {1, 3},
}};

static constexpr uint32_t CODEPOINT_BASE = 0x2800;

// Every Braille code point (U+2800..U+28FF) is a 3-byte UTF-8 sequence.
static constexpr uint32_t GLYPH_BYTES = 3;

using Glyph = std::array<uint8_t, GLYPH_BYTES>;

constexpr uint32_t codepoint(uint8_t pattern) {
    return CODEPOINT_BASE + pattern;
}

// 1110xxxx 10xxxxxx 10xxxxxx
constexpr Glyph encode(uint8_t pattern) {
    const uint32_t cp = codepoint(pattern);
    return Glyph{{
        static_cast<uint8_t>(0xE0 | ((cp >> 12) & 0x0F)),
        static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F)),
        static_cast<uint8_t>(0x80 | (cp & 0x3F)),
    }};
}

// Appends the 3 glyph bytes for 'pattern' to 'out'.
void append(std::string& out, uint8_t pattern);

// Bytes needed for a rows x cols grid, one '\n' per row.
constexpr std::size_t textSize(uint32_t cols, uint32_t rows) {
    return static_cast<std::size_t>(rows) * (static_cast<std::size_t>(cols) * GLYPH_BYTES + 1);
}

} // namespace braille
