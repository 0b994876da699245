#include "braille/BinaryRenderer.hpp"
#include "braille/BrailleCodec.hpp"
#include <iostream>
#include <string>
#include <vector>

static int g_failures = 0;

static void check(const char* name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static std::string glyphLine(uint8_t pattern) {
    std::string s;
    braille::append(s, pattern);
    s.push_back('\n');
    return s;
}

int main() {
    using namespace braille;

    std::cout << "=== braille_renderer_test ===\n";

    const GridSize one{1, 1};

    {
        std::cout << "\n[Test 0] Single cell, one dot at a time\n";
        // 2x4 buffer, one byte per dot position
        for (uint32_t i = 0; i < DOTS_PER_CELL; ++i) {
            std::vector<uint8_t> bin(8, 0);
            bin[DOT_OFFSETS[i].dy * 2 + DOT_OFFSETS[i].dx] = 255;

            std::string out;
            renderBinary(bin, 2, 4, one, false, out);

            const std::string name = "dot " + std::to_string(i) + " -> bit " + std::to_string(i);
            check(name.c_str(), out == glyphLine(static_cast<uint8_t>(1u << i)));
        }
    }

    {
        std::cout << "\n[Test 1] All on / all off / invert\n";
        std::vector<uint8_t> on(8, 1);    // any non-zero counts as on
        std::vector<uint8_t> off(8, 0);
        std::string out;

        renderBinary(on, 2, 4, one, false, out);
        check("all on -> U+28FF", out == glyphLine(0xFF));

        renderBinary(off, 2, 4, one, false, out);
        check("all off -> U+2800", out == glyphLine(0x00));

        renderBinary(off, 2, 4, one, true, out);
        check("all off inverted -> U+28FF", out == glyphLine(0xFF));
    }

    {
        std::cout << "\n[Test 2] Output length == rows * (cols*3 + 1)\n";
        std::vector<uint8_t> bin(37 * 23, 0);
        for (std::size_t i = 0; i < bin.size(); i += 3) bin[i] = 255;

        const GridSize grids[] = {{1, 1}, {5, 3}, {40, 12}, {80, 24}};
        for (const GridSize& g : grids) {
            std::string out;
            renderBinary(bin, 37, 23, g, false, out);
            const std::string name = std::to_string(g.cols) + "x" + std::to_string(g.rows);
            check(name.c_str(), out.size() == textSize(g.cols, g.rows));
        }
    }

    {
        std::cout << "\n[Test 3] Rows end in newline, output replaced\n";
        std::vector<uint8_t> bin(16 * 16, 255);
        std::string out = "stale";
        renderBinary(bin, 16, 16, GridSize{4, 3}, false, out);

        bool newlines = true;
        const std::size_t line = 4 * GLYPH_BYTES + 1;
        for (uint32_t r = 0; r < 3; ++r) newlines = newlines && out[r * line + line - 1] == '\n';
        check("3 newline-terminated rows", newlines && out.size() == 3 * line);
        check("previous contents dropped", out.compare(0, 5, "stale") != 0);
    }

    {
        std::cout << "\n[Test 4] Zero grid dims are treated as 1\n";
        std::vector<uint8_t> bin(8, 255);
        std::string out;
        renderBinary(bin, 2, 4, GridSize{0, 0}, false, out);
        check("1x1 output", out == glyphLine(0xFF));
    }

    if (g_failures) {
        std::cout << "\nbraille_renderer_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nbraille_renderer_test: PASS\n";
    return 0;
}
