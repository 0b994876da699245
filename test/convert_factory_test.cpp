#include "apps/convert/Converter.hpp"
#include "braille/BrailleCodec.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int g_failures = 0;

static void check(const std::string& name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static const dith::ConverterType ALL_TYPES[] = {
    dith::ConverterType::EDGE,
    dith::ConverterType::ATKINSON,
    dith::ConverterType::FLOYD_STEINBERG,
    dith::ConverterType::BAYER,
    dith::ConverterType::BLUE_NOISE,
};

int main() {
    using namespace dith;

    std::cout << "=== convert_factory_test ===\n";

    // 96x60 radial-ish test card: gradient plus a hard-edged square
    const uint32_t W = 96, H = 60;
    std::vector<uint8_t> px(W * H);
    for (uint32_t y = 0; y < H; ++y) {
        for (uint32_t x = 0; x < W; ++x) {
            uint8_t v = static_cast<uint8_t>((x * 255) / (W - 1));
            if (x >= 30 && x < 60 && y >= 15 && y < 45) v = 255 - v;
            px[y * W + x] = v;
        }
    }
    msg::ImageFrame img{};
    img.data = px.data();
    img.width = W;
    img.height = H;
    img.stride = W;

    {
        std::cout << "\n[Test 0] Names round-trip\n";
        for (ConverterType t : ALL_TYPES) {
            ConverterType parsed = ConverterType::EDGE;
            const bool ok = ParseConverterType(TypeStr(t), parsed);
            check(std::string(TypeStr(t)), ok && parsed == t);
        }
        ConverterType dummy = ConverterType::BAYER;
        check("unknown name rejected", !ParseConverterType("sobel", dummy) && dummy == ConverterType::BAYER);
        check("names are case sensitive", !ParseConverterType("Edge", dummy));
    }

    {
        std::cout << "\n[Test 1] Default thresholds\n";
        check("edge -> 2", DefaultThreshold(ConverterType::EDGE) == 2);
        check("atkinson -> 128", DefaultThreshold(ConverterType::ATKINSON) == 128);
        check("floyd_steinberg -> 128", DefaultThreshold(ConverterType::FLOYD_STEINBERG) == 128);
        check("bayer -> 128", DefaultThreshold(ConverterType::BAYER) == 128);
        check("blue_noise -> 128", DefaultThreshold(ConverterType::BLUE_NOISE) == 128);
    }

    {
        std::cout << "\n[Test 2] MakeConverter() builds the requested type\n";
        for (ConverterType t : ALL_TYPES) {
            ConverterConfig cfg{DefaultThreshold(t), true};
            std::unique_ptr<Converter> c = MakeConverter(t, cfg);
            const bool ok = c && c->type() == t && c->config().threshold == cfg.threshold && c->config().invert;
            check(std::string(TypeStr(t)), ok);
        }
    }

    {
        std::cout << "\n[Test 3] Output length == rows * (cols*3 + 1) for every converter\n";
        const braille::GridSize grids[] = {{1, 1}, {7, 3}, {48, 15}, {80, 24}, {200, 100}};
        for (ConverterType t : ALL_TYPES) {
            std::unique_ptr<Converter> c = MakeConverter(t, ConverterConfig{DefaultThreshold(t), false});
            bool all = true;
            for (const braille::GridSize& g : grids) {
                std::string out;
                all = all && c->convert(img, g, out);
                all = all && out.size() == braille::textSize(g.cols, g.rows);
            }
            check(std::string(TypeStr(t)), all);
        }
    }

    {
        std::cout << "\n[Test 4] invert changes the output for every converter\n";
        const braille::GridSize g{24, 8};
        for (ConverterType t : ALL_TYPES) {
            std::unique_ptr<Converter> plain = MakeConverter(t, ConverterConfig{DefaultThreshold(t), false});
            std::unique_ptr<Converter> inv   = MakeConverter(t, ConverterConfig{DefaultThreshold(t), true});
            std::string a, b;
            const bool ok = plain->convert(img, g, a) && inv->convert(img, g, b);
            check(std::string(TypeStr(t)), ok && a != b && a.size() == b.size());
        }
    }

    {
        std::cout << "\n[Test 5] Converters are stateless across calls\n";
        for (ConverterType t : ALL_TYPES) {
            std::unique_ptr<Converter> c = MakeConverter(t, ConverterConfig{DefaultThreshold(t), false});
            std::string first, second;
            (void)c->convert(img, braille::GridSize{30, 10}, first);
            (void)c->convert(img, braille::GridSize{30, 10}, second);
            check(std::string(TypeStr(t)), first == second);
        }
    }

    {
        std::cout << "\n[Test 6] Malformed input rejected by every converter\n";
        msg::ImageFrame bad = img;
        bad.stride = W - 1;
        for (ConverterType t : ALL_TYPES) {
            std::unique_ptr<Converter> c = MakeConverter(t, ConverterConfig{});
            std::string out = "junk";
            check(std::string(TypeStr(t)), !c->convert(bad, braille::GridSize{4, 4}, out) && out.empty());
        }
    }

    if (g_failures) {
        std::cout << "\nconvert_factory_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nconvert_factory_test: PASS\n";
    return 0;
}
