// convert_errordiffusion_test.cpp
//
// Checks the diffusion kernels share by share. A source pixel below threshold
// pushes its error to its neighbours; every other kernel position holds a
// "compensator" that lands exactly on 255 (zero error of its own), so the pixel
// under test sees only the share from the source.

#include "apps/convert/AtkinsonConverter.hpp"
#include "apps/convert/FloydSteinbergConverter.hpp"

#include <iostream>
#include <string>
#include <vector>

static int g_failures = 0;

static void check(const std::string& name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

struct Pos {
    uint32_t x;
    uint32_t y;
};

static msg::ImageFrame frameOf(const std::vector<uint8_t>& px, uint32_t w, uint32_t h) {
    msg::ImageFrame f{};
    f.data   = px.data();
    f.width  = w;
    f.height = h;
    f.stride = w;
    return f;
}

static double onFraction(const std::vector<uint8_t>& bin) {
    std::size_t on = 0;
    for (uint8_t v : bin) on += (v != 0);
    return static_cast<double>(on) / static_cast<double>(bin.size());
}

int main() {
    using namespace dith;

    std::cout << "=== convert_errordiffusion_test ===\n";

    // ---------------- Atkinson ----------------
    // 5x3, source 96 at (1,0): share = 96/8 = 12 to six neighbours (6/8 of the error)
    const uint32_t AW = 5, AH = 3;
    const Pos atk_src{1, 0};
    const Pos atk_nb[] = {{2, 0}, {3, 0}, {0, 1}, {1, 1}, {2, 1}, {1, 2}};
    const uint8_t ATK_SHARE = 12;

    auto atkImage = [&](const Pos& probe, uint8_t probe_val) {
        std::vector<uint8_t> px(AW * AH, 0);
        px[atk_src.y * AW + atk_src.x] = 96;
        for (const Pos& p : atk_nb) px[p.y * AW + p.x] = 255 - ATK_SHARE;
        px[probe.y * AW + probe.x] = probe_val;
        return px;
    };

    const AtkinsonConverter atk;

    {
        std::cout << "\n[Test 0] Atkinson: each of the six neighbours gets error/8\n";
        for (const Pos& p : atk_nb) {
            const std::string at = "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
            std::vector<uint8_t> bin;

            // 116 + 12 == 128 -> on
            std::vector<uint8_t> hi = atkImage(p, 128 - ATK_SHARE);
            atk.binarize(frameOf(hi, AW, AH), bin);
            check(at + " 116 -> on", bin[p.y * AW + p.x] == 255);

            // 115 + 12 == 127 -> off
            std::vector<uint8_t> lo = atkImage(p, 127 - ATK_SHARE);
            atk.binarize(frameOf(lo, AW, AH), bin);
            check(at + " 115 -> off", bin[p.y * AW + p.x] == 0);
        }
    }

    {
        std::cout << "\n[Test 1] Atkinson: positions outside the kernel get nothing\n";
        const Pos outside[] = {{4, 0}, {3, 1}, {0, 2}, {4, 2}};
        for (const Pos& p : outside) {
            const std::string at = "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
            std::vector<uint8_t> bin;

            std::vector<uint8_t> lo = atkImage(p, 127);
            atk.binarize(frameOf(lo, AW, AH), bin);
            check(at + " 127 -> off", bin[p.y * AW + p.x] == 0);

            std::vector<uint8_t> hi = atkImage(p, 128);
            atk.binarize(frameOf(hi, AW, AH), bin);
            check(at + " 128 -> on", bin[p.y * AW + p.x] == 255);
        }
    }

    // ---------------- Floyd-Steinberg ----------------
    // 4x2, source 112 at (1,0): 7/16=49 right, 3/16=21 down-left, 5/16=35 down, 1/16=7 down-right
    const uint32_t FW = 4, FH = 2;
    const Pos fs_src{1, 0};
    struct Share { Pos p; uint8_t share; };
    const Share fs_nb[] = {{{2, 0}, 49}, {{0, 1}, 21}, {{1, 1}, 35}, {{2, 1}, 7}};

    auto fsImage = [&](const Pos& probe, uint8_t probe_val) {
        std::vector<uint8_t> px(FW * FH, 0);
        px[fs_src.y * FW + fs_src.x] = 112;
        for (const Share& s : fs_nb) px[s.p.y * FW + s.p.x] = static_cast<uint8_t>(255 - s.share);
        px[probe.y * FW + probe.x] = probe_val;
        return px;
    };

    const FloydSteinbergConverter fs;

    {
        std::cout << "\n[Test 2] Floyd-Steinberg: 7/16, 3/16, 5/16, 1/16 (all of the error)\n";
        uint32_t total = 0;
        for (const Share& s : fs_nb) {
            total += s.share;
            const std::string at = "(" + std::to_string(s.p.x) + "," + std::to_string(s.p.y) + ")";
            std::vector<uint8_t> bin;

            std::vector<uint8_t> hi = fsImage(s.p, static_cast<uint8_t>(128 - s.share));
            fs.binarize(frameOf(hi, FW, FH), bin);
            check(at + " share " + std::to_string(s.share) + " reaches 128 -> on", bin[s.p.y * FW + s.p.x] == 255);

            std::vector<uint8_t> lo = fsImage(s.p, static_cast<uint8_t>(127 - s.share));
            fs.binarize(frameOf(lo, FW, FH), bin);
            check(at + " share " + std::to_string(s.share) + " stops at 127 -> off", bin[s.p.y * FW + s.p.x] == 0);
        }
        check("shares sum to the full error (112)", total == 112);
    }

    {
        std::cout << "\n[Test 3] Floyd-Steinberg: positions outside the kernel get nothing\n";
        const Pos outside[] = {{3, 0}, {3, 1}};
        for (const Pos& p : outside) {
            const std::string at = "(" + std::to_string(p.x) + "," + std::to_string(p.y) + ")";
            std::vector<uint8_t> bin;

            std::vector<uint8_t> lo = fsImage(p, 127);
            fs.binarize(frameOf(lo, FW, FH), bin);
            check(at + " 127 -> off", bin[p.y * FW + p.x] == 0);

            std::vector<uint8_t> hi = fsImage(p, 128);
            fs.binarize(frameOf(hi, FW, FH), bin);
            check(at + " 128 -> on", bin[p.y * FW + p.x] == 255);
        }
    }

    {
        std::cout << "\n[Test 4] Flat gray: FS keeps the mean, Atkinson pushes contrast\n";
        const uint32_t N = 64;
        std::vector<uint8_t> dark(N * N, 64);
        std::vector<uint8_t> light(N * N, 192);
        std::vector<uint8_t> bin_fs, bin_atk;

        fs.binarize(frameOf(dark, N, N), bin_fs);
        atk.binarize(frameOf(dark, N, N), bin_atk);
        const double fs_dark = onFraction(bin_fs);
        const double atk_dark = onFraction(bin_atk);
        std::cout << "  gray 64: fs=" << fs_dark << " atkinson=" << atk_dark << "\n";
        check("FS on-fraction near 64/255", fs_dark > 0.22 && fs_dark < 0.28);
        check("Atkinson darker than FS", atk_dark < fs_dark);

        fs.binarize(frameOf(light, N, N), bin_fs);
        atk.binarize(frameOf(light, N, N), bin_atk);
        const double fs_light = onFraction(bin_fs);
        const double atk_light = onFraction(bin_atk);
        std::cout << "  gray 192: fs=" << fs_light << " atkinson=" << atk_light << "\n";
        check("FS on-fraction near 192/255", fs_light > 0.72 && fs_light < 0.78);
        check("Atkinson lighter than FS", atk_light > fs_light);
    }

    {
        std::cout << "\n[Test 5] Padded stride is honoured\n";
        // 3x2 image in rows of 8 bytes; padding is 255 and must never be read as a pixel
        std::vector<uint8_t> px(8 * 2, 255);
        for (uint32_t y = 0; y < 2; ++y)
            for (uint32_t x = 0; x < 3; ++x) px[y * 8 + x] = 0;

        msg::ImageFrame f{};
        f.data = px.data();
        f.width = 3;
        f.height = 2;
        f.stride = 8;

        std::vector<uint8_t> bin;
        fs.binarize(f, bin);
        bool all_off = bin.size() == 6;
        for (uint8_t v : bin) all_off = all_off && v == 0;
        check("FS: black image stays black", all_off);

        atk.binarize(f, bin);
        all_off = bin.size() == 6;
        for (uint8_t v : bin) all_off = all_off && v == 0;
        check("Atkinson: black image stays black", all_off);
    }

    if (g_failures) {
        std::cout << "\nconvert_errordiffusion_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nconvert_errordiffusion_test: PASS\n";
    return 0;
}
