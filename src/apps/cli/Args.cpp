#include "apps/cli/Args.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>

namespace {

// Decimal only, whole string, inside [lo, hi]
static bool parse_u32(const char* s, uint32_t lo, uint32_t hi, uint32_t& out) {
    if (!s || *s == '\0' || *s == '-' || *s == '+') return false;

    errno = 0;
    char* end = nullptr;
    const unsigned long v = std::strtoul(s, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    if (v < lo || v > hi) return false;

    out = static_cast<uint32_t>(v);
    return true;
}

} // anonymous namespace

namespace dith {

static inline void sanitise(AppConfig& cfg) {
    if (cfg.fps < FPS_MIN) cfg.fps = FPS_MIN;
    if (cfg.fps > FPS_MAX) cfg.fps = FPS_MAX;
    if (cfg.width == 0)  cfg.width  = 640;
    if (cfg.height == 0) cfg.height = 480;
}

bool ParseArgs(int argc, char** argv, AppConfig& out, std::string& err) {
    bool have_source = false;
    bool have_threshold = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                err = std::string("Missing value for ") + name;
                return nullptr;
            }
            return argv[++i];
        };

        auto bad_value = [&](const char* name, const char* v) {
            err = std::string("Invalid value for ") + name + ": " + v;
            return false;
        };

        if (a == "--help" || a == "-h") {
            out.help = true;
            return true;
        } else if (a == "--source") {
            const char* v = need_value("--source");
            if (!v) return false;
            const std::string s = v;
            if (s == "cam")       out.source = SourceKind::CAMERA;
            else if (s == "file") out.source = SourceKind::FILE;
            else return bad_value("--source", v);
            have_source = true;
        } else if (a == "--path") {
            const char* v = need_value("--path");
            if (!v) return false;
            out.path = v;
        } else if (a == "--device") {
            const char* v = need_value("--device");
            if (!v) return false;
            out.device = v;
        } else if (a == "--width") {
            const char* v = need_value("--width");
            if (!v) return false;
            if (!parse_u32(v, 1, 16384, out.width)) return bad_value("--width", v);
        } else if (a == "--height") {
            const char* v = need_value("--height");
            if (!v) return false;
            if (!parse_u32(v, 1, 16384, out.height)) return bad_value("--height", v);
        } else if (a == "--pixfmt") {
            const char* v = need_value("--pixfmt");
            if (!v) return false;
            const std::string s = v;
            if (s == "grey")      out.pixfmt = CameraPixFmt::GREY;
            else if (s == "yuyv") out.pixfmt = CameraPixFmt::YUYV;
            else return bad_value("--pixfmt", v);
        } else if (a == "--mode") {
            const char* v = need_value("--mode");
            if (!v) return false;
            if (!ParseConverterType(v, out.mode)) return bad_value("--mode", v);
        } else if (a == "--threshold") {
            const char* v = need_value("--threshold");
            if (!v) return false;
            uint32_t t = 0;
            if (!parse_u32(v, 0, 255, t)) return bad_value("--threshold", v);
            out.conv.threshold = static_cast<uint8_t>(t);
            have_threshold = true;
        } else if (a == "--invert") {
            out.conv.invert = true;
        } else if (a == "--strategy") {
            const char* v = need_value("--strategy");
            if (!v) return false;
            if (!ParseCaptureStrategy(v, out.strategy)) return bad_value("--strategy", v);
        } else if (a == "--warmup") {
            const char* v = need_value("--warmup");
            if (!v) return false;
            if (!parse_u32(v, 0, 1000, out.warmup)) return bad_value("--warmup", v);
        } else if (a == "--fps") {
            const char* v = need_value("--fps");
            if (!v) return false;
            if (!parse_u32(v, FPS_MIN, FPS_MAX, out.fps)) return bad_value("--fps", v);
        } else if (a == "--cols") {
            const char* v = need_value("--cols");
            if (!v) return false;
            if (!parse_u32(v, 1, 4096, out.cols)) return bad_value("--cols", v);
        } else if (a == "--stats") {
            out.stats = true;
        } else {
            err = "Unknown argument: " + a;
            return false;
        }
    }

    if (!have_source) {
        err = "Missing --source";
        return false;
    }
    if (out.source == SourceKind::FILE && out.path.empty()) {
        err = "--source file requires --path";
        return false;
    }

    // The threshold's meaning depends on the mode, so the default follows it
    if (!have_threshold) out.conv.threshold = DefaultThreshold(out.mode);

    sanitise(out);
    return true;
}

void PrintUsage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " --source cam|file [--path FILE]\n"
        << "       [--device DEV] [--width N] [--height N] [--pixfmt grey|yuyv]\n"
        << "       [--mode edge|atkinson|floyd_steinberg|bayer|blue_noise]\n"
        << "       [--threshold 0..255] [--invert]\n"
        << "       [--strategy direct|pipelined] [--warmup N] [--fps N]\n"
        << "       [--cols N] [--stats] [--help]\n"
        << "\nExample:\n"
        << "  " << exe << " --source cam --mode atkinson --strategy pipelined --stats\n"
        << "  " << exe << " --source file --path photo.png --mode bayer\n";
}

} // namespace dith
