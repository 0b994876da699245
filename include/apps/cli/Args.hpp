#pragma once
#include <cstdint>
#include <string>

#include "apps/capture/FrameProvider.hpp"
#include "apps/convert/Converter.hpp"
#include "platform/linux/CameraCapture.hpp"

namespace dith {

enum class SourceKind : uint8_t {
    CAMERA = 0,
    FILE,
};

// ------------------------------
// Config
// ------------------------------
struct AppConfig {
    SourceKind  source = SourceKind::CAMERA;
    std::string path;                       // --source file

    // Camera
    std::string  device = "/dev/video0";
    uint32_t     width  = 640;
    uint32_t     height = 480;
    CameraPixFmt pixfmt = CameraPixFmt::YUYV;

    CaptureStrategy strategy = CaptureStrategy::PIPELINED;
    uint32_t warmup = 3;                    // frames dropped before the pipeline starts

    // Conversion
    ConverterType   mode = ConverterType::EDGE;
    ConverterConfig conv{DefaultThreshold(ConverterType::EDGE), false};

    // Output
    uint32_t fps  = 60;                     // frame-rate cap
    uint32_t cols = 0;                      // 0: fit to the terminal
    bool     stats = false;

    bool help = false;
};

static constexpr uint32_t FPS_MIN = 1;
static constexpr uint32_t FPS_MAX = 240;

// Fills 'out' from argv. On false, 'err' says what was wrong.
// --help sets out.help and stops parsing.
bool ParseArgs(int argc, char** argv, AppConfig& out, std::string& err);

void PrintUsage(const char* exe);

} // namespace dith
