#include "apps/cli/Args.hpp"
#include "apps/capture/FrameProvider.hpp"
#include "apps/convert/Converter.hpp"
#include "apps/term/Terminal.hpp"
#include "braille/Geometry.hpp"
#include "platform/ImageFileSource.hpp"
#include "platform/linux/CameraCapture.hpp"

#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <new>
#include <sstream>
#include <string>
#include <unistd.h>

#include "os/rtos.hpp"

using namespace dith;

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) {
    g_stop = 1;
}

static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

// --cols pins the width; otherwise fit inside the terminal (80x24 if unknown).
static braille::GridSize grid_for(const AppConfig& cfg, const msg::ImageFrame& f, bool reserve_row) {
    if (cfg.cols > 0) {
        braille::GridSize g{};
        g.cols = cfg.cols;
        g.rows = braille::rowsForCols(f.width, f.height, cfg.cols);
        return g;
    }

    TermSize ts{};
    if (!GetTermSize(ts)) ts = TermSize{};

    uint32_t rows = ts.rows;
    if (reserve_row && rows > 1) rows -= 1;
    return braille::dimensionsToFit(f.width, f.height, ts.cols, rows);
}

static double ms_between(uint64_t a_us, uint64_t b_us) {
    return static_cast<double>(b_us - a_us) / 1000.0;
}

// === Static image: render once ===
static int run_file(const AppConfig& cfg, const Converter& conv) {
    ImageFileSource src(cfg.path);
    if (!src.Open()) {
        std::cerr << "[MAIN] Cannot open " << cfg.path << ": "
                  << SourceStatusStr(src.lastStatus()) << "\n";
        return 1;
    }

    msg::ImageFrame frame{};
    if (!src.Capture(frame)) {
        std::cerr << "[MAIN] Capture failed: " << SourceStatusStr(src.lastStatus()) << "\n";
        return 1;
    }

    std::string text;
    if (!conv.convert(frame, grid_for(cfg, frame, false), text)) {
        std::cerr << "[MAIN] Conversion failed for " << cfg.path << "\n";
        return 1;
    }

    std::string screen;
    AppendClearScreen(screen);
    screen += text;

    if (!WriteAll(STDOUT_FILENO, screen)) {
        std::cerr << "[MAIN] stdout write failed\n";
        return 1;
    }
    return 0;
}

// === Camera: warm up, start provider, render until signalled ===
static int run_camera(const AppConfig& cfg, const Converter& conv) {
    CameraCaptureConfig cam_cfg{};
    cam_cfg.dev    = cfg.device.c_str();
    cam_cfg.width  = cfg.width;
    cam_cfg.height = cfg.height;
    cam_cfg.pixfmt = cfg.pixfmt;

    CameraCapture cam(cam_cfg);
    if (!cam.Open()) {
        std::cerr << "[MAIN] Camera open failed: " << SourceStatusStr(cam.lastStatus())
                  << " errno=" << cam.lastErrno() << "\n";
        return 1;
    }

    if (!DiscardWarmupFrames(cam, cfg.warmup)) {
        std::cerr << "[MAIN] Warm-up failed\n";
        return 1;
    }

    std::unique_ptr<FrameProvider> provider = MakeFrameProvider(cfg.strategy, cam);
    if (!provider || !provider->Start()) {
        std::cerr << "[MAIN] Frame provider (" << StrategyStr(cfg.strategy) << ) failed to start: "
                  << provider->lastErrorStr() << "\n";
        return 1;
    }

    std::cerr << "[MAIN] Streaming mode=" << TypeStr(conv.type())
              << " strategy=" << StrategyStr(cfg.strategy)
              << " fps=" << cfg.fps << "\n";

    const uint64_t target_us = 1000000ull / cfg.fps;

    std::string text;
    std::string screen;
    int rc = 0;

    while (!g_stop) {
        const uint64_t t_start = Rtos::NowUs();

        msg::ImageFrame frame{};
        if (!provider->NextFrame(frame)) {
            std::cerr << "[MAIN] No frame: " << provider->lastErrorStr() << "\n";
            rc = 1;
            break;
        }

        const uint64_t t_conv = Rtos::NowUs();
        if (!conv.convert(frame, grid_for(cfg, frame, cfg.stats), text)) {
            std::cerr << "[MAIN] Conversion failed id=" << frame.frame_id << "\n";
            rc = 1;
            break;
        }
        const uint64_t t_conv_end = Rtos::NowUs();

        screen.clear();
        AppendClearScreen(screen);
        screen += text;
        if (!WriteAll(STDOUT_FILENO, screen)) {
            std::cerr << "[MAIN] stdout write failed\n";
            rc = 1;
            break;
        }
        const uint64_t t_render_end = Rtos::NowUs();

        if (cfg.stats) {
            const double total_ms = ms_between(t_start, t_render_end);
            const double fps = total_ms > 0.0 ? 1000.0 / total_ms : 0.0;

            std::ostringstream line;
            line << std::fixed << std::setprecision(1)
                 << "FPS: " << fps
                 << " | Convert: " << ms_between(t_conv, t_conv_end) << "ms"
                 << " | Render: " << ms_between(t_conv_end, t_render_end) << "ms"
                 << " | Total: " << total_ms << "ms";
            if (!WriteAll(STDOUT_FILENO, line.str())) {
                rc = 1;
                break;
            }
        }

        // Frame-rate cap
        const uint64_t elapsed = Rtos::NowUs() - t_start;
        if (elapsed < target_us) {
            Rtos::SleepMs(static_cast<int>((target_us - elapsed) / 1000));
        }
    }

    provider->Stop();
    cam.Close();
    std::cerr << "\n[MAIN] Stopped\n";
    return rc;
}

int main(int argc, char** argv) {
    AppConfig cfg{};
    std::string err;
    if (!ParseArgs(argc, argv, cfg, err)) {
        std::cerr << err << "\n";
        PrintUsage(argv[0]);
        return 1;
    }
    if (cfg.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    try {
        std::unique_ptr<Converter> conv = MakeConverter(cfg.mode, cfg.conv);
        if (!conv) {
            std::cerr << "[MAIN] No converter for mode " << TypeStr(cfg.mode) << "\n";
            return 1;
        }

        if (cfg.source == SourceKind::FILE) {
            return run_file(cfg, *conv);
        }

        install_signal_handlers();
        return run_camera(cfg, *conv);
    } catch (const std::bad_alloc&) {
        std::cerr << "[MAIN] Out of memory\n";
        return 1;
    }
}
