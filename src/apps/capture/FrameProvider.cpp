#include "apps/capture/FrameProvider.hpp"
#include "apps/capture/DirectCapture.hpp"
#include "apps/capture/PipelinedCapture.hpp"

#include <iostream>

namespace dith {

const char* StrategyStr(CaptureStrategy s) {
    switch (s) {
        case CaptureStrategy::DIRECT:    return "direct";
        case CaptureStrategy::PIPELINED: return "pipelined";
        default:                         return "unknown";
    }
}

bool ParseCaptureStrategy(const std::string& name, CaptureStrategy& out) {
    if (name == StrategyStr(CaptureStrategy::DIRECT)) {
        out = CaptureStrategy::DIRECT;
        return true;
    }
    if (name == StrategyStr(CaptureStrategy::PIPELINED)) {
        out = CaptureStrategy::PIPELINED;
        return true;
    }
    return false;
}

bool DiscardWarmupFrames(IFrameSource& src, uint32_t n) {
    msg::ImageFrame f{};
    for (uint32_t i = 0; i < n; ++i) {
        if (!src.Capture(f)) {
            std::cerr << "[PIPELINE] Warm-up frame " << i << " failed: "
                      << SourceStatusStr(src.lastStatus())
                      << " errno=" << src.lastErrno() << "\n";
            return false;
        }
    }
    return true;
}

std::unique_ptr<FrameProvider> MakeFrameProvider(CaptureStrategy s, IFrameSource& src) {
    switch (s) {
        case CaptureStrategy::DIRECT:    return std::make_unique<DirectCapture>(src);
        case CaptureStrategy::PIPELINED: return std::make_unique<PipelinedCapture>(src);
        default:                         return nullptr;
    }
}

} // namespace dith
