#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "platform/IFrameSource.hpp"
#include "msg/ImageFrame.hpp"

namespace dith {

enum class CaptureStrategy : uint8_t {
    DIRECT = 0,     // capture on the render thread
    PIPELINED,      // background task + double buffer
};

// CLI names: direct, pipelined
const char* StrategyStr(CaptureStrategy s);
bool ParseCaptureStrategy(const std::string& name, CaptureStrategy& out);

// ---------------------------------------------------------------------------
// FrameProvider: what the render loop pulls frames from.
// The frame returned by NextFrame() stays valid until the next NextFrame() or
// Stop(). Stop() is idempotent.
// ---------------------------------------------------------------------------
class FrameProvider {
public:
    virtual bool Start() = 0;
    virtual bool NextFrame(msg::ImageFrame& out) = 0;
    virtual void Stop() = 0;

    // Why the last Start()/NextFrame() failed, for logging.
    virtual const char* lastErrorStr() const = 0;

    virtual ~FrameProvider() = default;
};

// Capture and drop n frames (auto-exposure settling). False on the first failed capture.
bool DiscardWarmupFrames(IFrameSource& src, uint32_t n);

// 'src' must outlive the returned provider.
std::unique_ptr<FrameProvider> MakeFrameProvider(CaptureStrategy s, IFrameSource& src);

} // namespace dith
