#pragma once
#include "apps/capture/FrameProvider.hpp"

namespace dith {

// Pass-through: every NextFrame() is one blocking Capture() on the caller's thread.
class DirectCapture : public FrameProvider {
public:
    explicit DirectCapture(IFrameSource& src) : m_src(src) {}

    bool Start() override { return true; }
    bool NextFrame(msg::ImageFrame& out) override { return m_src.Capture(out); }
    void Stop() override {}

    const char* lastErrorStr() const override { return SourceStatusStr(m_src.lastStatus()); }

private:
    IFrameSource& m_src;
};

} // namespace dith
