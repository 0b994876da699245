#pragma once
#include <atomic>
#include <cstdint>
#include <vector>

#include "os/rtos.hpp"

#include "apps/capture/FrameProvider.hpp"
#include "platform/IFrameSource.hpp"
#include "msg/ImageFrame.hpp"

namespace dith {

// Back-off after a failed capture in the background task
static constexpr int PIPELINE_RETRY_MS = 5;

// ---------------------------------------------------------------------------
//  PipelinedCapture
//  One background task captures continuously into the buffer the consumer is
//  not looking at. NextFrame() never waits for a new frame; it exposes the
//  latest completed one (possibly the same one again).
// ---------------------------------------------------------------------------
class PipelinedCapture : public FrameProvider {
public:
    explicit PipelinedCapture(IFrameSource& src);
    ~PipelinedCapture() override;

    PipelinedCapture(const PipelinedCapture&) = delete;
    PipelinedCapture& operator=(const PipelinedCapture&) = delete;

    // Captures the first frame synchronously, sizes both buffers from it and
    // spawns the capture task.
    bool Start() override;
    bool NextFrame(msg::ImageFrame& out) override;
    void Stop() override;

    // Pipeline fault if there is one, otherwise the source's status.
    const char* lastErrorStr() const override;

    // OSAL-compatible entry point, arg is the PipelinedCapture
    static void TaskEntry(void* arg);

    enum class Status : uint8_t {
        OK = 0,
        NOT_STARTED,
        FIRST_FRAME_FAIL,
        TASK_FAIL,
        FRAME_SIZE_CHANGED,
    };

    // FDIR FUNCTIONS
    static const char* StatusStr(Status s);

    Status lastStatus() const;

    // Frames copied by the task since Start() (first frame not included)
    uint32_t framesCaptured() const { return m_frames_captured.load(); }

private:
    // Task loop. Intended to be called only by the capture task.
    void Run();

    // Copies f row by row into m_bufs[idx] and publishes its metadata. Caller holds m_mtx.
    void storeFrame(const msg::ImageFrame& f, int idx);

    void releaseBuffers();

private:
    IFrameSource& m_src;

    Rtos::Task m_task;
    mutable Rtos::Mutex m_mtx;

    std::atomic<bool>     m_stop_requested{false};
    std::atomic<uint32_t> m_frames_captured{0};
    bool m_started = false;

    // Geometry of the first frame; every later frame must match it
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    uint32_t m_stride = 0;

    // ---- Guarded by m_mtx ----
    std::vector<uint8_t> m_bufs[2];
    msg::ImageFrame      m_meta[2]{};
    int m_latest_idx = 0;   // last completed buffer
    int m_read_idx = 0;     // buffer currently exposed to the consumer

    // FDIR
    Status m_status = Status::NOT_STARTED;
};

} // namespace dith
