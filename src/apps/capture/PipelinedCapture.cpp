// PipelinedCapture.cpp
#include "apps/capture/PipelinedCapture.hpp"

#include <cstddef>
#include <cstring> // memcpy
#include <iostream>
#include <mutex>

namespace dith {

const char* PipelinedCapture::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                 return "OK";
        case Status::NOT_STARTED:        return "NOT_STARTED";
        case Status::FIRST_FRAME_FAIL:   return "FIRST_FRAME_FAIL";
        case Status::TASK_FAIL:          return "TASK_FAIL";
        case Status::FRAME_SIZE_CHANGED: return "FRAME_SIZE_CHANGED";
        default:                         return "UNKNOWN";
    }
}

PipelinedCapture::PipelinedCapture(IFrameSource& src)
: m_src(src) {}

PipelinedCapture::~PipelinedCapture() {
    Stop();
}

PipelinedCapture::Status PipelinedCapture::lastStatus() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    return m_status;
}

const char* PipelinedCapture::lastErrorStr() const {
    const Status s = lastStatus();
    if (s != Status::OK) return StatusStr(s);
    return SourceStatusStr(m_src.lastStatus());
}

bool PipelinedCapture::Start() {
    if (m_started) return true;

    m_stop_requested.store(false);
    m_frames_captured.store(0);

    msg::ImageFrame first{};
    if (!m_src.Capture(first) || !first.valid()) {
        std::cerr << "[PIPELINE] First frame failed: "
                  << SourceStatusStr(m_src.lastStatus())
                  << " errno=" << m_src.lastErrno() << "\n";
        std::lock_guard<Rtos::Mutex> lk(m_mtx);
        m_status = Status::FIRST_FRAME_FAIL;
        return false;
    }

    m_width  = first.width;
    m_height = first.height;
    m_stride = first.stride;

    {
        // Task not running yet, the lock only orders the stores
        std::lock_guard<Rtos::Mutex> lk(m_mtx);
        const std::size_t bytes = static_cast<std::size_t>(m_width) * m_height;
        m_bufs[0].assign(bytes, 0);
        m_bufs[1].assign(bytes, 0);

        storeFrame(first, 0);
        m_latest_idx = 0;
        m_read_idx   = 0;
        m_status = Status::OK;
    }

    if (!m_task.Create("FrameCapture", &PipelinedCapture::TaskEntry, this)) {
        std::lock_guard<Rtos::Mutex> lk(m_mtx);
        m_status = Status::TASK_FAIL;
        releaseBuffers();
        return false;
    }

    m_started = true;
    return true;
}

bool PipelinedCapture::NextFrame(msg::ImageFrame& out) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    if (!m_started) {
        m_status = Status::NOT_STARTED;
        return false;
    }
    if (m_status != Status::OK) return false;

    // Hand the consumer the newest buffer; the task now writes the other one.
    m_read_idx = m_latest_idx;
    out = m_meta[m_read_idx];
    return true;
}

void PipelinedCapture::Stop() {
    if (!m_started) return;

    m_stop_requested.store(true);
    m_task.Join();

    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    releaseBuffers();
    m_started = false;
    if (m_status == Status::OK) m_status = Status::NOT_STARTED;
}

void PipelinedCapture::TaskEntry(void* arg) {
    auto* self = static_cast<PipelinedCapture*>(arg);
    if (!self) return;
    self->Run();
}

void PipelinedCapture::Run() {
    uint32_t fail_streak = 0;

    while (!m_stop_requested.load()) {
        msg::ImageFrame f{};

        if (!m_src.Capture(f)) {
            if (fail_streak++ == 0) {
                std::cerr << "[PIPELINE] Capture failed: "
                          << SourceStatusStr(m_src.lastStatus())
                          << " errno=" << m_src.lastErrno() << ", retrying\n";
            }
            Rtos::SleepMs(PIPELINE_RETRY_MS);
            continue;
        }
        fail_streak = 0;

        if (f.width != m_width || f.height != m_height || f.stride != m_stride) {
            std::cerr << "[PIPELINE] Frame size changed " << m_width << "x" << m_height
                      << " stride=" << m_stride << " -> " << f.width << "x" << f.height
                      << " stride=" << f.stride << ", capture stopped\n";
            std::lock_guard<Rtos::Mutex> lk(m_mtx);
            m_status = Status::FRAME_SIZE_CHANGED;
            return;
        }

        {
            std::lock_guard<Rtos::Mutex> lk(m_mtx);
            const int target = 1 - m_read_idx;
            storeFrame(f, target);
            m_latest_idx = target;
        }
        m_frames_captured.fetch_add(1);
    }
}

// -------------------- private helpers --------------------

void PipelinedCapture::storeFrame(const msg::ImageFrame& f, int idx) {
    uint8_t* dst = m_bufs[idx].data();

    // Stored packed: stride == width
    for (uint32_t y = 0; y < m_height; ++y) {
        std::memcpy(dst + static_cast<std::size_t>(y) * m_width,
                    f.data + static_cast<std::size_t>(y) * f.stride,
                    m_width);
    }

    msg::ImageFrame& meta = m_meta[idx];
    meta.data     = dst;
    meta.width    = m_width;
    meta.height   = m_height;
    meta.stride   = m_width;
    meta.t_us     = f.t_us;
    meta.frame_id = f.frame_id;
}

void PipelinedCapture::releaseBuffers() {
    for (int i = 0; i < 2; ++i) {
        std::vector<uint8_t>().swap(m_bufs[i]);
        m_meta[i] = msg::ImageFrame{};
    }
    m_latest_idx = 0;
    m_read_idx = 0;
}

} // namespace dith
