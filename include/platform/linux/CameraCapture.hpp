#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include "platform/IFrameSource.hpp"
#include "msg/ImageFrame.hpp"

namespace dith {
static constexpr uint32_t CAMERA_MAX_BUFS = 16;
}

namespace dith {

// Only formats whose luma can be exposed as GRAY8.
enum class CameraPixFmt : uint8_t {
    GREY = 0,   // 8-bit mono, exposed in place
    YUYV,       // 4:2:2 packed, luma extracted into an owned buffer
};

const char* PixFmtStr(CameraPixFmt f);

// ------------------------------
// Config
// ------------------------------
struct CameraCaptureConfig {

    // V4L2 Device Node
    const char* dev = "/dev/video0";

    // Requested size; the driver may adjust it, the negotiated size is read back.
    uint32_t width  = 640;
    uint32_t height = 480;

    CameraPixFmt pixfmt = CameraPixFmt::YUYV;

    // How many MMAP buffers to request via VIDIOC_REQBUFS.
    uint32_t buffer_count = 4;
};

// ------------------------------
// CameraCapture: owns V4L2 streaming + mmapped buffers.
// Not thread-safe: one thread at a time may call Capture().
// ------------------------------
class CameraCapture : public IFrameSource {
public:
    explicit CameraCapture(const CameraCaptureConfig& cfg);
    ~CameraCapture() override;

    CameraCapture(const CameraCapture&) = delete;
    CameraCapture& operator=(const CameraCapture&) = delete;

    // Open device, set+read back format, allocate+map buffers, queue buffers, stream on.
    // Returns false on any ioctl failure; lastStatus()/lastErrno() tell why.
    bool Open() override;

    // Stream off and release all resources. Safe to call even if Open() partially failed.
    void Close() override;

    // Returns the previously held buffer to the driver, then one blocking dequeue.
    bool Capture(msg::ImageFrame& out) override;

    SourceStatus lastStatus() const override { return m_status; }
    int          lastErrno()  const override { return m_errno; }

    // Optional introspection for logging/debug
    uint32_t negotiatedWidth()  const { return m_width; }
    uint32_t negotiatedHeight() const { return m_height; }
    uint32_t negotiatedStride() const { return m_stride; }

private:
    struct MmapBuf {
        uint8_t* ptr = nullptr;
        uint32_t len = 0;
    };

    CameraCaptureConfig m_cfg{};
    int m_fd = -1; // File descriptor

    // Negotiated format (read back from VIDIOC_G_FMT and stored once)
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    uint32_t m_stride = 0;        // bytes per row (bytesperline)

    // MMAP buffers
    MmapBuf  m_bufs[CAMERA_MAX_BUFS]{};
    uint32_t m_buf_count = 0;

    // Luma plane for YUYV frames
    std::vector<uint8_t> m_luma;

    uint32_t m_frame_id = 0;
    bool m_running = false;

    // Buffer currently handed out through Capture()
    bool     m_held_valid = false;
    uint32_t m_held_idx = 0;

    // FDIR
    SourceStatus m_status = SourceStatus::OK;
    int          m_errno  = 0;

private:
    // Setup helpers
    bool openDevice();
    bool queryCaps();
    bool setAndReadFormat();
    bool requestAndMapBuffers();
    bool queueAllBuffers();
    bool streamOn();
    void streamOff();
    void unmapBuffers();
    void closeDevice();

    bool requeue(uint32_t idx);

    // Fail
    bool fail(SourceStatus s);
};

} // namespace dith
