// CameraCapture.cpp
#include "platform/linux/CameraCapture.hpp"
#include "os/rtos.hpp"

#include <linux/videodev2.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <errno.h>
#include <iostream>

namespace {

// Retry ioctl if interrupted by a signal.
// Without it we can get rare failures under load/interrupts.
static int xioctl(int fd, unsigned long req, void* arg) {
    int r;
    do { r = ::ioctl(fd, req, arg); }
    while (r == -1 && errno == EINTR);
    return r;
}

static uint32_t fourcc(dith::CameraPixFmt f) {
    switch (f) {
        case dith::CameraPixFmt::GREY: return V4L2_PIX_FMT_GREY;
        case dith::CameraPixFmt::YUYV: return V4L2_PIX_FMT_YUYV;
        default:                       return 0;
    }
}

static uint32_t bytes_per_px(dith::CameraPixFmt f) {
    return (f == dith::CameraPixFmt::YUYV) ? 2 : 1;
}

} // anonymous namespace

namespace dith {

const char* PixFmtStr(CameraPixFmt f) {
    switch (f) {
        case CameraPixFmt::GREY: return "GREY";
        case CameraPixFmt::YUYV: return "YUYV";
        default:                 return "UNKNOWN";
    }
}

static inline CameraCaptureConfig sanitise(const CameraCaptureConfig& in) {
    CameraCaptureConfig cfg = in;

    if (!cfg.dev) cfg.dev = "/dev/video0";

    if (cfg.width == 0)  cfg.width  = 640;
    if (cfg.height == 0) cfg.height = 480;

    if (cfg.buffer_count < 2) cfg.buffer_count = 2;
    if (cfg.buffer_count > CAMERA_MAX_BUFS) cfg.buffer_count = CAMERA_MAX_BUFS;

    return cfg;
}

CameraCapture::CameraCapture(const CameraCaptureConfig& cfg)
: m_cfg(sanitise(cfg)) {
    m_status = SourceStatus::OK;
    m_errno  = 0;
}

CameraCapture::~CameraCapture() {
    Close();
}

bool CameraCapture::Open() {
    if (m_running) return true;

    // Reseting any previous errors
    m_status = SourceStatus::OK;
    m_errno  = 0;

    if (!openDevice()) return false; // OK because openDevice() sets status
    if (!queryCaps()) { Close(); return false; }
    if (!setAndReadFormat()) { Close(); return false; }
    if (!requestAndMapBuffers()) { Close(); return false; }
    if (!queueAllBuffers()) { Close(); return false; }
    if (!streamOn()) { Close(); return false; }

    m_frame_id = 0;
    m_held_valid = false;

    std::cout << "[CAMERA] " << m_cfg.dev << " " << m_width << "x" << m_height
              << " stride=" << m_stride << " fmt=" << PixFmtStr(m_cfg.pixfmt)
              << " bufs=" << m_buf_count << "\n";
    return true;
}

void CameraCapture::Close() {
    if (m_running) {
        streamOff();
        m_running = false;
    }
    m_held_valid = false;
    unmapBuffers();
    closeDevice();
}

bool CameraCapture::Capture(msg::ImageFrame& out) {
    if (!m_running) return fail(SourceStatus::NOT_OPEN);

    // The caller is done with the previous frame once it asks for the next one.
    if (m_held_valid) {
        m_held_valid = false;
        if (!requeue(m_held_idx)) return false;
    }

    v4l2_buffer buf{};
    buf.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;

    if (xioctl(m_fd, VIDIOC_DQBUF, &buf) == -1) {
        if (errno == EAGAIN) return fail(SourceStatus::NO_FRAME);
        return fail(SourceStatus::DQBUF_FAIL);
    }

    const uint32_t idx = buf.index;
    if (idx >= m_buf_count) {
        // Should never happen if driver is sane.
        return fail(SourceStatus::DQBUF_FAIL);
    }

    m_held_idx   = idx;
    m_held_valid = true;

    const uint8_t* base = m_bufs[idx].ptr;

    if (m_cfg.pixfmt == CameraPixFmt::YUYV) {
        // Y0 U Y1 V: luma is every even byte
        m_luma.resize(static_cast<std::size_t>(m_width) * m_height);
        for (uint32_t y = 0; y < m_height; ++y) {
            const uint8_t* src = base + static_cast<std::size_t>(y) * m_stride;
            uint8_t* dst = m_luma.data() + static_cast<std::size_t>(y) * m_width;
            for (uint32_t x = 0; x < m_width; ++x) {
                dst[x] = src[x * 2];
            }
        }
        out.data   = m_luma.data();
        out.stride = m_width;
    } else {
        out.data   = base;
        out.stride = m_stride;
    }

    out.width    = m_width;
    out.height   = m_height;
    out.t_us     = Rtos::NowUs();
    out.frame_id = m_frame_id++;

    m_status = SourceStatus::OK;
    return true;
}

// -------------------- private helpers --------------------

bool CameraCapture::openDevice() {
    m_fd = ::open(m_cfg.dev, O_RDWR | O_CLOEXEC);
    if (m_fd < 0) {
        switch (errno) {
            case EACCES:
            case EPERM:  return fail(SourceStatus::PERMISSION_DENIED);
            case EBUSY:  return fail(SourceStatus::DEVICE_BUSY);
            case ENOENT:
            case ENODEV:
            case ENXIO:  return fail(SourceStatus::NO_DEVICE);
            default:     return fail(SourceStatus::OPEN_FAIL);
        }
    }
    return true;
}

bool CameraCapture::queryCaps() {
    v4l2_capability cap{};
    if (xioctl(m_fd, VIDIOC_QUERYCAP, &cap) == -1) return fail(SourceStatus::QUERYCAP_FAIL);

    // device_caps is the per-node view when the driver fills it in
    const uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps : cap.capabilities;

    const bool streaming = (caps & V4L2_CAP_STREAMING) != 0;
    const bool capture   = (caps & V4L2_CAP_VIDEO_CAPTURE) != 0;

    if (!streaming || !capture){
        return fail(SourceStatus::UNSUPPORTED_CAPS);
    }
    return true;
}

bool CameraCapture::setAndReadFormat() {
    v4l2_format fmt{};
    fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

    fmt.fmt.pix.width       = m_cfg.width;
    fmt.fmt.pix.height      = m_cfg.height;
    fmt.fmt.pix.pixelformat = fourcc(m_cfg.pixfmt);
    fmt.fmt.pix.field       = V4L2_FIELD_NONE;

    if (xioctl(m_fd, VIDIOC_S_FMT, &fmt) == -1) {
        if (errno == EBUSY) return fail(SourceStatus::DEVICE_BUSY);
        return fail(SourceStatus::SETFMT_FAIL);
    }
    if (xioctl(m_fd, VIDIOC_G_FMT, &fmt) == -1) return fail(SourceStatus::SETFMT_FAIL);

    // Size may be adjusted by the driver, the pixel format may not.
    if (fmt.fmt.pix.pixelformat != fourcc(m_cfg.pixfmt)) return fail(SourceStatus::UNSUPPORTED_FORMAT);

    m_width  = fmt.fmt.pix.width;
    m_height = fmt.fmt.pix.height;
    m_stride = fmt.fmt.pix.bytesperline;

    if (m_width == 0 || m_height == 0) return fail(SourceStatus::SETFMT_FAIL);

    // Some drivers leave bytesperline at 0 for packed formats
    const uint32_t min_stride = m_width * bytes_per_px(m_cfg.pixfmt);
    if (m_stride == 0) m_stride = min_stride;

    // Basic sanity: stride must fit at least one row
    if (m_stride < min_stride) return fail(SourceStatus::SETFMT_FAIL);

    return true;
}

bool CameraCapture::requestAndMapBuffers() {

    v4l2_requestbuffers req{};
    req.count  = m_cfg.buffer_count;
    req.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;

    if (xioctl(m_fd, VIDIOC_REQBUFS, &req) == -1) return fail(SourceStatus::REQBUFS_FAIL);
    if (req.count < 2) return fail(SourceStatus::REQBUFS_FAIL);
    if (req.count > CAMERA_MAX_BUFS) req.count = CAMERA_MAX_BUFS;

    for (uint32_t i = 0; i < req.count; ++i) {
        v4l2_buffer buf{};
        buf.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;
        buf.index  = i;

        if (xioctl(m_fd, VIDIOC_QUERYBUF, &buf) == -1) return fail(SourceStatus::REQBUFS_FAIL);

        void* p = ::mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, buf.m.offset);
        if (p == MAP_FAILED) return fail(SourceStatus::MMAP_FAIL);

        m_bufs[i].ptr = static_cast<uint8_t*>(p);
        m_bufs[i].len = buf.length;
        m_buf_count = i + 1;

        // A short buffer would make the luma/stride reads run past the mapping
        if (buf.length < m_stride * m_height) return fail(SourceStatus::MMAP_FAIL);
    }

    return true;
}

bool CameraCapture::queueAllBuffers() {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (!requeue(i)) return false;
    }
    return true;
}

bool CameraCapture::requeue(uint32_t idx) {
    if (idx >= m_buf_count) return fail(SourceStatus::QBUF_FAIL);

    v4l2_buffer buf{};
    buf.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    buf.index  = idx;

    if (xioctl(m_fd, VIDIOC_QBUF, &buf) == -1) return fail(SourceStatus::QBUF_FAIL);
    return true;
}

bool CameraCapture::streamOn() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (xioctl(m_fd, VIDIOC_STREAMON, &type) == -1) {
        if (errno == EBUSY) return fail(SourceStatus::DEVICE_BUSY);
        return fail(SourceStatus::STREAMON_FAIL);
    }
    m_running = true;
    return true;
}

void CameraCapture::streamOff() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (xioctl(m_fd, VIDIOC_STREAMOFF, &type) == -1) {
        std::cerr << "[CAMERA] STREAMOFF failed errno=" << errno << "\n";
    }
}

void CameraCapture::unmapBuffers() {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (m_bufs[i].ptr && m_bufs[i].len) {
            ::munmap(m_bufs[i].ptr, m_bufs[i].len);
        }
        m_bufs[i].ptr = nullptr;
        m_bufs[i].len = 0;
    }
    m_buf_count = 0;
}

void CameraCapture::closeDevice() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

// FDIR

bool CameraCapture::fail(SourceStatus s) {
    m_status = s;

    switch (s) {
        // logic failures have no errno of their own
        case SourceStatus::NOT_OPEN:
        case SourceStatus::UNSUPPORTED_CAPS:
        case SourceStatus::UNSUPPORTED_FORMAT:
            m_errno = 0;
            break;

        default:
            m_errno = errno;
            break;
    }
    return false;
}

} // namespace dith
