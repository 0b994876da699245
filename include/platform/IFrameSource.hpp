#pragma once
#include <cstdint>

#include "msg/ImageFrame.hpp"

namespace dith {

enum class SourceStatus : uint8_t {
    OK = 0,

    // Runtime conditions
    NO_FRAME,
    PERMISSION_DENIED,
    DEVICE_BUSY,
    NOT_OPEN,
    NO_DEVICE,

    // SYSCALL FAILS
    OPEN_FAIL,
    QUERYCAP_FAIL,
    SETFMT_FAIL,
    REQBUFS_FAIL,
    MMAP_FAIL,
    QBUF_FAIL,
    STREAMON_FAIL,
    DQBUF_FAIL,

    // LOGIC FAILS
    UNSUPPORTED_CAPS,
    UNSUPPORTED_FORMAT,
    LOAD_FAIL,
};

const char* SourceStatusStr(SourceStatus s);

// ---------------------------------------------------------------------------
// IFrameSource: anything that can hand out GRAY8 frames (camera, file).
// The frame returned by Capture() is a view owned by the source and stays
// valid until the next Capture() or Close().
// ---------------------------------------------------------------------------
class IFrameSource {
public:
    virtual bool Open() = 0;
    virtual void Close() = 0;
    virtual bool Capture(msg::ImageFrame& out) = 0;

    virtual SourceStatus lastStatus() const = 0;
    virtual int lastErrno() const { return 0; }

    virtual ~IFrameSource() = default;
};

} // namespace dith
