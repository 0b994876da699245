#include "platform/IFrameSource.hpp"

namespace dith {

const char* SourceStatusStr(SourceStatus s) {
    switch (s) {
        case SourceStatus::OK:                 return "OK";
        case SourceStatus::NO_FRAME:           return "NO_FRAME";
        case SourceStatus::PERMISSION_DENIED:  return "PERMISSION_DENIED";
        case SourceStatus::DEVICE_BUSY:        return "DEVICE_BUSY";
        case SourceStatus::NOT_OPEN:           return "NOT_OPEN";
        case SourceStatus::NO_DEVICE:          return "NO_DEVICE";
        case SourceStatus::OPEN_FAIL:          return "OPEN_FAIL";
        case SourceStatus::QUERYCAP_FAIL:      return "QUERYCAP_FAIL";
        case SourceStatus::SETFMT_FAIL:        return "SETFMT_FAIL";
        case SourceStatus::REQBUFS_FAIL:       return "REQBUFS_FAIL";
        case SourceStatus::MMAP_FAIL:          return "MMAP_FAIL";
        case SourceStatus::QBUF_FAIL:          return "QBUF_FAIL";
        case SourceStatus::STREAMON_FAIL:      return "STREAMON_FAIL";
        case SourceStatus::DQBUF_FAIL:         return "DQBUF_FAIL";
        case SourceStatus::UNSUPPORTED_CAPS:   return "UNSUPPORTED_CAPS";
        case SourceStatus::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case SourceStatus::LOAD_FAIL:          return "LOAD_FAIL";
        default:                               return "UNKNOWN";
    }
}

} // namespace dith
