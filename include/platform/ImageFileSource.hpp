#pragma once
#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "platform/IFrameSource.hpp"
#include "msg/ImageFrame.hpp"

namespace dith {

// Still image decoded once on Open(); every Capture() hands out the same pixels.
class ImageFileSource : public IFrameSource {
public:
    explicit ImageFileSource(std::string path);
    ~ImageFileSource() override = default;

    bool Open() override;
    void Close() override;
    bool Capture(msg::ImageFrame& out) override;

    SourceStatus lastStatus() const override { return m_status; }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    cv::Mat     m_img;          // GRAY8, continuous
    uint32_t    m_frame_id = 0;

    SourceStatus m_status = SourceStatus::OK;
};

} // namespace dith
