#include "platform/ImageFileSource.hpp"
#include "os/rtos.hpp"

#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <utility>

namespace dith {

ImageFileSource::ImageFileSource(std::string path)
: m_path(std::move(path)) {}

bool ImageFileSource::Open() {
    m_status = SourceStatus::OK;

    cv::Mat img = cv::imread(m_path, cv::IMREAD_GRAYSCALE);
    if (img.empty()) {
        std::cerr << "[FILE] Could not load image " << m_path << "\n";
        m_status = SourceStatus::LOAD_FAIL;
        return false;
    }
    if (img.type() != CV_8UC1) {
        std::cerr << "[FILE] Unexpected image type " << img.type() << " for " << m_path << "\n";
        m_status = SourceStatus::LOAD_FAIL;
        return false;
    }
    if (!img.isContinuous()) {
        img = img.clone();
    }

    m_img = img;
    m_frame_id = 0;
    return true;
}

void ImageFileSource::Close() {
    m_img.release();
}

bool ImageFileSource::Capture(msg::ImageFrame& out) {
    if (m_img.empty()) {
        m_status = SourceStatus::NOT_OPEN;
        return false;
    }

    out.data     = m_img.data;
    out.width    = static_cast<uint32_t>(m_img.cols);
    out.height   = static_cast<uint32_t>(m_img.rows);
    out.stride   = static_cast<uint32_t>(m_img.step[0]);   // bytes per row
    out.t_us     = Rtos::NowUs();
    out.frame_id = m_frame_id++;

    m_status = SourceStatus::OK;
    return true;
}

} // namespace dith
