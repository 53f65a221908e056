#include "kernel/services/export_service.hpp"

#include <exception>
#include <iostream>
#include <thread>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "adapter/buffer_adapter_opencv.hpp"

namespace mf {

ExportService::ExportService() : in_flight_(std::make_shared<std::atomic<int>>(0)) {}

cv::Mat ExportService::convert(const ImageBuffer& raw, ImageType type, int bit_depth, ColorSpace color_space) {
    if (bit_depth != 8 && bit_depth != 16) {
        throw GraphError(GraphErrc::InvalidParameter, "Unsupported export bit depth " + std::to_string(bit_depth));
    }
    if (raw.empty() || raw.type != DataType::FLOAT32) {
        throw GraphError(GraphErrc::InvalidParameter, "Export expects float pixel data");
    }
    cv::Mat src = toCvMat(raw);
    cv::Mat color;
    if (type == ImageType::Rgb) {
        cv::cvtColor(src, color, cv::COLOR_RGBA2BGR);
    } else {
        color = src.clone();
    }

    cv::max(color, 0.0, color);
    cv::min(color, 1.0, color);
    if (color_space == ColorSpace::Srgb) {
        cv::pow(color, 1.0 / 2.2, color);
    }

    cv::Mat out;
    if (bit_depth == 8) color.convertTo(out, CV_8U, 255.0);
    else color.convertTo(out, CV_16U, 65535.0);
    return out;
}

void ExportService::write_async(cv::Mat converted, const fs::path& path) {
    auto counter = in_flight_;
    counter->fetch_add(1);
    std::thread([counter, image = std::move(converted), path]() {
        try {
            if (!cv::imwrite(path.string(), image)) {
                std::cerr << "Warning: export to '" << path.string() << "' failed." << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: export to '" << path.string() << "' failed: " << e.what() << std::endl;
        }
        counter->fetch_sub(1);
    }).detach();
}

bool ExportService::wait_idle(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (in_flight_->load() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace mf
