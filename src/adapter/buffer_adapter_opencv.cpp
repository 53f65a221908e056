#include "adapter/buffer_adapter_opencv.hpp"
#include <stdexcept>

namespace mf {

static int toCvType(DataType type, int channels) {
    switch (type) {
        case DataType::UINT8:   return CV_8UC(channels);
        case DataType::UINT16:  return CV_16UC(channels);
        case DataType::FLOAT32: return CV_32FC(channels);
    }
    throw std::runtime_error("Unsupported data type for OpenCV conversion");
}

static DataType fromCvType(int cv_type) {
    switch (CV_MAT_DEPTH(cv_type)) {
        case CV_8U:  return DataType::UINT8;
        case CV_16U: return DataType::UINT16;
        case CV_32F: return DataType::FLOAT32;
        default: throw std::runtime_error("Unsupported cv::Mat depth for ImageBuffer conversion");
    }
}

cv::Mat toCvMat(const ImageBuffer& buffer) {
    if (!buffer.data) {
        throw std::runtime_error("toCvMat: Buffer has no host data.");
    }
    int type = toCvType(buffer.type, buffer.channels);
    return cv::Mat(buffer.height, buffer.width, type, buffer.data.get(), buffer.step);
}

ImageBuffer fromCvMat(const cv::Mat& mat) {
    ImageBuffer buffer;
    buffer.width = mat.cols;
    buffer.height = mat.rows;
    buffer.channels = mat.channels();
    buffer.type = fromCvType(mat.type());
    buffer.device = Device::CPU;
    buffer.step = mat.step;

    // lambda 捕获 mat 的副本，只要 buffer.data 存在，原始数据的引用计数就不会归零。
    buffer.data = std::shared_ptr<void>(mat.data, [mat_ref = mat](void*) {});
    return buffer;
}

} // namespace mf
