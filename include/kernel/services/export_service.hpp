#pragma once
#include <atomic>
#include <chrono>
#include <memory>

#include <opencv2/core.hpp>

#include "image_buffer.hpp"
#include "mf_types.hpp"
#include "resource.hpp"

namespace mf {

struct ExportSpec {
    fs::path path;
    int bit_depth = 8;
    ColorSpace color_space = ColorSpace::Srgb;
};

/**
 * @brief 把计算结果下载后的像素转换并写盘。
 *
 * 转换在调用线程完成；编码与写文件在分离线程中进行，失败只记录到
 * std::cerr，不影响解释器。wait_idle 用于进程退出前等待写盘结束。
 */
class MATFORGE_API ExportService {
public:
    ExportService();

    /**
     * @brief 将 float 像素转换为 8/16 位整数图像 (RGB 为 BGR 通道顺序，便于 imwrite)。
     * @throws GraphError(InvalidParameter) 不支持的位深。
     */
    static cv::Mat convert(const ImageBuffer& raw, ImageType type, int bit_depth, ColorSpace color_space);

    void write_async(cv::Mat converted, const fs::path& path);
    bool wait_idle(std::chrono::milliseconds timeout) const;
    int in_flight() const { return in_flight_->load(); }

private:
    std::shared_ptr<std::atomic<int>> in_flight_;
};

} // namespace mf
