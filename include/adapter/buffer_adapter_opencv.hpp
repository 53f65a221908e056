#pragma once

#include "image_buffer.hpp"
#include <opencv2/core.hpp>

namespace mf {

/**
 * @brief 将 ImageBuffer 转换为 cv::Mat 视图。
 * @note 零拷贝；返回的 Mat 与 buffer 共享内存，生命周期由调用者保证。
 * @throws std::runtime_error 当 buffer 没有数据或类型不受支持。
 */
cv::Mat toCvMat(const ImageBuffer& buffer);

/**
 * @brief 将一个 cv::Mat 包装为 ImageBuffer。
 * @note 零拷贝。返回的 ImageBuffer 通过 std::shared_ptr
 *       共享 cv::Mat 的内存和引用计数。
 */
ImageBuffer fromCvMat(const cv::Mat& mat);

} // namespace mf
