#pragma once

#include <cstddef>
#include <memory>

namespace mf {

// 描述像素数据类型，实现与具体库解耦
enum class DataType {
    UINT8, UINT16, FLOAT32
};

// 描述数据所在的设备
enum class Device {
    CPU,
    GPU,
};

// 跨越计算后端边界（上传、下载、缩略图、导出）的像素数据描述符。
// 不携带任何 GPU 句柄，只描述一块主机内存。
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    DataType type = DataType::FLOAT32;
    Device device = Device::CPU;
    size_t step = 0; // 每行字节数 (stride)

    // 使用带自定义删除器的 shared_ptr 管理不同来源的内存。
    std::shared_ptr<void> data = nullptr;

    bool empty() const { return !data || width == 0 || height == 0; }
};

} // namespace mf
