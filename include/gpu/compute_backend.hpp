#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "image_buffer.hpp"
#include "mf_types.hpp"

namespace mf {

enum class BackendErrc {
    OutOfMemory = 1,
    InvalidImage,
    Upload,
    Download,
    Pipeline,
    Thumbnail,
};

struct MATFORGE_API BackendError : public std::runtime_error {
    BackendError(BackendErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    BackendErrc code() const noexcept { return code_; }
private:
    BackendErrc code_;
};

// 0 表示空句柄
using ImageHandle = std::uint64_t;
using ThumbnailHandle = std::uint32_t;

enum class ImageLayout { Undefined, General, ShaderRead, TransferSrc, TransferDst };

// 交给前端的只读视图
struct BackendImageView {
    ImageHandle image = 0;
    ImageLayout layout = ImageLayout::Undefined;
    std::uint32_t size = 0;
    ImageType type = ImageType::Grayscale;
};

struct AllocatorUsage {
    std::size_t bytes_used = 0;
    std::size_t bytes_budget = 0;
    std::size_t images_backed = 0;
};

// 一次计算 pass 的描述符绑定。未连接的可选输入不出现在 inputs 中。
struct PassBindings {
    std::map<std::string, ImageHandle> inputs;
    std::map<std::string, ImageHandle> outputs;
    std::map<std::string, ImageHandle> intermediates;
};

struct ComputePass {
    std::string shader;
    std::vector<std::uint8_t> uniforms;
    // 第 i 位表示按 socket 名排序的第 i 个输入已绑定
    std::uint32_t occupancy = 0;
    std::uint32_t size = 0;
};

/**
 * @brief 图像计算后端的抽象接口。
 *
 * 图像先以句柄形式创建，只有在 ensure_backed 之后才占用内存；release
 * 丢弃内存但保留句柄，可再次 ensure_backed。内存不足时抛出
 * BackendError(OutOfMemory)，解释器据此清理并重试。
 */
class MATFORGE_API ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    virtual ImageHandle create_image(std::uint32_t size, ImageType type, bool transfer_dst) = 0;
    virtual void destroy_image(ImageHandle image) = 0;

    // 返回 true 表示本次新分配了内存，内容未定义
    virtual bool ensure_backed(ImageHandle image) = 0;
    virtual bool is_backed(ImageHandle image) const = 0;
    virtual void release(ImageHandle image) = 0;

    virtual std::uint32_t image_size(ImageHandle image) const = 0;
    virtual ImageType image_type(ImageHandle image) const = 0;
    virtual BackendImageView view(ImageHandle image) const = 0;

    // 像素尺寸与通道数必须和图像一致
    virtual void upload(ImageHandle image, const ImageBuffer& pixels) = 0;
    virtual ImageBuffer download(ImageHandle image) = 0;
    virtual void copy_image(ImageHandle from, ImageHandle to) = 0;

    virtual bool has_pipeline(const std::string& shader) const = 0;
    virtual void run_pass(const ComputePass& pass, const PassBindings& bindings) = 0;

    virtual ThumbnailHandle new_thumbnail(ImageType type) = 0;
    virtual void return_thumbnail(ThumbnailHandle thumbnail) = 0;
    virtual void generate_thumbnail(ImageHandle image, ThumbnailHandle thumbnail) = 0;
    virtual ImageBuffer thumbnail_pixels(ThumbnailHandle thumbnail) const = 0;

    virtual AllocatorUsage usage() const = 0;
};

} // namespace mf
