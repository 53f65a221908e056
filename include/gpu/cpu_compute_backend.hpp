#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include "gpu/compute_backend.hpp"

namespace mf {

/**
 * @brief 基于 OpenCV 的 CPU 计算后端。
 *
 * 每张图像是一块 CV_32FC1 (灰度) 或 CV_32FC4 (RGBA) 的 cv::Mat。
 * 分配受 memory_budget 约束，超出即抛出 BackendError(OutOfMemory)。
 * inject_allocation_failures(n) 让接下来 n 次需要分配内存的请求失败，
 * 用于复现显存不足时的清理与重试路径；inject_download_failures(n) 同理作用于
 * 回读。
 */
class MATFORGE_API CpuComputeBackend : public ComputeBackend {
public:
    struct Counters {
        std::size_t allocations = 0;
        std::size_t releases = 0;
        std::size_t dispatches = 0;
        std::size_t uploads = 0;
        std::size_t downloads = 0;
        std::size_t copies = 0;
        std::size_t thumbnails = 0;
        std::map<std::string, std::size_t> dispatches_by_shader;
    };

    static constexpr std::size_t kDefaultMemoryBudget = std::size_t(1) << 30;
    static constexpr std::uint32_t kDefaultThumbnailSize = 128;

    explicit CpuComputeBackend(std::size_t memory_budget = kDefaultMemoryBudget,
                               std::uint32_t thumbnail_size = kDefaultThumbnailSize);

    ImageHandle create_image(std::uint32_t size, ImageType type, bool transfer_dst) override;
    void destroy_image(ImageHandle image) override;
    bool ensure_backed(ImageHandle image) override;
    bool is_backed(ImageHandle image) const override;
    void release(ImageHandle image) override;
    std::uint32_t image_size(ImageHandle image) const override;
    ImageType image_type(ImageHandle image) const override;
    BackendImageView view(ImageHandle image) const override;

    void upload(ImageHandle image, const ImageBuffer& pixels) override;
    ImageBuffer download(ImageHandle image) override;
    void copy_image(ImageHandle from, ImageHandle to) override;

    bool has_pipeline(const std::string& shader) const override;
    void run_pass(const ComputePass& pass, const PassBindings& bindings) override;

    ThumbnailHandle new_thumbnail(ImageType type) override;
    void return_thumbnail(ThumbnailHandle thumbnail) override;
    void generate_thumbnail(ImageHandle image, ThumbnailHandle thumbnail) override;
    ImageBuffer thumbnail_pixels(ThumbnailHandle thumbnail) const override;

    AllocatorUsage usage() const override;

    void set_memory_budget(std::size_t bytes);
    void inject_allocation_failures(int count);
    void inject_download_failures(int count);
    // 模拟 pipeline 创建失败
    void disable_pipeline(const std::string& shader);

    Counters counters() const;
    void reset_counters();
    std::size_t live_images() const;

    // 测试用：直接读取图像像素（深拷贝）
    cv::Mat pixels(ImageHandle image) const;

private:
    struct ImageSlot {
        std::uint32_t size = 0;
        ImageType type = ImageType::Grayscale;
        bool transfer_dst = false;
        ImageLayout layout = ImageLayout::Undefined;
        cv::Mat data;
    };
    struct ThumbnailSlot {
        ImageType type = ImageType::Grayscale;
        bool in_use = false;
        cv::Mat data;
    };

    static std::size_t image_bytes(std::uint32_t size, ImageType type);
    ImageSlot& slot(ImageHandle image);
    const ImageSlot& slot(ImageHandle image) const;
    const cv::Mat& backed_data(ImageHandle image, const char* what) const;

    void pass_blend(const ComputePass& pass, const PassBindings& bindings, bool masked);
    void pass_perlin_noise(const ComputePass& pass, const PassBindings& bindings);
    void pass_fill(const ComputePass& pass, const PassBindings& bindings, const cv::Scalar& value);
    void pass_blur(const ComputePass& pass, const PassBindings& bindings);

    mutable std::mutex mutex_;
    std::unordered_map<ImageHandle, ImageSlot> images_;
    ImageHandle next_handle_ = 1;
    std::vector<ThumbnailSlot> thumbnails_;
    std::uint32_t thumbnail_size_;
    std::size_t memory_budget_;
    std::size_t bytes_used_ = 0;
    int pending_failures_ = 0;
    int pending_download_failures_ = 0;
    std::set<std::string> disabled_pipelines_;
    Counters counters_;
};

} // namespace mf
