#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "mf_types.hpp"
#include "resource.hpp"

namespace mf {

/**
 * @brief 外部图像：来源为磁盘路径或已打包的编码字节。
 *
 * 解码结果缓存在 buffer 中（线性空间 RGBA float，正方形）；修改色彩空间
 * 会使缓存失效。
 */
struct MATFORGE_API ExternalImage {
    ColorSpace color_space = ColorSpace::Srgb;
    std::optional<fs::path> path;
    std::vector<std::uint8_t> packed;
    cv::Mat buffer;
    std::uint32_t dimensions = 1024;

    bool is_packed() const { return !path.has_value(); }
    bool needs_loading() const { return buffer.empty(); }
    void invalidate() { buffer.release(); }

    // @throws GraphError(Io) 读取源文件失败
    void pack();
    // @throws GraphError(Io) 读取或解码失败
    const cv::Mat& ensure_loaded();
    std::uint64_t hash() const;
};

class MATFORGE_API ExternalImageService {
public:
    // 把 SVG 文件栅格化为 size x size 的 RGBA float 图像
    using SvgRasterizer = std::function<cv::Mat(const fs::path& path, std::uint32_t size)>;

    void add_image(const ImageResource& res, const fs::path& path, ColorSpace color_space);
    void add_packed_image(const ImageResource& res, std::vector<std::uint8_t> bytes, ColorSpace color_space);
    bool remove_image(const ImageResource& res);
    ExternalImage* find(const ImageResource& res);
    const ExternalImage* find(const ImageResource& res) const;
    bool set_color_space(const ImageResource& res, ColorSpace color_space);
    // @throws GraphError(Io)
    bool pack(const ImageResource& res);
    std::vector<ImageResource> images() const;

    void add_svg(const SvgResource& res, const fs::path& path);
    bool has_svg(const SvgResource& res) const { return svgs_.count(res) != 0; }
    void set_svg_rasterizer(SvgRasterizer rasterizer) { rasterizer_ = std::move(rasterizer); }
    /**
     * @throws GraphError(NotFound) 未注册的 SVG
     * @throws GraphError(MissingDependency) 没有可用的栅格化器
     */
    cv::Mat rasterize_svg(const SvgResource& res, std::uint32_t size) const;

    void clear();

private:
    std::map<ImageResource, ExternalImage> images_;
    std::map<SvgResource, fs::path> svgs_;
    SvgRasterizer rasterizer_;
};

} // namespace mf
