#include "kernel/services/external_image_service.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace mf {

namespace {

std::vector<std::uint8_t> read_file_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw GraphError(GraphErrc::Io, "Failed to open image: " + path.string());
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

cv::Mat to_linear_rgba(const cv::Mat& img, ColorSpace color_space) {
    cv::Mat float_img;
    double scale = (img.depth() == CV_8U) ? 1.0 / 255.0 : ((img.depth() == CV_16U) ? 1.0 / 65535.0 : 1.0);
    img.convertTo(float_img, CV_32F, scale);

    cv::Mat rgba;
    switch (float_img.channels()) {
        case 1: cv::cvtColor(float_img, rgba, cv::COLOR_GRAY2RGBA); break;
        case 3: cv::cvtColor(float_img, rgba, cv::COLOR_BGR2RGBA); break;
        case 4: cv::cvtColor(float_img, rgba, cv::COLOR_BGRA2RGBA); break;
        default:
            throw GraphError(GraphErrc::Io, "Unsupported channel count " + std::to_string(float_img.channels()));
    }

    if (color_space == ColorSpace::Srgb) {
        std::vector<cv::Mat> planes;
        cv::split(rgba, planes);
        for (int c = 0; c < 3; ++c) cv::pow(planes[c], 2.2, planes[c]);
        cv::merge(planes, rgba);
    }
    return rgba;
}

} // namespace

void ExternalImage::pack() {
    if (is_packed()) return;
    packed = read_file_bytes(*path);
    path.reset();
}

const cv::Mat& ExternalImage::ensure_loaded() {
    if (!buffer.empty()) return buffer;
    std::vector<std::uint8_t> raw = is_packed() ? packed : read_file_bytes(*path);
    cv::Mat decoded;
    try {
        decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw GraphError(GraphErrc::Io, std::string("Failed to decode image: ") + e.what());
    }
    if (decoded.empty()) {
        throw GraphError(GraphErrc::Io, "Failed to decode image" + (path ? " " + path->string() : std::string()));
    }
    cv::Mat rgba = to_linear_rgba(decoded, color_space);
    int side = std::max(rgba.cols, rgba.rows);
    dimensions = static_cast<std::uint32_t>(std::min(std::max(side, 32), 16384));
    if (rgba.cols != static_cast<int>(dimensions) || rgba.rows != static_cast<int>(dimensions)) {
        cv::resize(rgba, buffer, cv::Size(dimensions, dimensions), 0, 0, cv::INTER_LINEAR);
    } else {
        buffer = rgba;
    }
    return buffer;
}

std::uint64_t ExternalImage::hash() const {
    std::uint64_t h = 1469598103934665603ULL;
    auto mix = [&h](std::uint64_t v) {
        h ^= v;
        h *= 1099511628211ULL;
    };
    mix(static_cast<std::uint64_t>(color_space));
    mix(is_packed() ? packed.size() : std::hash<std::string>{}(path->string()));
    return h;
}

void ExternalImageService::add_image(const ImageResource& res, const fs::path& path, ColorSpace color_space) {
    ExternalImage img;
    img.path = path;
    img.color_space = color_space;
    images_[res] = std::move(img);
}

void ExternalImageService::add_packed_image(const ImageResource& res, std::vector<std::uint8_t> bytes,
                                            ColorSpace color_space) {
    ExternalImage img;
    img.packed = std::move(bytes);
    img.color_space = color_space;
    images_[res] = std::move(img);
}

bool ExternalImageService::remove_image(const ImageResource& res) {
    return images_.erase(res) != 0;
}

ExternalImage* ExternalImageService::find(const ImageResource& res) {
    auto it = images_.find(res);
    return it == images_.end() ? nullptr : &it->second;
}

const ExternalImage* ExternalImageService::find(const ImageResource& res) const {
    auto it = images_.find(res);
    return it == images_.end() ? nullptr : &it->second;
}

bool ExternalImageService::set_color_space(const ImageResource& res, ColorSpace color_space) {
    auto* img = find(res);
    if (!img) return false;
    if (img->color_space != color_space) {
        img->color_space = color_space;
        img->invalidate();
    }
    return true;
}

bool ExternalImageService::pack(const ImageResource& res) {
    auto* img = find(res);
    if (!img) return false;
    img->pack();
    return true;
}

std::vector<ImageResource> ExternalImageService::images() const {
    std::vector<ImageResource> out;
    for (const auto& kv : images_) out.push_back(kv.first);
    return out;
}

void ExternalImageService::add_svg(const SvgResource& res, const fs::path& path) {
    svgs_[res] = path;
}

cv::Mat ExternalImageService::rasterize_svg(const SvgResource& res, std::uint32_t size) const {
    auto it = svgs_.find(res);
    if (it == svgs_.end()) throw GraphError(GraphErrc::NotFound, "Unknown svg " + res.to_string());
    if (!rasterizer_) {
        throw GraphError(GraphErrc::MissingDependency, "No svg rasterizer registered for " + res.to_string());
    }
    cv::Mat out = rasterizer_(it->second, size);
    if (out.empty() || out.type() != CV_32FC4 || out.rows != static_cast<int>(size) ||
        out.cols != static_cast<int>(size)) {
        throw GraphError(GraphErrc::Io, "Svg rasterizer returned an invalid image for " + res.to_string());
    }
    return out;
}

void ExternalImageService::clear() {
    images_.clear();
    svgs_.clear();
}

} // namespace mf
