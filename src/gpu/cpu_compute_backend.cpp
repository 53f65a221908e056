#include "gpu/cpu_compute_backend.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numeric>
#include <random>

#include <opencv2/imgproc.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "operators.hpp"

namespace mf {

namespace {

int mat_type(ImageType type) {
    return type == ImageType::Rgb ? CV_32FC4 : CV_32FC1;
}

template <typename T>
T read_uniforms(const ComputePass& pass) {
    if (pass.uniforms.size() != sizeof(T)) {
        throw BackendError(BackendErrc::Pipeline,
                           "Uniform block size mismatch for shader '" + pass.shader + "'");
    }
    T u;
    std::memcpy(&u, pass.uniforms.data(), sizeof(T));
    return u;
}

ImageHandle binding(const std::map<std::string, ImageHandle>& m, const std::string& name,
                    const std::string& shader) {
    auto it = m.find(name);
    if (it == m.end() || it->second == 0) {
        throw BackendError(BackendErrc::Pipeline,
                           "Shader '" + shader + "' is missing binding '" + name + "'");
    }
    return it->second;
}

float smooth_min(float a, float b, float sharpness) {
    float k = 1.0f / std::max(sharpness, 1e-3f);
    float h = std::max(k - std::abs(a - b), 0.0f) / k;
    return std::min(a, b) - h * h * k * 0.25f;
}

float blend_value(BlendMode mode, float bg, float fg, float sharpness) {
    switch (mode) {
        case BlendMode::Mix: return fg;
        case BlendMode::Multiply: return bg * fg;
        case BlendMode::Add: return bg + fg;
        case BlendMode::Subtract: return bg - fg;
        case BlendMode::Screen: return 1.0f - (1.0f - bg) * (1.0f - fg);
        case BlendMode::Overlay:
            return bg < 0.5f ? 2.0f * bg * fg : 1.0f - 2.0f * (1.0f - bg) * (1.0f - fg);
        case BlendMode::Darken: return std::min(bg, fg);
        case BlendMode::Lighten: return std::max(bg, fg);
        case BlendMode::SmoothDarken: return smooth_min(bg, fg, sharpness);
        case BlendMode::SmoothLighten: return -smooth_min(-bg, -fg, sharpness);
    }
    return fg;
}

// 可平铺的 Perlin 噪声，周期为 period 个网格
class PerlinField {
public:
    PerlinField() : p_(512) {
        std::iota(p_.begin(), p_.begin() + 256, 0);
        std::mt19937 g(1337u);
        std::shuffle(p_.begin(), p_.begin() + 256, g);
        std::copy(p_.begin(), p_.begin() + 256, p_.begin() + 256);
    }

    double noise(double x, double y, int period) const {
        auto fade = [](double t) { return t * t * t * (t * (t * 6 - 15) + 10); };
        auto lerp = [](double t, double a, double b) { return a + t * (b - a); };
        auto grad = [](int hash, double x, double y) {
            switch (hash & 3) {
                case 0: return x + y;
                case 1: return -x + y;
                case 2: return x - y;
                default: return -x - y;
            }
        };
        int xi = static_cast<int>(std::floor(x)), yi = static_cast<int>(std::floor(y));
        x -= std::floor(x);
        y -= std::floor(y);
        auto wrap = [period](int v) { return ((v % period) + period) % period & 255; };
        int X0 = wrap(xi), X1 = wrap(xi + 1), Y0 = wrap(yi), Y1 = wrap(yi + 1);
        double u = fade(x), v = fade(y);
        int aa = p_[p_[X0] + Y0], ab = p_[p_[X0] + Y1], ba = p_[p_[X1] + Y0], bb = p_[p_[X1] + Y1];
        return lerp(v, lerp(u, grad(aa, x, y), grad(ba, x - 1, y)),
                    lerp(u, grad(ab, x, y - 1), grad(bb, x - 1, y - 1)));
    }

private:
    std::vector<int> p_;
};

const PerlinField& perlin_field() {
    static const PerlinField field;
    return field;
}

const std::vector<std::string>& builtin_pipelines() {
    static const std::vector<std::string> names = {
        "blend", "blend_masked", "perlin_noise", "rgb", "value", "blur",
    };
    return names;
}

} // namespace

CpuComputeBackend::CpuComputeBackend(std::size_t memory_budget, std::uint32_t thumbnail_size)
    : thumbnail_size_(thumbnail_size), memory_budget_(memory_budget) {}

std::size_t CpuComputeBackend::image_bytes(std::uint32_t size, ImageType type) {
    std::size_t px = static_cast<std::size_t>(size) * size;
    return px * sizeof(float) * (type == ImageType::Rgb ? 4 : 1);
}

CpuComputeBackend::ImageSlot& CpuComputeBackend::slot(ImageHandle image) {
    auto it = images_.find(image);
    if (it == images_.end()) {
        throw BackendError(BackendErrc::InvalidImage, "Unknown image handle " + std::to_string(image));
    }
    return it->second;
}

const CpuComputeBackend::ImageSlot& CpuComputeBackend::slot(ImageHandle image) const {
    auto it = images_.find(image);
    if (it == images_.end()) {
        throw BackendError(BackendErrc::InvalidImage, "Unknown image handle " + std::to_string(image));
    }
    return it->second;
}

const cv::Mat& CpuComputeBackend::backed_data(ImageHandle image, const char* what) const {
    const auto& s = slot(image);
    if (s.data.empty()) {
        throw BackendError(BackendErrc::InvalidImage,
                           std::string(what) + ": image " + std::to_string(image) + " is not backed");
    }
    return s.data;
}

ImageHandle CpuComputeBackend::create_image(std::uint32_t size, ImageType type, bool transfer_dst) {
    std::lock_guard<std::mutex> lock(mutex_);
    ImageHandle handle = next_handle_++;
    ImageSlot s;
    s.size = size;
    s.type = type;
    s.transfer_dst = transfer_dst;
    images_.emplace(handle, std::move(s));
    return handle;
}

void CpuComputeBackend::destroy_image(ImageHandle image) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = images_.find(image);
    if (it == images_.end()) return;
    if (!it->second.data.empty()) {
        bytes_used_ -= image_bytes(it->second.size, it->second.type);
        counters_.releases++;
    }
    images_.erase(it);
}

bool CpuComputeBackend::ensure_backed(ImageHandle image) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = slot(image);
    if (!s.data.empty()) return false;

    const std::size_t bytes = image_bytes(s.size, s.type);
    if (pending_failures_ > 0) {
        --pending_failures_;
        throw BackendError(BackendErrc::OutOfMemory,
                           "Injected allocation failure for image " + std::to_string(image));
    }
    if (bytes_used_ + bytes > memory_budget_) {
        throw BackendError(BackendErrc::OutOfMemory,
                           "Memory budget exhausted: " + std::to_string(bytes_used_) + " + " +
                               std::to_string(bytes) + " > " + std::to_string(memory_budget_));
    }
    try {
        s.data = cv::Mat::zeros(static_cast<int>(s.size), static_cast<int>(s.size), mat_type(s.type));
    } catch (const cv::Exception& e) {
        throw BackendError(BackendErrc::OutOfMemory, std::string("Allocation failed: ") + e.what());
    }
    s.layout = ImageLayout::Undefined;
    bytes_used_ += bytes;
    counters_.allocations++;
    return true;
}

bool CpuComputeBackend::is_backed(ImageHandle image) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = images_.find(image);
    return it != images_.end() && !it->second.data.empty();
}

void CpuComputeBackend::release(ImageHandle image) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = slot(image);
    if (s.data.empty()) return;
    s.data.release();
    s.layout = ImageLayout::Undefined;
    bytes_used_ -= image_bytes(s.size, s.type);
    counters_.releases++;
}

std::uint32_t CpuComputeBackend::image_size(ImageHandle image) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot(image).size;
}

ImageType CpuComputeBackend::image_type(ImageHandle image) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot(image).type;
}

BackendImageView CpuComputeBackend::view(ImageHandle image) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& s = slot(image);
    return BackendImageView{image, s.layout, s.size, s.type};
}

void CpuComputeBackend::upload(ImageHandle image, const ImageBuffer& pixels) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = slot(image);
    if (s.data.empty()) {
        throw BackendError(BackendErrc::Upload, "Upload target is not backed");
    }
    if (!s.transfer_dst) {
        throw BackendError(BackendErrc::Upload, "Upload target was not created as a transfer destination");
    }
    if (pixels.empty() || pixels.type != DataType::FLOAT32 ||
        pixels.width != static_cast<int>(s.size) || pixels.height != static_cast<int>(s.size) ||
        pixels.channels != s.data.channels()) {
        throw BackendError(BackendErrc::Upload, "Upload pixel layout does not match the target image");
    }
    toCvMat(pixels).copyTo(s.data);
    s.layout = ImageLayout::ShaderRead;
    counters_.uploads++;
}

ImageBuffer CpuComputeBackend::download(ImageHandle image) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_download_failures_ > 0) {
        pending_download_failures_--;
        throw BackendError(BackendErrc::Download, "download of image " + std::to_string(image) + " failed");
    }
    cv::Mat copy = backed_data(image, "download").clone();
    counters_.downloads++;
    return fromCvMat(copy);
}

void CpuComputeBackend::copy_image(ImageHandle from, ImageHandle to) {
    std::lock_guard<std::mutex> lock(mutex_);
    const cv::Mat& src = backed_data(from, "copy source");
    auto& dst = slot(to);
    if (dst.data.empty()) {
        throw BackendError(BackendErrc::InvalidImage, "copy destination is not backed");
    }
    if (src.channels() != dst.data.channels()) {
        throw BackendError(BackendErrc::InvalidImage, "copy between images of different types");
    }
    if (src.rows == dst.data.rows) {
        src.copyTo(dst.data);
    } else {
        cv::resize(src, dst.data, dst.data.size(), 0, 0, cv::INTER_LINEAR);
    }
    dst.layout = ImageLayout::ShaderRead;
    counters_.copies++;
}

bool CpuComputeBackend::has_pipeline(const std::string& shader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disabled_pipelines_.count(shader)) return false;
    const auto& names = builtin_pipelines();
    return std::find(names.begin(), names.end(), shader) != names.end();
}

void CpuComputeBackend::run_pass(const ComputePass& pass, const PassBindings& bindings) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disabled_pipelines_.count(pass.shader)) {
        throw BackendError(BackendErrc::Pipeline, "Pipeline '" + pass.shader + "' is unavailable");
    }
    if (pass.shader == "blend") {
        pass_blend(pass, bindings, false);
    } else if (pass.shader == "blend_masked") {
        pass_blend(pass, bindings, true);
    } else if (pass.shader == "perlin_noise") {
        pass_perlin_noise(pass, bindings);
    } else if (pass.shader == "rgb") {
        auto u = read_uniforms<uniforms::RgbUniforms>(pass);
        pass_fill(pass, bindings, cv::Scalar(u.rgb[0], u.rgb[1], u.rgb[2], 1.0));
    } else if (pass.shader == "value") {
        auto u = read_uniforms<uniforms::ValueUniforms>(pass);
        pass_fill(pass, bindings, cv::Scalar::all(u.value));
    } else if (pass.shader == "blur") {
        pass_blur(pass, bindings);
    } else {
        throw BackendError(BackendErrc::Pipeline, "No pipeline for shader '" + pass.shader + "'");
    }
    for (const auto& kv : bindings.outputs) slot(kv.second).layout = ImageLayout::General;
    counters_.dispatches++;
    counters_.dispatches_by_shader[pass.shader]++;
}

void CpuComputeBackend::pass_blend(const ComputePass& pass, const PassBindings& bindings, bool masked) {
    auto u = read_uniforms<uniforms::BlendUniforms>(pass);
    const cv::Mat& bg = backed_data(binding(bindings.inputs, "background", pass.shader), "blend");
    const cv::Mat& fg = backed_data(binding(bindings.inputs, "foreground", pass.shader), "blend");
    cv::Mat& out = slot(binding(bindings.outputs, "color", pass.shader)).data;
    if (out.empty()) throw BackendError(BackendErrc::InvalidImage, "blend output is not backed");

    cv::Mat bg_r, fg_r, mask_r;
    auto fit = [&out](const cv::Mat& in, cv::Mat& tmp) -> const cv::Mat& {
        if (in.size() == out.size()) return in;
        cv::resize(in, tmp, out.size(), 0, 0, cv::INTER_LINEAR);
        return tmp;
    };
    const cv::Mat& b = fit(bg, bg_r);
    const cv::Mat& f = fit(fg, fg_r);
    const cv::Mat* mask = nullptr;
    if (masked) {
        mask = &fit(backed_data(binding(bindings.inputs, "mask", pass.shader), "blend_masked"), mask_r);
    }
    if (b.channels() != out.channels() || f.channels() != out.channels()) {
        throw BackendError(BackendErrc::Pipeline, "blend inputs do not match the output type");
    }

    const auto mode = static_cast<BlendMode>(u.blend_mode);
    const int channels = out.channels();
    for (int y = 0; y < out.rows; ++y) {
        const float* pb = b.ptr<float>(y);
        const float* pf = f.ptr<float>(y);
        const float* pm = mask ? mask->ptr<float>(y) : nullptr;
        float* po = out.ptr<float>(y);
        for (int x = 0; x < out.cols; ++x) {
            const float mix = pm ? pm[x] : u.mix;
            for (int c = 0; c < channels; ++c) {
                const int i = x * channels + c;
                if (channels == 4 && c == 3) {
                    po[i] = 1.0f;
                    continue;
                }
                float v = blend_value(mode, pb[i], pf[i], u.sharpness);
                v = pb[i] + (v - pb[i]) * mix;
                if (u.clamp_output) v = std::min(std::max(v, 0.0f), 1.0f);
                po[i] = v;
            }
        }
    }
}

void CpuComputeBackend::pass_perlin_noise(const ComputePass& pass, const PassBindings& bindings) {
    auto u = read_uniforms<uniforms::PerlinNoiseUniforms>(pass);
    cv::Mat& out = slot(binding(bindings.outputs, "noise", pass.shader)).data;
    if (out.empty()) throw BackendError(BackendErrc::InvalidImage, "perlin_noise output is not backed");

    const auto& field = perlin_field();
    const int base_period = std::max(1, static_cast<int>(std::lround(u.scale)));
    const int octaves = std::max(1, u.octaves);
    for (int y = 0; y < out.rows; ++y) {
        float* row = out.ptr<float>(y);
        for (int x = 0; x < out.cols; ++x) {
            double nx = static_cast<double>(x) / out.cols;
            double ny = static_cast<double>(y) / out.rows;
            double sum = 0.0, amplitude = 1.0, norm = 0.0;
            int period = base_period;
            for (int o = 0; o < octaves; ++o) {
                sum += amplitude * field.noise(nx * period, ny * period, period);
                norm += amplitude;
                amplitude /= std::max(u.attenuation, 1e-3f);
                period *= 2;
            }
            row[x] = static_cast<float>((sum / norm + 1.0) * 0.5);
        }
    }
}

void CpuComputeBackend::pass_fill(const ComputePass& pass, const PassBindings& bindings, const cv::Scalar& value) {
    if (bindings.outputs.size() != 1) {
        throw BackendError(BackendErrc::Pipeline, "Shader '" + pass.shader + "' expects one output");
    }
    cv::Mat& out = slot(bindings.outputs.begin()->second).data;
    if (out.empty()) throw BackendError(BackendErrc::InvalidImage, pass.shader + " output is not backed");
    out.setTo(value);
}

void CpuComputeBackend::pass_blur(const ComputePass& pass, const PassBindings& bindings) {
    auto u = read_uniforms<uniforms::BlurUniforms>(pass);
    const cv::Mat& in = backed_data(binding(bindings.inputs, "image", pass.shader), "blur");
    cv::Mat& tmp = slot(binding(bindings.intermediates, "tmp", pass.shader)).data;
    cv::Mat& out = slot(binding(bindings.outputs, "blurred", pass.shader)).data;
    if (tmp.empty() || out.empty()) {
        throw BackendError(BackendErrc::InvalidImage, "blur images are not backed");
    }

    cv::Mat src;
    if (in.size() == out.size()) src = in;
    else cv::resize(in, src, out.size(), 0, 0, cv::INTER_LINEAR);

    // sigma 以 1024 像素为基准，保证不同分辨率下效果一致
    const double sigma = u.sigma * static_cast<double>(out.rows) / 1024.0;
    if (sigma <= 1e-3) {
        src.copyTo(out);
        return;
    }
    const int radius = static_cast<int>(std::ceil(3.0 * sigma));
    cv::Mat kernel = cv::getGaussianKernel(2 * radius + 1, sigma, CV_32F);
    cv::Mat identity = cv::Mat::ones(1, 1, CV_32F);
    // 水平 pass 写入中间图像，垂直 pass 写入输出
    cv::sepFilter2D(src, tmp, CV_32F, kernel, identity, cv::Point(-1, -1), 0, cv::BORDER_REFLECT_101);
    cv::sepFilter2D(tmp, out, CV_32F, identity, kernel, cv::Point(-1, -1), 0, cv::BORDER_REFLECT_101);
}

ThumbnailHandle CpuComputeBackend::new_thumbnail(ImageType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < thumbnails_.size(); ++i) {
        if (!thumbnails_[i].in_use) {
            thumbnails_[i].in_use = true;
            thumbnails_[i].type = type;
            thumbnails_[i].data = cv::Mat::zeros(thumbnail_size_, thumbnail_size_, mat_type(type));
            return static_cast<ThumbnailHandle>(i);
        }
    }
    ThumbnailSlot s;
    s.in_use = true;
    s.type = type;
    s.data = cv::Mat::zeros(thumbnail_size_, thumbnail_size_, mat_type(type));
    thumbnails_.push_back(std::move(s));
    return static_cast<ThumbnailHandle>(thumbnails_.size() - 1);
}

void CpuComputeBackend::return_thumbnail(ThumbnailHandle thumbnail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thumbnail >= thumbnails_.size()) return;
    thumbnails_[thumbnail].in_use = false;
    thumbnails_[thumbnail].data.release();
}

void CpuComputeBackend::generate_thumbnail(ImageHandle image, ThumbnailHandle thumbnail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thumbnail >= thumbnails_.size() || !thumbnails_[thumbnail].in_use) {
        throw BackendError(BackendErrc::Thumbnail, "Unknown thumbnail " + std::to_string(thumbnail));
    }
    const cv::Mat& src = backed_data(image, "thumbnail");
    auto& t = thumbnails_[thumbnail];
    if (src.channels() != t.data.channels()) {
        t.type = slot(image).type;
        t.data = cv::Mat::zeros(thumbnail_size_, thumbnail_size_, mat_type(t.type));
    }
    cv::resize(src, t.data, t.data.size(), 0, 0, cv::INTER_AREA);
    counters_.thumbnails++;
}

ImageBuffer CpuComputeBackend::thumbnail_pixels(ThumbnailHandle thumbnail) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thumbnail >= thumbnails_.size() || !thumbnails_[thumbnail].in_use) {
        throw BackendError(BackendErrc::Thumbnail, "Unknown thumbnail " + std::to_string(thumbnail));
    }
    return fromCvMat(thumbnails_[thumbnail].data.clone());
}

AllocatorUsage CpuComputeBackend::usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AllocatorUsage u;
    u.bytes_used = bytes_used_;
    u.bytes_budget = memory_budget_;
    for (const auto& kv : images_) {
        if (!kv.second.data.empty()) u.images_backed++;
    }
    return u;
}

void CpuComputeBackend::set_memory_budget(std::size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    memory_budget_ = bytes;
}

void CpuComputeBackend::inject_allocation_failures(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failures_ = count;
}

void CpuComputeBackend::inject_download_failures(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_download_failures_ = count;
}

void CpuComputeBackend::disable_pipeline(const std::string& shader) {
    std::lock_guard<std::mutex> lock(mutex_);
    disabled_pipelines_.insert(shader);
}

CpuComputeBackend::Counters CpuComputeBackend::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

void CpuComputeBackend::reset_counters() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_ = Counters{};
}

std::size_t CpuComputeBackend::live_images() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return images_.size();
}

cv::Mat CpuComputeBackend::pixels(ImageHandle image) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backed_data(image, "pixels").clone();
}

} // namespace mf
