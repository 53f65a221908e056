#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mf {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(MATFORGE_LIB_BUILD)
        #define MATFORGE_API __declspec(dllexport)
    #else
        #define MATFORGE_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(MATFORGE_LIB_BUILD)
        #define MATFORGE_API __attribute__((visibility("default")))
    #else
        #define MATFORGE_API
    #endif
#endif

enum class GraphErrc {
    Unknown = 1, NotFound, Io, InvalidYaml, InvalidParameter, InvalidResource,
    MissingDependency, Duplicate, Cycle, Linearization,
    // Type monomorphization / connection errors
    TypeMismatch, SelfConnection, SinkToSink, PolymorphicConnection,
};

struct MATFORGE_API GraphError : public std::runtime_error {
    explicit GraphError(const std::string& what)
        : std::runtime_error(what), code_(GraphErrc::Unknown) {}
    GraphError(GraphErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    GraphErrc code() const noexcept { return code_; }
private:
    GraphErrc code_;
};

const char* graph_errc_name(GraphErrc code);

// --- 图像类型 ---
// Grayscale 为单通道 float，Rgb 为四通道 (RGBA, alpha 恒为 1)。
enum class ImageType { Grayscale, Rgb };

inline const char* image_type_name(ImageType ty) {
    return ty == ImageType::Rgb ? "rgb" : "grayscale";
}

enum class ColorSpace { Srgb, Linear };

enum class OutputType {
    Albedo, Roughness, Normal, Displacement, Metallic, Value, Rgb,
};

const char* output_type_name(OutputType ty);
std::optional<OutputType> output_type_from_name(const std::string& name);

// Output 节点输入端的图像类型
inline ImageType output_image_type(OutputType ty) {
    switch (ty) {
        case OutputType::Albedo:
        case OutputType::Normal:
        case OutputType::Rgb:
            return ImageType::Rgb;
        default:
            return ImageType::Grayscale;
    }
}

enum class MaterialChannel { Displacement, Albedo, Normal, Roughness, Metallic };

inline const std::vector<MaterialChannel>& all_material_channels() {
    static const std::vector<MaterialChannel> channels = {
        MaterialChannel::Displacement, MaterialChannel::Albedo, MaterialChannel::Normal,
        MaterialChannel::Roughness, MaterialChannel::Metallic,
    };
    return channels;
}

const char* channel_short_name(MaterialChannel channel);
std::optional<MaterialChannel> channel_from_name(const std::string& name);
OutputType channel_output_type(MaterialChannel channel);

enum class BlendMode {
    Mix, Multiply, Add, Subtract, Screen, Overlay, Darken, Lighten, SmoothDarken, SmoothLighten,
};

const char* blend_mode_name(BlendMode mode);
std::optional<BlendMode> blend_mode_from_name(const std::string& name);

// 节点内部的类型变量编号
using TypeVariable = std::uint8_t;

// 一个 socket 的声明类型：要么是具体的图像类型，要么是一个类型变量。
struct OperatorType {
    bool polymorphic = false;
    ImageType image = ImageType::Grayscale;
    TypeVariable variable = 0;

    static OperatorType monomorphic(ImageType ty) { return OperatorType{false, ty, 0}; }
    static OperatorType poly(TypeVariable var) { return OperatorType{true, ImageType::Grayscale, var}; }

    std::optional<ImageType> concrete() const {
        if (polymorphic) return std::nullopt;
        return image;
    }

    bool operator==(const OperatorType& o) const {
        return polymorphic == o.polymorphic &&
               (polymorphic ? variable == o.variable : image == o.image);
    }
    bool operator!=(const OperatorType& o) const { return !(*this == o); }
};

} // namespace mf
