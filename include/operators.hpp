#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "mf_types.hpp"
#include "resource.hpp"

namespace mf {

struct SocketSpec {
    OperatorType type;
    bool optional = false;
};

// 按名称排序，保证线性化顺序稳定
using SocketMap = std::map<std::string, SocketSpec>;

// --- 原子算子 ---
// 每个结构体只保存参数；socket 声明与哈希由下面的自由函数提供。

struct Blend {
    BlendMode blend_mode = BlendMode::Mix;
    float mix = 0.5f;
    float sharpness = 16.0f;
    bool clamp_output = false;
};

struct BlendMasked {
    BlendMode blend_mode = BlendMode::Mix;
    float sharpness = 16.0f;
    bool clamp_output = true;
};

struct PerlinNoise {
    float scale = 3.0f;
    int octaves = 2;
    float attenuation = 2.0f;
};

struct Rgb {
    std::array<float, 3> rgb{{0.5f, 0.5f, 0.5f}};
};

struct Value {
    float value = 0.5f;
};

struct Blur {
    float sigma = 4.0f;
};

struct Image {
    ImageResource resource;
};

struct Svg {
    SvgResource resource;
};

struct Input {
    ImageType type = ImageType::Grayscale;
};

struct Output {
    OutputType output_type = OutputType::Value;
};

using AtomicOperator =
    std::variant<Blend, BlendMasked, PerlinNoise, Rgb, Value, Blur, Image, Svg, Input, Output>;

// 复杂算子对内部参数的一次覆盖，不修改被调用图本身
struct ParamSubstitution {
    ParamResource resource;
    YAML::Node value;

    void substitute(AtomicOperator& op) const;
};

struct ComplexOperator {
    GraphResource graph;
    std::string title;
    // 对外暴露的 socket -> (类型, 子图中的 Input/Output 节点)
    std::map<std::string, std::pair<OperatorType, NodeResource>> inputs;
    std::map<std::string, std::pair<OperatorType, NodeResource>> outputs;
    // 对外暴露的参数 -> 子图参数的覆盖值
    std::map<std::string, ParamSubstitution> parameters;
};

using Operator = std::variant<AtomicOperator, ComplexOperator>;

// --- Uniform 布局，由计算后端按相同布局解读 ---
namespace uniforms {
struct BlendUniforms {
    std::uint32_t blend_mode;
    float mix;
    float sharpness;
    std::uint32_t clamp_output;
};
struct PerlinNoiseUniforms {
    float scale;
    std::int32_t octaves;
    float attenuation;
};
struct RgbUniforms {
    float rgb[3];
};
struct ValueUniforms {
    float value;
};
struct BlurUniforms {
    float sigma;
};
} // namespace uniforms

// --- 能力接口 ---
SocketMap operator_inputs(const AtomicOperator& op);
SocketMap operator_outputs(const AtomicOperator& op);
SocketMap operator_inputs(const ComplexOperator& op);
SocketMap operator_outputs(const ComplexOperator& op);
SocketMap operator_inputs(const Operator& op);
SocketMap operator_outputs(const Operator& op);

std::uint64_t parameter_hash(const AtomicOperator& op);
std::uint64_t parameter_hash(const ComplexOperator& op);
std::uint64_t parameter_hash(const Operator& op);

/**
 * @brief 修改算子参数。
 * @throws GraphError(InvalidParameter) 字段未知或值无法解析。
 */
void set_parameter(AtomicOperator& op, const std::string& field, const YAML::Node& value);
void set_parameter(ComplexOperator& op, const std::string& field, const YAML::Node& value);
void set_parameter(Operator& op, const std::string& field, const YAML::Node& value);

std::string operator_title(const Operator& op);
std::string default_name(const Operator& op);

// 需要 GPU 计算 pass 的算子返回 shader 名称；Image/Svg/Input/Output 返回空。
std::optional<std::string> shader_name(const AtomicOperator& op);
std::vector<std::uint8_t> uniform_bytes(const AtomicOperator& op);

// 输出图像由外部数据写入（上传或拷贝），需要可作为传输目标
bool has_external_data(const AtomicOperator& op);

inline bool is_output(const AtomicOperator& op) { return std::holds_alternative<Output>(op); }
inline bool is_input(const AtomicOperator& op) { return std::holds_alternative<Input>(op); }

/**
 * @brief 从图描述中的 type 与 parameters 构造原子算子。
 * @throws GraphError(InvalidYaml) 未知的算子类型。
 */
AtomicOperator atomic_operator_from_yaml(const std::string& type, const YAML::Node& parameters);

} // namespace mf
