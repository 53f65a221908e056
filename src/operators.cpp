#include "operators.hpp"

#include <cctype>
#include <cstring>
#include <type_traits>

#include "kernel/param_utils.hpp"

namespace mf {

namespace {

// FNV-1a，仅用于参数变化检测
class ParamHasher {
public:
    void bytes(const void* data, size_t len) {
        const auto* p = static_cast<const std::uint8_t*>(data);
        for (size_t i = 0; i < len; ++i) {
            value_ ^= p[i];
            value_ *= 1099511628211ULL;
        }
    }
    void str(const std::string& s) {
        bytes(s.data(), s.size());
        bytes("\0", 1);
    }
    template <typename T>
    void pod(const T& v) {
        static_assert(std::is_trivially_copyable<T>::value, "pod() requires trivially copyable data");
        bytes(&v, sizeof(T));
    }
    std::uint64_t value() const { return value_; }

private:
    std::uint64_t value_ = 14695981039346656037ULL;
};

template <typename T>
std::vector<std::uint8_t> to_bytes(const T& v) {
    std::vector<std::uint8_t> out(sizeof(T));
    std::memcpy(out.data(), &v, sizeof(T));
    return out;
}

template <typename T>
T param_as(const YAML::Node& value, const std::string& field) {
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "Invalid value for parameter '" + field + "': " + e.what());
    }
}

BlendMode parse_blend_mode(const YAML::Node& value, const std::string& field) {
    std::string s = param_as<std::string>(value, field);
    if (auto mode = blend_mode_from_name(s)) return *mode;
    int index = param_as<int>(value, field);
    if (index < 0 || index > static_cast<int>(BlendMode::SmoothLighten)) {
        throw GraphError(GraphErrc::InvalidParameter, "Unknown blend mode '" + s + "'");
    }
    return static_cast<BlendMode>(index);
}

ImageType parse_image_type(const std::string& s) {
    if (s == "rgb") return ImageType::Rgb;
    if (s == "grayscale") return ImageType::Grayscale;
    throw GraphError(GraphErrc::InvalidParameter, "Unknown image type '" + s + "'");
}

OutputType parse_output_type(const std::string& s) {
    if (auto ty = output_type_from_name(s)) return *ty;
    throw GraphError(GraphErrc::InvalidParameter, "Unknown output type '" + s + "'");
}

template <typename R>
R parse_external_resource(const std::string& s) {
    if (s.find(':') == std::string::npos) return R("/" + s);
    return R::parse(s);
}

[[noreturn]] void unknown_field(const std::string& op, const std::string& field) {
    throw GraphError(GraphErrc::InvalidParameter, "Operator '" + op + "' has no parameter '" + field + "'");
}

} // namespace

void ParamSubstitution::substitute(AtomicOperator& op) const {
    set_parameter(op, resource.parameter_field(), value);
}

SocketMap operator_inputs(const AtomicOperator& op) {
    return std::visit([](auto&& o) -> SocketMap {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blend>) {
            return {{"background", {OperatorType::poly(0)}}, {"foreground", {OperatorType::poly(0)}}};
        } else if constexpr (std::is_same_v<T, BlendMasked>) {
            return {{"background", {OperatorType::poly(0)}},
                    {"foreground", {OperatorType::poly(0)}},
                    {"mask", {OperatorType::monomorphic(ImageType::Grayscale)}}};
        } else if constexpr (std::is_same_v<T, Blur>) {
            return {{"image", {OperatorType::poly(0)}}};
        } else if constexpr (std::is_same_v<T, Output>) {
            return {{"data", {OperatorType::monomorphic(output_image_type(o.output_type))}}};
        } else {
            return {};
        }
    }, op);
}

SocketMap operator_outputs(const AtomicOperator& op) {
    return std::visit([](auto&& o) -> SocketMap {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blend> || std::is_same_v<T, BlendMasked>) {
            return {{"color", {OperatorType::poly(0)}}};
        } else if constexpr (std::is_same_v<T, PerlinNoise>) {
            return {{"noise", {OperatorType::monomorphic(ImageType::Grayscale)}}};
        } else if constexpr (std::is_same_v<T, Rgb>) {
            return {{"color", {OperatorType::monomorphic(ImageType::Rgb)}}};
        } else if constexpr (std::is_same_v<T, Value>) {
            return {{"value", {OperatorType::monomorphic(ImageType::Grayscale)}}};
        } else if constexpr (std::is_same_v<T, Blur>) {
            return {{"blurred", {OperatorType::poly(0)}}};
        } else if constexpr (std::is_same_v<T, Image> || std::is_same_v<T, Svg>) {
            return {{"image", {OperatorType::monomorphic(ImageType::Rgb)}}};
        } else if constexpr (std::is_same_v<T, Input>) {
            return {{"data", {OperatorType::monomorphic(o.type)}}};
        } else {
            return {};
        }
    }, op);
}

SocketMap operator_inputs(const ComplexOperator& op) {
    SocketMap out;
    for (const auto& kv : op.inputs) out[kv.first] = SocketSpec{kv.second.first};
    return out;
}

SocketMap operator_outputs(const ComplexOperator& op) {
    SocketMap out;
    for (const auto& kv : op.outputs) out[kv.first] = SocketSpec{kv.second.first};
    return out;
}

SocketMap operator_inputs(const Operator& op) {
    return std::visit([](auto&& o) { return operator_inputs(o); }, op);
}

SocketMap operator_outputs(const Operator& op) {
    return std::visit([](auto&& o) { return operator_outputs(o); }, op);
}

std::uint64_t parameter_hash(const AtomicOperator& op) {
    ParamHasher h;
    h.pod(op.index());
    std::visit([&h](auto&& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Image> || std::is_same_v<T, Svg>) {
            h.str(o.resource.to_string());
        } else if constexpr (std::is_same_v<T, Input>) {
            h.pod(o.type);
        } else if constexpr (std::is_same_v<T, Output>) {
            h.pod(o.output_type);
        }
    }, op);
    auto bytes = uniform_bytes(op);
    h.bytes(bytes.data(), bytes.size());
    return h.value();
}

std::uint64_t parameter_hash(const ComplexOperator& op) {
    ParamHasher h;
    h.str(op.graph.to_string());
    for (const auto& kv : op.parameters) {
        h.str(kv.first);
        h.str(kv.second.resource.to_string());
        h.str(YAML::Dump(kv.second.value));
    }
    return h.value();
}

std::uint64_t parameter_hash(const Operator& op) {
    return std::visit([](auto&& o) { return parameter_hash(o); }, op);
}

void set_parameter(AtomicOperator& op, const std::string& field, const YAML::Node& value) {
    std::visit([&](auto&& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blend>) {
            if (field == "blend_mode") o.blend_mode = parse_blend_mode(value, field);
            else if (field == "mix") o.mix = param_as<float>(value, field);
            else if (field == "sharpness") o.sharpness = param_as<float>(value, field);
            else if (field == "clamp_output") o.clamp_output = param_as<bool>(value, field);
            else unknown_field("blend", field);
        } else if constexpr (std::is_same_v<T, BlendMasked>) {
            if (field == "blend_mode") o.blend_mode = parse_blend_mode(value, field);
            else if (field == "sharpness") o.sharpness = param_as<float>(value, field);
            else if (field == "clamp_output") o.clamp_output = param_as<bool>(value, field);
            else unknown_field("blend_masked", field);
        } else if constexpr (std::is_same_v<T, PerlinNoise>) {
            if (field == "scale") o.scale = param_as<float>(value, field);
            else if (field == "octaves") o.octaves = param_as<int>(value, field);
            else if (field == "attenuation") o.attenuation = param_as<float>(value, field);
            else unknown_field("perlin_noise", field);
        } else if constexpr (std::is_same_v<T, Rgb>) {
            if (field != "rgb") unknown_field("rgb", field);
            auto v = param_as<std::vector<float>>(value, field);
            if (v.size() != 3) {
                throw GraphError(GraphErrc::InvalidParameter, "Parameter 'rgb' expects 3 components");
            }
            o.rgb = {{v[0], v[1], v[2]}};
        } else if constexpr (std::is_same_v<T, Value>) {
            if (field != "value") unknown_field("value", field);
            o.value = param_as<float>(value, field);
        } else if constexpr (std::is_same_v<T, Blur>) {
            if (field != "sigma") unknown_field("blur", field);
            o.sigma = param_as<float>(value, field);
        } else if constexpr (std::is_same_v<T, Image>) {
            if (field != "resource") unknown_field("image", field);
            o.resource = parse_external_resource<ImageResource>(param_as<std::string>(value, field));
        } else if constexpr (std::is_same_v<T, Svg>) {
            if (field != "resource") unknown_field("svg", field);
            o.resource = parse_external_resource<SvgResource>(param_as<std::string>(value, field));
        } else if constexpr (std::is_same_v<T, Input>) {
            if (field != "type") unknown_field("input", field);
            o.type = parse_image_type(param_as<std::string>(value, field));
        } else if constexpr (std::is_same_v<T, Output>) {
            if (field != "output_type") unknown_field("output", field);
            o.output_type = parse_output_type(param_as<std::string>(value, field));
        }
    }, op);
}

void set_parameter(ComplexOperator& op, const std::string& field, const YAML::Node& value) {
    auto it = op.parameters.find(field);
    if (it == op.parameters.end()) unknown_field(op.title, field);
    it->second.value = YAML::Clone(value);
}

void set_parameter(Operator& op, const std::string& field, const YAML::Node& value) {
    std::visit([&](auto&& o) { set_parameter(o, field, value); }, op);
}

std::string default_name(const Operator& op) {
    if (const auto* complex = std::get_if<ComplexOperator>(&op)) {
        return complex->graph.file();
    }
    return std::visit([](auto&& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blend>) return "blend";
        else if constexpr (std::is_same_v<T, BlendMasked>) return "blend_masked";
        else if constexpr (std::is_same_v<T, PerlinNoise>) return "perlin_noise";
        else if constexpr (std::is_same_v<T, Rgb>) return "rgb";
        else if constexpr (std::is_same_v<T, Value>) return "value";
        else if constexpr (std::is_same_v<T, Blur>) return "blur";
        else if constexpr (std::is_same_v<T, Image>) return "image";
        else if constexpr (std::is_same_v<T, Svg>) return "svg";
        else if constexpr (std::is_same_v<T, Input>) return "input";
        else return "output";
    }, std::get<AtomicOperator>(op));
}

std::string operator_title(const Operator& op) {
    if (const auto* complex = std::get_if<ComplexOperator>(&op)) {
        return complex->title.empty() ? complex->graph.file() : complex->title;
    }
    std::string name = default_name(op);
    std::string title;
    bool upper = true;
    for (char c : name) {
        if (c == '_') {
            title += ' ';
            upper = true;
        } else {
            title += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
            upper = false;
        }
    }
    return title;
}

std::optional<std::string> shader_name(const AtomicOperator& op) {
    return std::visit([](auto&& o) -> std::optional<std::string> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blend>) return std::string("blend");
        else if constexpr (std::is_same_v<T, BlendMasked>) return std::string("blend_masked");
        else if constexpr (std::is_same_v<T, PerlinNoise>) return std::string("perlin_noise");
        else if constexpr (std::is_same_v<T, Rgb>) return std::string("rgb");
        else if constexpr (std::is_same_v<T, Value>) return std::string("value");
        else if constexpr (std::is_same_v<T, Blur>) return std::string("blur");
        else return std::nullopt;
    }, op);
}

std::vector<std::uint8_t> uniform_bytes(const AtomicOperator& op) {
    return std::visit([](auto&& o) -> std::vector<std::uint8_t> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blend>) {
            uniforms::BlendUniforms u{static_cast<std::uint32_t>(o.blend_mode), o.mix, o.sharpness,
                                      o.clamp_output ? 1u : 0u};
            return to_bytes(u);
        } else if constexpr (std::is_same_v<T, BlendMasked>) {
            uniforms::BlendUniforms u{static_cast<std::uint32_t>(o.blend_mode), 1.0f, o.sharpness,
                                      o.clamp_output ? 1u : 0u};
            return to_bytes(u);
        } else if constexpr (std::is_same_v<T, PerlinNoise>) {
            uniforms::PerlinNoiseUniforms u{o.scale, o.octaves, o.attenuation};
            return to_bytes(u);
        } else if constexpr (std::is_same_v<T, Rgb>) {
            uniforms::RgbUniforms u{{o.rgb[0], o.rgb[1], o.rgb[2]}};
            return to_bytes(u);
        } else if constexpr (std::is_same_v<T, Value>) {
            return to_bytes(uniforms::ValueUniforms{o.value});
        } else if constexpr (std::is_same_v<T, Blur>) {
            return to_bytes(uniforms::BlurUniforms{o.sigma});
        } else {
            return {};
        }
    }, op);
}

bool has_external_data(const AtomicOperator& op) {
    return std::holds_alternative<Image>(op) || std::holds_alternative<Svg>(op) ||
           std::holds_alternative<Input>(op);
}

AtomicOperator atomic_operator_from_yaml(const std::string& type, const YAML::Node& p) {
    if (type == "blend" || type == "blend_masked") {
        auto mode = blend_mode_from_name(as_str(p, "blend_mode", "mix"));
        if (!mode) {
            throw GraphError(GraphErrc::InvalidYaml, "Unknown blend_mode '" + as_str(p, "blend_mode") + "'");
        }
        if (type == "blend_masked") {
            return BlendMasked{*mode, static_cast<float>(as_double_flexible(p, "sharpness", 16.0)),
                               as_bool_flexible(p, "clamp_output", true)};
        }
        return Blend{*mode, static_cast<float>(as_double_flexible(p, "mix", 0.5)),
                     static_cast<float>(as_double_flexible(p, "sharpness", 16.0)),
                     as_bool_flexible(p, "clamp_output", false)};
    }
    if (type == "perlin_noise") {
        return PerlinNoise{static_cast<float>(as_double_flexible(p, "scale", 3.0)),
                           as_int_flexible(p, "octaves", 2),
                           static_cast<float>(as_double_flexible(p, "attenuation", 2.0))};
    }
    if (type == "rgb") {
        AtomicOperator op = Rgb{};
        if (p && p["rgb"]) set_parameter(op, "rgb", p["rgb"]);
        return op;
    }
    if (type == "value") {
        return Value{static_cast<float>(as_double_flexible(p, "value", 0.5))};
    }
    if (type == "blur") {
        return Blur{static_cast<float>(as_double_flexible(p, "sigma", 4.0))};
    }
    if (type == "image") {
        return Image{parse_external_resource<ImageResource>(as_str(p, "resource"))};
    }
    if (type == "svg") {
        return Svg{parse_external_resource<SvgResource>(as_str(p, "resource"))};
    }
    if (type == "input") {
        return Input{parse_image_type(as_str(p, "type", "grayscale"))};
    }
    if (type == "output") {
        return Output{parse_output_type(as_str(p, "output_type", "value"))};
    }
    throw GraphError(GraphErrc::InvalidYaml, "Unknown operator type '" + type + "'");
}

} // namespace mf
