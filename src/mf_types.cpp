#include "mf_types.hpp"

namespace mf {

const char* graph_errc_name(GraphErrc code) {
    switch (code) {
        case GraphErrc::Unknown: return "unknown";
        case GraphErrc::NotFound: return "not_found";
        case GraphErrc::Io: return "io";
        case GraphErrc::InvalidYaml: return "invalid_yaml";
        case GraphErrc::InvalidParameter: return "invalid_parameter";
        case GraphErrc::InvalidResource: return "invalid_resource";
        case GraphErrc::MissingDependency: return "missing_dependency";
        case GraphErrc::Duplicate: return "duplicate";
        case GraphErrc::Cycle: return "cycle";
        case GraphErrc::Linearization: return "linearization";
        case GraphErrc::TypeMismatch: return "type_mismatch";
        case GraphErrc::SelfConnection: return "self_connection";
        case GraphErrc::SinkToSink: return "sink_to_sink";
        case GraphErrc::PolymorphicConnection: return "polymorphic_connection";
    }
    return "unknown";
}

const char* output_type_name(OutputType ty) {
    switch (ty) {
        case OutputType::Albedo: return "albedo";
        case OutputType::Roughness: return "roughness";
        case OutputType::Normal: return "normal";
        case OutputType::Displacement: return "displacement";
        case OutputType::Metallic: return "metallic";
        case OutputType::Value: return "value";
        case OutputType::Rgb: return "rgb";
    }
    return "value";
}

std::optional<OutputType> output_type_from_name(const std::string& name) {
    for (auto ty : {OutputType::Albedo, OutputType::Roughness, OutputType::Normal,
                    OutputType::Displacement, OutputType::Metallic, OutputType::Value,
                    OutputType::Rgb}) {
        if (name == output_type_name(ty)) return ty;
    }
    return std::nullopt;
}

const char* channel_short_name(MaterialChannel channel) {
    switch (channel) {
        case MaterialChannel::Displacement: return "disp";
        case MaterialChannel::Albedo: return "col";
        case MaterialChannel::Normal: return "nor";
        case MaterialChannel::Roughness: return "rgh";
        case MaterialChannel::Metallic: return "met";
    }
    return "col";
}

std::optional<MaterialChannel> channel_from_name(const std::string& name) {
    for (auto channel : all_material_channels()) {
        if (name == channel_short_name(channel) ||
            name == output_type_name(channel_output_type(channel))) {
            return channel;
        }
    }
    return std::nullopt;
}

OutputType channel_output_type(MaterialChannel channel) {
    switch (channel) {
        case MaterialChannel::Displacement: return OutputType::Displacement;
        case MaterialChannel::Albedo: return OutputType::Albedo;
        case MaterialChannel::Normal: return OutputType::Normal;
        case MaterialChannel::Roughness: return OutputType::Roughness;
        case MaterialChannel::Metallic: return OutputType::Metallic;
    }
    return OutputType::Value;
}

const char* blend_mode_name(BlendMode mode) {
    switch (mode) {
        case BlendMode::Mix: return "mix";
        case BlendMode::Multiply: return "multiply";
        case BlendMode::Add: return "add";
        case BlendMode::Subtract: return "subtract";
        case BlendMode::Screen: return "screen";
        case BlendMode::Overlay: return "overlay";
        case BlendMode::Darken: return "darken";
        case BlendMode::Lighten: return "lighten";
        case BlendMode::SmoothDarken: return "smooth_darken";
        case BlendMode::SmoothLighten: return "smooth_lighten";
    }
    return "mix";
}

std::optional<BlendMode> blend_mode_from_name(const std::string& name) {
    for (int i = 0; i <= static_cast<int>(BlendMode::SmoothLighten); ++i) {
        auto mode = static_cast<BlendMode>(i);
        if (name == blend_mode_name(mode)) return mode;
    }
    return std::nullopt;
}

} // namespace mf
