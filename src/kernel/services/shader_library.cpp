#include "kernel/services/shader_library.hpp"

namespace mf {

std::vector<ShaderDescription> ShaderLibrary::builtin_descriptions() {
    std::vector<ShaderDescription> out;
    out.push_back({"blend", {"background", "foreground"}, {"color"}, {}, 1});
    out.push_back({"blend_masked", {"background", "foreground", "mask"}, {"color"}, {}, 1});
    out.push_back({"perlin_noise", {}, {"noise"}, {}, 1});
    out.push_back({"rgb", {}, {"color"}, {}, 1});
    out.push_back({"value", {}, {"value"}, {}, 1});
    out.push_back({"blur", {"image"}, {"blurred"}, {{"tmp", std::nullopt, "blurred"}}, 2});
    return out;
}

std::vector<std::string> ShaderLibrary::load(const ComputeBackend& backend,
                                             const std::vector<ShaderDescription>& descriptions) {
    std::vector<std::string> failed;
    shaders_.clear();
    for (const auto& d : descriptions) {
        if (backend.has_pipeline(d.name)) {
            shaders_[d.name] = d;
        } else {
            failed.push_back(d.name);
        }
    }
    return failed;
}

const ShaderDescription* ShaderLibrary::find(const std::string& shader) const {
    auto it = shaders_.find(shader);
    return it == shaders_.end() ? nullptr : &it->second;
}

} // namespace mf
