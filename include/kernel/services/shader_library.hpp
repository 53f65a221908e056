#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "gpu/compute_backend.hpp"
#include "mf_types.hpp"

namespace mf {

// 中间图像：尺寸与节点分配尺寸一致；类型未指定时跟随 type_from_output
struct IntermediateImageSpec {
    std::string name;
    std::optional<ImageType> type;
    std::string type_from_output;
};

struct ShaderDescription {
    std::string name;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::vector<IntermediateImageSpec> intermediates;
    // 1 = 逐像素；>1 表示分成多次 pass (例如可分离模糊)
    int passes = 1;
};

/**
 * @brief 算子 shader 描述表。
 *
 * 启动时对每个描述调用 ComputeBackend::has_pipeline，只保留后端能创建
 * pipeline 的 shader；解释器查不到 shader 时报告 MissingShader。
 */
class MATFORGE_API ShaderLibrary {
public:
    ShaderLibrary() = default;

    static std::vector<ShaderDescription> builtin_descriptions();
    // 返回加载失败的 shader 名称
    std::vector<std::string> load(const ComputeBackend& backend,
                                  const std::vector<ShaderDescription>& descriptions = builtin_descriptions());

    const ShaderDescription* find(const std::string& shader) const;
    bool empty() const { return shaders_.empty(); }
    std::size_t size() const { return shaders_.size(); }

private:
    std::map<std::string, ShaderDescription> shaders_;
};

} // namespace mf
