#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "gpu/compute_backend.hpp"
#include "mf_types.hpp"
#include "resource.hpp"

namespace mf {

constexpr std::uint32_t kDefaultGroupSize = 1024;
constexpr double kTimingDecay = 0.85;

// 指数滑动平均，用于节点执行耗时
class Ema {
public:
    explicit Ema(double decay = kTimingDecay) : decay_(decay) {}
    void update(double sample) {
        value_ = has_value_ ? decay_ * value_ + (1.0 - decay_) * sample : sample;
        has_value_ = true;
    }
    double get() const { return value_; }
    bool has_value() const { return has_value_; }

private:
    double decay_;
    double value_ = 0.0;
    bool has_value_ = false;
};

struct GroupSize {
    std::uint32_t ideal = kDefaultGroupSize;
    std::optional<std::uint32_t> allocated;
    bool scalable = true;

    std::uint32_t allocation_size() const;

    /**
     * @brief 按栈帧尺寸调整可缩放节点的分配尺寸。
     *
     * 节点在 parent_size 下理想尺寸为 ideal；在 frame_size 的栈帧中按同一比例
     * 缩放。返回 true 表示分配尺寸发生了变化，输出图像需要重建。
     */
    bool ensure_allocation_size(std::uint32_t parent_size, std::uint32_t frame_size);
};

struct TypedOutput {
    ImageHandle image = 0;
    ImageType type = ImageType::Grayscale;
    bool transfer_dst = false;
    // 最后一次写入的序号；由拷贝写入时记录来源输出
    std::uint64_t seq = 0;
    std::optional<SocketResource> copied_from;
};

/**
 * @brief 一个节点的全部计算状态：输出图像、输入绑定、更新序号与缩略图。
 *
 * seq 是输出最后一次被写入时解释器的序号；force 表示无论哈希与输入是否
 * 变化都必须重算。
 */
struct SocketGroup {
    std::map<std::string, TypedOutput> typed_outputs;
    // 已声明但可能尚未单态化的输出
    std::set<std::string> known_outputs;
    std::map<std::string, SocketResource> inputs;
    bool force = false;
    std::uint64_t seq = 0;
    std::optional<std::uint64_t> last_hash;
    GroupSize size;
    Ema timing;
    std::optional<ThumbnailHandle> thumbnail;
    std::uint64_t thumbnail_seq = 0;
};

/**
 * @brief socket 注册表：统一持有所有节点的输出图像。
 *
 * 图像句柄只由注册表创建和销毁；注册表析构时归还所有图像与缩略图。
 * 解释器与 ComputeManager 都通过这里的访问器读写节点状态。
 */
class MATFORGE_API SocketRegistry {
public:
    explicit SocketRegistry(ComputeBackend& backend);
    ~SocketRegistry();
    SocketRegistry(const SocketRegistry&) = delete;
    SocketRegistry& operator=(const SocketRegistry&) = delete;

    SocketGroup& ensure_group_exists(const NodeResource& node, std::uint32_t size);
    bool has_group(const NodeResource& node) const;
    SocketGroup* find(const NodeResource& node);
    const SocketGroup* find(const NodeResource& node) const;
    // @throws GraphError(NotFound)
    SocketGroup& group(const NodeResource& node);
    const SocketGroup& group(const NodeResource& node) const;

    // 删除节点，返回被销毁图像的 socket 列表
    std::vector<SocketResource> remove_group(const NodeResource& node);
    void rename_group(const NodeResource& from, const NodeResource& to);
    void rename_graph(const GraphResource& from, const GraphResource& to);
    std::vector<NodeResource> known_groups() const;
    void clear();

    // type 为空表示多态输出尚未单态化，只记录为已知输出
    void add_output_socket(const SocketResource& socket, std::optional<ImageType> type,
                           std::uint32_t size, bool transfer_dst);
    bool is_known_output(const SocketResource& socket) const;
    // 为已知输出创建指定类型的图像（已存在同类型时不做任何事）。返回是否新建。
    bool monomorphize_output(const SocketResource& socket, ImageType type);
    bool remove_output_image(const SocketResource& socket);

    std::optional<TypedOutput> output(const SocketResource& socket) const;
    std::optional<std::uint64_t> output_updated(const SocketResource& socket) const;

    // 输入绑定：sink socket -> 上游输出 socket
    bool connect_input(const SocketResource& from, const SocketResource& to);
    void disconnect_input(const SocketResource& to);
    std::optional<SocketResource> input_binding(const SocketResource& to) const;
    std::optional<TypedOutput> input_source(const SocketResource& to) const;
    std::optional<std::uint64_t> input_updated(const SocketResource& to) const;

    bool force(const NodeResource& node) const;
    void set_force(const NodeResource& node);
    void force_all();
    // 标记全部输出在 seq 时更新，同时清除 force
    void set_outputs_updated(const NodeResource& node, std::uint64_t seq);
    // 单个输出被拷贝写入
    void set_output_copied(const SocketResource& socket, std::uint64_t seq, const SocketResource& source);
    // 只改写全部输出的序号，不改动拷贝来源、组序号与 force
    void set_outputs_sequence(const NodeResource& node, std::uint64_t seq);

    // 释放节点输出图像的内存并置 force；句柄保持有效
    void free_images(const NodeResource& node);
    // 以新尺寸重建节点的输出图像并置 force
    void reinit_output_images(const NodeResource& node, std::uint32_t size);
    // 修改理想尺寸，变化时返回 true
    bool resize(const NodeResource& node, std::uint32_t size, bool scalable);

    // 返回 true 表示新建了缩略图
    bool ensure_thumbnail(const NodeResource& node, ImageType type);
    std::optional<ThumbnailHandle> clear_thumbnail(const NodeResource& node);

    void update_timing(const NodeResource& node, double seconds);
    // 只影响之后创建的节点
    void set_timing_decay(double decay) { timing_decay_ = decay; }

private:
    void destroy_group_images(SocketGroup& group);

    ComputeBackend& backend_;
    std::unordered_map<NodeResource, SocketGroup> groups_;
    double timing_decay_ = kTimingDecay;
};

} // namespace mf
