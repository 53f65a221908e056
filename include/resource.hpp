#pragma once
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>

#include "mf_types.hpp"

namespace mf {

// 资源种类标记。Resource<Kind> 仅在编译期区分用途，运行期只是一条路径。
namespace r {
struct Graph {};
struct Node {};
struct Socket {};
struct Param {};
struct Img {};
struct Svg {};
} // namespace r

template <typename Kind> struct ResourceScheme;
template <> struct ResourceScheme<r::Graph>  { static constexpr const char* value = "graph"; };
template <> struct ResourceScheme<r::Node>   { static constexpr const char* value = "node"; };
template <> struct ResourceScheme<r::Socket> { static constexpr const char* value = "node"; };
template <> struct ResourceScheme<r::Param>  { static constexpr const char* value = "node"; };
template <> struct ResourceScheme<r::Img>    { static constexpr const char* value = "img"; };
template <> struct ResourceScheme<r::Svg>    { static constexpr const char* value = "svg"; };

template <typename Kind>
constexpr bool resource_has_fragment =
    std::is_same<Kind, r::Socket>::value || std::is_same<Kind, r::Param>::value;

/**
 * @brief 分层资源路径，形如 "node:/graph/node:socket"。
 *
 * 图、节点、socket、参数与外部图像都以此为键。比较和哈希均按值进行。
 */
template <typename Kind>
class Resource {
public:
    Resource() = default;
    explicit Resource(std::string path, std::string fragment = {})
        : path_(std::move(path)), fragment_(std::move(fragment)) {
        if (path_.empty() || path_.front() != '/') path_.insert(path_.begin(), '/');
    }

    /**
     * @brief 从字符串形式解析资源。
     * @throws GraphError(InvalidResource) 当 scheme 不符或缺少必要的 fragment。
     */
    static Resource parse(const std::string& text) {
        const std::string scheme = ResourceScheme<Kind>::value;
        if (text.compare(0, scheme.size() + 1, scheme + ":") != 0) {
            throw GraphError(GraphErrc::InvalidResource,
                             "Resource '" + text + "' does not use scheme '" + scheme + "'");
        }
        std::string rest = text.substr(scheme.size() + 1);
        std::string fragment;
        auto colon = rest.find(':');
        if (colon != std::string::npos) {
            fragment = rest.substr(colon + 1);
            rest = rest.substr(0, colon);
        }
        if (rest.size() < 2 || rest.front() != '/') {
            throw GraphError(GraphErrc::InvalidResource, "Resource '" + text + "' has an empty path");
        }
        if (resource_has_fragment<Kind> == fragment.empty()) {
            throw GraphError(GraphErrc::InvalidResource,
                             "Resource '" + text + "' has an unexpected fragment layout");
        }
        return Resource(rest, fragment);
    }

    const std::string& path() const { return path_; }
    const std::string& fragment() const { return fragment_; }
    bool empty() const { return path_.empty(); }

    // 路径的最后一段
    std::string file() const {
        auto slash = path_.rfind('/');
        return slash == std::string::npos ? path_ : path_.substr(slash + 1);
    }

    // 路径的父目录（不含前导 '/'）
    std::string directory() const {
        auto slash = path_.rfind('/');
        if (slash == std::string::npos || slash == 0) return {};
        return path_.substr(1, slash - 1);
    }

    std::string to_string() const {
        std::string out = std::string(ResourceScheme<Kind>::value) + ":" + path_;
        if (!fragment_.empty()) out += ":" + fragment_;
        return out;
    }

    bool operator==(const Resource& o) const { return path_ == o.path_ && fragment_ == o.fragment_; }
    bool operator!=(const Resource& o) const { return !(*this == o); }
    bool operator<(const Resource& o) const {
        return path_ < o.path_ || (path_ == o.path_ && fragment_ < o.fragment_);
    }

    // --- Graph ---
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Graph>::value, int> = 0>
    Resource<r::Node> graph_node(const std::string& node) const {
        return Resource<r::Node>(path_ + "/" + node);
    }

    // --- Node ---
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Node>::value, int> = 0>
    Resource<r::Socket> node_socket(const std::string& socket) const {
        return Resource<r::Socket>(path_, socket);
    }
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Node>::value, int> = 0>
    Resource<r::Param> node_parameter(const std::string& field) const {
        return Resource<r::Param>(path_, field);
    }
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Node>::value, int> = 0>
    Resource<r::Graph> node_graph() const {
        return Resource<r::Graph>("/" + directory());
    }

    // --- Socket ---
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Socket>::value, int> = 0>
    Resource<r::Node> socket_node() const { return Resource<r::Node>(path_); }
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Socket>::value, int> = 0>
    const std::string& socket_name() const { return fragment_; }

    // --- Param ---
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Param>::value, int> = 0>
    Resource<r::Node> parameter_node() const { return Resource<r::Node>(path_); }
    template <typename K = Kind, std::enable_if_t<std::is_same<K, r::Param>::value, int> = 0>
    const std::string& parameter_field() const { return fragment_; }

private:
    std::string path_;
    std::string fragment_;
};

template <typename Kind>
std::ostream& operator<<(std::ostream& os, const Resource<Kind>& res) {
    return os << res.to_string();
}

using GraphResource = Resource<r::Graph>;
using NodeResource = Resource<r::Node>;
using SocketResource = Resource<r::Socket>;
using ParamResource = Resource<r::Param>;
using ImageResource = Resource<r::Img>;
using SvgResource = Resource<r::Svg>;

inline GraphResource graph_resource(const std::string& name) { return GraphResource("/" + name); }

inline NodeResource node_resource(const std::string& graph, const std::string& node) {
    return NodeResource("/" + graph + "/" + node);
}

} // namespace mf

namespace std {
template <typename Kind>
struct hash<mf::Resource<Kind>> {
    size_t operator()(const mf::Resource<Kind>& res) const noexcept {
        size_t h = std::hash<std::string>{}(res.path());
        return h ^ (std::hash<std::string>{}(res.fragment()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
} // namespace std
