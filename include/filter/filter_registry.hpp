#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "engine_config.hpp"
#include "filter/compose.hpp"

namespace pw {

// params: the `parameters` map of a YAML leaf (may be null).
using FilterFactory = std::function<FilterPtr(const YAML::Node& params, const EngineConfig& config)>;

class PIXELWEAVE_API FilterRegistry {
public:
    static FilterRegistry& instance();

    // Re-registering a key replaces the previous factory.
    void register_filter(const std::string& type, const std::string& subtype, FilterFactory fn);

    std::optional<FilterFactory> find(const std::string& type, const std::string& subtype) const;

    // Throws FilterError(NotFound) for an unknown key.
    FilterPtr create(const std::string& type, const std::string& subtype,
                     const YAML::Node& params, const EngineConfig& config = {}) const;

    std::vector<std::string> get_keys() const;
    bool unregister_filter(const std::string& type, const std::string& subtype);
    bool unregister_key(const std::string& key);
private:
    std::unordered_map<std::string, FilterFactory> table_;
};

inline std::string make_key(const std::string& type, const std::string& subtype) {
    return type + ":" + subtype;
}

// average | multiply | difference | min | max
std::optional<JoinFn> join_fn_from_name(const std::string& mode);

/**
 * @brief 从 YAML 描述构建一棵滤镜树。
 *
 * 支持的节点形式:
 *   - 叶子: { type: point, subtype: invert, parameters: {...} }
 *   - { then: [f1, f2, ...] }      左折叠为 Then
 *   - { and_then: [f1, f2, ...] }  左折叠为 AndThen
 *   - { join: [a, b], mode: average, color: rgb }
 *
 * 叶子通过 FilterRegistry::instance() 查找。
 * 结构错误抛出 InvalidParameter，未知的 type:subtype 抛出 NotFound。
 */
FilterPtr filter_from_yaml(const YAML::Node& node, const EngineConfig& config = {});

namespace filters {
// Registers point:*, mixing:blend, geometry:crop and kernel:* into FilterRegistry::instance().
void register_builtin();
} // namespace filters

} // namespace pw
