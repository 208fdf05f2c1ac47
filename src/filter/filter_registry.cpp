#include "filter/filter_registry.hpp"

#include <algorithm>
#include <cmath>

#include "engine/param_utils.hpp"
#include "filter/builtin.hpp"
#include "filter/kernel.hpp"

namespace pw {

FilterRegistry& FilterRegistry::instance() {
    static FilterRegistry inst;
    return inst;
}

void FilterRegistry::register_filter(const std::string& type, const std::string& subtype, FilterFactory fn) {
    table_[make_key(type, subtype)] = std::move(fn);
}

std::optional<FilterFactory> FilterRegistry::find(const std::string& type, const std::string& subtype) const {
    auto it = table_.find(make_key(type, subtype));
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

FilterPtr FilterRegistry::create(const std::string& type, const std::string& subtype,
                                 const YAML::Node& params, const EngineConfig& config) const {
    auto fn = find(type, subtype);
    if (!fn) {
        throw FilterError(FilterErrc::NotFound, "No filter registered for '" + make_key(type, subtype) + "'");
    }
    return (*fn)(params, config);
}

std::vector<std::string> FilterRegistry::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(table_.size());
    for (const auto& pair : table_) keys.push_back(pair.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool FilterRegistry::unregister_filter(const std::string& type, const std::string& subtype) {
    return unregister_key(make_key(type, subtype));
}

bool FilterRegistry::unregister_key(const std::string& key) {
    return table_.erase(key) > 0;
}

// --- 合并函数 ---

std::optional<JoinFn> join_fn_from_name(const std::string& mode) {
    if (mode == "average") {
        return JoinFn([](const Point&, const Pixel& a, const Pixel& b) { return (a + b) / 2.0; });
    }
    if (mode == "multiply") {
        return JoinFn([](const Point&, const Pixel& a, const Pixel& b) { return a * b; });
    }
    if (mode == "difference") {
        return JoinFn([](const Point&, const Pixel& a, const Pixel& b) {
            Pixel out = a - b;
            out.map_in_place([](double v) { return std::abs(v); });
            return out;
        });
    }
    if (mode == "min" || mode == "max") {
        const bool take_min = mode == "min";
        return JoinFn([take_min](const Point&, const Pixel& a, const Pixel& b) {
            Pixel out = a;
            for (int c = 0; c < out.size(); ++c) {
                out[c] = take_min ? std::min(a[c], b[c]) : std::max(a[c], b[c]);
            }
            return out;
        });
    }
    return std::nullopt;
}

// --- YAML 树 ---

namespace {

std::vector<FilterPtr> build_children(const YAML::Node& seq, const EngineConfig& config, const char* who) {
    if (!seq.IsSequence() || seq.size() == 0) {
        throw FilterError(FilterErrc::InvalidParameter, std::string(who) + " expects a non-empty sequence");
    }
    std::vector<FilterPtr> out;
    out.reserve(seq.size());
    for (const auto& child : seq) out.push_back(filter_from_yaml(child, config));
    return out;
}

} // namespace

FilterPtr filter_from_yaml(const YAML::Node& node, const EngineConfig& config) {
    if (!node || !node.IsMap()) {
        throw FilterError(FilterErrc::InvalidParameter, "filter description must be a map");
    }

    if (node["then"]) {
        return chain(build_children(node["then"], config, "then"));
    }

    if (node["and_then"]) {
        auto children = build_children(node["and_then"], config, "and_then");
        FilterPtr out = children.front();
        for (size_t i = 1; i < children.size(); ++i) out = and_then(out, children[i]);
        return out;
    }

    if (node["join"]) {
        auto children = build_children(node["join"], config, "join");
        if (children.size() != 2) {
            throw FilterError(FilterErrc::InvalidParameter, "join expects exactly two filters");
        }
        std::string mode = as_str(node, "mode", "average");
        auto fn = join_fn_from_name(mode);
        if (!fn) throw FilterError(FilterErrc::InvalidParameter, "join: unknown mode '" + mode + "'");
        std::string color_str = as_str(node, "color", "rgb");
        auto color = color_from_name(color_str);
        if (!color) throw FilterError(FilterErrc::InvalidParameter, "join: unknown color '" + color_str + "'");
        return join(children[0], children[1], *color, *fn);
    }

    std::string type = as_str(node, "type");
    std::string subtype = as_str(node, "subtype");
    if (type.empty() || subtype.empty()) {
        throw FilterError(FilterErrc::InvalidParameter, "filter leaf requires 'type' and 'subtype'");
    }
    return FilterRegistry::instance().create(type, subtype, node["parameters"], config);
}

// --- 内置滤镜 ---

namespace filters {

namespace {

// 卷积核的公共参数: edge 与 border_value
FilterPtr finish_kernel(Kernel k, const YAML::Node& P, const EngineConfig& config) {
    std::string edge_str = as_str(P, "edge", config.default_edge_strategy);
    auto edge = edge_strategy_from_name(edge_str);
    if (!edge) throw FilterError(FilterErrc::InvalidParameter, "kernel: unknown edge strategy '" + edge_str + "'");
    k.set_edge_strategy(*edge);
    k.set_border_value(as_double_flexible(P, "border_value", config.kernel_border_value));
    if (as_bool_flexible(P, "normalize", false)) k.normalize();
    return make_filter<Kernel>(std::move(k));
}

FilterPtr make_custom_kernel(const YAML::Node& P, const EngineConfig& config) {
    if (!P || !P.IsMap() || !P["weights"] || !P["weights"].IsSequence()) {
        throw FilterError(FilterErrc::InvalidParameter, "kernel:custom requires a 'weights' sequence");
    }
    std::vector<std::vector<double>> rows;
    try {
        rows = P["weights"].as<std::vector<std::vector<double>>>();
    } catch (const YAML::Exception& e) {
        throw FilterError(FilterErrc::InvalidParameter, std::string("kernel:custom: bad weights: ") + e.what());
    }
    return finish_kernel(Kernel(std::move(rows)), P, config);
}

FilterPtr make_crop(const YAML::Node& P, const EngineConfig&) {
    int x = as_int_flexible(P, "x", 0);
    int y = as_int_flexible(P, "y", 0);
    int w = as_int_flexible(P, "width", -1);
    int h = as_int_flexible(P, "height", -1);
    if (w <= 0 || h <= 0) {
        throw FilterError(FilterErrc::InvalidParameter, "geometry:crop requires positive width and height");
    }
    return make_filter<Crop>(Region(x, y, w, h));
}

FilterPtr make_convert(const YAML::Node& P, const EngineConfig&) {
    std::string color_str = as_str(P, "color");
    auto color = color_from_name(color_str);
    if (!color) throw FilterError(FilterErrc::InvalidParameter, "point:convert: unknown color '" + color_str + "'");
    return make_filter<Convert>(*color);
}

} // namespace

void register_builtin() {
    auto& R = FilterRegistry::instance();

    // 逐点滤镜
    R.register_filter("point", "invert", [](const YAML::Node&, const EngineConfig&) {
        return make_filter<Invert>();
    });
    R.register_filter("point", "gamma_log", [](const YAML::Node& P, const EngineConfig& c) {
        return make_filter<GammaLog>(as_double_flexible(P, "gamma", c.default_gamma));
    });
    R.register_filter("point", "gamma_lin", [](const YAML::Node& P, const EngineConfig& c) {
        return make_filter<GammaLin>(as_double_flexible(P, "gamma", c.default_gamma));
    });
    R.register_filter("point", "saturation", [](const YAML::Node& P, const EngineConfig&) {
        return make_filter<Saturation>(as_double_flexible(P, "factor", 1.0));
    });
    R.register_filter("point", "brightness", [](const YAML::Node& P, const EngineConfig&) {
        return make_filter<Brightness>(as_double_flexible(P, "factor", 1.0));
    });
    R.register_filter("point", "contrast", [](const YAML::Node& P, const EngineConfig&) {
        return make_filter<Contrast>(as_double_flexible(P, "factor", 1.0));
    });
    R.register_filter("point", "to_grayscale", [](const YAML::Node&, const EngineConfig&) {
        return make_filter<ToGrayscale>();
    });
    R.register_filter("point", "to_color", [](const YAML::Node&, const EngineConfig&) {
        return make_filter<ToColor>();
    });
    R.register_filter("point", "convert", make_convert);

    R.register_filter("mixing", "blend", [](const YAML::Node&, const EngineConfig&) {
        return make_filter<Blend>();
    });
    R.register_filter("geometry", "crop", make_crop);

    // 卷积核
    R.register_filter("kernel", "gaussian", [](const YAML::Node& P, const EngineConfig& c) {
        return finish_kernel(Kernel::gaussian(as_int_flexible(P, "size", 3), as_double_flexible(P, "sigma", 1.4)), P, c);
    });
    R.register_filter("kernel", "sobel_x", [](const YAML::Node& P, const EngineConfig& c) {
        return finish_kernel(Kernel::sobel_x(), P, c);
    });
    R.register_filter("kernel", "sobel_y", [](const YAML::Node& P, const EngineConfig& c) {
        return finish_kernel(Kernel::sobel_y(), P, c);
    });
    R.register_filter("kernel", "sobel", [](const YAML::Node& P, const EngineConfig& c) {
        return finish_kernel(Kernel::sobel(), P, c);
    });
    R.register_filter("kernel", "laplacian", [](const YAML::Node& P, const EngineConfig& c) {
        return finish_kernel(Kernel::laplacian(), P, c);
    });
    R.register_filter("kernel", "custom", make_custom_kernel);
}

} // namespace filters

} // namespace pw
