#include "filter/kernel.hpp"

#include <algorithm>
#include <cmath>

namespace pw {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

int map_dimension(EdgeStrategy strategy, int value, int max) {
    switch (strategy) {
        case EdgeStrategy::Constant:
            return value;
        case EdgeStrategy::Extend:
            return std::max(0, std::min(value, max));
        case EdgeStrategy::Wrap: {
            const int n = max + 1;
            int r = value % n;
            return r < 0 ? r + n : r;
        }
        case EdgeStrategy::Mirror: {
            int r = value;
            if (value < 0) {
                r = -value;
            } else if (value > max) {
                r = max - (value % (max + 1)) - 1;
            }
            // 偏移超过一个图像宽度 (或 max == 0) 时仍需落在有效范围内
            return std::max(0, std::min(r, max));
        }
    }
    return value;
}

const char* edge_strategy_name(EdgeStrategy strategy) {
    switch (strategy) {
        case EdgeStrategy::Constant: return "constant";
        case EdgeStrategy::Extend:   return "extend";
        case EdgeStrategy::Wrap:     return "wrap";
        case EdgeStrategy::Mirror:   return "mirror";
    }
    return "unknown";
}

std::optional<EdgeStrategy> edge_strategy_from_name(const std::string& name) {
    if (name == "constant" || name == "zero") return EdgeStrategy::Constant;
    if (name == "extend" || name == "replicate" || name == "clamp") return EdgeStrategy::Extend;
    if (name == "wrap") return EdgeStrategy::Wrap;
    if (name == "mirror" || name == "reflect") return EdgeStrategy::Mirror;
    return std::nullopt;
}

Kernel::Kernel(int rows, int cols) : rows_(rows), cols_(cols) {
    if (rows <= 0 || cols <= 0) {
        throw FilterError(FilterErrc::InvalidParameter,
                          "Kernel: size must be positive, got " + std::to_string(rows) + "x" +
                          std::to_string(cols));
    }
    data_.assign(rows, std::vector<double>(cols, 0.0));
}

Kernel::Kernel(std::vector<std::vector<double>> data)
    : rows_(static_cast<int>(data.size())), cols_(0), data_(std::move(data)) {
    if (data_.empty() || data_[0].empty()) {
        throw FilterError(FilterErrc::InvalidParameter, "Kernel: data must be non-empty");
    }
    cols_ = static_cast<int>(data_[0].size());
    for (size_t r = 1; r < data_.size(); ++r) {
        if (static_cast<int>(data_[r].size()) != cols_) {
            throw FilterError(FilterErrc::InvalidParameter,
                              "Kernel: row " + std::to_string(r) + " has " +
                              std::to_string(data_[r].size()) + " entries, expected " +
                              std::to_string(cols_));
        }
    }
}

Kernel Kernel::square(int n) { return Kernel(n, n); }

Kernel Kernel::create(int rows, int cols, const std::function<double(int, int)>& f) {
    Kernel k(rows, cols);
    for (int j = 0; j < rows; ++j) {
        for (int i = 0; i < cols; ++i) {
            k.data_[j][i] = f(i, j);
        }
    }
    return k;
}

Kernel Kernel::gaussian(int n, double sigma) {
    if (n <= 0 || n % 2 == 0) {
        throw FilterError(FilterErrc::InvalidParameter,
                          "Kernel::gaussian: size must be odd and positive, got " + std::to_string(n));
    }
    if (sigma <= 0.0) {
        throw FilterError(FilterErrc::InvalidParameter, "Kernel::gaussian: sigma must be positive");
    }
    const double s2 = sigma * sigma;
    const double a = 1.0 / (2.0 * kPi * s2);
    const int c = n / 2;
    Kernel k = create(n, n, [&](int i, int j) {
        const double dx = i - c;
        const double dy = j - c;
        return a * std::exp(-(dx * dx + dy * dy) / (2.0 * s2));
    });
    k.normalize();
    return k;
}

Kernel Kernel::sobel_x() {
    return Kernel(std::vector<std::vector<double>>{{1.0, 0.0, -1.0},
                                                   {2.0, 0.0, -2.0},
                                                   {1.0, 0.0, -1.0}});
}

Kernel Kernel::sobel_y() {
    return Kernel(std::vector<std::vector<double>>{{1.0, 2.0, 1.0},
                                                   {0.0, 0.0, 0.0},
                                                   {-1.0, -2.0, -1.0}});
}

Kernel Kernel::sobel() { return sobel_x() + sobel_y(); }

Kernel Kernel::laplacian() {
    return Kernel(std::vector<std::vector<double>>{{0.0, -1.0, 0.0},
                                                   {-1.0, 4.0, -1.0},
                                                   {0.0, -1.0, 0.0}});
}

double Kernel::sum() const {
    double s = 0.0;
    for (const auto& row : data_) {
        for (double w : row) s += w;
    }
    return s;
}

void Kernel::normalize() {
    const double s = sum();
    if (s == 0.0) return;
    for (auto& row : data_) {
        for (double& w : row) w /= s;
    }
}

void Kernel::compute_at(const Point& pt, const Input& input, Pixel& dest) const {
    const int max_x = input.width() - 1;
    const int max_y = input.height() - 1;
    const int r2 = rows_ / 2;
    const int c2 = cols_ / 2;
    const bool constant = edge_strategy_ == EdgeStrategy::Constant;

    Pixel acc = input.new_pixel();
    // 中心在 (rows/2, cols/2); 偶数尺寸的核在正方向少一个单元
    for (int ky = -r2; ky < rows_ - r2; ++ky) {
        const auto& krow = data_[ky + r2];
        const int sy = map_dimension(edge_strategy_, pt.y + ky, max_y);
        for (int kx = -c2; kx < cols_ - c2; ++kx) {
            const double w = krow[kx + c2];
            const int sx = map_dimension(edge_strategy_, pt.x + kx, max_x);
            if (constant && (sx < 0 || sy < 0 || sx > max_x || sy > max_y)) {
                for (int c = 0; c < acc.size(); ++c) acc[c] += border_value_ * w;
                continue;
            }
            const Point src(sx, sy);
            for (int c = 0; c < acc.size(); ++c) acc[c] += input.get_f(src, c) * w;
        }
    }
    acc.convert_to(dest);
}

std::string Kernel::name() const {
    return "kernel" + std::to_string(rows_) + "x" + std::to_string(cols_);
}

void Kernel::require_same_shape(const Kernel& other, const char* op) const {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        throw FilterError(FilterErrc::ShapeMismatch,
                          std::string("Kernel ") + op + ": shape " + std::to_string(rows_) + "x" +
                          std::to_string(cols_) + " vs " + std::to_string(other.rows_) + "x" +
                          std::to_string(other.cols_));
    }
}

Kernel& Kernel::operator+=(const Kernel& other) {
    require_same_shape(other, "+=");
    for (int j = 0; j < rows_; ++j) {
        for (int i = 0; i < cols_; ++i) data_[j][i] += other.data_[j][i];
    }
    return *this;
}

Kernel& Kernel::operator-=(const Kernel& other) {
    require_same_shape(other, "-=");
    for (int j = 0; j < rows_; ++j) {
        for (int i = 0; i < cols_; ++i) data_[j][i] -= other.data_[j][i];
    }
    return *this;
}

Kernel& Kernel::operator*=(const Kernel& other) {
    require_same_shape(other, "*=");
    for (int j = 0; j < rows_; ++j) {
        for (int i = 0; i < cols_; ++i) data_[j][i] *= other.data_[j][i];
    }
    return *this;
}

Kernel& Kernel::operator/=(const Kernel& other) {
    require_same_shape(other, "/=");
    for (int j = 0; j < rows_; ++j) {
        for (int i = 0; i < cols_; ++i) data_[j][i] /= other.data_[j][i];
    }
    return *this;
}

bool Kernel::operator==(const Kernel& other) const {
    return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_ &&
           edge_strategy_ == other.edge_strategy_ && border_value_ == other.border_value_;
}

} // namespace pw
