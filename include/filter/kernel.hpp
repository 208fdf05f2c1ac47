#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "filter/filter.hpp"

namespace pw {

// 卷积核处理图像边缘时的策略
enum class EdgeStrategy {
    Constant, // 越界读取使用固定的边界值
    Extend,   // 截断到最近的边缘像素
    Wrap,     // 周期延拓
    Mirror,   // 以边缘像素为轴镜像 (不重复边缘)
};

/**
 * @brief 把一维越界坐标映射回 [0, max]。
 * @note Constant 原样返回 value，由调用方判断是否越界并使用边界值。
 *       Mirror 在偏移超过一个图像宽度时截断到 [0, max]。
 */
int map_dimension(EdgeStrategy strategy, int value, int max);

const char* edge_strategy_name(EdgeStrategy strategy);
std::optional<EdgeStrategy> edge_strategy_from_name(const std::string& name);

/**
 * @class Kernel
 * @brief rows x cols 的二维卷积核，同时也是一个需要邻域访问的 Filter。
 *
 * 对点 (x, y)，遍历核的每个单元 (ky, kx) ∈ [-rows/2, rows - rows/2) x [-cols/2, cols - cols/2)，
 * 源坐标 (x + kx, y + ky) 两个轴分别经边缘策略映射，读取通道值乘以权重后累加。
 * 核内部不做截断，整数类型的目标图像在写入时截断。
 */
class Kernel : public Filter {
public:
    Kernel(int rows, int cols);
    explicit Kernel(std::vector<std::vector<double>> data);

    static Kernel square(int n);
    // f(x, y): x is the column, y the row.
    static Kernel create(int rows, int cols, const std::function<double(int, int)>& f);

    static Kernel gaussian(int n, double sigma);
    static Kernel gaussian_3x3() { return gaussian(3, 1.4); }
    static Kernel gaussian_5x5() { return gaussian(5, 1.4); }
    static Kernel gaussian_7x7() { return gaussian(7, 1.4); }
    static Kernel gaussian_9x9() { return gaussian(9, 1.4); }
    static Kernel sobel_x();
    static Kernel sobel_y();
    // sobel_x() + sobel_y()
    static Kernel sobel();
    static Kernel laplacian();

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    double at(int row, int col) const { return data_[row][col]; }
    double& at(int row, int col) { return data_[row][col]; }
    const std::vector<std::vector<double>>& data() const { return data_; }

    double sum() const;
    // Divides every weight by sum(); no-op when the sum is zero.
    void normalize();

    EdgeStrategy edge_strategy() const { return edge_strategy_; }
    void set_edge_strategy(EdgeStrategy strategy) { edge_strategy_ = strategy; }
    // Value read for out-of-range taps under EdgeStrategy::Constant.
    double border_value() const { return border_value_; }
    void set_border_value(double value) { border_value_ = value; }

    void compute_at(const Point& pt, const Input& input, Pixel& dest) const override;
    bool requires_intermediate_image() const override { return true; }
    std::string name() const override;

    // 逐元素运算，两个核的形状必须一致，否则抛出 ShapeMismatch
    Kernel& operator+=(const Kernel& other);
    Kernel& operator-=(const Kernel& other);
    Kernel& operator*=(const Kernel& other);
    Kernel& operator/=(const Kernel& other);

    bool operator==(const Kernel& other) const;
    bool operator!=(const Kernel& other) const { return !(*this == other); }

private:
    void require_same_shape(const Kernel& other, const char* op) const;

    int rows_;
    int cols_;
    std::vector<std::vector<double>> data_;
    EdgeStrategy edge_strategy_ = EdgeStrategy::Constant;
    double border_value_ = 0.0;
};

inline Kernel operator+(Kernel a, const Kernel& b) { return a += b; }
inline Kernel operator-(Kernel a, const Kernel& b) { return a -= b; }
inline Kernel operator*(Kernel a, const Kernel& b) { return a *= b; }
inline Kernel operator/(Kernel a, const Kernel& b) { return a /= b; }

} // namespace pw
