#ifndef TSM_TENSOR_HPP
#define TSM_TENSOR_HPP

#include "utils.hpp"
#include <vector>
#include <string>

namespace tsm {

using Shape = std::vector<size_t>;

std::string shape_to_string(const Shape& shape);

/**
 * Dense row-major tensor of doubles.
 *
 * The leading dimension is the batch/time axis; everything after it forms a
 * "row". A time series of k features is a tensor of shape (T, k).
 */
class Tensor {
public:
    Tensor() = default;

    /**
     * @param shape Extents, outermost first
     * @param values Row-major values, size must equal the product of shape
     */
    Tensor(Shape shape, std::vector<double> values);

    // Zero-filled tensor
    explicit Tensor(Shape shape);

    /**
     * Build a 2-D tensor from rows (rows = time, cols = features)
     * @param rows Row data, every row must have `width` values
     * @param width Row width, used when rows is empty
     */
    static Tensor from_rows(const matrix::Matrix& rows, size_t width);
    static Tensor from_rows(const matrix::Matrix& rows);

    // Rows flattened over the trailing dimensions
    matrix::Matrix to_rows() const;

    const Shape& shape() const { return shape_; }
    const std::vector<double>& values() const { return values_; }

    size_t dim() const { return shape_.size(); }
    size_t size() const { return values_.size(); }
    size_t rows() const { return shape_.empty() ? 0 : shape_[0]; }
    size_t row_width() const;

    double at(size_t row, size_t col) const { return values_[row * row_width() + col]; }
    double& at(size_t row, size_t col) { return values_[row * row_width() + col]; }

    // Rows [begin, end) as a new tensor
    Tensor slice_rows(size_t begin, size_t end) const;

    // Same shape and bit-identical values
    bool operator==(const Tensor& other) const;
    bool operator!=(const Tensor& other) const { return !(*this == other); }

private:
    Shape shape_;
    std::vector<double> values_;
};

} // namespace tsm

#endif // TSM_TENSOR_HPP
