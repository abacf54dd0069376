#include "tensor.hpp"
#include "errors.hpp"
#include <cstring>
#include <sstream>

namespace tsm {

namespace {

size_t element_count(const Shape& shape) {
    if (shape.empty()) return 0;
    size_t n = 1;
    for (size_t extent : shape) {
        n *= extent;
    }
    return n;
}

} // namespace

std::string shape_to_string(const Shape& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    if (shape.size() == 1) oss << ",";
    oss << ")";
    return oss.str();
}

Tensor::Tensor(Shape shape, std::vector<double> values)
    : shape_(std::move(shape)), values_(std::move(values)) {
    if (values_.size() != element_count(shape_)) {
        throw InvalidArgumentError("Tensor of shape " + shape_to_string(shape_) +
                                   " cannot hold " + std::to_string(values_.size()) + " values");
    }
}

Tensor::Tensor(Shape shape)
    : shape_(std::move(shape)), values_(element_count(shape_), 0.0) {}

Tensor Tensor::from_rows(const matrix::Matrix& rows, size_t width) {
    std::vector<double> values;
    values.reserve(rows.size() * width);
    for (const auto& row : rows) {
        if (row.size() != width) {
            throw InvalidArgumentError("Row of width " + std::to_string(row.size()) +
                                       " where " + std::to_string(width) + " was expected");
        }
        values.insert(values.end(), row.begin(), row.end());
    }
    return Tensor({rows.size(), width}, std::move(values));
}

Tensor Tensor::from_rows(const matrix::Matrix& rows) {
    if (rows.empty()) {
        throw InvalidArgumentError("Cannot infer the width of an empty row set");
    }
    return from_rows(rows, rows[0].size());
}

size_t Tensor::row_width() const {
    if (shape_.size() < 2) return 1;
    size_t width = 1;
    for (size_t i = 1; i < shape_.size(); ++i) {
        width *= shape_[i];
    }
    return width;
}

matrix::Matrix Tensor::to_rows() const {
    size_t width = row_width();
    matrix::Matrix result(rows(), std::vector<double>(width));
    for (size_t r = 0; r < rows(); ++r) {
        std::copy(values_.begin() + r * width, values_.begin() + (r + 1) * width,
                  result[r].begin());
    }
    return result;
}

Tensor Tensor::slice_rows(size_t begin, size_t end) const {
    if (begin > end || end > rows()) {
        throw InvalidArgumentError("Row slice [" + std::to_string(begin) + ", " +
                                   std::to_string(end) + ") out of range for " +
                                   shape_to_string(shape_));
    }
    size_t width = row_width();
    Shape shape = shape_;
    shape[0] = end - begin;
    return Tensor(shape, std::vector<double>(values_.begin() + begin * width,
                                             values_.begin() + end * width));
}

bool Tensor::operator==(const Tensor& other) const {
    if (shape_ != other.shape_ || values_.size() != other.values_.size()) {
        return false;
    }
    return values_.empty() ||
           std::memcmp(values_.data(), other.values_.data(),
                       values_.size() * sizeof(double)) == 0;
}

} // namespace tsm
