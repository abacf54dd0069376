#ifndef TSM_UTILS_HPP
#define TSM_UTILS_HPP

#include <vector>
#include <cmath>
#include <numeric>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <cstdint>

namespace tsm {

// Simple matrix operations (for internal use)
namespace matrix {

using Matrix = std::vector<std::vector<double>>;
using Vector = std::vector<double>;

Matrix zeros(size_t rows, size_t cols);
Matrix transpose(const Matrix& m);
Matrix multiply(const Matrix& a, const Matrix& b);

// A^T * A (cols x cols)
Matrix gram(const Matrix& a);

// A * A^T (rows x rows)
Matrix outer_gram(const Matrix& a);

// Cholesky decomposition for positive definite matrices, returns lower L
Matrix cholesky(const Matrix& m);

// Solve (L * L^T) X = B for every column of B
Matrix cholesky_solve(const Matrix& L, const Matrix& B);

/**
 * Least squares solution of A X = B (one column of X per column of B).
 *
 * Uses the normal equations when A has at least as many rows as columns,
 * and the minimum-norm solution X = A^T (A A^T)^-1 B otherwise. A relative
 * ridge (ridge * mean diagonal of the Gram matrix) keeps both systems
 * positive definite on rank deficient data.
 *
 * @param A Design matrix (rows = observations)
 * @param B Targets (rows = observations)
 * @param ridge Relative regularisation
 * @return X with A.cols() rows and B.cols() columns
 */
Matrix least_squares(const Matrix& A, const Matrix& B, double ridge = 1e-8);

} // namespace matrix

// Statistical utility functions
namespace stats {

// Median; the mean of the two central values for even sizes
double median(std::vector<double> data);

// First-order differences along the time axis (rows = time, cols = features)
matrix::Matrix difference(const matrix::Matrix& rows);

} // namespace stats

namespace hash {

// 64-bit FNV-1a
uint64_t fnv1a(const std::string& bytes, uint64_t seed = 0xcbf29ce484222325ULL);

// Fixed width lowercase hex rendering
std::string to_hex(uint64_t value);

// 16 random hex characters, for session and snapshot ids
std::string random_token();

} // namespace hash

} // namespace tsm

#endif // TSM_UTILS_HPP
