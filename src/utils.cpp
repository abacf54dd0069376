#include "utils.hpp"
#include <cmath>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <random>

namespace tsm {

namespace stats {

double median(std::vector<double> data) {
    if (data.empty()) {
        throw std::invalid_argument("Median of an empty sample");
    }
    size_t mid = data.size() / 2;
    std::nth_element(data.begin(), data.begin() + mid, data.end());
    double upper = data[mid];
    if (data.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(data.begin(), data.begin() + mid);
    return 0.5 * (lower + upper);
}

matrix::Matrix difference(const matrix::Matrix& rows) {
    if (rows.size() < 2) return {};

    matrix::Matrix result(rows.size() - 1);
    for (size_t t = 1; t < rows.size(); ++t) {
        const auto& cur = rows[t];
        const auto& prev = rows[t - 1];
        if (cur.size() != prev.size()) {
            throw std::invalid_argument("Ragged rows cannot be differenced");
        }
        result[t - 1].resize(cur.size());
        for (size_t j = 0; j < cur.size(); ++j) {
            result[t - 1][j] = cur[j] - prev[j];
        }
    }
    return result;
}

} // namespace stats

namespace hash {

uint64_t fnv1a(const std::string& bytes, uint64_t seed) {
    uint64_t h = seed;
    for (unsigned char c : bytes) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

std::string to_hex(uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

std::string random_token() {
    static std::mt19937_64 rng = [] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }();
    return to_hex(rng());
}

} // namespace hash

namespace matrix {

Matrix zeros(size_t rows, size_t cols) {
    return Matrix(rows, std::vector<double>(cols, 0.0));
}

Matrix transpose(const Matrix& m) {
    if (m.empty()) return {};
    size_t rows = m.size();
    size_t cols = m[0].size();
    Matrix result = zeros(cols, rows);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result[j][i] = m[i][j];
        }
    }
    return result;
}

Matrix multiply(const Matrix& a, const Matrix& b) {
    if (a.empty() || b.empty() || a[0].size() != b.size()) {
        throw std::invalid_argument("Matrix dimensions don't match for multiplication");
    }

    size_t rows = a.size();
    size_t cols = b[0].size();
    size_t inner = b.size();
    Matrix result = zeros(rows, cols);

    // i-k-j order keeps the inner loop on contiguous rows
    for (size_t i = 0; i < rows; ++i) {
        for (size_t k = 0; k < inner; ++k) {
            double aik = a[i][k];
            if (aik == 0.0) continue;
            const auto& bk = b[k];
            auto& ri = result[i];
            for (size_t j = 0; j < cols; ++j) {
                ri[j] += aik * bk[j];
            }
        }
    }
    return result;
}

Matrix gram(const Matrix& a) {
    if (a.empty()) return {};
    size_t cols = a[0].size();
    Matrix g = zeros(cols, cols);

    for (const auto& row : a) {
        for (size_t i = 0; i < cols; ++i) {
            double ai = row[i];
            if (ai == 0.0) continue;
            auto& gi = g[i];
            for (size_t j = i; j < cols; ++j) {
                gi[j] += ai * row[j];
            }
        }
    }
    for (size_t i = 0; i < cols; ++i) {
        for (size_t j = 0; j < i; ++j) {
            g[i][j] = g[j][i];
        }
    }
    return g;
}

Matrix outer_gram(const Matrix& a) {
    size_t rows = a.size();
    Matrix g = zeros(rows, rows);

    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = i; j < rows; ++j) {
            const auto& ai = a[i];
            const auto& aj = a[j];
            double sum = 0.0;
            for (size_t k = 0; k < ai.size(); ++k) {
                sum += ai[k] * aj[k];
            }
            g[i][j] = sum;
            g[j][i] = sum;
        }
    }
    return g;
}

Matrix cholesky(const Matrix& m) {
    size_t n = m.size();
    Matrix L = zeros(n, n);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j <= i; ++j) {
            double sum = 0.0;
            for (size_t k = 0; k < j; ++k) {
                sum += L[i][k] * L[j][k];
            }
            if (i == j) {
                double val = m[i][i] - sum;
                if (val <= 0) {
                    throw std::runtime_error("Matrix not positive definite");
                }
                L[i][i] = std::sqrt(val);
            } else {
                L[i][j] = (m[i][j] - sum) / L[j][j];
            }
        }
    }
    return L;
}

Matrix cholesky_solve(const Matrix& L, const Matrix& B) {
    size_t n = L.size();
    if (B.size() != n) {
        throw std::invalid_argument("Invalid dimensions for Cholesky solve");
    }
    size_t m = n == 0 ? 0 : B[0].size();

    // Forward substitution: L Y = B
    Matrix Y = zeros(n, m);
    for (size_t i = 0; i < n; ++i) {
        Y[i] = B[i];
        for (size_t k = 0; k < i; ++k) {
            double lik = L[i][k];
            for (size_t c = 0; c < m; ++c) {
                Y[i][c] -= lik * Y[k][c];
            }
        }
        for (size_t c = 0; c < m; ++c) {
            Y[i][c] /= L[i][i];
        }
    }

    // Backward substitution: L^T X = Y
    Matrix X = zeros(n, m);
    for (size_t ii = n; ii-- > 0;) {
        X[ii] = Y[ii];
        for (size_t k = ii + 1; k < n; ++k) {
            double lki = L[k][ii];
            for (size_t c = 0; c < m; ++c) {
                X[ii][c] -= lki * X[k][c];
            }
        }
        for (size_t c = 0; c < m; ++c) {
            X[ii][c] /= L[ii][ii];
        }
    }
    return X;
}

namespace {

void add_relative_ridge(Matrix& g, double ridge) {
    double trace = 0.0;
    for (size_t i = 0; i < g.size(); ++i) {
        trace += g[i][i];
    }
    double lambda = trace > 0.0 ? ridge * trace / g.size() : ridge;
    for (size_t i = 0; i < g.size(); ++i) {
        g[i][i] += lambda;
    }
}

} // namespace

Matrix least_squares(const Matrix& A, const Matrix& B, double ridge) {
    if (A.empty() || A.size() != B.size()) {
        throw std::invalid_argument("Invalid dimensions for least squares");
    }

    size_t rows = A.size();
    size_t cols = A[0].size();
    Matrix At = transpose(A);

    if (rows >= cols) {
        Matrix G = gram(A);
        add_relative_ridge(G, ridge);
        return cholesky_solve(cholesky(G), multiply(At, B));
    }

    Matrix K = outer_gram(A);
    add_relative_ridge(K, ridge);
    Matrix alpha = cholesky_solve(cholesky(K), B);
    return multiply(At, alpha);
}

} // namespace matrix

} // namespace tsm
