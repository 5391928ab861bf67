#pragma once

#include "core/types.hh"
#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace shardkeep {

// ============================================================================
// Galois Field GF(2^8) Arithmetic
// ============================================================================

// Log/antilog tables are built once per process on first use and are
// read-only afterwards, so every operation is safe from any thread.
class GF256 {
public:
    using element_type = std::uint8_t;

    static constexpr element_type zero = 0;
    static constexpr element_type one = 1;

    // Forces table construction; optional, every operation does it lazily
    static void initialize();

    [[nodiscard]] static element_type add(element_type a, element_type b) { return a ^ b; }
    [[nodiscard]] static element_type sub(element_type a, element_type b) { return a ^ b; }
    [[nodiscard]] static element_type mul(element_type a, element_type b);
    [[nodiscard]] static element_type div(element_type a, element_type b);
    [[nodiscard]] static element_type pow(element_type a, std::size_t n);

    // Undefined for zero; returns zero so callers must never rely on it
    [[nodiscard]] static element_type inv(element_type a);

    // Generator 2 raised to the power i
    [[nodiscard]] static element_type exp(std::size_t i);

private:
    struct Tables {
        std::array<element_type, 256> log{};
        std::array<element_type, 512> exp{};
    };

    static const Tables& tables();
};

// ============================================================================
// Matrices over a field
// ============================================================================

// Field requires: element_type, zero, one, add, sub, mul, inv
template<typename Field>
using Matrix = std::vector<std::vector<typename Field::element_type>>;

template<typename Field>
[[nodiscard]] Matrix<Field> identity_matrix(std::size_t size) {
    Matrix<Field> m(size, std::vector<typename Field::element_type>(size, Field::zero));
    for (std::size_t i = 0; i < size; i++) {
        m[i][i] = Field::one;
    }
    return m;
}

// (rows x inner) * (inner x cols)
template<typename Field>
[[nodiscard]] Matrix<Field> multiply_matrix(const Matrix<Field>& a, const Matrix<Field>& b) {
    std::size_t rows = a.size();
    std::size_t inner = b.size();
    std::size_t cols = inner == 0 ? 0 : b[0].size();

    Matrix<Field> result(rows, std::vector<typename Field::element_type>(cols, Field::zero));
    for (std::size_t r = 0; r < rows; r++) {
        for (std::size_t c = 0; c < cols; c++) {
            auto acc = Field::zero;
            for (std::size_t i = 0; i < inner; i++) {
                acc = Field::add(acc, Field::mul(a[r][i], b[i][c]));
            }
            result[r][c] = acc;
        }
    }
    return result;
}

// Gauss-Jordan elimination; std::nullopt when the matrix is singular
template<typename Field>
[[nodiscard]] std::optional<Matrix<Field>> invert_matrix(Matrix<Field> matrix) {
    std::size_t size = matrix.size();
    for (const auto& row : matrix) {
        if (row.size() != size) {
            return std::nullopt;
        }
    }

    auto inverse = identity_matrix<Field>(size);

    for (std::size_t col = 0; col < size; col++) {
        std::size_t pivot_row = col;
        while (pivot_row < size && matrix[pivot_row][col] == Field::zero) {
            pivot_row++;
        }
        if (pivot_row == size) {
            return std::nullopt;
        }

        std::swap(matrix[col], matrix[pivot_row]);
        std::swap(inverse[col], inverse[pivot_row]);

        auto scale = Field::inv(matrix[col][col]);
        for (std::size_t j = 0; j < size; j++) {
            matrix[col][j] = Field::mul(matrix[col][j], scale);
            inverse[col][j] = Field::mul(inverse[col][j], scale);
        }

        for (std::size_t row = 0; row < size; row++) {
            if (row == col || matrix[row][col] == Field::zero) {
                continue;
            }
            auto factor = matrix[row][col];
            for (std::size_t j = 0; j < size; j++) {
                matrix[row][j] = Field::sub(matrix[row][j], Field::mul(factor, matrix[col][j]));
                inverse[row][j] = Field::sub(inverse[row][j], Field::mul(factor, inverse[col][j]));
            }
        }
    }

    return inverse;
}

using GFMatrix = Matrix<GF256>;

}  // namespace shardkeep
