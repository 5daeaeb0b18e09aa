#pragma once

#include "../errors.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace plate::fem::detail
{
    // Row-major dense storage. Square by default; rectangular blocks are used
    // for the fixed/free coupling of the partitioned system.
    class DenseMatrix
    {
    public:
        DenseMatrix() = default;

        explicit DenseMatrix(std::size_t dimension)
            : DenseMatrix(dimension, dimension)
        {
        }

        DenseMatrix(std::size_t rows, std::size_t columns)
            : m_rows(rows)
            , m_columns(columns)
            , m_data(rows * columns, 0.0)
        {
        }

        void resize(std::size_t rows, std::size_t columns)
        {
            m_rows = rows;
            m_columns = columns;
            m_data.assign(rows * columns, 0.0);
        }

        [[nodiscard]] std::size_t rows() const noexcept { return m_rows; }
        [[nodiscard]] std::size_t columns() const noexcept { return m_columns; }
        [[nodiscard]] bool is_square() const noexcept { return m_rows == m_columns; }

        [[nodiscard]] double& operator()(std::size_t row, std::size_t column) noexcept
        {
            assert(row < m_rows && column < m_columns);
            return m_data[row * m_columns + column];
        }

        [[nodiscard]] double operator()(std::size_t row, std::size_t column) const noexcept
        {
            assert(row < m_rows && column < m_columns);
            return m_data[row * m_columns + column];
        }

        [[nodiscard]] double max_abs() const noexcept
        {
            double result = 0.0;
            for (const double value : m_data)
            {
                result = std::max(result, std::abs(value));
            }
            return result;
        }

    private:
        std::size_t m_rows{0};
        std::size_t m_columns{0};
        std::vector<double> m_data{};
    };

    inline std::vector<double> multiply(const DenseMatrix& matrix, const std::vector<double>& x)
    {
        if (x.size() != matrix.columns())
        {
            throw std::invalid_argument("Dense multiply: vector length does not match column count");
        }

        std::vector<double> result(matrix.rows(), 0.0);
        for (std::size_t row = 0; row < matrix.rows(); ++row)
        {
            double sum = 0.0;
            for (std::size_t column = 0; column < matrix.columns(); ++column)
            {
                sum += matrix(row, column) * x[column];
            }
            result[row] = sum;
        }
        return result;
    }

    // Pivots are compared against pivot_tolerance scaled by the largest entry,
    // so the test is independent of the material's unit system.
    inline double pivot_threshold(const DenseMatrix& matrix, double pivot_tolerance) noexcept
    {
        return pivot_tolerance * std::max(matrix.max_abs(), 1e-300);
    }

    inline std::vector<double> solve(DenseMatrix matrix, std::vector<double> rhs, double pivot_tolerance)
    {
        if (!matrix.is_square() || rhs.size() != matrix.rows())
        {
            throw std::invalid_argument("Dense solve requires a square matrix and matching right-hand side");
        }

        const auto n = matrix.rows();
        const double threshold = pivot_threshold(matrix, pivot_tolerance);
        std::vector<double> solution(n, 0.0);

        for (std::size_t k = 0; k < n; ++k)
        {
            std::size_t pivot_row = k;
            double pivot_value = std::abs(matrix(k, k));
            for (std::size_t i = k + 1; i < n; ++i)
            {
                const double candidate = std::abs(matrix(i, k));
                if (candidate > pivot_value)
                {
                    pivot_value = candidate;
                    pivot_row = i;
                }
            }

            if (pivot_value <= threshold)
            {
                throw SingularSystemError("Matrix is singular to working precision (structure is under-constrained)");
            }

            if (pivot_row != k)
            {
                for (std::size_t j = k; j < n; ++j)
                {
                    std::swap(matrix(k, j), matrix(pivot_row, j));
                }
                std::swap(rhs[k], rhs[pivot_row]);
            }

            const double pivot = matrix(k, k);
            for (std::size_t i = k + 1; i < n; ++i)
            {
                const double factor = matrix(i, k) / pivot;
                matrix(i, k) = 0.0;
                for (std::size_t j = k + 1; j < n; ++j)
                {
                    matrix(i, j) -= factor * matrix(k, j);
                }
                rhs[i] -= factor * rhs[k];
            }
        }

        for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(n) - 1; i >= 0; --i)
        {
            double sum = rhs[static_cast<std::size_t>(i)];
            for (std::size_t j = static_cast<std::size_t>(i) + 1; j < n; ++j)
            {
                sum -= matrix(static_cast<std::size_t>(i), j) * solution[j];
            }
            solution[static_cast<std::size_t>(i)] = sum / matrix(static_cast<std::size_t>(i), static_cast<std::size_t>(i));
        }

        return solution;
    }

    // Full Gauss-Jordan inversion. Kept for the explicit inverse(K) · f path.
    inline DenseMatrix inverse(DenseMatrix matrix, double pivot_tolerance)
    {
        if (!matrix.is_square())
        {
            throw std::invalid_argument("Only square matrices can be inverted");
        }

        const auto n = matrix.rows();
        const double threshold = pivot_threshold(matrix, pivot_tolerance);
        DenseMatrix result(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            result(i, i) = 1.0;
        }

        for (std::size_t k = 0; k < n; ++k)
        {
            std::size_t pivot_row = k;
            double pivot_value = std::abs(matrix(k, k));
            for (std::size_t i = k + 1; i < n; ++i)
            {
                const double candidate = std::abs(matrix(i, k));
                if (candidate > pivot_value)
                {
                    pivot_value = candidate;
                    pivot_row = i;
                }
            }

            if (pivot_value <= threshold)
            {
                throw SingularSystemError("Matrix is singular to working precision (structure is under-constrained)");
            }

            if (pivot_row != k)
            {
                for (std::size_t j = 0; j < n; ++j)
                {
                    std::swap(matrix(k, j), matrix(pivot_row, j));
                    std::swap(result(k, j), result(pivot_row, j));
                }
            }

            const double inv_pivot = 1.0 / matrix(k, k);
            for (std::size_t j = 0; j < n; ++j)
            {
                matrix(k, j) *= inv_pivot;
                result(k, j) *= inv_pivot;
            }

            for (std::size_t i = 0; i < n; ++i)
            {
                if (i == k)
                {
                    continue;
                }
                const double factor = matrix(i, k);
                if (factor == 0.0)
                {
                    continue;
                }
                for (std::size_t j = 0; j < n; ++j)
                {
                    matrix(i, j) -= factor * matrix(k, j);
                    result(i, j) -= factor * result(k, j);
                }
            }
        }

        return result;
    }
} // namespace plate::fem::detail
