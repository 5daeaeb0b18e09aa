#pragma once

#include "dense_matrix.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace plate::fem::detail
{
    // Stores explicit triplets produced during assembly.
    struct CooMatrix
    {
        std::size_t dimension{0};
        std::vector<int> rows{};
        std::vector<int> cols{};
        std::vector<double> values{};
        std::vector<int> row_prefix{};
    };

    // Canonical sparse matrix for CPU solves. Owns CSR buffers and provides
    // utility helpers such as dense materialisation for debugging.
    class CsrMatrix
    {
    public:
        CsrMatrix() = default;

        explicit CsrMatrix(CooMatrix&& coo)
            : m_dimension(coo.dimension)
            , m_row_ptr(std::move(coo.row_prefix))
            , m_col_idx(std::move(coo.cols))
            , m_values(std::move(coo.values))
        {
            validate();
        }

        CsrMatrix(std::size_t dimension, std::vector<int> row_ptr, std::vector<int> col_idx, std::vector<double> values)
            : m_dimension(dimension)
            , m_row_ptr(std::move(row_ptr))
            , m_col_idx(std::move(col_idx))
            , m_values(std::move(values))
        {
            validate();
        }

        [[nodiscard]] std::size_t dimension() const noexcept { return m_dimension; }
        [[nodiscard]] std::size_t non_zeros() const noexcept { return m_values.size(); }
        [[nodiscard]] const std::vector<int>& row_ptr() const noexcept { return m_row_ptr; }
        [[nodiscard]] const std::vector<int>& col_idx() const noexcept { return m_col_idx; }
        [[nodiscard]] const std::vector<double>& values() const noexcept { return m_values; }

        [[nodiscard]] double at(std::size_t row, std::size_t column) const
        {
            if (row >= m_dimension || column >= m_dimension)
            {
                throw std::out_of_range("CSR index out of range");
            }
            const auto begin = static_cast<std::size_t>(m_row_ptr[row]);
            const auto end = static_cast<std::size_t>(m_row_ptr[row + 1]);
            for (std::size_t idx = begin; idx < end; ++idx)
            {
                if (static_cast<std::size_t>(m_col_idx[idx]) == column)
                {
                    return m_values[idx];
                }
            }
            return 0.0;
        }

        [[nodiscard]] DenseMatrix to_dense() const
        {
            DenseMatrix dense(m_dimension);
            for (std::size_t row = 0; row < m_dimension; ++row)
            {
                const auto row_begin = static_cast<std::size_t>(m_row_ptr[row]);
                const auto row_end = static_cast<std::size_t>(m_row_ptr[row + 1]);
                for (std::size_t idx = row_begin; idx < row_end; ++idx)
                {
                    const auto column = static_cast<std::size_t>(m_col_idx[idx]);
                    dense(row, column) = m_values[idx];
                }
            }
            return dense;
        }

    private:
        void validate()
        {
            if (m_row_ptr.size() != m_dimension + 1)
            {
                throw std::invalid_argument("CSR row pointer length must equal dimension + 1");
            }
            if (m_col_idx.size() != m_values.size())
            {
                throw std::invalid_argument("CSR column and value arrays must have identical sizes");
            }
        }

        std::size_t m_dimension{0};
        std::vector<int> m_row_ptr{};
        std::vector<int> m_col_idx{};
        std::vector<double> m_values{};
    };

    inline void multiply(const CsrMatrix& csr, const std::vector<double>& x, std::vector<double>& result)
    {
        const auto n = csr.dimension();
        if (result.size() != n)
        {
            result.assign(n, 0.0);
        }
        else
        {
            std::fill(result.begin(), result.end(), 0.0);
        }

        const auto& row_ptr = csr.row_ptr();
        const auto& col_idx = csr.col_idx();
        const auto& values = csr.values();

        for (std::size_t row = 0; row < n; ++row)
        {
            const auto begin = static_cast<std::size_t>(row_ptr[row]);
            const auto end = static_cast<std::size_t>(row_ptr[row + 1]);
            double sum = 0.0;
            for (std::size_t idx = begin; idx < end; ++idx)
            {
                const auto column = static_cast<std::size_t>(col_idx[idx]);
                sum += values[idx] * x[column];
            }
            result[row] = sum;
        }
    }

    inline std::vector<double> diagonal(const CsrMatrix& csr)
    {
        const auto n = csr.dimension();
        std::vector<double> diag(n, 0.0);

        const auto& row_ptr = csr.row_ptr();
        const auto& col_idx = csr.col_idx();
        const auto& values = csr.values();

        for (std::size_t row = 0; row < n; ++row)
        {
            const auto begin = static_cast<std::size_t>(row_ptr[row]);
            const auto end = static_cast<std::size_t>(row_ptr[row + 1]);
            for (std::size_t idx = begin; idx < end; ++idx)
            {
                if (static_cast<std::size_t>(col_idx[idx]) == row)
                {
                    diag[row] = values[idx];
                    break;
                }
            }
        }

        return diag;
    }

    // Maps global indices to their position in `keep`; entries outside it map to npos.
    inline std::vector<std::size_t> position_map(std::size_t dimension, const std::vector<std::size_t>& keep)
    {
        std::vector<std::size_t> positions(dimension, std::numeric_limits<std::size_t>::max());
        for (std::size_t local = 0; local < keep.size(); ++local)
        {
            if (keep[local] >= dimension)
            {
                throw std::out_of_range("Restriction index exceeds matrix dimension");
            }
            positions[keep[local]] = local;
        }
        return positions;
    }

    // Square sub-matrix with rows and columns drawn from `keep`, renumbered in its order.
    inline CsrMatrix restrict_to(const CsrMatrix& csr, const std::vector<std::size_t>& keep)
    {
        const auto positions = position_map(csr.dimension(), keep);
        const auto& row_ptr = csr.row_ptr();
        const auto& col_idx = csr.col_idx();
        const auto& values = csr.values();

        std::vector<int> sub_row_ptr(keep.size() + 1, 0);
        std::vector<int> sub_col_idx;
        std::vector<double> sub_values;
        sub_col_idx.reserve(csr.non_zeros());
        sub_values.reserve(csr.non_zeros());

        for (std::size_t local_row = 0; local_row < keep.size(); ++local_row)
        {
            const auto row = keep[local_row];
            const auto begin = static_cast<std::size_t>(row_ptr[row]);
            const auto end = static_cast<std::size_t>(row_ptr[row + 1]);
            for (std::size_t idx = begin; idx < end; ++idx)
            {
                const auto mapped = positions[static_cast<std::size_t>(col_idx[idx])];
                if (mapped == std::numeric_limits<std::size_t>::max())
                {
                    continue;
                }
                sub_col_idx.push_back(static_cast<int>(mapped));
                sub_values.push_back(values[idx]);
            }
            sub_row_ptr[local_row + 1] = static_cast<int>(sub_col_idx.size());
        }

        return CsrMatrix(keep.size(), std::move(sub_row_ptr), std::move(sub_col_idx), std::move(sub_values));
    }

    // Rectangular block: rows from `row_set`, columns from `column_set`.
    inline DenseMatrix extract_block(const CsrMatrix& csr, const std::vector<std::size_t>& row_set, const std::vector<std::size_t>& column_set)
    {
        const auto positions = position_map(csr.dimension(), column_set);
        const auto& row_ptr = csr.row_ptr();
        const auto& col_idx = csr.col_idx();
        const auto& values = csr.values();

        DenseMatrix block(row_set.size(), column_set.size());
        for (std::size_t local_row = 0; local_row < row_set.size(); ++local_row)
        {
            const auto row = row_set[local_row];
            if (row >= csr.dimension())
            {
                throw std::out_of_range("Block row index exceeds matrix dimension");
            }
            const auto begin = static_cast<std::size_t>(row_ptr[row]);
            const auto end = static_cast<std::size_t>(row_ptr[row + 1]);
            for (std::size_t idx = begin; idx < end; ++idx)
            {
                const auto mapped = positions[static_cast<std::size_t>(col_idx[idx])];
                if (mapped != std::numeric_limits<std::size_t>::max())
                {
                    block(local_row, mapped) = values[idx];
                }
            }
        }
        return block;
    }
} // namespace plate::fem::detail
