#pragma once

#include "detail/dense_matrix.hpp"
#include "detail/sparse_matrix.hpp"
#include "element.hpp"
#include "material.hpp"
#include "mesh.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace plate::fem
{
    inline LocalStiffness element_stiffness(const Element& element, const ElasticityMatrix& D) noexcept
    {
        return local_stiffness(element.B, D, element.area);
    }

    // K[dofs[i]][dofs[j]] += ke[i][j]; contributions from elements sharing a
    // node accumulate, so the call order does not matter.
    inline void scatter_add(detail::DenseMatrix& K, const LocalStiffness& ke, const ElementDofs& dofs)
    {
        for (auto dof : dofs)
        {
            if (dof >= K.rows() || dof >= K.columns())
            {
                throw std::out_of_range("Element DOF index exceeds global matrix size");
            }
        }

        for (std::size_t i = 0; i < 6; ++i)
        {
            for (std::size_t j = 0; j < 6; ++j)
            {
                K(dofs[i], dofs[j]) += ke[i * 6 + j];
            }
        }
    }

    inline detail::DenseMatrix assemble_dense(const Mesh& mesh, const Material& material)
    {
        const auto D = elasticity_matrix(material);
        detail::DenseMatrix K(mesh.dof_count());
        for (const auto& element : mesh.elements())
        {
            scatter_add(K, element_stiffness(element, D), element.dofs);
        }
        return K;
    }

    inline detail::CsrMatrix assemble_sparse(const Mesh& mesh, const Material& material)
    {
        const auto D = elasticity_matrix(material);
        const std::size_t dof_count = mesh.dof_count();

        std::vector<std::vector<std::size_t>> adjacency(dof_count);
        for (const auto& element : mesh.elements())
        {
            for (auto global_i : element.dofs)
            {
                auto& row_adjacency = adjacency[global_i];
                for (auto global_j : element.dofs)
                {
                    row_adjacency.push_back(global_j);
                }
            }
        }

        for (std::size_t row = 0; row < dof_count; ++row)
        {
            auto& row_adjacency = adjacency[row];
            row_adjacency.push_back(row);
            std::sort(row_adjacency.begin(), row_adjacency.end());
            row_adjacency.erase(std::unique(row_adjacency.begin(), row_adjacency.end()), row_adjacency.end());
        }

        std::vector<int> row_prefix(dof_count + 1, 0);
        for (std::size_t row = 0; row < dof_count; ++row)
        {
            row_prefix[row + 1] = row_prefix[row] + static_cast<int>(adjacency[row].size());
        }

        detail::CooMatrix coo{};
        coo.dimension = dof_count;
        coo.row_prefix = row_prefix;
        const std::size_t total_entries = static_cast<std::size_t>(coo.row_prefix.back());
        coo.rows.assign(total_entries, 0);
        coo.cols.assign(total_entries, 0);
        coo.values.assign(total_entries, 0.0);

        std::vector<std::unordered_map<std::size_t, std::size_t>> index_map(dof_count);
        for (std::size_t row = 0; row < dof_count; ++row)
        {
            const auto start = static_cast<std::size_t>(coo.row_prefix[row]);
            const auto& columns = adjacency[row];
            index_map[row].reserve(columns.size());
            for (std::size_t offset = 0; offset < columns.size(); ++offset)
            {
                const auto index = start + offset;
                coo.rows[index] = static_cast<int>(row);
                coo.cols[index] = static_cast<int>(columns[offset]);
                index_map[row].emplace(columns[offset], index);
            }
        }

        for (const auto& element : mesh.elements())
        {
            const auto ke = element_stiffness(element, D);
            for (std::size_t local_i = 0; local_i < 6; ++local_i)
            {
                const auto global_i = element.dofs[local_i];
                for (std::size_t local_j = 0; local_j < 6; ++local_j)
                {
                    const auto iterator = index_map[global_i].find(element.dofs[local_j]);
                    if (iterator == index_map[global_i].end())
                    {
                        throw std::logic_error("Missing adjacency entry during assembly");
                    }
                    coo.values[iterator->second] += ke[local_i * 6 + local_j];
                }
            }
        }

        return detail::CsrMatrix(std::move(coo));
    }
} // namespace plate::fem
