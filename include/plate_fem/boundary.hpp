#pragma once

#include "detail/dense_matrix.hpp"
#include "detail/sparse_matrix.hpp"
#include "dof.hpp"
#include "errors.hpp"
#include "mesh.hpp"

#include <safe_io/utils.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace plate::fem
{
    struct DofPartition
    {
        // Free DOFs: force known, displacement solved for.
        std::vector<std::size_t> free{};
        // Fixed DOFs: zero displacement, reaction solved for.
        std::vector<std::size_t> fixed{};
        // External force plus known reaction, restricted to `free`.
        std::vector<double> known_forces{};
        // External force at every DOF, used to separate reactions from applied load.
        std::vector<double> external_forces{};
    };

    struct ReducedSystem
    {
        detail::DenseMatrix free_free{};
        detail::DenseMatrix fixed_free{};
    };

    struct SparseReducedSystem
    {
        detail::CsrMatrix free_free{};
        detail::DenseMatrix fixed_free{};
    };

    /*
     * Splits the DOFs into Dirichlet and free sets. Each DOF must have exactly
     * one of {displacement, reaction} known. Prescribed displacements must be the
     * exact zero sentinel: the coupling term K_free_fixed * d_fixed is dropped.
     */
    inline DofPartition partition_dofs(const Mesh& mesh)
    {
        DofPartition partition{};
        partition.external_forces.assign(mesh.dof_count(), 0.0);

        for (const auto& node : mesh.nodes())
        {
            for (std::size_t component = 0; component < 2; ++component)
            {
                const auto dof = global_dof(node.id, component);
                const auto& displacement = node.displacement[component];
                const auto& reaction = node.reaction[component];
                const auto& force = node.force[component];

                if (!force.is_known())
                {
                    throw InvalidBoundaryConditionError(dof, "external force must be known");
                }
                partition.external_forces[dof] = force.value_or_zero();

                if (displacement.is_known() && reaction.is_known())
                {
                    throw InvalidBoundaryConditionError(dof, "both displacement and reaction are prescribed");
                }
                if (!displacement.is_known() && !reaction.is_known())
                {
                    throw InvalidBoundaryConditionError(dof, "neither displacement nor reaction is prescribed");
                }

                if (displacement.is_known())
                {
                    if (!displacement.is_zero())
                    {
                        throw InvalidBoundaryConditionError(dof, "nonzero prescribed displacements are not supported");
                    }
                    partition.fixed.push_back(dof);
                }
                else
                {
                    partition.free.push_back(dof);
                    partition.known_forces.push_back(force.value_or_zero() + reaction.value_or_zero());
                }
            }
        }

        return partition;
    }

    namespace detail
    {
        // Representative node per group of nodes joined through elements.
        inline std::vector<std::size_t> node_components(const Mesh& mesh)
        {
            std::vector<std::size_t> parent(mesh.node_count());
            std::iota(parent.begin(), parent.end(), std::size_t{0});

            const auto find = [&parent](std::size_t node) {
                while (parent[node] != node)
                {
                    parent[node] = parent[parent[node]];
                    node = parent[node];
                }
                return node;
            };

            for (const auto& element : mesh.elements())
            {
                const auto root = find(element.node_ids[0]);
                parent[find(element.node_ids[1])] = root;
                parent[find(element.node_ids[2])] = find(root);
            }

            for (std::size_t node = 0; node < parent.size(); ++node)
            {
                parent[node] = find(node);
            }
            return parent;
        }
    } // namespace detail

    /*
     * Throws SingularSystemError when the supports leave a rigid-body motion
     * free. Each group of element-connected nodes needs fixed components whose
     * rigid-mode rows [1, 0, -y] (x) and [0, 1, x] (y) reach rank 3; a node with
     * no element must be fixed in both directions. Mechanisms inside a group
     * (hinged sub-bodies) are not detected here.
     */
    inline void ensure_restrained(const Mesh& mesh)
    {
        const auto component = detail::node_components(mesh);
        const auto n = mesh.node_count();

        std::vector<bool> has_element(n, false);
        for (const auto& element : mesh.elements())
        {
            has_element[component[element.node_ids[0]]] = true;
        }

        std::vector<double> centre_x(n, 0.0);
        std::vector<double> centre_y(n, 0.0);
        std::vector<std::size_t> members(n, 0);
        constexpr double far = std::numeric_limits<double>::max();
        std::vector<std::array<double, 4>> bounds(n, std::array<double, 4>{far, -far, far, -far});
        for (const auto& node : mesh.nodes())
        {
            const auto root = component[node.id];
            centre_x[root] += node.x;
            centre_y[root] += node.y;
            ++members[root];
            auto& box = bounds[root];
            box = {std::min(box[0], node.x), std::max(box[1], node.x), std::min(box[2], node.y), std::max(box[3], node.y)};
        }

        // Gram matrix of the rigid-mode rows, coordinates centred and scaled per group.
        std::vector<std::array<double, 9>> gram(n, std::array<double, 9>{});
        for (const auto& node : mesh.nodes())
        {
            const auto root = component[node.id];
            const auto& box = bounds[root];
            const double extent = std::max(box[1] - box[0], box[3] - box[2]);
            const double scale = extent > 0.0 ? extent : 1.0;
            const double x = (node.x - centre_x[root] / static_cast<double>(members[root])) / scale;
            const double y = (node.y - centre_y[root] / static_cast<double>(members[root])) / scale;

            for (std::size_t axis = 0; axis < 2; ++axis)
            {
                if (!node.displacement[axis].is_zero())
                {
                    continue;
                }
                const std::array<double, 3> row = axis == 0 ? std::array<double, 3>{1.0, 0.0, -y} : std::array<double, 3>{0.0, 1.0, x};
                for (std::size_t i = 0; i < 3; ++i)
                {
                    for (std::size_t j = 0; j < 3; ++j)
                    {
                        gram[root][i * 3 + j] += row[i] * row[j];
                    }
                }
            }
        }

        for (std::size_t root = 0; root < n; ++root)
        {
            if (component[root] != root)
            {
                continue;
            }

            if (!has_element[root])
            {
                if (!mesh.node(root).is_fully_fixed())
                {
                    throw SingularSystemError(safe_io::sformat("Node {} belongs to no element and is not fixed", root));
                }
                continue;
            }

            const auto& g = gram[root];
            const double determinant = g[0] * (g[4] * g[8] - g[5] * g[7]) - g[1] * (g[3] * g[8] - g[5] * g[6]) + g[2] * (g[3] * g[7] - g[4] * g[6]);
            const double mean_diagonal = (g[0] + g[4] + g[8]) / 3.0;
            if (!(determinant > 1e-12 * mean_diagonal * mean_diagonal * mean_diagonal))
            {
                throw SingularSystemError(safe_io::sformat(
                    "Structure is under-constrained: the part containing node {} can move as a rigid body",
                    root));
            }
        }
    }

    inline ReducedSystem reduce(const detail::DenseMatrix& K, const DofPartition& partition)
    {
        if (!K.is_square())
        {
            throw std::invalid_argument("Global stiffness matrix must be square");
        }

        ReducedSystem system{};
        system.free_free.resize(partition.free.size(), partition.free.size());
        system.fixed_free.resize(partition.fixed.size(), partition.free.size());

        for (std::size_t i = 0; i < partition.free.size(); ++i)
        {
            for (std::size_t j = 0; j < partition.free.size(); ++j)
            {
                system.free_free(i, j) = K(partition.free[i], partition.free[j]);
            }
        }

        for (std::size_t i = 0; i < partition.fixed.size(); ++i)
        {
            for (std::size_t j = 0; j < partition.free.size(); ++j)
            {
                system.fixed_free(i, j) = K(partition.fixed[i], partition.free[j]);
            }
        }

        return system;
    }

    inline SparseReducedSystem reduce(const detail::CsrMatrix& K, const DofPartition& partition)
    {
        SparseReducedSystem system{};
        system.free_free = detail::restrict_to(K, partition.free);
        system.fixed_free = detail::extract_block(K, partition.fixed, partition.free);
        return system;
    }
} // namespace plate::fem
