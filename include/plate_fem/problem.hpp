#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace plate::fem
{
    struct SolveResult
    {
        // Indexed by global DOF (2 * node_id + component).
        std::vector<double> displacements{};
        // Reaction at fixed DOFs, zero elsewhere.
        std::vector<double> reactions{};
        std::vector<std::size_t> free_dofs{};
        std::vector<std::size_t> fixed_dofs{};
        std::size_t iterations{0};
        double residual_norm{0.0};
        bool converged{true};

        // Sum of reactions (x, y) over all fixed DOFs.
        [[nodiscard]] std::array<double, 2> total_reaction() const noexcept
        {
            std::array<double, 2> total{};
            for (auto dof : fixed_dofs)
            {
                total[dof % 2] += reactions[dof];
            }
            return total;
        }
    };
} // namespace plate::fem
