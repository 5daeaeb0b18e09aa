#pragma once

#include "errors.hpp"
#include "material.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <utility>

namespace plate::fem
{
    struct Point
    {
        double x{0.0};
        double y{0.0};
    };

    using Corners = std::array<Point, 3>;

    // Row-major 3x6 strain-displacement operator and 6x6 element stiffness.
    using StrainDisplacement = std::array<double, 18>;
    using LocalStiffness = std::array<double, 36>;
    using ElementDofs = std::array<std::size_t, 6>;

    enum class DegenerateAreaPolicy
    {
        Clamp,
        Reject,
    };

    struct ElementOptions
    {
        DegenerateAreaPolicy degenerate_policy{DegenerateAreaPolicy::Clamp};
        // Relative to the squared longest edge of the element.
        double area_epsilon{1e-12};
    };

    struct AreaResult
    {
        double value{0.0};
        bool degenerate{false};
    };

    // Positive for clockwise winding.
    inline double winding(const Corners& corners) noexcept
    {
        const auto& [p0, p1, p2] = corners;
        return (p1.y - p0.y) * (p2.x - p1.x) - (p1.x - p0.x) * (p2.y - p1.y);
    }

    // Swaps the first two corners (and their ids) when the triple is clockwise.
    inline bool order_counter_clockwise(std::array<std::size_t, 3>& node_ids, Corners& corners) noexcept
    {
        if (winding(corners) > 0.0)
        {
            std::swap(node_ids[0], node_ids[1]);
            std::swap(corners[0], corners[1]);
            return true;
        }
        return false;
    }

    inline ElementDofs dof_indices(const std::array<std::size_t, 3>& node_ids) noexcept
    {
        ElementDofs dofs{};
        for (std::size_t i = 0; i < 3; ++i)
        {
            dofs[2 * i] = 2 * node_ids[i];
            dofs[2 * i + 1] = 2 * node_ids[i] + 1;
        }
        return dofs;
    }

    inline double signed_area(const Corners& corners) noexcept
    {
        const auto& [p0, p1, p2] = corners;
        return 0.5 * ((p1.x - p0.x) * (p2.y - p0.y) - (p2.x - p0.x) * (p1.y - p0.y));
    }

    inline double longest_edge_squared(const Corners& corners) noexcept
    {
        double longest = 0.0;
        for (std::size_t i = 0; i < 3; ++i)
        {
            const auto& from = corners[i];
            const auto& to = corners[(i + 1) % 3];
            const double dx = to.x - from.x;
            const double dy = to.y - from.y;
            longest = std::max(longest, dx * dx + dy * dy);
        }
        return longest;
    }

    // Degenerate when |A| <= epsilon * (longest edge)^2, a scale-free test:
    // small valid elements keep their true area. Coincident corners fall back
    // to epsilon itself.
    inline AreaResult compute_area(const Corners& corners, const ElementOptions& options, std::size_t element_id)
    {
        const double area = signed_area(corners);
        const double edge_squared = longest_edge_squared(corners);
        const double threshold = edge_squared > 0.0 ? options.area_epsilon * edge_squared : options.area_epsilon;
        if (std::abs(area) > threshold)
        {
            return AreaResult{area, false};
        }

        if (options.degenerate_policy == DegenerateAreaPolicy::Reject)
        {
            throw DegenerateElementError(element_id, area);
        }
        return AreaResult{threshold, true};
    }

    /*
     * Constant strain-displacement matrix of the linear triangle:
     *
     *          1   | b0  0  b1  0  b2  0 |
     *   B = ------ |  0 c0   0 c1   0 c2 |
     *        2 A   | c0 b0  c1 b1  c2 b2 |
     *
     * with b_i = y_j - y_k and c_i = x_k - x_j over the cyclic triple (i, j, k).
     */
    inline StrainDisplacement strain_displacement(const Corners& corners, double area) noexcept
    {
        const auto& [n0, n1, n2] = corners;

        const std::array<double, 3> b{
            n1.y - n2.y,
            n2.y - n0.y,
            n0.y - n1.y,
        };

        const std::array<double, 3> c{
            n2.x - n1.x,
            n0.x - n2.x,
            n1.x - n0.x,
        };

        const double factor = 1.0 / (2.0 * area);
        StrainDisplacement B{};
        for (std::size_t i = 0; i < 3; ++i)
        {
            B[0 * 6 + 2 * i] = factor * b[i];
            B[1 * 6 + 2 * i + 1] = factor * c[i];
            B[2 * 6 + 2 * i] = factor * c[i];
            B[2 * 6 + 2 * i + 1] = factor * b[i];
        }
        return B;
    }

    // Ke = A * B^T D B
    inline LocalStiffness local_stiffness(const StrainDisplacement& B, const ElasticityMatrix& D, double area) noexcept
    {
        std::array<double, 18> DB{};
        for (std::size_t i = 0; i < 3; ++i)
        {
            for (std::size_t j = 0; j < 6; ++j)
            {
                double sum = 0.0;
                for (std::size_t k = 0; k < 3; ++k)
                {
                    sum += D[i * 3 + k] * B[k * 6 + j];
                }
                DB[i * 6 + j] = sum;
            }
        }

        LocalStiffness ke{};
        for (std::size_t i = 0; i < 6; ++i)
        {
            for (std::size_t j = 0; j < 6; ++j)
            {
                double sum = 0.0;
                for (std::size_t k = 0; k < 3; ++k)
                {
                    sum += B[k * 6 + i] * DB[k * 6 + j];
                }
                ke[i * 6 + j] = area * sum;
            }
        }
        return ke;
    }

    inline std::array<double, 3> strain_from(const StrainDisplacement& B, const std::array<double, 6>& displacements) noexcept
    {
        std::array<double, 3> strain{};
        for (std::size_t i = 0; i < 3; ++i)
        {
            double sum = 0.0;
            for (std::size_t j = 0; j < 6; ++j)
            {
                sum += B[i * 6 + j] * displacements[j];
            }
            strain[i] = sum;
        }
        return strain;
    }
} // namespace plate::fem
