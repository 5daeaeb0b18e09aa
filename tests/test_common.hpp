#pragma once

#include <plate_fem/material.hpp>
#include <plate_fem/mesh.hpp>
#include <plate_fem/mesh_builder.hpp>

#include <cmath>
#include <cstddef>

namespace plate::fem::test_support
{
    constexpr double kBoundaryTolerance = 1e-9;

    inline Mesh make_mesh(const Triangulation& triangulation, const ImportOptions& options = {})
    {
        return import_triangulation(triangulation.points, triangulation.triangles, options);
    }

    /*
     * Unit square, 2x2 cells, under uniaxial tension sigma0 in x:
     * rollers on x = 0, the origin pinned in y, consistent nodal loads on x = 1.
     */
    inline Mesh make_tension_patch(double sigma0)
    {
        auto mesh = make_mesh(rectangle(1.0, 1.0, 2, 2));
        for (const auto& node : mesh.nodes())
        {
            if (std::abs(node.x) < kBoundaryTolerance)
            {
                mesh.fix_x(node.id);
                if (std::abs(node.y) < kBoundaryTolerance)
                {
                    mesh.fix_y(node.id);
                }
            }
            else if (std::abs(node.x - 1.0) < kBoundaryTolerance)
            {
                const bool corner = std::abs(node.y) < kBoundaryTolerance || std::abs(node.y - 1.0) < kBoundaryTolerance;
                mesh.apply_force(node.id, corner ? sigma0 * 0.25 : sigma0 * 0.5, 0.0);
            }
        }
        return mesh;
    }

    inline Material unit_material()
    {
        return Material{.youngs_modulus = 1.0, .poisson_ratio = 0.3};
    }
} // namespace plate::fem::test_support
