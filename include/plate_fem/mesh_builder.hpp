#pragma once

#include "element.hpp"
#include "mesh.hpp"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace plate::fem
{
    // Raw triangulator output in the form consumed by import_triangulation().
    struct Triangulation
    {
        std::vector<Point> points{};
        std::vector<Triangle> triangles{};
    };

    struct PlateGeometry
    {
        double length{10.0};
        double width{3.0};
        Point hole_center{5.0, 1.5};
        double hole_radius{0.5};
        std::size_t cells_x{40};
        std::size_t cells_y{12};
    };

    namespace detail
    {
        inline std::size_t grid_index(std::size_t i, std::size_t j, std::size_t cells_x) noexcept
        {
            return j * (cells_x + 1) + i;
        }

        template <typename KeepCell>
        Triangulation structured_grid(double length, double width, std::size_t cells_x, std::size_t cells_y, KeepCell&& keep_cell)
        {
            if (cells_x == 0 || cells_y == 0)
            {
                throw std::invalid_argument("Structured mesh needs at least one cell in each direction");
            }
            if (!(length > 0.0) || !(width > 0.0))
            {
                throw std::invalid_argument("Structured mesh needs positive extents");
            }

            const double dx = length / static_cast<double>(cells_x);
            const double dy = width / static_cast<double>(cells_y);

            Triangulation mesh{};
            mesh.points.reserve((cells_x + 1) * (cells_y + 1));
            for (std::size_t j = 0; j <= cells_y; ++j)
            {
                for (std::size_t i = 0; i <= cells_x; ++i)
                {
                    mesh.points.push_back(Point{static_cast<double>(i) * dx, static_cast<double>(j) * dy});
                }
            }

            mesh.triangles.reserve(cells_x * cells_y * 2);
            for (std::size_t j = 0; j < cells_y; ++j)
            {
                for (std::size_t i = 0; i < cells_x; ++i)
                {
                    const Point centre{(static_cast<double>(i) + 0.5) * dx, (static_cast<double>(j) + 0.5) * dy};
                    if (!keep_cell(centre))
                    {
                        continue;
                    }

                    const std::size_t n0 = grid_index(i, j, cells_x);
                    const std::size_t n1 = n0 + 1;
                    const std::size_t n2 = grid_index(i, j + 1, cells_x);
                    const std::size_t n3 = n2 + 1;

                    mesh.triangles.push_back(Triangle{n0, n1, n3});
                    mesh.triangles.push_back(Triangle{n0, n3, n2});
                }
            }

            return mesh;
        }
    } // namespace detail

    inline Triangulation rectangle(double length, double width, std::size_t cells_x, std::size_t cells_y)
    {
        return detail::structured_grid(length, width, cells_x, cells_y, [](const Point&) { return true; });
    }

    /*
     * Rectangle [0, length] x [0, width] with every grid cell whose centre lies
     * inside the hole removed. Grid points left without a triangle, and the
     * hole centre appended as a construction point, are dropped on import.
     */
    inline Triangulation plate_with_hole(const PlateGeometry& geometry)
    {
        if (geometry.hole_radius < 0.0)
        {
            throw std::invalid_argument("Hole radius must be non-negative");
        }

        const double radius_squared = geometry.hole_radius * geometry.hole_radius;
        auto mesh = detail::structured_grid(
            geometry.length,
            geometry.width,
            geometry.cells_x,
            geometry.cells_y,
            [&geometry, radius_squared](const Point& centre) {
                const double dx = centre.x - geometry.hole_center.x;
                const double dy = centre.y - geometry.hole_center.y;
                return dx * dx + dy * dy >= radius_squared;
            });

        mesh.points.push_back(geometry.hole_center);
        return mesh;
    }
} // namespace plate::fem
