#pragma once

#include "mesh.hpp"
#include "postprocess.hpp"

#include <cstddef>
#include <fstream>
#include <span>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace plate::fem
{
    /*
     * ASCII VTK XML unstructured grid: node displacements as point data, the
     * stress components and von Mises value as cell data. Returns false if the
     * file cannot be opened.
     */
    inline bool write_vtu(const std::string& path, const Mesh& mesh, std::span<const ElementResult> results)
    {
        std::ofstream out(path);
        if (!out)
        {
            return false;
        }

        constexpr int vtk_triangle = 5;
        const bool with_cells = results.size() == mesh.element_count();

        fmt::print(out, "<?xml version=\"1.0\"?>\n");
        fmt::print(out, "<VTKFile type=\"UnstructuredGrid\" version=\"0.1\" byte_order=\"LittleEndian\">\n<UnstructuredGrid>\n");
        fmt::print(out, "<Piece NumberOfPoints=\"{}\" NumberOfCells=\"{}\">\n", mesh.node_count(), mesh.element_count());

        fmt::print(out, "<Points>\n<DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n");
        for (const auto& node : mesh.nodes())
        {
            fmt::print(out, "{:.16g} {:.16g} 0\n", node.x, node.y);
        }
        fmt::print(out, "</DataArray>\n</Points>\n");

        fmt::print(out, "<Cells>\n<DataArray type=\"Int32\" Name=\"connectivity\" format=\"ascii\">\n");
        for (const auto& element : mesh.elements())
        {
            fmt::print(out, "{} {} {}\n", element.node_ids[0], element.node_ids[1], element.node_ids[2]);
        }
        fmt::print(out, "</DataArray>\n<DataArray type=\"Int32\" Name=\"offsets\" format=\"ascii\">\n");
        for (std::size_t e = 0; e < mesh.element_count(); ++e)
        {
            fmt::print(out, "{}\n", 3 * (e + 1));
        }
        fmt::print(out, "</DataArray>\n<DataArray type=\"UInt8\" Name=\"types\" format=\"ascii\">\n");
        for (std::size_t e = 0; e < mesh.element_count(); ++e)
        {
            fmt::print(out, "{}\n", vtk_triangle);
        }
        fmt::print(out, "</DataArray>\n</Cells>\n");

        fmt::print(out, "<PointData>\n<DataArray type=\"Float64\" Name=\"displacement\" NumberOfComponents=\"3\" format=\"ascii\">\n");
        for (const auto& node : mesh.nodes())
        {
            const double dx = node.displacement.x.is_known() ? node.displacement.x.value() : 0.0;
            const double dy = node.displacement.y.is_known() ? node.displacement.y.value() : 0.0;
            fmt::print(out, "{:.16g} {:.16g} 0\n", dx, dy);
        }
        fmt::print(out, "</DataArray>\n</PointData>\n");

        if (with_cells)
        {
            const auto write_cell_array = [&](const char* name, auto&& extract) {
                fmt::print(out, "<DataArray type=\"Float64\" Name=\"{}\" NumberOfComponents=\"1\" format=\"ascii\">\n", name);
                for (const auto& result : results)
                {
                    fmt::print(out, "{:.16g}\n", extract(result));
                }
                fmt::print(out, "</DataArray>\n");
            };

            fmt::print(out, "<CellData>\n");
            write_cell_array("stress_xx", [](const ElementResult& r) { return r.stress[0]; });
            write_cell_array("stress_yy", [](const ElementResult& r) { return r.stress[1]; });
            write_cell_array("stress_xy", [](const ElementResult& r) { return r.stress[2]; });
            write_cell_array("von_mises", [](const ElementResult& r) { return r.von_mises; });
            fmt::print(out, "</CellData>\n");
        }

        fmt::print(out, "</Piece>\n</UnstructuredGrid>\n</VTKFile>\n");
        return static_cast<bool>(out);
    }
} // namespace plate::fem
