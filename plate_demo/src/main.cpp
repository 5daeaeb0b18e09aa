// Tension test on a plate with a central hole: fixed at x = 0, pulled at x = length
#include <plate_fem/plate_fem.hpp>
#include <safe_io/utils.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <string_view>

namespace
{
    using plate::fem::ElementResult;
    using plate::fem::Material;
    using plate::fem::Mesh;
    using plate::fem::PlateGeometry;
    using plate::fem::SolverOptions;
    using plate::fem::SolverType;

    constexpr double boundary_tolerance = 1e-9;
    constexpr double applied_load = 1e3;

    Mesh build_plate(const PlateGeometry& geometry)
    {
        const auto triangulation = plate::fem::plate_with_hole(geometry);
        auto mesh = plate::fem::import_triangulation(triangulation.points, triangulation.triangles);

        for (auto id : mesh.nodes_where([](const auto& node) { return std::abs(node.x) < boundary_tolerance; }))
        {
            mesh.fix(id);
        }

        const double loaded_edge = geometry.length;
        for (auto id : mesh.nodes_where([loaded_edge](const auto& node) { return std::abs(node.x - loaded_edge) < boundary_tolerance; }))
        {
            mesh.apply_force(id, applied_load, 0.0);
        }

        return mesh;
    }

    int run_demo(bool verbose)
    {
        const PlateGeometry geometry{};
        const Material steel{.youngs_modulus = 200e9, .poisson_ratio = 0.28};

        auto mesh = build_plate(geometry);
        safe_io::info(
            "Plate {}x{} with hole r={} at ({}, {}): {} nodes, {} elements",
            geometry.length,
            geometry.width,
            geometry.hole_radius,
            geometry.hole_center.x,
            geometry.hole_center.y,
            mesh.node_count(),
            mesh.element_count());

        SolverOptions options{};
        options.solver = SolverType::ConjugateGradient;
        options.tolerance = 1e-12;
        options.verbose = verbose;

        const auto result = plate::fem::solve(mesh, steel, options);

        double applied_x = 0.0;
        for (const auto& node : mesh.nodes())
        {
            if (node.has_external_load())
            {
                applied_x += node.force.x.value();
            }
        }
        const auto reaction = result.total_reaction();
        const double imbalance = std::abs(reaction[0] + applied_x) / std::max(std::abs(applied_x), 1.0);

        safe_io::info("Applied load {:.6e} N, support reaction {:.6e} N (relative imbalance {:.3e})", applied_x, reaction[0], imbalance);

        double max_ux = 0.0;
        for (auto dof : result.free_dofs)
        {
            if (dof % 2 == 0)
            {
                max_ux = std::max(max_ux, result.displacements[dof]);
            }
        }
        safe_io::info("Maximum axial displacement {:.6e} m", max_ux);

        const auto element_results = plate::fem::post_process(mesh, steel);
        const auto scene = plate::fem::build_scene(
            mesh,
            element_results,
            plate::fem::VisualizationOptions{.show_legend = true, .auto_scale = true, .deformation_scale = 1e5, .legend_title = "von Mises [Pa]"});
        safe_io::info("{} range: {:.6e} .. {:.6e}", scene.legend.title, scene.legend.min, scene.legend.max);

        const auto hottest = std::max_element(element_results.begin(), element_results.end(), [](const ElementResult& lhs, const ElementResult& rhs) {
            return lhs.von_mises < rhs.von_mises;
        });
        if (hottest != element_results.end())
        {
            const auto centre = mesh.corners(mesh.element(hottest->element_id));
            safe_io::info(
                "Peak stress in element {} near ({:.3f}, {:.3f})",
                hottest->element_id,
                (centre[0].x + centre[1].x + centre[2].x) / 3.0,
                (centre[0].y + centre[1].y + centre[2].y) / 3.0);
        }

        constexpr const char* output_path = "plate_with_hole.vtu";
        if (!plate::fem::write_vtu(output_path, mesh, element_results))
        {
            safe_io::eprint("Could not write {}", output_path);
            return 1;
        }
        safe_io::info("Wrote {}", output_path);

        if (!result.converged || imbalance > 1e-6)
        {
            safe_io::eprint("Equilibrium check failed");
            return 1;
        }
        return 0;
    }
} // namespace

// -q silences the summary, -v adds solver and import diagnostics.
int main(int argc, char** argv)
{
    bool verbose = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view argument = argv[i];
        if (argument == "-q" || argument == "--quiet")
        {
            safe_io::set_verbosity(safe_io::Verbosity::Quiet);
        }
        else if (argument == "-v" || argument == "--verbose")
        {
            safe_io::set_verbosity(safe_io::Verbosity::Verbose);
            verbose = true;
        }
        else
        {
            safe_io::eprint("Unknown argument '{}'. Usage: plate_with_hole [-q|-v]", argument);
            return 2;
        }
    }

    try
    {
        return run_demo(verbose);
    }
    catch (const plate::fem::Error& error)
    {
        safe_io::eprint("Analysis failed: {}", error.what());
    }
    catch (const std::exception& error)
    {
        safe_io::eprint("Unexpected error: {}", error.what());
    }
    return 1;
}
