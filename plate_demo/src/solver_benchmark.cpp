#include <plate_fem/errors.hpp>
#include <plate_fem/mesh.hpp>
#include <plate_fem/mesh_builder.hpp>
#include <plate_fem/problem.hpp>
#include <plate_fem/solver.hpp>

#include <safe_io/utils.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace
{
    using plate::fem::FactorizationBreakdownError;
    using plate::fem::Material;
    using plate::fem::Mesh;
    using plate::fem::PlateGeometry;
    using plate::fem::PreconditionerType;
    using plate::fem::SolveResult;
    using plate::fem::SolverOptions;
    using plate::fem::SolverType;

    Mesh build_loaded_plate(const PlateGeometry& geometry)
    {
        const auto triangulation = plate::fem::plate_with_hole(geometry);
        auto mesh = plate::fem::import_triangulation(triangulation.points, triangulation.triangles);

        constexpr double eps = 1e-9;
        for (const auto& node : mesh.nodes())
        {
            if (std::abs(node.x) < eps)
            {
                mesh.fix(node.id);
            }
            else if (std::abs(node.x - geometry.length) < eps)
            {
                mesh.apply_force(node.id, 1e3, 0.0);
            }
        }
        return mesh;
    }

    struct TimingSummary
    {
        SolveResult result{};
        double average_ms{0.0};
    };

    // Each repetition solves a fresh copy: solve() writes results into the nodes.
    TimingSummary run_solver(const Mesh& pristine, const Material& material, const SolverOptions& options, std::size_t repetitions)
    {
        SolveResult last_result{};
        double total_ms = 0.0;

        for (std::size_t iteration = 0; iteration < repetitions; ++iteration)
        {
            auto mesh = pristine;
            const auto start = std::chrono::steady_clock::now();
            last_result = plate::fem::solve(mesh, material, options);
            const auto end = std::chrono::steady_clock::now();
            total_ms += std::chrono::duration<double, std::milli>(end - start).count();
        }

        TimingSummary summary{};
        summary.result = std::move(last_result);
        summary.average_ms = repetitions > 0 ? total_ms / static_cast<double>(repetitions) : 0.0;
        return summary;
    }

    double max_difference(const std::vector<double>& lhs, const std::vector<double>& rhs)
    {
        if (lhs.size() != rhs.size())
        {
            return std::numeric_limits<double>::infinity();
        }

        double diff = 0.0;
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            diff = std::max(diff, std::abs(lhs[i] - rhs[i]));
        }
        return diff;
    }

    double max_magnitude(const std::vector<double>& values)
    {
        double result = 0.0;
        for (const double value : values)
        {
            result = std::max(result, std::abs(value));
        }
        return result;
    }
}

int main()
{
    constexpr std::size_t repetitions = 3;

    const PlateGeometry geometry{.cells_x = 40, .cells_y = 12};
    const Material material{.youngs_modulus = 200e9, .poisson_ratio = 0.28};
    const auto mesh = build_loaded_plate(geometry);

    const auto direct = run_solver(mesh, material, SolverOptions{.solver = SolverType::Direct}, repetitions);
    const auto inverse = run_solver(mesh, material, SolverOptions{.solver = SolverType::DenseInverse}, repetitions);
    const auto cg_jacobi = run_solver(
        mesh,
        material,
        SolverOptions{.solver = SolverType::ConjugateGradient, .preconditioner = PreconditionerType::Jacobi, .tolerance = 1e-12},
        repetitions);
    std::optional<TimingSummary> cg_ic0;
    try
    {
        cg_ic0 = run_solver(
            mesh,
            material,
            SolverOptions{.solver = SolverType::ConjugateGradient, .preconditioner = PreconditionerType::IncompleteCholesky0, .tolerance = 1e-12},
            repetitions);
    }
    catch (const FactorizationBreakdownError& error)
    {
        safe_io::warn("CG + IC0 skipped: {}", error.what());
    }

    safe_io::print(
        "Solver benchmark on plate mesh ({} nodes, {} elements, {} DOFs)",
        mesh.node_count(),
        mesh.element_count(),
        mesh.dof_count());

    const double scale = std::max(max_magnitude(direct.result.displacements), std::numeric_limits<double>::min());
    bool mismatch = false;
    std::vector<std::pair<const char*, const TimingSummary*>> runs{
        {"Direct", &direct},
        {"DenseInverse", &inverse},
        {"CG + Jacobi", &cg_jacobi},
    };
    if (cg_ic0)
    {
        runs.emplace_back("CG + IC0", &*cg_ic0);
    }

    for (const auto& [label, run] : runs)
    {
        const double relative_diff = max_difference(direct.result.displacements, run->result.displacements) / scale;
        safe_io::print(
            " {:<14} average {:>9.3f} ms | iterations {:>5} | residual {:.3e} | diff vs Direct {:.3e}",
            label,
            run->average_ms,
            run->result.iterations,
            run->result.residual_norm,
            relative_diff);
        mismatch = mismatch || relative_diff > 1e-6;
    }

    if (mismatch)
    {
        safe_io::print("Numerical mismatch detected between solver strategies.");
        return 1;
    }

    const auto& fastest = cg_ic0 ? *cg_ic0 : cg_jacobi;
    safe_io::print(
        "Results match within tolerance. CG speedup over DenseInverse {:.2f}x",
        (fastest.average_ms > 0.0) ? (inverse.average_ms / fastest.average_ms) : 0.0);

    return 0;
}
