#pragma once

#include "assembler.hpp"
#include "boundary.hpp"
#include "detail/dense_matrix.hpp"
#include "detail/sparse_matrix.hpp"
#include "errors.hpp"
#include "material.hpp"
#include "mesh.hpp"
#include "problem.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <safe_io/utils.hpp>

namespace plate::fem
{
    enum class SolverType
    {
        DenseInverse,
        Direct,
        ConjugateGradient,
    };

    enum class PreconditionerType
    {
        None,
        Jacobi,
        IncompleteCholesky0,
    };

    struct SolverOptions
    {
        SolverType solver{SolverType::ConjugateGradient};
        PreconditionerType preconditioner{PreconditionerType::Jacobi};
        // Relative to the norm of the reduced right-hand side.
        double tolerance{1e-10};
        // Zero selects 10 * number of free DOFs.
        std::size_t max_iterations{0};
        bool verbose{false};
        // Singularity threshold: dense pivots against the largest entry of the
        // reduced stiffness, CG curvature p'Kp / p'p against its largest diagonal.
        double pivot_tolerance{1e-12};
    };

    inline std::string_view to_string(SolverType type) noexcept
    {
        switch (type)
        {
        case SolverType::DenseInverse:
            return "DenseInverse";
        case SolverType::Direct:
            return "Direct";
        case SolverType::ConjugateGradient:
            return "ConjugateGradient";
        }
        return "Unknown";
    }

    inline std::string_view to_string(PreconditionerType type) noexcept
    {
        switch (type)
        {
        case PreconditionerType::None:
            return "None";
        case PreconditionerType::Jacobi:
            return "Jacobi";
        case PreconditionerType::IncompleteCholesky0:
            return "IC0";
        }
        return "Unknown";
    }

    namespace detail
    {
        struct LinearSolveSummary
        {
            std::vector<double> solution{};
            std::size_t iterations{0};
            double achieved_residual{0.0};
            bool converged{true};
        };

        inline double norm(const std::vector<double>& v)
        {
            return std::sqrt(std::inner_product(v.begin(), v.end(), v.begin(), 0.0));
        }

        class Preconditioner
        {
        public:
            virtual ~Preconditioner() = default;
            virtual void apply(const std::vector<double>& r, std::vector<double>& z) const = 0;
        };

        class IdentityPreconditioner final : public Preconditioner
        {
        public:
            void apply(const std::vector<double>& r, std::vector<double>& z) const override
            {
                z = r;
            }
        };

        class JacobiPreconditioner final : public Preconditioner
        {
        public:
            explicit JacobiPreconditioner(const CsrMatrix& csr)
                : m_inverse_diagonal(diagonal(csr))
            {
                for (auto& value : m_inverse_diagonal)
                {
                    if (value <= 0.0)
                    {
                        throw SingularSystemError("Free degree of freedom has no positive stiffness on the diagonal");
                    }
                    value = 1.0 / value;
                }
            }

            void apply(const std::vector<double>& r, std::vector<double>& z) const override
            {
                const auto n = m_inverse_diagonal.size();
                z.resize(n);
                for (std::size_t i = 0; i < n; ++i)
                {
                    z[i] = r[i] * m_inverse_diagonal[i];
                }
            }

        private:
            std::vector<double> m_inverse_diagonal{};
        };

        /*
         * Zero fill-in incomplete Cholesky, A ~ L L^T on the lower pattern of A.
         * L is kept in CSR with the diagonal as the last entry of each row, and
         * its transpose in a second CSR for the backward sweep.
         */
        class Ic0Preconditioner final : public Preconditioner
        {
        public:
            explicit Ic0Preconditioner(const CsrMatrix& csr)
            {
                factorise(csr);
                transpose();
            }

            void apply(const std::vector<double>& r, std::vector<double>& z) const override
            {
                const auto n = m_diag.size();
                z.assign(n, 0.0);

                // L y = r; y is built in place in z.
                for (std::size_t row = 0; row < n; ++row)
                {
                    double sum = r[row];
                    for (auto idx = m_lower_ptr[row]; idx + 1 < m_lower_ptr[row + 1]; ++idx)
                    {
                        sum -= m_lower_values[idx] * z[m_lower_cols[idx]];
                    }
                    z[row] = sum / m_diag[row];
                }

                // L^T z = y
                for (std::size_t step = n; step > 0; --step)
                {
                    const auto row = step - 1;
                    double sum = z[row];
                    for (auto idx = m_upper_ptr[row]; idx < m_upper_ptr[row + 1]; ++idx)
                    {
                        sum -= m_upper_values[idx] * z[m_upper_cols[idx]];
                    }
                    z[row] = sum / m_diag[row];
                }
            }

        private:
            void factorise(const CsrMatrix& csr)
            {
                const auto n = csr.dimension();
                const auto& row_ptr = csr.row_ptr();
                const auto& col_idx = csr.col_idx();
                const auto& values = csr.values();

                m_lower_ptr.assign(n + 1, 0);
                m_lower_cols.clear();
                m_lower_values.clear();
                m_diag.assign(n, 0.0);

                std::vector<std::pair<std::size_t, double>> row_entries;
                for (std::size_t row = 0; row < n; ++row)
                {
                    row_entries.clear();
                    for (auto idx = static_cast<std::size_t>(row_ptr[row]); idx < static_cast<std::size_t>(row_ptr[row + 1]); ++idx)
                    {
                        const auto column = static_cast<std::size_t>(col_idx[idx]);
                        if (column <= row)
                        {
                            row_entries.emplace_back(column, values[idx]);
                        }
                    }
                    std::sort(row_entries.begin(), row_entries.end());
                    if (row_entries.empty() || row_entries.back().first != row)
                    {
                        throw FactorizationBreakdownError("IC(0) preconditioner requires explicit diagonal entries");
                    }

                    const auto row_begin = m_lower_cols.size();
                    double diagonal = row_entries.back().second;
                    for (std::size_t k = 0; k + 1 < row_entries.size(); ++k)
                    {
                        const auto [column, a_value] = row_entries[k];

                        // a_rc minus the dot product of the already factored parts of rows `row` and `column`.
                        double sum = a_value;
                        auto left = row_begin;
                        auto right = m_lower_ptr[column];
                        const auto right_end = m_lower_ptr[column + 1] - 1;
                        while (left < m_lower_cols.size() && right < right_end)
                        {
                            if (m_lower_cols[left] == m_lower_cols[right])
                            {
                                sum -= m_lower_values[left++] * m_lower_values[right++];
                            }
                            else if (m_lower_cols[left] < m_lower_cols[right])
                            {
                                ++left;
                            }
                            else
                            {
                                ++right;
                            }
                        }

                        const double l_value = sum / m_diag[column];
                        m_lower_cols.push_back(column);
                        m_lower_values.push_back(l_value);
                        diagonal -= l_value * l_value;
                    }

                    if (!(diagonal > 0.0))
                    {
                        throw FactorizationBreakdownError("IC(0) factorisation failed: matrix is not SPD");
                    }
                    m_diag[row] = std::sqrt(diagonal);
                    m_lower_cols.push_back(row);
                    m_lower_values.push_back(m_diag[row]);
                    m_lower_ptr[row + 1] = m_lower_cols.size();
                }
            }

            // Strictly lower part of L regrouped by column.
            void transpose()
            {
                const auto n = m_diag.size();
                m_upper_ptr.assign(n + 1, 0);
                for (std::size_t row = 0; row < n; ++row)
                {
                    for (auto idx = m_lower_ptr[row]; idx + 1 < m_lower_ptr[row + 1]; ++idx)
                    {
                        ++m_upper_ptr[m_lower_cols[idx] + 1];
                    }
                }
                std::partial_sum(m_upper_ptr.begin(), m_upper_ptr.end(), m_upper_ptr.begin());

                std::vector<std::size_t> fill(m_upper_ptr.begin(), m_upper_ptr.end() - 1);
                m_upper_cols.assign(m_upper_ptr.back(), 0);
                m_upper_values.assign(m_upper_ptr.back(), 0.0);
                for (std::size_t row = 0; row < n; ++row)
                {
                    for (auto idx = m_lower_ptr[row]; idx + 1 < m_lower_ptr[row + 1]; ++idx)
                    {
                        const auto slot = fill[m_lower_cols[idx]]++;
                        m_upper_cols[slot] = row;
                        m_upper_values[slot] = m_lower_values[idx];
                    }
                }
            }

            std::vector<std::size_t> m_lower_ptr{};
            std::vector<std::size_t> m_lower_cols{};
            std::vector<double> m_lower_values{};
            std::vector<std::size_t> m_upper_ptr{};
            std::vector<std::size_t> m_upper_cols{};
            std::vector<double> m_upper_values{};
            std::vector<double> m_diag{};
        };

        inline bool is_symmetric(const CsrMatrix& csr, double tolerance = 1e-9)
        {
            const auto n = csr.dimension();
            const auto& row_ptr = csr.row_ptr();
            const auto& col_idx = csr.col_idx();
            const auto& values = csr.values();

            for (std::size_t row = 0; row < n; ++row)
            {
                const auto begin = static_cast<std::size_t>(row_ptr[row]);
                const auto end = static_cast<std::size_t>(row_ptr[row + 1]);
                for (std::size_t idx = begin; idx < end; ++idx)
                {
                    const auto column = static_cast<std::size_t>(col_idx[idx]);
                    if (column < row)
                    {
                        continue;
                    }

                    const double value = values[idx];
                    const double scale = std::max(1.0, std::abs(value));
                    if (std::abs(csr.at(column, row) - value) > tolerance * scale)
                    {
                        return false;
                    }
                }
            }

            return true;
        }

        inline std::unique_ptr<Preconditioner> make_preconditioner(const CsrMatrix& csr, PreconditionerType type)
        {
            switch (type)
            {
            case PreconditionerType::None:
                return std::make_unique<IdentityPreconditioner>();
            case PreconditionerType::Jacobi:
                return std::make_unique<JacobiPreconditioner>(csr);
            case PreconditionerType::IncompleteCholesky0:
                if (!is_symmetric(csr))
                {
                    throw std::invalid_argument("IC(0) preconditioner requires a symmetric matrix");
                }
                return std::make_unique<Ic0Preconditioner>(csr);
            }

            throw std::invalid_argument("Unsupported preconditioner type");
        }

        inline LinearSolveSummary conjugate_gradient(const CsrMatrix& csr, const std::vector<double>& rhs, const SolverOptions& options, const Preconditioner& preconditioner)
        {
            const auto n = csr.dimension();
            LinearSolveSummary summary{};
            summary.solution.assign(n, 0.0);

            const double rhs_norm = norm(rhs);
            const double relative = options.tolerance > 0.0 ? options.tolerance : 1e-12;
            const double tolerance = relative * rhs_norm;
            const std::size_t max_iterations = options.max_iterations != 0 ? options.max_iterations : n * 10;

            if (rhs_norm == 0.0)
            {
                return summary;
            }

            const auto diag = diagonal(csr);
            const double stiffness_scale = diag.empty() ? 0.0 : *std::max_element(diag.begin(), diag.end());

            std::vector<double> r = rhs;
            std::vector<double> z(n, 0.0);
            preconditioner.apply(r, z);
            std::vector<double> p = z;
            std::vector<double> Ap(n, 0.0);

            double rho = std::inner_product(r.begin(), r.end(), z.begin(), 0.0);
            double residual_norm = rhs_norm;
            summary.converged = false;

            for (std::size_t iteration = 0; iteration < max_iterations; ++iteration)
            {
                multiply(csr, p, Ap);
                const double denom = std::inner_product(p.begin(), p.end(), Ap.begin(), 0.0);
                if (!(denom > 0.0))
                {
                    throw SingularSystemError("CG breakdown: reduced stiffness matrix is not positive definite");
                }
                // A search direction with almost no stiffness is a mechanism.
                const double direction_norm_sq = std::inner_product(p.begin(), p.end(), p.begin(), 0.0);
                if (denom <= options.pivot_tolerance * stiffness_scale * direction_norm_sq)
                {
                    throw SingularSystemError("CG breakdown: a displacement mode has no stiffness (structure is under-constrained)");
                }

                const double alpha = rho / denom;
                for (std::size_t i = 0; i < n; ++i)
                {
                    summary.solution[i] += alpha * p[i];
                    r[i] -= alpha * Ap[i];
                }

                residual_norm = norm(r);
                summary.iterations = iteration + 1;
                if (residual_norm <= tolerance)
                {
                    summary.converged = true;
                    break;
                }

                preconditioner.apply(r, z);
                const double rho_new = std::inner_product(r.begin(), r.end(), z.begin(), 0.0);
                if (rho_new == 0.0)
                {
                    throw SingularSystemError("CG breakdown: preconditioned residual vanished before convergence");
                }
                const double beta = rho_new / rho;
                rho = rho_new;
                for (std::size_t i = 0; i < n; ++i)
                {
                    p[i] = z[i] + beta * p[i];
                }
            }

            summary.achieved_residual = residual_norm;
            return summary;
        }

        inline LinearSolveSummary solve_linear_system(const CsrMatrix& csr, const std::vector<double>& rhs, const SolverOptions& options)
        {
            auto preconditioner = make_preconditioner(csr, options.preconditioner);
            auto summary = conjugate_gradient(csr, rhs, options, *preconditioner);

            std::vector<double> residual(rhs.size(), 0.0);
            multiply(csr, summary.solution, residual);
            for (std::size_t i = 0; i < residual.size(); ++i)
            {
                residual[i] -= rhs[i];
            }
            summary.achieved_residual = norm(residual);
            return summary;
        }

        inline LinearSolveSummary solve_linear_system(const DenseMatrix& matrix, const std::vector<double>& rhs, const SolverOptions& options)
        {
            LinearSolveSummary summary{};

            switch (options.solver)
            {
            case SolverType::DenseInverse:
                summary.solution = multiply(inverse(matrix, options.pivot_tolerance), rhs);
                break;
            case SolverType::Direct:
                summary.solution = solve(matrix, rhs, options.pivot_tolerance);
                break;
            default:
                throw std::invalid_argument("Dense path requires DenseInverse or Direct solver");
            }
            summary.iterations = 1;

            auto residual = multiply(matrix, summary.solution);
            for (std::size_t i = 0; i < residual.size(); ++i)
            {
                residual[i] -= rhs[i];
            }
            summary.achieved_residual = norm(residual);
            return summary;
        }

        inline void log_dense(std::string_view label, const DenseMatrix& matrix)
        {
            safe_io::print("{} ({}x{})", label, matrix.rows(), matrix.columns());
            for (std::size_t row = 0; row < matrix.rows(); ++row)
            {
                std::string row_values;
                row_values.reserve(matrix.columns() * 12);
                for (std::size_t column = 0; column < matrix.columns(); ++column)
                {
                    row_values += fmt::format("{:>12.4e}", matrix(row, column));
                }
                safe_io::print("{}", row_values);
            }
        }
    } // namespace detail

    /*
     * Assembles, partitions and solves the static problem defined by the
     * boundary conditions stored on the mesh nodes. Unknown displacements and
     * reactions are written back into the nodes; the full vectors are returned.
     */
    inline SolveResult solve(Mesh& mesh, const Material& material, const SolverOptions& options = {})
    {
        const auto partition = partition_dofs(mesh);
        ensure_restrained(mesh);
        const std::size_t dof_count = mesh.dof_count();
        constexpr std::size_t printable_dofs = 24;

        detail::LinearSolveSummary summary{};
        detail::DenseMatrix fixed_free{};

        if (options.solver == SolverType::ConjugateGradient)
        {
            const auto K = assemble_sparse(mesh, material);
            auto reduced = reduce(K, partition);
            if (options.verbose)
            {
                safe_io::print("Assembled sparse stiffness ({} DOFs, {} non-zeros)", dof_count, K.non_zeros());
            }
            if (!partition.free.empty())
            {
                summary = detail::solve_linear_system(reduced.free_free, partition.known_forces, options);
            }
            fixed_free = std::move(reduced.fixed_free);
        }
        else
        {
            const auto K = assemble_dense(mesh, material);
            auto reduced = reduce(K, partition);
            if (options.verbose)
            {
                safe_io::print("Assembled dense stiffness ({}x{})", dof_count, dof_count);
                if (dof_count <= printable_dofs)
                {
                    detail::log_dense("K", K);
                }
            }
            if (!partition.free.empty())
            {
                summary = detail::solve_linear_system(reduced.free_free, partition.known_forces, options);
            }
            fixed_free = std::move(reduced.fixed_free);
        }

        if (options.verbose)
        {
            safe_io::print("{} free / {} fixed DOFs", partition.free.size(), partition.fixed.size());
            if (partition.free.size() <= printable_dofs)
            {
                safe_io::print("Known forces: {}", fmt::join(partition.known_forces, ", "));
            }
            safe_io::print(
                "{} solver ({} preconditioner) finished in {} iteration(s). Residual L2 norm: {:.6e}",
                to_string(options.solver),
                to_string(options.preconditioner),
                summary.iterations,
                summary.achieved_residual);
        }

        if (!summary.converged)
        {
            safe_io::warn(
                "CG did not reach tolerance {:.1e} after {} iterations (residual {:.3e})",
                options.tolerance,
                summary.iterations,
                summary.achieved_residual);
        }

        SolveResult result{};
        result.displacements.assign(dof_count, 0.0);
        result.reactions.assign(dof_count, 0.0);
        result.free_dofs = partition.free;
        result.fixed_dofs = partition.fixed;
        result.iterations = summary.iterations;
        result.residual_norm = summary.achieved_residual;
        result.converged = summary.converged;

        for (std::size_t i = 0; i < partition.free.size(); ++i)
        {
            result.displacements[partition.free[i]] = summary.solution[i];
        }

        // f_fixed = K_fixed_free * d_free; prescribed displacements are zero.
        const auto fixed_forces = detail::multiply(fixed_free, summary.solution);
        for (std::size_t i = 0; i < partition.fixed.size(); ++i)
        {
            const auto dof = partition.fixed[i];
            result.reactions[dof] = fixed_forces[i] - partition.external_forces[dof];
        }

        for (auto dof : partition.free)
        {
            mesh.node(dof / 2).displacement[dof % 2] = DofValue::known(result.displacements[dof]);
        }
        for (auto dof : partition.fixed)
        {
            mesh.node(dof / 2).reaction[dof % 2] = DofValue::known(result.reactions[dof]);
        }

        return result;
    }
} // namespace plate::fem
