#pragma once

#include <safe_io/utils.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace plate::fem
{
    // Base for failures that originate in the model rather than in API misuse.
    class Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class DegenerateElementError final : public Error
    {
    public:
        DegenerateElementError(std::size_t element_id, double area)
            : Error(safe_io::sformat("Element {} is degenerate (signed area {:.3e})", element_id, area))
            , m_element_id(element_id)
        {
        }

        [[nodiscard]] std::size_t element_id() const noexcept { return m_element_id; }

    private:
        std::size_t m_element_id{0};
    };

    class SingularSystemError final : public Error
    {
    public:
        using Error::Error;
    };

    // Incomplete factorisation broke down; the system itself may still be solvable
    // with another preconditioner.
    class FactorizationBreakdownError final : public Error
    {
    public:
        using Error::Error;
    };

    class InvalidBoundaryConditionError final : public Error
    {
    public:
        InvalidBoundaryConditionError(std::size_t dof, const std::string& reason)
            : Error(safe_io::sformat("Invalid boundary condition at DOF {}: {}", dof, reason))
            , m_dof(dof)
        {
        }

        [[nodiscard]] std::size_t dof() const noexcept { return m_dof; }

    private:
        std::size_t m_dof{0};
    };
} // namespace plate::fem
