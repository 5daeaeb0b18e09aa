#pragma once

#include <cstddef>
#include <stdexcept>

namespace plate::fem
{
    // State of one scalar nodal quantity. Zero is an exact sentinel set at
    // construction so fixity and load checks never compare floats.
    class DofValue
    {
    public:
        enum class Kind
        {
            Unknown,
            Zero,
            Known,
        };

        constexpr DofValue() noexcept = default;

        [[nodiscard]] static constexpr DofValue unknown() noexcept { return DofValue{Kind::Unknown, 0.0}; }
        [[nodiscard]] static constexpr DofValue zero() noexcept { return DofValue{Kind::Zero, 0.0}; }
        [[nodiscard]] static constexpr DofValue known(double value) noexcept { return DofValue{Kind::Known, value}; }

        [[nodiscard]] constexpr Kind kind() const noexcept { return m_kind; }
        [[nodiscard]] constexpr bool is_known() const noexcept { return m_kind != Kind::Unknown; }
        [[nodiscard]] constexpr bool is_zero() const noexcept { return m_kind == Kind::Zero; }

        [[nodiscard]] double value() const
        {
            if (m_kind == Kind::Unknown)
            {
                throw std::logic_error("Value of an unknown degree of freedom was requested");
            }
            return m_value;
        }

        // Numeric value with unknown treated as zero; used when summing known contributions.
        [[nodiscard]] constexpr double value_or_zero() const noexcept { return m_kind == Kind::Known ? m_value : 0.0; }

    private:
        constexpr DofValue(Kind kind, double value) noexcept
            : m_kind(kind)
            , m_value(value)
        {
        }

        Kind m_kind{Kind::Unknown};
        double m_value{0.0};
    };

    struct DofPair
    {
        DofValue x{};
        DofValue y{};

        [[nodiscard]] const DofValue& operator[](std::size_t component) const
        {
            if (component > 1)
            {
                throw std::out_of_range("DOF component must be 0 (x) or 1 (y)");
            }
            return component == 0 ? x : y;
        }

        [[nodiscard]] DofValue& operator[](std::size_t component)
        {
            if (component > 1)
            {
                throw std::out_of_range("DOF component must be 0 (x) or 1 (y)");
            }
            return component == 0 ? x : y;
        }
    };

    [[nodiscard]] constexpr std::size_t global_dof(std::size_t node_id, std::size_t component) noexcept
    {
        return 2 * node_id + component;
    }
} // namespace plate::fem
