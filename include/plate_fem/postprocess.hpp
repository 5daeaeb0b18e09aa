#pragma once

#include "element.hpp"
#include "material.hpp"
#include "mesh.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace plate::fem
{
    struct ElementResult
    {
        std::size_t element_id{0};
        std::array<double, 6> displacements{};
        // (exx, eyy, gxy)
        std::array<double, 3> strain{};
        // (sxx, syy, sxy)
        std::array<double, 3> stress{};
        double von_mises{0.0};
    };

    // Plane-stress von Mises measure. The radicand is a positive semi-definite
    // quadratic form; the clamp only absorbs round-off.
    inline double von_mises(const std::array<double, 3>& stress) noexcept
    {
        const auto [sxx, syy, sxy] = stress;
        const double radicand = sxx * sxx + syy * syy - sxx * syy + 3.0 * sxy * sxy;
        return std::sqrt(std::max(0.0, radicand));
    }

    inline ElementResult evaluate_element(const Mesh& mesh, const Element& element, const ElasticityMatrix& D)
    {
        ElementResult result{};
        result.element_id = element.id;

        for (std::size_t local = 0; local < 3; ++local)
        {
            const auto& node = mesh.node(element.node_ids[local]);
            if (!node.displacement.x.is_known() || !node.displacement.y.is_known())
            {
                throw std::logic_error("Node " + std::to_string(node.id) + " has no solved displacement; run solve() first");
            }
            result.displacements[2 * local] = node.displacement.x.value();
            result.displacements[2 * local + 1] = node.displacement.y.value();
        }

        result.strain = strain_from(element.B, result.displacements);
        result.stress = stress_from(D, result.strain);
        result.von_mises = von_mises(result.stress);
        return result;
    }

    inline std::vector<ElementResult> post_process(const Mesh& mesh, const Material& material)
    {
        const auto D = elasticity_matrix(material);
        std::vector<ElementResult> results;
        results.reserve(mesh.element_count());
        for (const auto& element : mesh.elements())
        {
            results.push_back(evaluate_element(mesh, element, D));
        }
        return results;
    }

    // Monotonic map of [0, 1] onto itself applied after normalisation.
    using ColorRemap = std::function<double(double)>;

    inline ColorRemap linear_remap()
    {
        return [](double t) { return t; };
    }

    // log10(1 + (10^decades - 1) t) / decades: spreads the low end of the range.
    inline ColorRemap logarithmic_remap(double decades = 2.0)
    {
        if (!(decades > 0.0))
        {
            throw std::invalid_argument("Logarithmic colour remap needs a positive number of decades");
        }
        const double span = std::pow(10.0, decades) - 1.0;
        return [span, decades](double t) { return std::log10(1.0 + span * t) / decades; };
    }

    struct Rgb
    {
        double r{0.0};
        double g{0.0};
        double b{0.0};
    };

    // Jet ramps: blue, green and red peak at 0.25, 0.5 and 0.75.
    inline Rgb to_rgb(double fraction) noexcept
    {
        const auto ramp = [fraction](double centre) {
            return std::clamp(1.5 - std::abs(4.0 * fraction - 4.0 * centre), 0.0, 1.0);
        };
        return Rgb{ramp(0.75), ramp(0.5), ramp(0.25)};
    }

    /*
     * Normalisation state for colouring a scalar field. Built from the complete
     * set of element results so the extrema are final before any colour is
     * requested.
     */
    class ColorContext
    {
    public:
        ColorContext(double min_value, double max_value, ColorRemap remap = linear_remap())
            : m_min(min_value)
            , m_max(max_value)
            , m_remap(std::move(remap))
        {
            if (m_min > m_max)
            {
                throw std::invalid_argument("Colour range minimum exceeds maximum");
            }
            if (!m_remap)
            {
                throw std::invalid_argument("Colour remap function is empty");
            }
        }

        [[nodiscard]] static ColorContext from_results(std::span<const ElementResult> results, ColorRemap remap = linear_remap())
        {
            if (results.empty())
            {
                return ColorContext(0.0, 0.0, std::move(remap));
            }

            double min_value = std::numeric_limits<double>::max();
            double max_value = std::numeric_limits<double>::lowest();
            for (const auto& result : results)
            {
                min_value = std::min(min_value, result.von_mises);
                max_value = std::max(max_value, result.von_mises);
            }
            return ColorContext(min_value, max_value, std::move(remap));
        }

        [[nodiscard]] double min() const noexcept { return m_min; }
        [[nodiscard]] double max() const noexcept { return m_max; }

        // Normalised and remapped position of `value` in [0, 1]. A flat field
        // normalises to 0.5 before remapping.
        [[nodiscard]] double fraction(double value) const
        {
            const double normalised = m_max == m_min ? 0.5 : std::clamp((value - m_min) / (m_max - m_min), 0.0, 1.0);
            return std::clamp(m_remap(normalised), 0.0, 1.0);
        }

        [[nodiscard]] Rgb color(double value) const { return to_rgb(fraction(value)); }

    private:
        double m_min{0.0};
        double m_max{0.0};
        ColorRemap m_remap{};
    };
} // namespace plate::fem
