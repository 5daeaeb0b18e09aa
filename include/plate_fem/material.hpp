#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace plate::fem
{
    enum class Hypothesis
    {
        PlaneStress,
        PlaneStrain,
    };

    inline std::string_view to_string(Hypothesis hypothesis) noexcept
    {
        switch (hypothesis)
        {
        case Hypothesis::PlaneStress:
            return "PlaneStress";
        case Hypothesis::PlaneStrain:
            return "PlaneStrain";
        }
        return "Unknown";
    }

    // Isotropic linear elastic material. Values are taken as given; a Poisson
    // ratio outside (-1, 0.5) yields a defined but non-physical matrix.
    struct Material
    {
        double youngs_modulus{1.0};
        double poisson_ratio{0.0};
        Hypothesis hypothesis{Hypothesis::PlaneStress};
    };

    // Row-major 3x3 Hookean matrix mapping (exx, eyy, gxy) to (sxx, syy, sxy).
    using ElasticityMatrix = std::array<double, 9>;

    inline ElasticityMatrix elasticity_matrix(const Material& material) noexcept
    {
        const double E = material.youngs_modulus;
        const double nu = material.poisson_ratio;
        ElasticityMatrix D{};

        if (material.hypothesis == Hypothesis::PlaneStrain)
        {
            const double factor = E / ((1.0 + nu) * (1.0 - 2.0 * nu));
            D[0] = factor * (1.0 - nu);
            D[1] = factor * nu;
            D[3] = factor * nu;
            D[4] = factor * (1.0 - nu);
            D[8] = factor * (1.0 - 2.0 * nu) / 2.0;
        }
        else
        {
            const double factor = E / (1.0 - nu * nu);
            D[0] = factor;
            D[1] = factor * nu;
            D[3] = factor * nu;
            D[4] = factor;
            D[8] = factor * (1.0 - nu) / 2.0;
        }

        return D;
    }

    inline std::array<double, 3> stress_from(const ElasticityMatrix& D, const std::array<double, 3>& strain) noexcept
    {
        std::array<double, 3> stress{};
        for (std::size_t i = 0; i < 3; ++i)
        {
            stress[i] = D[i * 3 + 0] * strain[0] + D[i * 3 + 1] * strain[1] + D[i * 3 + 2] * strain[2];
        }
        return stress;
    }
} // namespace plate::fem
