#include <plate_fem/material.hpp>

#include <gtest/gtest.h>

#include <array>

using namespace plate::fem;

TEST(MaterialTest, PlaneStressMatrix)
{
    const Material material{.youngs_modulus = 200e9, .poisson_ratio = 0.28};
    const auto D = elasticity_matrix(material);
    const double factor = 200e9 / (1.0 - 0.28 * 0.28);

    EXPECT_DOUBLE_EQ(D[0], factor);
    EXPECT_DOUBLE_EQ(D[1], factor * 0.28);
    EXPECT_DOUBLE_EQ(D[2], 0.0);
    EXPECT_DOUBLE_EQ(D[3], factor * 0.28);
    EXPECT_DOUBLE_EQ(D[4], factor);
    EXPECT_DOUBLE_EQ(D[5], 0.0);
    EXPECT_DOUBLE_EQ(D[6], 0.0);
    EXPECT_DOUBLE_EQ(D[7], 0.0);
    EXPECT_DOUBLE_EQ(D[8], factor * (1.0 - 0.28) / 2.0);
}

TEST(MaterialTest, PlaneStrainMatrix)
{
    const Material material{.youngs_modulus = 1.0, .poisson_ratio = 0.25, .hypothesis = Hypothesis::PlaneStrain};
    const auto D = elasticity_matrix(material);
    const double factor = 1.0 / (1.25 * 0.5);

    EXPECT_DOUBLE_EQ(D[0], factor * 0.75);
    EXPECT_DOUBLE_EQ(D[1], factor * 0.25);
    EXPECT_DOUBLE_EQ(D[4], factor * 0.75);
    EXPECT_DOUBLE_EQ(D[8], factor * 0.25);
}

TEST(MaterialTest, UniaxialStressRecoversYoungsModulus)
{
    // Plane stress: strain (e, -nu e, 0) must give (E e, 0, 0).
    const Material material{.youngs_modulus = 70e9, .poisson_ratio = 0.33};
    const auto stress = stress_from(elasticity_matrix(material), std::array<double, 3>{1e-3, -0.33e-3, 0.0});

    EXPECT_NEAR(stress[0], 70e9 * 1e-3, 1e-3);
    EXPECT_NEAR(stress[1], 0.0, 1e-3);
    EXPECT_DOUBLE_EQ(stress[2], 0.0);
}

TEST(MaterialTest, OutOfRangeValuesAreNotValidated)
{
    const Material material{.youngs_modulus = -5.0, .poisson_ratio = 0.7};
    EXPECT_NO_THROW((void)elasticity_matrix(material));
    EXPECT_EQ(to_string(Hypothesis::PlaneStress), "PlaneStress");
}
