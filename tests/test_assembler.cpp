#include "test_common.hpp"

#include <plate_fem/assembler.hpp>
#include <plate_fem/mesh.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace plate::fem;

class AssemblerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        // Unit square split along its diagonal; elements share nodes 0 and 2.
        mesh.add_node(0.0, 0.0);
        mesh.add_node(1.0, 0.0);
        mesh.add_node(1.0, 1.0);
        mesh.add_node(0.0, 1.0);
        mesh.add_element({0, 1, 2});
        mesh.add_element({0, 2, 3});
    }

    Mesh mesh;
    Material material{.youngs_modulus = 210.0, .poisson_ratio = 0.3};
};

TEST_F(AssemblerTest, SharedNodesAccumulateAdditively)
{
    const auto D = elasticity_matrix(material);
    const auto ke0 = element_stiffness(mesh.element(0), D);
    const auto ke1 = element_stiffness(mesh.element(1), D);

    detail::DenseMatrix only_first(mesh.dof_count());
    detail::DenseMatrix only_second(mesh.dof_count());
    detail::DenseMatrix forward(mesh.dof_count());
    detail::DenseMatrix reverse(mesh.dof_count());

    scatter_add(only_first, ke0, mesh.element(0).dofs);
    scatter_add(only_second, ke1, mesh.element(1).dofs);
    scatter_add(forward, ke0, mesh.element(0).dofs);
    scatter_add(forward, ke1, mesh.element(1).dofs);
    scatter_add(reverse, ke1, mesh.element(1).dofs);
    scatter_add(reverse, ke0, mesh.element(0).dofs);

    for (std::size_t i = 0; i < mesh.dof_count(); ++i)
    {
        for (std::size_t j = 0; j < mesh.dof_count(); ++j)
        {
            EXPECT_DOUBLE_EQ(forward(i, j), only_first(i, j) + only_second(i, j));
            EXPECT_DOUBLE_EQ(forward(i, j), reverse(i, j));
        }
    }

    // Node 1 belongs to element 0 only, node 3 to element 1 only.
    EXPECT_DOUBLE_EQ(forward(2, 6), 0.0);
    EXPECT_GT(forward(0, 0), only_first(0, 0));
}

TEST_F(AssemblerTest, ScatterRejectsOutOfRangeDofs)
{
    detail::DenseMatrix small(4);
    const auto ke = element_stiffness(mesh.element(0), elasticity_matrix(material));
    EXPECT_THROW(scatter_add(small, ke, mesh.element(0).dofs), std::out_of_range);
}

TEST_F(AssemblerTest, GlobalMatrixAnnihilatesTranslations)
{
    const auto K = assemble_dense(mesh, material);
    std::vector<double> tx(mesh.dof_count(), 0.0);
    std::vector<double> ty(mesh.dof_count(), 0.0);
    for (std::size_t node = 0; node < mesh.node_count(); ++node)
    {
        tx[2 * node] = 1.0;
        ty[2 * node + 1] = 1.0;
    }

    const double scale = K.max_abs();
    for (const double value : detail::multiply(K, tx))
    {
        EXPECT_NEAR(value, 0.0, 1e-12 * scale);
    }
    for (const double value : detail::multiply(K, ty))
    {
        EXPECT_NEAR(value, 0.0, 1e-12 * scale);
    }
}

TEST(AssemblerComparisonTest, DenseAndSparseAgree)
{
    const auto mesh = test_support::make_mesh(rectangle(3.0, 1.0, 6, 2));
    const Material material{.youngs_modulus = 200e9, .poisson_ratio = 0.28};

    const auto dense = assemble_dense(mesh, material);
    const auto sparse = assemble_sparse(mesh, material);
    const auto materialised = sparse.to_dense();

    ASSERT_EQ(sparse.dimension(), mesh.dof_count());
    EXPECT_LT(sparse.non_zeros(), mesh.dof_count() * mesh.dof_count());

    const double scale = dense.max_abs();
    for (std::size_t i = 0; i < mesh.dof_count(); ++i)
    {
        for (std::size_t j = 0; j < mesh.dof_count(); ++j)
        {
            EXPECT_NEAR(materialised(i, j), dense(i, j), 1e-12 * scale);
            EXPECT_NEAR(dense(i, j), dense(j, i), 1e-12 * scale);
        }
    }
}

TEST(SparseStorageTest, TripletsMoveIntoCsr)
{
    detail::CooMatrix coo{.dimension = 2, .rows = {0, 0, 1}, .cols = {0, 1, 1}, .values = {4.0, -1.0, 3.0}, .row_prefix = {0, 2, 3}};
    const detail::CsrMatrix csr(std::move(coo));

    EXPECT_EQ(csr.non_zeros(), 3u);
    EXPECT_DOUBLE_EQ(csr.at(0, 1), -1.0);
    EXPECT_DOUBLE_EQ(csr.at(1, 0), 0.0);
    EXPECT_DOUBLE_EQ(csr.at(1, 1), 3.0);
    EXPECT_THROW((void)csr.at(2, 0), std::out_of_range);

    detail::CooMatrix truncated{.dimension = 2, .rows = {0}, .cols = {0}, .values = {1.0}, .row_prefix = {0, 1}};
    EXPECT_THROW((void)detail::CsrMatrix(std::move(truncated)), std::invalid_argument);
}
