#include <plate_fem/dof.hpp>
#include <plate_fem/mesh.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace plate::fem;

TEST(DofValueTest, TagsAreDistinct)
{
    EXPECT_FALSE(DofValue::unknown().is_known());
    EXPECT_TRUE(DofValue::zero().is_known());
    EXPECT_TRUE(DofValue::zero().is_zero());
    EXPECT_TRUE(DofValue::known(2.5).is_known());
    EXPECT_FALSE(DofValue::known(2.5).is_zero());
    EXPECT_DOUBLE_EQ(DofValue::known(2.5).value(), 2.5);
    EXPECT_DOUBLE_EQ(DofValue::zero().value(), 0.0);
}

TEST(DofValueTest, KnownZeroIsNotTheZeroSentinel)
{
    // Only the sentinel marks fixity; a computed 0.0 stays a plain value.
    EXPECT_FALSE(DofValue::known(0.0).is_zero());
    EXPECT_EQ(DofValue::known(0.0).kind(), DofValue::Kind::Known);
}

TEST(DofValueTest, UnknownValueThrows)
{
    EXPECT_THROW((void)DofValue::unknown().value(), std::logic_error);
    EXPECT_DOUBLE_EQ(DofValue::unknown().value_or_zero(), 0.0);
}

TEST(DofValueTest, PairIndexing)
{
    DofPair pair{DofValue::known(1.0), DofValue::known(2.0)};
    EXPECT_DOUBLE_EQ(pair[0].value(), 1.0);
    EXPECT_DOUBLE_EQ(pair[1].value(), 2.0);
    pair[1] = DofValue::zero();
    EXPECT_TRUE(pair.y.is_zero());
    EXPECT_THROW((void)pair[2], std::out_of_range);
    EXPECT_EQ(global_dof(7, 0), 14u);
    EXPECT_EQ(global_dof(7, 1), 15u);
}

TEST(NodeTest, DefaultsAreFreeAndUnloaded)
{
    Node node{};
    EXPECT_FALSE(node.is_fully_fixed());
    EXPECT_FALSE(node.has_external_load());
    EXPECT_FALSE(node.displacement.x.is_known());
    EXPECT_TRUE(node.reaction.x.is_zero());
}

TEST(NodeTest, FixityAndLoadFollowTags)
{
    Mesh mesh;
    const auto a = mesh.add_node(0.0, 0.0);
    const auto b = mesh.add_node(1.0, 0.0);

    mesh.fix_x(a);
    EXPECT_FALSE(mesh.node(a).is_fully_fixed());
    mesh.fix_y(a);
    EXPECT_TRUE(mesh.node(a).is_fully_fixed());
    EXPECT_FALSE(mesh.node(a).reaction.x.is_known());

    mesh.apply_force(b, 0.0, -3.0);
    EXPECT_TRUE(mesh.node(b).has_external_load());
}

TEST(NodeTest, EqualityIsGeometric)
{
    Node lhs{};
    lhs.id = 1;
    lhs.x = 0.5;
    lhs.y = 2.0;
    Node rhs = lhs;
    rhs.id = 9;
    EXPECT_TRUE(lhs == rhs);
    rhs.y = 2.5;
    EXPECT_FALSE(lhs == rhs);
}
