#include "test_common.hpp"

#include <plate_fem/mesh.hpp>
#include <plate_fem/mesh_builder.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace plate::fem;

TEST(MeshImportTest, SkipsUnreferencedPointsAndRenumbers)
{
    // Point 0 is a circle centre emitted by the mesher and used by no triangle.
    const std::vector<Point> points{
        Point{5.0, 5.0},
        Point{0.0, 0.0},
        Point{1.0, 0.0},
        Point{1.0, 1.0},
        Point{0.0, 1.0},
    };
    const std::vector<Triangle> triangles{Triangle{1, 2, 3}, Triangle{1, 3, 4}};

    const auto mesh = import_triangulation(points, triangles);

    ASSERT_EQ(mesh.node_count(), 4u);
    ASSERT_EQ(mesh.element_count(), 2u);
    for (std::size_t i = 0; i < mesh.node_count(); ++i)
    {
        EXPECT_EQ(mesh.node(i).id, i);
    }
    EXPECT_DOUBLE_EQ(mesh.node(0).x, 0.0);
    EXPECT_DOUBLE_EQ(mesh.node(2).y, 1.0);
    EXPECT_EQ(mesh.element(0).node_ids, (Triangle{0, 1, 2}));
    EXPECT_EQ(mesh.element(1).node_ids, (Triangle{0, 2, 3}));
}

TEST(MeshImportTest, MergesCoincidentPoints)
{
    const std::vector<Point> points{
        Point{0.0, 0.0},
        Point{1.0, 0.0},
        Point{0.0, 1.0},
        Point{1.0, 0.0},
        Point{1.0, 1.0},
        Point{0.0, 1.0},
    };
    const std::vector<Triangle> triangles{Triangle{0, 1, 2}, Triangle{3, 4, 5}};

    const auto merged = import_triangulation(points, triangles);
    EXPECT_EQ(merged.node_count(), 4u);
    EXPECT_EQ(merged.element(1).node_ids, (Triangle{1, 3, 2}));

    const auto separate = import_triangulation(points, triangles, ImportOptions{.merge_coincident = false});
    EXPECT_EQ(separate.node_count(), 6u);
}

TEST(MeshImportTest, RejectsOutOfRangeIndices)
{
    const std::vector<Point> points{Point{0.0, 0.0}, Point{1.0, 0.0}};
    const std::vector<Triangle> triangles{Triangle{0, 1, 2}};
    EXPECT_THROW((void)import_triangulation(points, triangles), std::out_of_range);
}

TEST(MeshTest, ElementValidation)
{
    Mesh empty;
    EXPECT_THROW(empty.add_element({0, 1, 2}), std::logic_error);

    Mesh mesh;
    mesh.add_node(0.0, 0.0);
    mesh.add_node(1.0, 0.0);
    EXPECT_THROW(mesh.add_element({0, 1, 2}), std::out_of_range);
    EXPECT_THROW((void)mesh.node(5), std::out_of_range);
    EXPECT_THROW((void)mesh.element(0), std::out_of_range);
    EXPECT_EQ(mesh.dof_count(), 4u);
}

TEST(MeshTest, NodesWhereSelectsByPredicate)
{
    const auto mesh = test_support::make_mesh(rectangle(2.0, 1.0, 4, 2));
    const auto left = mesh.nodes_where([](const Node& node) { return std::abs(node.x) < 1e-12; });
    EXPECT_EQ(left.size(), 3u);
    for (auto id : left)
    {
        EXPECT_DOUBLE_EQ(mesh.node(id).x, 0.0);
    }
}

TEST(MeshBuilderTest, RectangleCounts)
{
    const auto grid = rectangle(3.0, 2.0, 3, 2);
    EXPECT_EQ(grid.points.size(), 12u);
    EXPECT_EQ(grid.triangles.size(), 12u);
    EXPECT_THROW((void)rectangle(1.0, 1.0, 0, 2), std::invalid_argument);
}

TEST(MeshBuilderTest, PlateWithHoleDropsInteriorPoints)
{
    const PlateGeometry geometry{};
    const auto triangulation = plate_with_hole(geometry);

    // 41 x 13 grid points plus the hole centre.
    EXPECT_EQ(triangulation.points.size(), 41u * 13u + 1u);
    // 12 of the 480 cells have their centre inside the hole.
    EXPECT_EQ(triangulation.triangles.size(), 2u * (480u - 12u));

    const auto mesh = test_support::make_mesh(triangulation);
    EXPECT_EQ(mesh.node_count(), 41u * 13u - 5u);
    EXPECT_EQ(mesh.element_count(), 936u);

    // Only grid points surrounded by removed cells disappear: the centre and
    // its four neighbours at distance 0.25.
    for (const auto& node : mesh.nodes())
    {
        const double dx = node.x - geometry.hole_center.x;
        const double dy = node.y - geometry.hole_center.y;
        EXPECT_GT(std::sqrt(dx * dx + dy * dy), 0.3);
    }
    for (const auto& element : mesh.elements())
    {
        EXPECT_GT(element.area, 0.0);
        EXPECT_FALSE(element.degenerate);
    }
}
