#include "test_common.hpp"

#include <plate_fem/postprocess.hpp>
#include <plate_fem/solver.hpp>
#include <plate_fem/visualization.hpp>
#include <plate_fem/vtk_writer.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace plate::fem;

class SceneTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        // Shear load on a cantilevered patch gives a non-uniform stress field.
        mesh = test_support::make_mesh(rectangle(2.0, 1.0, 4, 2));
        for (auto id : mesh.nodes_where([](const Node& node) { return node.x < test_support::kBoundaryTolerance; }))
        {
            mesh.fix(id);
        }
        for (auto id : mesh.nodes_where([](const Node& node) { return std::abs(node.x - 2.0) < test_support::kBoundaryTolerance; }))
        {
            mesh.apply_force(id, 0.0, -1.0);
        }
        (void)solve(mesh, material, SolverOptions{.solver = SolverType::Direct});
        results = post_process(mesh, material);
    }

    Material material = test_support::unit_material();
    Mesh mesh;
    std::vector<ElementResult> results;
};

TEST_F(SceneTest, AutoScaledLegendSpansData)
{
    const auto scene = build_scene(mesh, results);

    ASSERT_EQ(scene.elements.size(), mesh.element_count());
    EXPECT_TRUE(scene.legend.visible);
    EXPECT_EQ(scene.legend.title, "von Mises stress");
    EXPECT_LT(scene.legend.min, scene.legend.max);

    bool saw_min = false;
    bool saw_max = false;
    for (const auto& visual : scene.elements)
    {
        EXPECT_GE(visual.fraction, 0.0);
        EXPECT_LE(visual.fraction, 1.0);
        saw_min = saw_min || visual.fraction == 0.0;
        saw_max = saw_max || visual.fraction == 1.0;
    }
    EXPECT_TRUE(saw_min);
    EXPECT_TRUE(saw_max);
}

TEST_F(SceneTest, FixedRangeAndHiddenLegend)
{
    const auto scene = build_scene(
        mesh,
        results,
        VisualizationOptions{.show_legend = false, .auto_scale = false, .legend_title = "stress", .value_range = {0.0, 1e6}});

    EXPECT_FALSE(scene.legend.visible);
    EXPECT_EQ(scene.legend.title, "stress");
    EXPECT_DOUBLE_EQ(scene.legend.min, 0.0);
    EXPECT_DOUBLE_EQ(scene.legend.max, 1e6);
    for (const auto& visual : scene.elements)
    {
        // Every value sits near the bottom of a range this wide.
        EXPECT_LT(visual.fraction, 0.01);
    }
}

TEST_F(SceneTest, DeformedCornersFollowScaledDisplacements)
{
    constexpr double scale = 10.0;
    const auto scene = build_scene(mesh, results, VisualizationOptions{.deformation_scale = scale});
    EXPECT_DOUBLE_EQ(scene.deformation_scale, scale);

    for (const auto& visual : scene.elements)
    {
        const auto& element = mesh.element(visual.element_id);
        for (std::size_t local = 0; local < 3; ++local)
        {
            const auto& node = mesh.node(element.node_ids[local]);
            EXPECT_DOUBLE_EQ(visual.corners[local].x, node.x);
            EXPECT_DOUBLE_EQ(visual.deformed[local].x, node.x + scale * node.displacement.x.value());
            EXPECT_DOUBLE_EQ(visual.deformed[local].y, node.y + scale * node.displacement.y.value());
        }
    }
}

TEST_F(SceneTest, ResultCountMustMatchMesh)
{
    results.pop_back();
    EXPECT_THROW((void)build_scene(mesh, results), std::invalid_argument);
}

TEST_F(SceneTest, WritesVtkUnstructuredGrid)
{
    const auto path = std::filesystem::temp_directory_path() / "plate_fem_scene_test.vtu";
    ASSERT_TRUE(write_vtu(path.string(), mesh, results));

    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto text = buffer.str();
    std::filesystem::remove(path);

    EXPECT_NE(text.find("NumberOfPoints=\"15\" NumberOfCells=\"16\""), std::string::npos);
    EXPECT_NE(text.find("Name=\"displacement\""), std::string::npos);
    EXPECT_NE(text.find("Name=\"von_mises\""), std::string::npos);
    EXPECT_NE(text.find("</VTKFile>"), std::string::npos);
}

TEST_F(SceneTest, UnwritablePathIsReported)
{
    const auto path = std::filesystem::temp_directory_path() / "plate_fem_missing_dir" / "out.vtu";
    EXPECT_FALSE(write_vtu(path.string(), mesh, results));
}
