#pragma once

#include "element.hpp"
#include "mesh.hpp"
#include "postprocess.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace plate::fem
{
    struct VisualizationOptions
    {
        bool show_legend{true};
        // Take the colour range from the data; otherwise use `value_range`.
        bool auto_scale{true};
        double deformation_scale{1.0};
        std::string legend_title{"von Mises stress"};
        std::array<double, 2> value_range{0.0, 1.0};
        ColorRemap remap{linear_remap()};
    };

    struct VisualElement
    {
        std::size_t element_id{0};
        Corners corners{};
        Corners deformed{};
        std::array<double, 6> displacements{};
        double value{0.0};
        double fraction{0.0};
        Rgb color{};
    };

    struct Legend
    {
        std::string title{};
        double min{0.0};
        double max{0.0};
        bool visible{true};
    };

    struct Scene
    {
        std::vector<VisualElement> elements{};
        Legend legend{};
        double deformation_scale{1.0};
    };

    // Everything a plotting front end needs, with no dependency on one.
    inline Scene build_scene(const Mesh& mesh, std::span<const ElementResult> results, const VisualizationOptions& options = {})
    {
        if (results.size() != mesh.element_count())
        {
            throw std::invalid_argument("Scene needs one result per mesh element");
        }

        const auto context = options.auto_scale
            ? ColorContext::from_results(results, options.remap)
            : ColorContext(options.value_range[0], options.value_range[1], options.remap);

        Scene scene{};
        scene.deformation_scale = options.deformation_scale;
        scene.legend = Legend{options.legend_title, context.min(), context.max(), options.show_legend};
        scene.elements.reserve(results.size());

        for (const auto& result : results)
        {
            const auto& element = mesh.element(result.element_id);

            VisualElement visual{};
            visual.element_id = element.id;
            visual.corners = mesh.corners(element);
            visual.displacements = result.displacements;
            for (std::size_t local = 0; local < 3; ++local)
            {
                visual.deformed[local] = Point{
                    visual.corners[local].x + options.deformation_scale * result.displacements[2 * local],
                    visual.corners[local].y + options.deformation_scale * result.displacements[2 * local + 1],
                };
            }
            visual.value = result.von_mises;
            visual.fraction = context.fraction(result.von_mises);
            visual.color = to_rgb(visual.fraction);
            scene.elements.push_back(visual);
        }

        return scene;
    }
} // namespace plate::fem
