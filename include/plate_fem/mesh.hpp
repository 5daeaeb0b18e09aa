#pragma once

#include "dof.hpp"
#include "element.hpp"

#include <safe_io/utils.hpp>

#include <array>
#include <cstddef>
#include <limits>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plate::fem
{
    struct Node
    {
        std::size_t id{0};
        double x{0.0};
        double y{0.0};
        DofPair force{DofValue::zero(), DofValue::zero()};
        DofPair reaction{DofValue::zero(), DofValue::zero()};
        DofPair displacement{DofValue::unknown(), DofValue::unknown()};

        [[nodiscard]] Point position() const noexcept { return Point{x, y}; }

        [[nodiscard]] bool is_fully_fixed() const noexcept
        {
            return displacement.x.is_zero() && displacement.y.is_zero();
        }

        [[nodiscard]] bool has_external_load() const noexcept
        {
            return !force.x.is_zero() || !force.y.is_zero();
        }

        // Geometric identity only; ids are not compared.
        friend bool operator==(const Node& lhs, const Node& rhs) noexcept
        {
            return lhs.x == rhs.x && lhs.y == rhs.y;
        }
    };

    struct Element
    {
        std::size_t id{0};
        std::array<std::size_t, 3> node_ids{};
        ElementDofs dofs{};
        double area{0.0};
        bool degenerate{false};
        StrainDisplacement B{};
    };

    class Mesh
    {
    public:
        Mesh() = default;

        explicit Mesh(ElementOptions options)
            : m_options(options)
        {
        }

        std::size_t add_node(double x, double y)
        {
            const auto id = m_nodes.size();
            Node node{};
            node.id = id;
            node.x = x;
            node.y = y;
            m_nodes.emplace_back(node);
            return id;
        }

        // Validates the node references, winds the triple counter-clockwise and
        // caches area, DOF indices and the strain-displacement operator.
        std::size_t add_element(std::array<std::size_t, 3> node_ids)
        {
            if (m_nodes.empty())
            {
                throw std::logic_error("Cannot add elements to an empty mesh");
            }

            for (auto id : node_ids)
            {
                if (id >= m_nodes.size())
                {
                    throw std::out_of_range("Element references a node that does not exist");
                }
            }

            Element element{};
            element.id = m_elements.size();

            Corners corners{m_nodes[node_ids[0]].position(), m_nodes[node_ids[1]].position(), m_nodes[node_ids[2]].position()};
            order_counter_clockwise(node_ids, corners);

            const auto area = compute_area(corners, m_options, element.id);
            if (area.degenerate)
            {
                safe_io::warn("element {} is degenerate; area clamped to {:.3e}", element.id, area.value);
            }

            element.node_ids = node_ids;
            element.dofs = dof_indices(node_ids);
            element.area = area.value;
            element.degenerate = area.degenerate;
            element.B = strain_displacement(corners, area.value);

            m_elements.emplace_back(element);
            return element.id;
        }

        [[nodiscard]] std::span<const Node> nodes() const noexcept { return m_nodes; }
        [[nodiscard]] std::span<Node> nodes() noexcept { return m_nodes; }

        [[nodiscard]] std::span<const Element> elements() const noexcept { return m_elements; }

        [[nodiscard]] const Node& node(std::size_t index) const
        {
            if (index >= m_nodes.size())
            {
                throw std::out_of_range("Node index out of range");
            }
            return m_nodes[index];
        }

        [[nodiscard]] Node& node(std::size_t index)
        {
            if (index >= m_nodes.size())
            {
                throw std::out_of_range("Node index out of range");
            }
            return m_nodes[index];
        }

        [[nodiscard]] const Element& element(std::size_t index) const
        {
            if (index >= m_elements.size())
            {
                throw std::out_of_range("Element index out of range");
            }
            return m_elements[index];
        }

        [[nodiscard]] Corners corners(const Element& element) const
        {
            return Corners{
                node(element.node_ids[0]).position(),
                node(element.node_ids[1]).position(),
                node(element.node_ids[2]).position(),
            };
        }

        [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
        [[nodiscard]] std::size_t element_count() const noexcept { return m_elements.size(); }
        [[nodiscard]] std::size_t dof_count() const noexcept { return 2 * m_nodes.size(); }

        // Zero displacement on both components; the reactions become the unknowns.
        void fix(std::size_t index)
        {
            fix_component(index, 0);
            fix_component(index, 1);
        }

        void fix_x(std::size_t index) { fix_component(index, 0); }
        void fix_y(std::size_t index) { fix_component(index, 1); }

        void apply_force(std::size_t index, double fx, double fy)
        {
            auto& target = node(index);
            target.force = DofPair{DofValue::known(fx), DofValue::known(fy)};
        }

        template <typename Predicate>
        [[nodiscard]] std::vector<std::size_t> nodes_where(Predicate&& predicate) const
        {
            std::vector<std::size_t> selected;
            for (const auto& candidate : m_nodes)
            {
                if (predicate(candidate))
                {
                    selected.push_back(candidate.id);
                }
            }
            return selected;
        }

    private:
        void fix_component(std::size_t index, std::size_t component)
        {
            auto& target = node(index);
            target.displacement[component] = DofValue::zero();
            target.reaction[component] = DofValue::unknown();
        }

        ElementOptions m_options{};
        std::vector<Node> m_nodes{};
        std::vector<Element> m_elements{};
    };

    using Triangle = std::array<std::size_t, 3>;

    struct ImportOptions
    {
        ElementOptions element{};
        bool merge_coincident{true};
    };

    /*
     * Builds a mesh from raw triangulator output. Points no triangle references
     * (construction helpers such as circle centres) are skipped, coincident
     * points collapse to one node, and the survivors are renumbered from zero
     * in their original order.
     */
    inline Mesh import_triangulation(std::span<const Point> points, std::span<const Triangle> triangles, const ImportOptions& options = {})
    {
        constexpr auto unmapped = std::numeric_limits<std::size_t>::max();

        std::vector<bool> referenced(points.size(), false);
        for (const auto& triangle : triangles)
        {
            for (auto index : triangle)
            {
                if (index >= points.size())
                {
                    throw std::out_of_range("Triangle references a point that does not exist");
                }
                referenced[index] = true;
            }
        }

        Mesh mesh{options.element};
        std::vector<std::size_t> renumbered(points.size(), unmapped);
        std::map<std::pair<double, double>, std::size_t> by_position;

        for (std::size_t index = 0; index < points.size(); ++index)
        {
            if (!referenced[index])
            {
                continue;
            }

            const auto& point = points[index];
            if (options.merge_coincident)
            {
                const auto key = std::make_pair(point.x, point.y);
                const auto existing = by_position.find(key);
                if (existing != by_position.end())
                {
                    renumbered[index] = existing->second;
                    continue;
                }
                renumbered[index] = mesh.add_node(point.x, point.y);
                by_position.emplace(key, renumbered[index]);
            }
            else
            {
                renumbered[index] = mesh.add_node(point.x, point.y);
            }
        }

        for (const auto& triangle : triangles)
        {
            mesh.add_element(Triangle{renumbered[triangle[0]], renumbered[triangle[1]], renumbered[triangle[2]]});
        }

        safe_io::debug(
            "imported {} of {} points and {} triangles",
            mesh.node_count(),
            points.size(),
            mesh.element_count());

        return mesh;
    }
} // namespace plate::fem
