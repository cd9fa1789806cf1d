#ifndef VELLUM_NODE_COMPONENTS_HPP
#define VELLUM_NODE_COMPONENTS_HPP

#include <cstdint>
#include <entt/entt.hpp>
#include <string>

#include "geometry/AffineTransform.hpp"
#include "geometry/Geometry.hpp"

namespace vellum {

// Generational handle into the scene's registry. 32 bits of slot and 32 bits
// of version, so a recycled slot does not revisit a destroyed node's handle
// until its version counter wraps after 2^32 - 1 reuses.
enum class NodeId : std::uint64_t {};

using Registry = entt::basic_registry<NodeId>;

inline constexpr NodeId kNullNode = entt::null;

// Intrusive child list; children keep insertion order.
struct Hierarchy {
    NodeId parent{entt::null};
    NodeId first_child{entt::null};
    NodeId next_sibling{entt::null};
    NodeId prev_sibling{entt::null};
};

// Local transform and visibility of a node, relative to its parent.
struct Transform {
    Point position{};
    float rotation{0.0f};  // radians, counter-clockwise
    Vec2 scale{1.0f, 1.0f};
    float z_position{0.0f};
    float alpha{1.0f};
    bool hidden{false};
};

// Resolved world state, rewritten at the end of every fixed update and before
// draw generation.
struct WorldTransform {
    AffineTransform matrix{};
    Point position{};
    float rotation{0.0f};
    Vec2 scale{1.0f, 1.0f};
    float alpha{1.0f};
};

struct NodeName {
    std::string value;
};

// Opaque handle into an external physics world.
struct PhysicsBody {
    std::uint32_t body_id{0};
    bool dynamic{true};
};

}  // namespace vellum

#endif  // VELLUM_NODE_COMPONENTS_HPP
