#ifndef VELLUM_SCENE_HPP
#define VELLUM_SCENE_HPP

#include <cstddef>
#include <cstdint>
#include <entt/entt.hpp>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "GameClock.hpp"
#include "InputState.hpp"
#include "LowLevelRenderer/RenderQueue.hpp"
#include "actions/Action.hpp"
#include "audio/AudioEngine.hpp"
#include "components/NodeComponents.hpp"
#include "components/ShaderAttributes.hpp"
#include "components/SpriteComponent.hpp"
#include "constraints/Constraint.hpp"
#include "geometry/AffineTransform.hpp"
#include "scene/SceneDelegate.hpp"
#include "scene/SceneGraph.hpp"
#include "warp/WarpComponents.hpp"

namespace vellum {

/**
 * @brief A tree of nodes plus the per-step pipeline that advances it.
 *
 * Nodes live in the scene's registry and are addressed by NodeId. The scene
 * creates one root node at construction; only nodes under it are updated and
 * drawn. Nodes removed from their parent stay alive as detached subtrees until
 * they are re-attached or destroyed.
 *
 * Editing calls taking a NodeId throw InvalidNodeException when the handle is
 * not a live node of this scene. The frame pipeline never throws.
 */
class Scene {
   public:
    using UpdateCallback = std::function<void(Scene&, float)>;

    explicit Scene(Size size = {});
    virtual ~Scene() = default;

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    NodeId root() const { return root_; }
    Size size() const { return size_; }
    void set_size(Size size) { size_ = size; }

    // --- Node lifecycle -------------------------------------------------------

    // New detached node with a default Transform.
    NodeId create_node(const std::string& name = {});

    // New detached node carrying 'sprite'.
    NodeId create_sprite(const Sprite& sprite, const std::string& name = {});

    void add_child(NodeId parent, NodeId child);
    void insert_child(NodeId parent, NodeId child, std::size_t index);
    void remove_from_parent(NodeId node);
    void remove_all_children(NodeId node);

    // Destroys the node and its subtree. Handles held elsewhere (constraint
    // targets included) stop resolving.
    void destroy_node(NodeId node);

    bool contains(NodeId node) const { return graph_.contains(node); }

    // --- Hierarchy queries ----------------------------------------------------

    NodeId parent(NodeId node) const { return graph_.parent(node); }
    std::vector<NodeId> children(NodeId node) const { return graph_.children(node); }

    // Direct child with that name, or kNullNode.
    NodeId child_node(NodeId parent, const std::string& name) const;

    // First node named 'name' under the root, depth-first; kNullNode if none.
    NodeId find_node(const std::string& name) const;

    // Nodes under the root whose name matches, depth-first.
    std::vector<NodeId> find_nodes(const std::string& name) const;

    // Number of ancestors, -1 for a dead handle.
    int depth(NodeId node) const { return graph_.depth(node); }

    // True when 'node' is the root or descends from it.
    bool in_tree(NodeId node) const;

    // --- Per-node state -------------------------------------------------------

    Transform& transform(NodeId node);
    const Transform& transform(NodeId node) const;

    void set_name(NodeId node, const std::string& name);
    std::string name(NodeId node) const;

    Sprite& set_sprite(NodeId node, const Sprite& sprite);
    Sprite* sprite(NodeId node);
    void clear_sprite(NodeId node);

    void add_constraint(NodeId node, const Constraint& constraint);
    std::vector<Constraint>& constraints(NodeId node);
    void clear_constraints(NodeId node);

    // subdivision_levels is clamped to [0, 3].
    void set_warp(NodeId node, const WarpGeometryGrid& grid, int subdivision_levels = 0);
    const Warp* warp(NodeId node) const;
    void clear_warp(NodeId node);

    // Animates the node's warp to 'target' over 'duration' seconds, replacing
    // any running warp animation.
    void warp_to(NodeId node, const WarpGeometryGrid& target, float duration);

    // Shows each grid for the matching entry of 'times' (missing entries count as 0).
    void animate_with_warps(NodeId node, const std::vector<WarpGeometryGrid>& grids,
                            const std::vector<float>& times);

    // Same, with 'duration' split evenly across the grids.
    void animate_with_warps(NodeId node, const std::vector<WarpGeometryGrid>& grids,
                            float duration);

    bool has_warp_animation(NodeId node) const;

    // --- Actions --------------------------------------------------------------

    // Runs a reset copy of 'action' on the node, first evaluated in the next
    // action pass of process_frame. A non-empty key replaces the running action
    // with the same key; an empty key gets a fresh one. Returns the key used.
    std::string run_action(NodeId node, const Action& action, const std::string& key = {});

    void remove_action(NodeId node, const std::string& key);
    void remove_all_actions(NodeId node);
    bool has_actions(NodeId node) const;

    // The running action with that key, or nullptr.
    const Action* action(NodeId node, const std::string& key) const;

    // --- Camera ---------------------------------------------------------------

    // Views the scene through 'node'; kNullNode goes back to the default view.
    // The camera only takes effect while it is in the tree.
    void set_camera(NodeId node);
    NodeId camera() const { return camera_; }

    // Visible scene area. Without an active camera: origin (0, 0) and the
    // scene's size.
    Rect viewport() const;

    // Scene to view coordinates for a view of 'view_size'.
    AffineTransform view_transform(Size view_size) const;

    // True when the node's bounds (sprite frame, or its position otherwise)
    // intersect the viewport.
    bool camera_contains(NodeId node) const;

    // Visible sprites under the root in preorder. Hidden subtrees and the
    // camera's own children are left out.
    std::vector<NodeId> visible_nodes() const;

    // --- Node attributes ------------------------------------------------------

    void set_shader_attribute(NodeId node, const std::string& name, const ShaderAttributeValue& value);
    std::optional<ShaderAttributeValue> shader_attribute(NodeId node, const std::string& name) const;
    bool remove_shader_attribute(NodeId node, const std::string& name);

    void set_physics_body(NodeId node, const PhysicsBody& body);
    const PhysicsBody* physics_body(NodeId node) const;

    // --- World space ----------------------------------------------------------

    // Resolved on demand from the current local transforms.
    Point world_position(NodeId node) const;
    float world_rotation(NodeId node) const;
    Vec2 world_scale(NodeId node) const;
    float world_alpha(NodeId node) const;

    // --- Frame ----------------------------------------------------------------

    // One fixed step:
    //   update, actions, physics, constraints, warps, world transform composition.
    // Does nothing while paused.
    void process_frame(float dt);

    // Fills 'queue' with this frame's draw commands, sorted by z.
    void generate_draw_commands(RenderQueue& queue);

    // Runs the constraint lists under the root once, outside the frame pipeline.
    void apply_constraints();

    // Called by process_frame when no delegate is set. Runs the update callback.
    virtual void update(float dt);

    virtual void did_evaluate_actions() {}
    virtual void did_simulate_physics() {}
    virtual void did_apply_constraints() {}
    virtual void did_apply_warps() {}
    virtual void did_finish_update() {}

    void set_update_callback(UpdateCallback callback) { update_callback_ = std::move(callback); }

    // Neither is owned; both must outlive their registration.
    void set_delegate(SceneDelegate* delegate) { delegate_ = delegate; }
    void set_physics_stepper(PhysicsStepper* stepper) { physics_stepper_ = stepper; }

    bool is_paused() const { return paused_; }
    void set_paused(bool paused) { paused_ = paused; }

    const InputState& input() const { return input_; }
    void set_input(const InputState& input) { input_ = input; }

    // Simulated seconds and fixed steps this scene has run.
    double current_time() const { return clock_.getSeconds(); }
    uint64_t frame_count() const { return clock_.getTicks(); }

    AudioEngine& audio() { return audio_; }
    const AudioEngine& audio() const { return audio_; }

    Registry& registry() { return registry_; }
    const Registry& registry() const { return registry_; }
    const SceneGraph& graph() const { return graph_; }

    std::string describe_tree() const { return graph_.describe_tree(root_); }

   private:
    Registry registry_;
    SceneGraph graph_;
    NodeId root_;
    Size size_;
    NodeId camera_{kNullNode};
    std::uint64_t next_action_key_{0};

    GameClock clock_;
    InputState input_;
    AudioEngine audio_;
    bool paused_{false};

    UpdateCallback update_callback_;
    SceneDelegate* delegate_{nullptr};
    PhysicsStepper* physics_stepper_{nullptr};

    void require_node_(NodeId node, const char* operation) const;
    bool camera_active_() const;
    Rect node_bounds_(NodeId node) const;
};

}  // namespace vellum

#endif  // VELLUM_SCENE_HPP
