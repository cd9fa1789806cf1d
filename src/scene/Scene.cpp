#include "scene/Scene.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "Logger.hpp"
#include "LowLevelRenderer/RenderSystem.hpp"
#include "SceneExceptions.hpp"
#include "SimulationManager.hpp"
#include "actions/ActionSystem.hpp"
#include "constraints/ConstraintSystem.hpp"
#include "scene/Camera.hpp"
#include "scene/TransformSystem.hpp"
#include "warp/WarpSystem.hpp"

namespace vellum {

Scene::Scene(Size size) : registry_(), graph_(registry_), root_(graph_.create_node()), size_(size) {
    registry_.emplace<Transform>(root_);
    registry_.emplace<NodeName>(root_, NodeName{"scene"});
}

void Scene::require_node_(NodeId node, const char* operation) const {
    if (!graph_.contains(node)) {
        throw InvalidNodeException(std::string(operation) + ": handle is not a live node");
    }
}

// --- Node lifecycle ---------------------------------------------------------

NodeId Scene::create_node(const std::string& name) {
    NodeId node = graph_.create_node();
    registry_.emplace<Transform>(node);
    if (!name.empty()) {
        registry_.emplace<NodeName>(node, NodeName{name});
    }
    return node;
}

NodeId Scene::create_sprite(const Sprite& sprite, const std::string& name) {
    NodeId node = create_node(name);
    registry_.emplace<Sprite>(node, sprite);
    return node;
}

void Scene::add_child(NodeId parent, NodeId child) {
    require_node_(parent, "add_child");
    require_node_(child, "add_child");
    if (child == root_) {
        throw InvalidNodeException("add_child: the scene root cannot become a child");
    }
    graph_.attach_child(parent, child);
}

void Scene::insert_child(NodeId parent, NodeId child, std::size_t index) {
    require_node_(parent, "insert_child");
    require_node_(child, "insert_child");
    if (child == root_) {
        throw InvalidNodeException("insert_child: the scene root cannot become a child");
    }
    graph_.insert_child(parent, child, index);
}

void Scene::remove_from_parent(NodeId node) {
    require_node_(node, "remove_from_parent");
    graph_.detach(node);
}

void Scene::remove_all_children(NodeId node) {
    require_node_(node, "remove_all_children");
    graph_.detach_children(node);
}

void Scene::destroy_node(NodeId node) {
    require_node_(node, "destroy_node");
    if (node == root_) {
        throw InvalidNodeException("destroy_node: the scene root is owned by the scene");
    }
    auto destroyed = graph_.destroy_subtree(node);
    Logger::getLogger()->debug("Destroyed {} node(s)", destroyed.size());
}

// --- Hierarchy queries ------------------------------------------------------

NodeId Scene::child_node(NodeId parent, const std::string& name) const {
    NodeId found = kNullNode;
    graph_.for_each_child(parent, [&](NodeId c) {
        if (found != kNullNode) return;
        const auto* n = registry_.try_get<NodeName>(c);
        if (n != nullptr && n->value == name) found = c;
    });
    return found;
}

NodeId Scene::find_node(const std::string& name) const {
    auto matches = find_nodes(name);
    return matches.empty() ? kNullNode : matches.front();
}

std::vector<NodeId> Scene::find_nodes(const std::string& name) const {
    std::vector<NodeId> matches;
    graph_.for_each_descendant_preorder(root_, [&](NodeId node) {
        const auto* n = registry_.try_get<NodeName>(node);
        if (n != nullptr && n->value == name) matches.push_back(node);
    });
    return matches;
}

bool Scene::in_tree(NodeId node) const {
    return graph_.contains(node) && (node == root_ || graph_.is_ancestor_of(root_, node));
}

// --- Per-node state ---------------------------------------------------------

Transform& Scene::transform(NodeId node) {
    require_node_(node, "transform");
    return registry_.get_or_emplace<Transform>(node);
}

const Transform& Scene::transform(NodeId node) const {
    require_node_(node, "transform");
    return registry_.get<Transform>(node);
}

void Scene::set_name(NodeId node, const std::string& name) {
    require_node_(node, "set_name");
    registry_.emplace_or_replace<NodeName>(node, NodeName{name});
}

std::string Scene::name(NodeId node) const {
    require_node_(node, "name");
    const auto* n = registry_.try_get<NodeName>(node);
    return n != nullptr ? n->value : std::string{};
}

Sprite& Scene::set_sprite(NodeId node, const Sprite& sprite) {
    require_node_(node, "set_sprite");
    return registry_.emplace_or_replace<Sprite>(node, sprite);
}

Sprite* Scene::sprite(NodeId node) {
    require_node_(node, "sprite");
    return registry_.try_get<Sprite>(node);
}

void Scene::clear_sprite(NodeId node) {
    require_node_(node, "clear_sprite");
    registry_.remove<Sprite>(node);
}

void Scene::add_constraint(NodeId node, const Constraint& constraint) {
    require_node_(node, "add_constraint");
    registry_.get_or_emplace<Constraints>(node).list.push_back(constraint);
}

std::vector<Constraint>& Scene::constraints(NodeId node) {
    require_node_(node, "constraints");
    return registry_.get_or_emplace<Constraints>(node).list;
}

void Scene::clear_constraints(NodeId node) {
    require_node_(node, "clear_constraints");
    registry_.remove<Constraints>(node);
}

void Scene::set_warp(NodeId node, const WarpGeometryGrid& grid, int subdivision_levels) {
    require_node_(node, "set_warp");
    int levels = std::clamp(subdivision_levels, 0, SimulationManager::kMaxSubdivisionLevels);
    registry_.emplace_or_replace<Warp>(node, Warp{grid, levels});
}

const Warp* Scene::warp(NodeId node) const {
    require_node_(node, "warp");
    return registry_.try_get<Warp>(node);
}

void Scene::clear_warp(NodeId node) {
    require_node_(node, "clear_warp");
    registry_.remove<Warp, WarpTransition, WarpSequence>(node);
}

void Scene::warp_to(NodeId node, const WarpGeometryGrid& target, float duration) {
    require_node_(node, "warp_to");
    registry_.remove<WarpSequence>(node);
    registry_.emplace_or_replace<WarpTransition>(
        node, WarpTransition{target, std::max(0.0f, duration), 0.0f, std::nullopt});
}

void Scene::animate_with_warps(NodeId node, const std::vector<WarpGeometryGrid>& grids,
                               const std::vector<float>& times) {
    require_node_(node, "animate_with_warps");
    registry_.remove<WarpTransition>(node);

    WarpSequence sequence;
    sequence.grids = grids;
    sequence.times.resize(grids.size(), 0.0f);
    for (std::size_t i = 0; i < grids.size() && i < times.size(); ++i) {
        sequence.times[i] = std::max(0.0f, times[i]);
    }
    registry_.emplace_or_replace<WarpSequence>(node, std::move(sequence));
}

void Scene::animate_with_warps(NodeId node, const std::vector<WarpGeometryGrid>& grids,
                               float duration) {
    std::vector<float> times;
    if (!grids.empty()) {
        times.assign(grids.size(), std::max(0.0f, duration) / static_cast<float>(grids.size()));
    }
    animate_with_warps(node, grids, times);
}

bool Scene::has_warp_animation(NodeId node) const {
    require_node_(node, "has_warp_animation");
    return registry_.any_of<WarpTransition, WarpSequence>(node);
}

// --- Actions ----------------------------------------------------------------

std::string Scene::run_action(NodeId node, const Action& action, const std::string& key) {
    require_node_(node, "run_action");
    std::string used = key.empty() ? "action-" + std::to_string(next_action_key_++) : key;

    auto& actions = registry_.get_or_emplace<Actions>(node);
    auto& running = actions.running;
    running.erase(std::remove_if(running.begin(), running.end(),
                                 [&used](const RunningAction& entry) { return entry.key == used; }),
                  running.end());
    running.push_back(RunningAction{used, action});
    running.back().action.reset();
    return used;
}

void Scene::remove_action(NodeId node, const std::string& key) {
    require_node_(node, "remove_action");
    auto* actions = registry_.try_get<Actions>(node);
    if (actions == nullptr) {
        return;
    }
    auto& running = actions->running;
    running.erase(std::remove_if(running.begin(), running.end(),
                                 [&key](const RunningAction& entry) { return entry.key == key; }),
                  running.end());
    actions->cancelled.push_back(key);
}

void Scene::remove_all_actions(NodeId node) {
    require_node_(node, "remove_all_actions");
    if (auto* actions = registry_.try_get<Actions>(node)) {
        actions->running.clear();
        actions->cleared = true;
    }
}

bool Scene::has_actions(NodeId node) const {
    require_node_(node, "has_actions");
    const auto* actions = registry_.try_get<Actions>(node);
    return actions != nullptr && !actions->running.empty();
}

const Action* Scene::action(NodeId node, const std::string& key) const {
    require_node_(node, "action");
    const auto* actions = registry_.try_get<Actions>(node);
    if (actions == nullptr) return nullptr;
    for (const auto& entry : actions->running) {
        if (entry.key == key) return &entry.action;
    }
    return nullptr;
}

void Scene::set_shader_attribute(NodeId node, const std::string& name,
                                 const ShaderAttributeValue& value) {
    require_node_(node, "set_shader_attribute");
    registry_.get_or_emplace<ShaderAttributes>(node).set(name, value);
}

std::optional<ShaderAttributeValue> Scene::shader_attribute(NodeId node,
                                                            const std::string& name) const {
    require_node_(node, "shader_attribute");
    const auto* attributes = registry_.try_get<ShaderAttributes>(node);
    if (attributes == nullptr) return std::nullopt;
    return attributes->get(name);
}

bool Scene::remove_shader_attribute(NodeId node, const std::string& name) {
    require_node_(node, "remove_shader_attribute");
    auto* attributes = registry_.try_get<ShaderAttributes>(node);
    return attributes != nullptr && attributes->remove(name);
}

void Scene::set_physics_body(NodeId node, const PhysicsBody& body) {
    require_node_(node, "set_physics_body");
    registry_.emplace_or_replace<PhysicsBody>(node, body);
}

const PhysicsBody* Scene::physics_body(NodeId node) const {
    require_node_(node, "physics_body");
    return registry_.try_get<PhysicsBody>(node);
}

// --- World space ------------------------------------------------------------

Point Scene::world_position(NodeId node) const {
    require_node_(node, "world_position");
    return TransformSystem::resolve(registry_, graph_, node).position;
}

float Scene::world_rotation(NodeId node) const {
    require_node_(node, "world_rotation");
    return TransformSystem::resolve(registry_, graph_, node).rotation;
}

Vec2 Scene::world_scale(NodeId node) const {
    require_node_(node, "world_scale");
    return TransformSystem::resolve(registry_, graph_, node).scale;
}

float Scene::world_alpha(NodeId node) const {
    require_node_(node, "world_alpha");
    return TransformSystem::resolve(registry_, graph_, node).alpha;
}

// --- Camera -----------------------------------------------------------------

void Scene::set_camera(NodeId node) {
    if (node != kNullNode) {
        require_node_(node, "set_camera");
    }
    camera_ = node;
}

bool Scene::camera_active_() const { return camera_ != kNullNode && in_tree(camera_); }

Rect Scene::viewport() const {
    if (!camera_active_()) {
        return {{0.0f, 0.0f}, size_};
    }
    WorldTransform world = TransformSystem::resolve(registry_, graph_, camera_);
    return camera_viewport(world.position, world.scale, size_);
}

AffineTransform Scene::view_transform(Size view_size) const {
    if (!camera_active_()) {
        Point center{size_.width / 2.0f, size_.height / 2.0f};
        return camera_view_transform(center, 0.0f, {1.0f, 1.0f}, view_size);
    }
    WorldTransform world = TransformSystem::resolve(registry_, graph_, camera_);
    return camera_view_transform(world.position, world.rotation, world.scale, view_size);
}

Rect Scene::node_bounds_(NodeId node) const {
    WorldTransform world = TransformSystem::resolve(registry_, graph_, node);
    const auto* sprite = registry_.try_get<Sprite>(node);
    if (sprite == nullptr) {
        return {world.position, {}};
    }
    Size size = scaled(sprite->size, {std::abs(world.scale.x), std::abs(world.scale.y)});
    return {{world.position.x - size.width * sprite->anchor_point.x,
             world.position.y - size.height * sprite->anchor_point.y},
            size};
}

bool Scene::camera_contains(NodeId node) const {
    require_node_(node, "camera_contains");
    return viewport().intersects(node_bounds_(node));
}

std::vector<NodeId> Scene::visible_nodes() const {
    std::vector<NodeId> visible;
    const Rect view = viewport();

    std::vector<NodeId> stack{root_};
    std::vector<NodeId> children;
    while (!stack.empty()) {
        NodeId node = stack.back();
        stack.pop_back();

        const auto* local = registry_.try_get<Transform>(node);
        if (local != nullptr && local->hidden) {
            continue;
        }
        if (registry_.all_of<Sprite>(node) && view.intersects(node_bounds_(node))) {
            visible.push_back(node);
        }
        if (node == camera_) {
            continue;
        }
        children = graph_.children(node);
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
    return visible;
}

// --- Frame ------------------------------------------------------------------

void Scene::update(float dt) {
    if (update_callback_) {
        update_callback_(*this, dt);
    }
}

void Scene::apply_constraints() { ConstraintSystem(registry_, graph_).apply_tree(root_); }

void Scene::process_frame(float dt) {
    if (paused_) {
        return;
    }
    clock_.tick(dt);

    if (delegate_ != nullptr) {
        delegate_->update(*this, dt);
    } else {
        update(dt);
    }

    ActionSystem(registry_, graph_).update(root_, dt);
    if (delegate_ != nullptr) {
        delegate_->did_evaluate_actions(*this);
    } else {
        did_evaluate_actions();
    }

    if (physics_stepper_ != nullptr) {
        physics_stepper_->simulate(*this, dt);
    }
    if (delegate_ != nullptr) {
        delegate_->did_simulate_physics(*this);
    } else {
        did_simulate_physics();
    }

    apply_constraints();
    if (delegate_ != nullptr) {
        delegate_->did_apply_constraints(*this);
    } else {
        did_apply_constraints();
    }

    WarpSystem(registry_).update(dt);
    if (delegate_ != nullptr) {
        delegate_->did_apply_warps(*this);
    } else {
        did_apply_warps();
    }

    TransformSystem(registry_, graph_).compose(root_);
    if (delegate_ != nullptr) {
        delegate_->did_finish_update(*this);
    } else {
        did_finish_update();
    }
}

void Scene::generate_draw_commands(RenderQueue& queue) {
    RenderSystem(registry_, graph_).collect(root_, queue);
}

}  // namespace vellum
