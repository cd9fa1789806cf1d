#ifndef VELLUM_ACTION_SYSTEM_HPP
#define VELLUM_ACTION_SYSTEM_HPP

#include <entt/entt.hpp>

#include "actions/Action.hpp"
#include "scene/SceneGraph.hpp"

namespace vellum {

class ActionSystem {
   public:
    ActionSystem(Registry& registry, SceneGraph& graph) : registry_(registry), graph_(graph) {}

    // Evaluates the running actions of every node under 'root', parents before
    // children and each node's actions in start order. Finished actions are
    // dropped. Nodes that asked to leave their parent are detached once every
    // node has been evaluated.
    void update(NodeId root, float dt);

   private:
    Registry& registry_;
    SceneGraph& graph_;

    void update_node_(NodeId node, float dt, std::vector<NodeId>& detach_requests);
};

}  // namespace vellum

#endif  // VELLUM_ACTION_SYSTEM_HPP
