#include "actions/ActionSystem.hpp"

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

#include "Logger.hpp"

namespace vellum {

void ActionSystem::update(NodeId root, float dt) {
    // Run blocks may edit the tree, so the visit order is fixed up front.
    std::vector<NodeId> order;
    graph_.for_each_descendant_preorder(root, [this, &order](NodeId node) {
        if (registry_.all_of<Actions>(node)) {
            order.push_back(node);
        }
    });

    std::vector<NodeId> detach_requests;
    for (NodeId node : order) {
        if (graph_.contains(node)) {
            update_node_(node, dt, detach_requests);
        }
    }

    for (NodeId node : detach_requests) {
        if (graph_.contains(node) && node != root) {
            graph_.detach(node);
        }
    }
    if (!detach_requests.empty()) {
        Logger::getLogger()->trace("Actions detached {} node(s)", detach_requests.size());
    }
}

void ActionSystem::update_node_(NodeId node, float dt, std::vector<NodeId>& detach_requests) {
    auto* actions = registry_.try_get<Actions>(node);
    if (actions == nullptr || actions->running.empty()) {
        return;
    }
    // The list is taken out while it runs: a run block may start or remove
    // actions on this very node.
    std::vector<RunningAction> running = std::move(actions->running);
    actions->running.clear();
    actions->cancelled.clear();
    actions->cleared = false;

    ActionContext context{registry_, node, detach_requests};
    std::vector<RunningAction> kept;
    for (auto& entry : running) {
        if (!graph_.contains(node)) {
            return;
        }
        if (!entry.action.evaluate(context, dt)) {
            kept.push_back(std::move(entry));
        }
    }

    if (!graph_.contains(node)) {
        return;
    }
    actions = registry_.try_get<Actions>(node);
    if (actions == nullptr) {
        return;
    }
    if (actions->cleared) {
        kept.clear();
    }

    auto dropped = [actions](const RunningAction& entry) {
        const auto matches = [&entry](const auto& key) { return key == entry.key; };
        return std::any_of(actions->cancelled.begin(), actions->cancelled.end(), matches) ||
               std::any_of(actions->running.begin(), actions->running.end(),
                           [&entry](const RunningAction& added) { return added.key == entry.key; });
    };
    kept.erase(std::remove_if(kept.begin(), kept.end(), dropped), kept.end());

    // Actions started during the step go after the survivors.
    kept.insert(kept.end(), std::make_move_iterator(actions->running.begin()),
                std::make_move_iterator(actions->running.end()));
    actions->running = std::move(kept);
    actions->cancelled.clear();
    actions->cleared = false;
}

}  // namespace vellum
