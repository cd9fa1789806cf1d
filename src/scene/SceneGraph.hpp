#ifndef VELLUM_SCENEGRAPH_HPP
#define VELLUM_SCENEGRAPH_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <entt/entt.hpp>
#include <string>
#include <utility>
#include <vector>

#include "SceneExceptions.hpp"
#include "components/NodeComponents.hpp"

namespace vellum {

// -----------------------------------------------------------------------------
// SceneGraph:
//  - Nodes are entities of a registry it does not own; NodeId is generation-safe.
//  - A Hierarchy component links each node to its parent and siblings.
//  - Parents own their children through the child list; the parent field is a
//    plain back-reference.
//  - Detached subtrees are kept as roots until re-attached or destroyed.
// -----------------------------------------------------------------------------
class SceneGraph {
   public:
    explicit SceneGraph(Registry& registry) noexcept : registry_{&registry} {}

    // --- Node lifecycle -------------------------------------------------------

    NodeId create_node() {
        NodeId e = registry_->create();
        registry_->emplace<Hierarchy>(e);
        roots_.push_back(e);
        return e;
    }

    // Destroys 'e' and everything below it. Returns the destroyed handles in
    // visit order (parents before children).
    std::vector<NodeId> destroy_subtree(NodeId e) {
        std::vector<NodeId> destroyed;
        if (!contains(e)) {
            return destroyed;
        }
        detach(e);

        std::vector<NodeId> stack{e};
        while (!stack.empty()) {
            NodeId cur = stack.back();
            stack.pop_back();

            for (NodeId c = first_child(cur); c != entt::null; c = next_sibling(c)) {
                stack.push_back(c);
            }
            erase_root_if_present_(cur);
            destroyed.push_back(cur);
        }
        // Links are read above, so entities are only released once all are collected.
        for (NodeId node : destroyed) {
            registry_->destroy(node);
        }
        return destroyed;
    }

    // --- Attach / Detach ------------------------------------------------------

    // Attach 'child' under 'parent' before sibling 'before' (append when null).
    // A child that already has a parent is moved.
    void attach_child(NodeId parent, NodeId child, NodeId before = entt::null) {
        require_(child, "attach_child: child");
        require_(parent, "attach_child: parent");
        if (child == parent || is_descendant_of_(parent, child)) {
            throw HierarchyCycleException("attach_child: node " + describe_(child) +
                                          " is an ancestor of " + describe_(parent));
        }
        if (before != entt::null && (!contains(before) || this->parent(before) != parent)) {
            throw InvalidNodeException("attach_child: " + describe_(before) +
                                       " is not a child of " + describe_(parent));
        }
        if (before == child) {
            // Already in place right before itself; nothing moves.
            return;
        }

        detach(child);
        erase_root_if_present_(child);

        auto& hc = registry_->get<Hierarchy>(child);
        auto& hp = registry_->get<Hierarchy>(parent);
        hc.parent = parent;

        if (before == entt::null) {
            if (hp.first_child == entt::null) {
                hp.first_child = child;
                return;
            }
            NodeId last = hp.first_child;
            while (registry_->get<Hierarchy>(last).next_sibling != entt::null) {
                last = registry_->get<Hierarchy>(last).next_sibling;
            }
            registry_->get<Hierarchy>(last).next_sibling = child;
            hc.prev_sibling = last;
            return;
        }

        auto& hb = registry_->get<Hierarchy>(before);
        NodeId prev = hb.prev_sibling;
        hc.next_sibling = before;
        hc.prev_sibling = prev;
        hb.prev_sibling = child;
        if (prev == entt::null) {
            hp.first_child = child;
        } else {
            registry_->get<Hierarchy>(prev).next_sibling = child;
        }
    }

    // Insert at a position in the child list; indices past the end append.
    // 'index' is where the child ends up, counted without the child itself.
    void insert_child(NodeId parent, NodeId child, std::size_t index) {
        require_(parent, "insert_child: parent");
        NodeId before = entt::null;
        std::size_t i = 0;
        for (NodeId c = first_child(parent); c != entt::null; c = next_sibling(c)) {
            if (c == child) {
                continue;
            }
            if (i == index) {
                before = c;
                break;
            }
            ++i;
        }
        attach_child(parent, child, before);
    }

    // Unlink 'child' from its parent. It survives as a root.
    void detach(NodeId child) {
        if (!contains(child)) {
            return;
        }
        auto& hc = registry_->get<Hierarchy>(child);
        if (hc.parent == entt::null) {
            add_root_if_absent_(child);
            return;
        }

        auto& hp = registry_->get<Hierarchy>(hc.parent);
        if (hc.prev_sibling != entt::null) {
            registry_->get<Hierarchy>(hc.prev_sibling).next_sibling = hc.next_sibling;
        } else {
            hp.first_child = hc.next_sibling;
        }
        if (hc.next_sibling != entt::null) {
            registry_->get<Hierarchy>(hc.next_sibling).prev_sibling = hc.prev_sibling;
        }

        hc.parent = entt::null;
        hc.prev_sibling = entt::null;
        hc.next_sibling = entt::null;
        add_root_if_absent_(child);
    }

    // Detaches every child of 'e'; returns them in their former order.
    std::vector<NodeId> detach_children(NodeId e) {
        std::vector<NodeId> removed = children(e);
        for (NodeId c : removed) {
            detach(c);
        }
        return removed;
    }

    // --- Queries --------------------------------------------------------------

    bool contains(NodeId e) const noexcept {
        return e != entt::null && registry_->valid(e) && registry_->all_of<Hierarchy>(e);
    }

    NodeId parent(NodeId e) const noexcept {
        return contains(e) ? registry_->get<Hierarchy>(e).parent : entt::null;
    }

    NodeId first_child(NodeId e) const noexcept {
        return contains(e) ? registry_->get<Hierarchy>(e).first_child : entt::null;
    }

    NodeId next_sibling(NodeId e) const noexcept {
        return contains(e) ? registry_->get<Hierarchy>(e).next_sibling : entt::null;
    }

    NodeId prev_sibling(NodeId e) const noexcept {
        return contains(e) ? registry_->get<Hierarchy>(e).prev_sibling : entt::null;
    }

    bool is_root(NodeId e) const noexcept {
        return contains(e) && registry_->get<Hierarchy>(e).parent == entt::null;
    }

    const std::vector<NodeId>& roots() const noexcept { return roots_; }

    std::vector<NodeId> children(NodeId e) const {
        std::vector<NodeId> result;
        for_each_child(e, [&result](NodeId c) { result.push_back(c); });
        return result;
    }

    std::size_t child_count(NodeId e) const {
        std::size_t n = 0;
        for_each_child(e, [&n](NodeId) { ++n; });
        return n;
    }

    // Iterate direct children in insertion order.
    template <typename Fn>
    void for_each_child(NodeId e, Fn&& fn) const {
        if (!contains(e)) return;
        for (NodeId c = first_child(e); c != entt::null; c = next_sibling(c)) {
            fn(c);
        }
    }

    // Preorder traversal of a subtree (includes root), children in insertion order.
    template <typename Fn>
    void for_each_descendant_preorder(NodeId root, Fn&& fn) const {
        if (!contains(root)) return;
        std::vector<NodeId> stack{root};
        std::vector<NodeId> siblings;
        while (!stack.empty()) {
            NodeId cur = stack.back();
            stack.pop_back();
            fn(cur);
            siblings.clear();
            for (NodeId c = first_child(cur); c != entt::null; c = next_sibling(c)) {
                siblings.push_back(c);
            }
            stack.insert(stack.end(), siblings.rbegin(), siblings.rend());
        }
    }

    // Root has depth 0. Returns -1 if not in graph.
    int depth(NodeId e) const noexcept {
        if (!contains(e)) return -1;
        int d = 0;
        for (NodeId p = parent(e); p != entt::null; p = parent(p)) {
            ++d;
        }
        return d;
    }

    bool is_ancestor_of(NodeId ancestor, NodeId node) const noexcept {
        return is_descendant_of_(node, ancestor);
    }

    // --- Debugging ------------------------------------------------------------

    // One line per node, indented two spaces per level.
    std::string describe_tree(NodeId root) const {
        if (!contains(root)) {
            return "(empty graph)\n";
        }
        std::string out;
        for_each_descendant_preorder(root, [&](NodeId node) {
            out.append(static_cast<std::size_t>(depth(node) - depth(root)) * 2, ' ');
            out += describe_(node);
            out += '\n';
        });
        return out;
    }

   private:
    Registry* registry_{nullptr};
    std::vector<NodeId> roots_{};

    // --- Helpers --------------------------------------------------------------

    void require_(NodeId e, const char* what) const {
        if (!contains(e)) {
            throw InvalidNodeException(std::string(what) + " is not a live node");
        }
    }

    static std::string describe_(NodeId e) {
        if (e == entt::null) return "<null>";
        return "<node " + std::to_string(static_cast<std::uint64_t>(entt::to_entity(e))) + "v" +
               std::to_string(static_cast<std::uint64_t>(entt::to_version(e))) + ">";
    }

    void add_root_if_absent_(NodeId e) {
        auto it = std::find(roots_.begin(), roots_.end(), e);
        if (it == roots_.end()) roots_.push_back(e);
    }

    void erase_root_if_present_(NodeId e) {
        auto it = std::find(roots_.begin(), roots_.end(), e);
        if (it != roots_.end()) roots_.erase(it);
    }

    // Returns true if 'candidate' is a descendant of 'ancestor'.
    bool is_descendant_of_(NodeId candidate, NodeId ancestor) const noexcept {
        if (candidate == entt::null || ancestor == entt::null) return false;
        for (NodeId p = parent(candidate); p != entt::null; p = parent(p)) {
            if (p == ancestor) return true;
        }
        return false;
    }
};

}  // namespace vellum

#endif  // VELLUM_SCENEGRAPH_HPP
