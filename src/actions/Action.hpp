#ifndef VELLUM_ACTION_HPP
#define VELLUM_ACTION_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "components/NodeComponents.hpp"
#include "geometry/Geometry.hpp"

namespace vellum {

enum class ActionTimingMode { Linear, EaseIn, EaseOut, EaseInOut };

// Maps linear progress in [0, 1] onto the eased curve.
float apply_timing(ActionTimingMode mode, float t);

struct MoveToAction {
    Point target;
};

struct MoveByAction {
    Vec2 delta;
};

struct RotateToAction {
    float target;  // radians
};

struct RotateByAction {
    float delta;
};

struct ScaleToAction {
    Vec2 target;
};

struct ScaleByAction {
    Vec2 factor;
};

struct FadeToAction {
    float target;
};

struct FadeByAction {
    float delta;
};

struct WaitAction {};

struct SetHiddenAction {
    bool hidden;
};

struct RemoveFromParentAction {};

struct RunBlockAction {
    std::function<void(NodeId)> block;
};

struct SequenceAction {
    std::size_t index{0};
};

struct GroupAction {};

struct RepeatAction {
    int count{1};
    bool forever{false};
    int completed{0};
};

using ActionKind =
    std::variant<MoveToAction, MoveByAction, RotateToAction, RotateByAction, ScaleToAction,
                 ScaleByAction, FadeToAction, FadeByAction, WaitAction, SetHiddenAction,
                 RemoveFromParentAction, RunBlockAction, SequenceAction, GroupAction,
                 RepeatAction>;

// What an action may touch while it runs. Detaching is deferred until every
// node has been evaluated.
struct ActionContext {
    Registry& registry;
    NodeId node;
    std::vector<NodeId>& detach_requests;
};

/**
 * @brief A timed change to a node's local transform, or a composition of them.
 *
 * Timed actions capture the node's transform the first time they run and
 * interpolate from it, so progress never compounds. Sequences advance one
 * child per step; groups run every child each step; repeats reset their child
 * each time it finishes. Instant actions (duration 0) finish on their first
 * step.
 *
 * An Action carries its own progress. Scenes run a reset copy, so one value
 * can be handed to any number of nodes.
 */
class Action {
   public:
    static Action move_to(Point position, float duration);
    static Action move_by(Vec2 delta, float duration);
    static Action rotate_to(float radians, float duration);
    static Action rotate_by(float radians, float duration);
    static Action scale_to(float scale, float duration) { return scale_to(Vec2{scale, scale}, duration); }
    static Action scale_to(Vec2 scale, float duration);
    static Action scale_by(float factor, float duration) { return scale_by(Vec2{factor, factor}, duration); }
    static Action scale_by(Vec2 factor, float duration);
    static Action fade_to(float alpha, float duration);
    static Action fade_by(float delta, float duration);
    static Action fade_in(float duration) { return fade_to(1.0f, duration); }
    static Action fade_out(float duration) { return fade_to(0.0f, duration); }
    static Action wait(float duration);
    static Action hide();
    static Action unhide();
    static Action remove_from_parent();
    static Action run(std::function<void(NodeId)> block);

    static Action sequence(std::vector<Action> actions);
    static Action group(std::vector<Action> actions);
    // A count below 1 runs the action once.
    static Action repeat(const Action& action, int count);
    static Action repeat_forever(const Action& action);

    // Sum for sequences, longest child for groups, infinite for repeat_forever.
    float duration() const { return duration_; }

    ActionTimingMode timing_mode() const { return timing_mode_; }
    void set_timing_mode(ActionTimingMode mode) { timing_mode_ = mode; }

    // Scales the time fed to this action and its children. Negative counts as 0.
    float speed() const { return speed_; }
    void set_speed(float speed) { speed_ = speed > 0.0f ? speed : 0.0f; }

    const ActionKind& kind() const { return kind_; }
    const std::vector<Action>& children() const { return children_; }

    bool is_complete() const { return complete_; }

    // Advances by dt against context.node. Returns true once finished.
    bool evaluate(ActionContext& context, float dt);

    // Back to the state before the first evaluate().
    void reset();

   private:
    Action(ActionKind kind, float duration);

    void apply_(ActionContext& context, float progress);

    ActionKind kind_;
    float duration_{0.0f};
    ActionTimingMode timing_mode_{ActionTimingMode::Linear};
    float speed_{1.0f};

    float elapsed_{0.0f};
    bool complete_{false};
    std::optional<Transform> start_;
    std::vector<Action> children_;
};

struct RunningAction {
    std::string key;
    Action action;
};

// Actions running on a node, evaluated in the order they were started.
// 'cancelled' and 'cleared' record removals made while the list was being
// evaluated.
struct Actions {
    std::vector<RunningAction> running;
    std::vector<std::string> cancelled;
    bool cleared{false};
};

}  // namespace vellum

#endif  // VELLUM_ACTION_HPP
