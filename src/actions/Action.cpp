#include "actions/Action.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>
#include <utility>

namespace vellum {

namespace {

float non_negative(float duration) { return duration > 0.0f ? duration : 0.0f; }

// A run block earlier in the step may have destroyed the node.
Transform* local_transform(ActionContext& context) {
    if (!context.registry.valid(context.node)) {
        return nullptr;
    }
    return context.registry.try_get<Transform>(context.node);
}

}  // namespace

float apply_timing(ActionTimingMode mode, float t) {
    switch (mode) {
        case ActionTimingMode::Linear:
            return t;
        case ActionTimingMode::EaseIn:
            return t * t;
        case ActionTimingMode::EaseOut:
            return t * (2.0f - t);
        case ActionTimingMode::EaseInOut:
            return t < 0.5f ? 2.0f * t * t : -1.0f + (4.0f - 2.0f * t) * t;
    }
    return t;
}

Action::Action(ActionKind kind, float duration) : kind_(std::move(kind)), duration_(duration) {}

// --- Factories --------------------------------------------------------------

Action Action::move_to(Point position, float duration) {
    return Action(MoveToAction{position}, non_negative(duration));
}

Action Action::move_by(Vec2 delta, float duration) {
    return Action(MoveByAction{delta}, non_negative(duration));
}

Action Action::rotate_to(float radians, float duration) {
    return Action(RotateToAction{radians}, non_negative(duration));
}

Action Action::rotate_by(float radians, float duration) {
    return Action(RotateByAction{radians}, non_negative(duration));
}

Action Action::scale_to(Vec2 scale, float duration) {
    return Action(ScaleToAction{scale}, non_negative(duration));
}

Action Action::scale_by(Vec2 factor, float duration) {
    return Action(ScaleByAction{factor}, non_negative(duration));
}

Action Action::fade_to(float alpha, float duration) {
    return Action(FadeToAction{alpha}, non_negative(duration));
}

Action Action::fade_by(float delta, float duration) {
    return Action(FadeByAction{delta}, non_negative(duration));
}

Action Action::wait(float duration) { return Action(WaitAction{}, non_negative(duration)); }

Action Action::hide() { return Action(SetHiddenAction{true}, 0.0f); }

Action Action::unhide() { return Action(SetHiddenAction{false}, 0.0f); }

Action Action::remove_from_parent() { return Action(RemoveFromParentAction{}, 0.0f); }

Action Action::run(std::function<void(NodeId)> block) {
    return Action(RunBlockAction{std::move(block)}, 0.0f);
}

Action Action::sequence(std::vector<Action> actions) {
    float total = 0.0f;
    for (auto& action : actions) {
        action.reset();
        total += action.duration();
    }
    Action result(SequenceAction{}, total);
    result.children_ = std::move(actions);
    return result;
}

Action Action::group(std::vector<Action> actions) {
    float longest = 0.0f;
    for (auto& action : actions) {
        action.reset();
        longest = std::max(longest, action.duration());
    }
    Action result(GroupAction{}, longest);
    result.children_ = std::move(actions);
    return result;
}

Action Action::repeat(const Action& action, int count) {
    const int times = std::max(1, count);
    Action result(RepeatAction{times, false, 0}, action.duration() * static_cast<float>(times));
    result.children_.push_back(action);
    result.children_.back().reset();
    return result;
}

Action Action::repeat_forever(const Action& action) {
    Action result(RepeatAction{0, true, 0}, std::numeric_limits<float>::infinity());
    result.children_.push_back(action);
    result.children_.back().reset();
    return result;
}

// --- Evaluation -------------------------------------------------------------

bool Action::evaluate(ActionContext& context, float dt) {
    if (complete_) {
        return true;
    }
    const float scaled = dt * speed_;

    if (auto* sequence = std::get_if<SequenceAction>(&kind_)) {
        if (sequence->index < children_.size() &&
            children_[sequence->index].evaluate(context, scaled)) {
            ++sequence->index;
        }
        complete_ = sequence->index >= children_.size();
        return complete_;
    }

    if (std::holds_alternative<GroupAction>(kind_)) {
        bool all_done = true;
        for (auto& child : children_) {
            if (!child.is_complete() && !child.evaluate(context, scaled)) {
                all_done = false;
            }
        }
        complete_ = all_done;
        return complete_;
    }

    if (auto* repeat = std::get_if<RepeatAction>(&kind_)) {
        if (children_.empty()) {
            complete_ = true;
            return true;
        }
        if (children_.front().evaluate(context, scaled)) {
            ++repeat->completed;
            if (!repeat->forever && repeat->completed >= repeat->count) {
                complete_ = true;
                return true;
            }
            children_.front().reset();
        }
        return false;
    }

    if (auto* run = std::get_if<RunBlockAction>(&kind_)) {
        complete_ = true;
        if (run->block) {
            run->block(context.node);
        }
        return true;
    }

    if (auto* visibility = std::get_if<SetHiddenAction>(&kind_)) {
        if (auto* local = local_transform(context)) {
            local->hidden = visibility->hidden;
        }
        complete_ = true;
        return true;
    }

    if (std::holds_alternative<RemoveFromParentAction>(kind_)) {
        context.detach_requests.push_back(context.node);
        complete_ = true;
        return true;
    }

    elapsed_ += scaled;
    if (duration_ > 0.0f) {
        float progress = std::min(elapsed_ / duration_, 1.0f);
        apply_(context, apply_timing(timing_mode_, progress));
        complete_ = elapsed_ >= duration_;
    } else {
        apply_(context, 1.0f);
        complete_ = true;
    }
    return complete_;
}

void Action::apply_(ActionContext& context, float progress) {
    auto* local = local_transform(context);
    if (local == nullptr) {
        return;
    }
    if (!start_) {
        start_ = *local;
    }
    const Transform& start = *start_;

    std::visit(
        [&](const auto& a) {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, MoveToAction>) {
                local->position = lerp(start.position, a.target, progress);
            } else if constexpr (std::is_same_v<T, MoveByAction>) {
                local->position = start.position + a.delta * progress;
            } else if constexpr (std::is_same_v<T, RotateToAction>) {
                local->rotation = start.rotation + (a.target - start.rotation) * progress;
            } else if constexpr (std::is_same_v<T, RotateByAction>) {
                local->rotation = start.rotation + a.delta * progress;
            } else if constexpr (std::is_same_v<T, ScaleToAction>) {
                local->scale = lerp(start.scale, a.target, progress);
            } else if constexpr (std::is_same_v<T, ScaleByAction>) {
                local->scale = {start.scale.x * (1.0f + (a.factor.x - 1.0f) * progress),
                                start.scale.y * (1.0f + (a.factor.y - 1.0f) * progress)};
            } else if constexpr (std::is_same_v<T, FadeToAction>) {
                local->alpha = start.alpha + (a.target - start.alpha) * progress;
            } else if constexpr (std::is_same_v<T, FadeByAction>) {
                local->alpha = start.alpha + a.delta * progress;
            }
            // Wait and the instant kinds have nothing to interpolate.
        },
        kind_);
}

void Action::reset() {
    elapsed_ = 0.0f;
    complete_ = false;
    start_.reset();
    if (auto* sequence = std::get_if<SequenceAction>(&kind_)) {
        sequence->index = 0;
    } else if (auto* repeat = std::get_if<RepeatAction>(&kind_)) {
        repeat->completed = 0;
    }
    for (auto& child : children_) {
        child.reset();
    }
}

}  // namespace vellum
