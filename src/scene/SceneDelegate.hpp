#ifndef VELLUM_SCENE_DELEGATE_HPP
#define VELLUM_SCENE_DELEGATE_HPP

namespace vellum {

class Scene;

// Hooks into Scene::process_frame. When a delegate is set its update()
// replaces the scene's own.
class SceneDelegate {
   public:
    virtual ~SceneDelegate() = default;

    virtual void update(Scene&, float) {}
    virtual void did_evaluate_actions(Scene&) {}
    virtual void did_simulate_physics(Scene&) {}
    virtual void did_apply_constraints(Scene&) {}
    virtual void did_apply_warps(Scene&) {}
    virtual void did_finish_update(Scene&) {}
};

// External physics world. The scene only calls it at the right point of the
// frame; bodies are referenced through PhysicsBody components.
class PhysicsStepper {
   public:
    virtual ~PhysicsStepper() = default;

    virtual void simulate(Scene& scene, float dt) = 0;
};

}  // namespace vellum

#endif  // VELLUM_SCENE_DELEGATE_HPP
