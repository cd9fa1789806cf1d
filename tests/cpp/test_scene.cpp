#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "LowLevelRenderer/RenderQueue.hpp"
#include "SceneExceptions.hpp"
#include "SimulationManager.hpp"
#include "scene/Scene.hpp"

using namespace vellum;

namespace {

constexpr float kEps = 1e-4f;

Sprite textured(TextureID id) {
    Sprite sprite;
    sprite.size = {16.0f, 16.0f};
    sprite.texture_id = id;
    return sprite;
}

class SceneTest : public ::testing::Test {
   protected:
    Scene scene{Size{640.0f, 480.0f}};
    RenderQueue queue;

    NodeId add_sprite(NodeId parent, TextureID id, float z) {
        NodeId node = scene.create_sprite(textured(id));
        scene.add_child(parent, node);
        scene.transform(node).z_position = z;
        return node;
    }

    std::vector<TextureID> drawn_textures() {
        scene.generate_draw_commands(queue);
        std::vector<TextureID> ids;
        for (const auto& cmd : queue.commands()) ids.push_back(cmd.texture_id);
        return ids;
    }
};

}  // namespace

TEST_F(SceneTest, RootExistsAndIsNamed) {
    EXPECT_TRUE(scene.contains(scene.root()));
    EXPECT_TRUE(scene.in_tree(scene.root()));
    EXPECT_EQ(scene.name(scene.root()), "scene");
    EXPECT_EQ(scene.parent(scene.root()), kNullNode);
}

TEST_F(SceneTest, WorldTransformComposition) {
    NodeId parent = scene.create_node("parent");
    scene.add_child(scene.root(), parent);
    Transform& p = scene.transform(parent);
    p.position = {100.0f, 50.0f};
    p.rotation = kPi / 2.0f;
    p.scale = {2.0f, 2.0f};
    p.alpha = 0.8f;

    NodeId child = scene.create_node("child");
    scene.add_child(parent, child);
    Transform& c = scene.transform(child);
    c.position = {10.0f, 0.0f};
    c.rotation = 0.1f;
    c.scale = {0.5f, 3.0f};
    c.alpha = 0.5f;

    Point world = scene.world_position(child);
    EXPECT_NEAR(world.x, 100.0f, kEps);
    EXPECT_NEAR(world.y, 70.0f, kEps);
    EXPECT_NEAR(scene.world_rotation(child), kPi / 2.0f + 0.1f, kEps);
    EXPECT_NEAR(scene.world_scale(child).x, 1.0f, kEps);
    EXPECT_NEAR(scene.world_scale(child).y, 6.0f, kEps);
    EXPECT_NEAR(scene.world_alpha(child), 0.4f, kEps);

    // The frame pipeline stores the same result.
    scene.process_frame(1.0f / 60.0f);
    const auto& stored = scene.registry().get<WorldTransform>(child);
    EXPECT_NEAR(stored.position.x, 100.0f, kEps);
    EXPECT_NEAR(stored.position.y, 70.0f, kEps);
    EXPECT_NEAR(stored.alpha, 0.4f, kEps);
}

TEST_F(SceneTest, DrawCommandsAreSortedByZWithStableTies) {
    add_sprite(scene.root(), 3, 3.0f);
    add_sprite(scene.root(), 1, 1.0f);
    add_sprite(scene.root(), 2, 2.0f);
    add_sprite(scene.root(), 4, 1.0f);

    EXPECT_EQ(drawn_textures(), (std::vector<TextureID>{1, 4, 2, 3}));
}

TEST_F(SceneTest, DrawCommandCarriesResolvedState) {
    NodeId parent = scene.create_node();
    scene.add_child(scene.root(), parent);
    scene.transform(parent).position = {10.0f, 20.0f};
    scene.transform(parent).alpha = 0.5f;
    scene.transform(parent).z_position = 100.0f;

    Sprite sprite = textured(9);
    sprite.color = {1.0f, 0.0f, 0.0f, 1.0f};
    sprite.color_blend_factor = 0.5f;
    sprite.blend_mode = BlendMode::Add;
    NodeId node = scene.create_sprite(sprite);
    scene.add_child(parent, node);
    scene.transform(node).position = {1.0f, 2.0f};
    scene.transform(node).z_position = -1.0f;

    scene.generate_draw_commands(queue);
    ASSERT_EQ(queue.size(), 1u);
    const DrawCommand& cmd = queue.commands()[0];
    EXPECT_EQ(cmd.world_position, (Point{11.0f, 22.0f}));
    EXPECT_FLOAT_EQ(cmd.alpha, 0.5f);
    // z is the node's own, not accumulated.
    EXPECT_FLOAT_EQ(cmd.z_position, -1.0f);
    EXPECT_EQ(cmd.blend_mode, BlendMode::Add);
    EXPECT_EQ(cmd.color, (Color{1.0f, 0.5f, 0.5f, 1.0f}));
    EXPECT_EQ(cmd.warp_mesh, -1);
    EXPECT_EQ(cmd.size, (Size{16.0f, 16.0f}));
}

TEST(SpriteTest, EffectiveColor) {
    Sprite sprite;
    sprite.color = {0.2f, 0.4f, 0.6f, 1.0f};
    EXPECT_EQ(effective_color(sprite), sprite.color);

    sprite.texture_id = 5;
    EXPECT_EQ(effective_color(sprite), Color::white());
    sprite.color_blend_factor = 1.0f;
    EXPECT_EQ(effective_color(sprite), sprite.color);
}

TEST_F(SceneTest, HiddenAndTransparentSubtreesAreSkipped) {
    NodeId hidden = scene.create_node();
    scene.add_child(scene.root(), hidden);
    scene.transform(hidden).hidden = true;
    add_sprite(hidden, 1, 0.0f);

    NodeId faded = scene.create_node();
    scene.add_child(scene.root(), faded);
    scene.transform(faded).alpha = 0.0f;
    add_sprite(faded, 2, 0.0f);

    add_sprite(scene.root(), 3, 0.0f);

    // Detached sprites never draw.
    scene.create_sprite(textured(4));

    EXPECT_EQ(drawn_textures(), (std::vector<TextureID>{3}));

    scene.transform(hidden).hidden = false;
    EXPECT_EQ(drawn_textures(), (std::vector<TextureID>{1, 3}));
}

TEST_F(SceneTest, WarpedSpriteGetsMesh) {
    NodeId node = add_sprite(scene.root(), 1, 0.0f);
    scene.set_warp(node, WarpGeometryGrid::bulge(2, 2), 2);
    add_sprite(scene.root(), 2, 1.0f);

    scene.generate_draw_commands(queue);
    ASSERT_EQ(queue.size(), 2u);
    ASSERT_EQ(queue.warp_meshes().size(), 1u);
    EXPECT_EQ(queue.commands()[0].warp_mesh, 0);
    EXPECT_EQ(queue.commands()[1].warp_mesh, -1);
    EXPECT_EQ(queue.warp_meshes()[0].columns, 8);

    SimulationManager::Instance()->setMaxSubdivisionLevels(1);
    scene.generate_draw_commands(queue);
    EXPECT_EQ(queue.warp_meshes()[0].columns, 4);
    SimulationManager::Instance()->resetDefaults();
}

TEST_F(SceneTest, SubdivisionLevelsAreClamped) {
    NodeId node = scene.create_node();
    scene.set_warp(node, WarpGeometryGrid(), 7);
    EXPECT_EQ(scene.warp(node)->subdivision_levels, 3);
    scene.clear_warp(node);
    EXPECT_EQ(scene.warp(node), nullptr);
}

TEST_F(SceneTest, ChildOrderFollowsInsertion) {
    NodeId a = scene.create_node("a");
    NodeId b = scene.create_node("b");
    NodeId c = scene.create_node("c");
    scene.add_child(scene.root(), a);
    scene.add_child(scene.root(), c);
    scene.insert_child(scene.root(), b, 1);

    EXPECT_EQ(scene.children(scene.root()), (std::vector<NodeId>{a, b, c}));

    // Re-adding moves the node to the end.
    scene.add_child(scene.root(), a);
    EXPECT_EQ(scene.children(scene.root()), (std::vector<NodeId>{b, c, a}));

    scene.insert_child(scene.root(), a, 100);
    EXPECT_EQ(scene.children(scene.root()).back(), a);
}

TEST_F(SceneTest, InsertChildMovesWithinSameParent) {
    NodeId a = scene.create_node("a");
    NodeId b = scene.create_node("b");
    NodeId c = scene.create_node("c");
    for (NodeId n : {a, b, c}) scene.add_child(scene.root(), n);

    // Forward: the index is the final position.
    scene.insert_child(scene.root(), a, 2);
    EXPECT_EQ(scene.children(scene.root()), (std::vector<NodeId>{b, c, a}));

    // Backward.
    scene.insert_child(scene.root(), a, 0);
    EXPECT_EQ(scene.children(scene.root()), (std::vector<NodeId>{a, b, c}));

    scene.insert_child(scene.root(), a, 1);
    EXPECT_EQ(scene.children(scene.root()), (std::vector<NodeId>{b, a, c}));

    // Already there.
    scene.insert_child(scene.root(), a, 1);
    EXPECT_EQ(scene.children(scene.root()), (std::vector<NodeId>{b, a, c}));
}

TEST_F(SceneTest, LookupByName) {
    NodeId group = scene.create_node("group");
    scene.add_child(scene.root(), group);
    NodeId first = scene.create_node("enemy");
    NodeId second = scene.create_node("enemy");
    scene.add_child(group, first);
    scene.add_child(scene.root(), second);

    EXPECT_EQ(scene.child_node(scene.root(), "group"), group);
    EXPECT_EQ(scene.child_node(scene.root(), "missing"), kNullNode);
    EXPECT_EQ(scene.find_node("enemy"), first);
    EXPECT_EQ(scene.find_nodes("enemy"), (std::vector<NodeId>{first, second}));

    scene.set_name(second, "boss");
    EXPECT_EQ(scene.name(second), "boss");
    EXPECT_EQ(scene.find_nodes("enemy").size(), 1u);
}

TEST_F(SceneTest, DetachKeepsNodeAlive) {
    NodeId parent = scene.create_node();
    NodeId child = scene.create_node();
    scene.add_child(scene.root(), parent);
    scene.add_child(parent, child);

    scene.remove_from_parent(parent);
    EXPECT_TRUE(scene.contains(parent));
    EXPECT_FALSE(scene.in_tree(child));
    EXPECT_EQ(scene.parent(child), parent);

    scene.add_child(scene.root(), parent);
    EXPECT_TRUE(scene.in_tree(child));
    EXPECT_EQ(scene.depth(child), 2);
    EXPECT_EQ(scene.depth(scene.root()), 0);

    scene.remove_all_children(parent);
    EXPECT_TRUE(scene.children(parent).empty());
    EXPECT_TRUE(scene.contains(child));
}

TEST_F(SceneTest, DestroyRemovesSubtree) {
    NodeId parent = scene.create_node();
    NodeId child = scene.create_node();
    scene.add_child(scene.root(), parent);
    scene.add_child(parent, child);

    scene.destroy_node(parent);
    EXPECT_FALSE(scene.contains(parent));
    EXPECT_FALSE(scene.contains(child));
    EXPECT_EQ(scene.depth(child), -1);
    EXPECT_TRUE(scene.children(scene.root()).empty());
}

TEST_F(SceneTest, InvalidEditsThrow) {
    NodeId parent = scene.create_node();
    NodeId child = scene.create_node();
    scene.add_child(scene.root(), parent);
    scene.add_child(parent, child);

    EXPECT_THROW(scene.add_child(child, parent), HierarchyCycleException);
    EXPECT_THROW(scene.add_child(parent, parent), HierarchyCycleException);
    EXPECT_THROW(scene.add_child(parent, scene.root()), InvalidNodeException);
    EXPECT_THROW(scene.destroy_node(scene.root()), InvalidNodeException);

    scene.destroy_node(child);
    EXPECT_THROW(scene.add_child(parent, child), InvalidNodeException);
    EXPECT_THROW(scene.transform(child), InvalidNodeException);
    EXPECT_THROW(scene.set_sprite(child, Sprite{}), InvalidNodeException);

    // Both derive from the common scene error.
    EXPECT_THROW(scene.remove_from_parent(child), SceneException);
}

TEST_F(SceneTest, ShaderAttributesKeepTheirShape) {
    NodeId node = scene.create_node();
    scene.set_shader_attribute(node, "u_tint", Vec4{1.0f, 0.5f, 0.25f, 1.0f});
    scene.set_shader_attribute(node, "u_time", 2.5f);

    auto tint = scene.shader_attribute(node, "u_tint");
    ASSERT_TRUE(tint.has_value());
    EXPECT_EQ(type_of(*tint), ShaderAttributeType::Vec4);
    EXPECT_EQ(std::get<Vec4>(*tint).y, 0.5f);

    const auto& attributes = scene.registry().get<ShaderAttributes>(node);
    EXPECT_FALSE(attributes.get_as<float>("u_tint").has_value());
    EXPECT_FLOAT_EQ(*attributes.get_as<float>("u_time"), 2.5f);

    scene.set_shader_attribute(node, "u_time", Vec2{1.0f, 2.0f});
    EXPECT_EQ(type_of(*scene.shader_attribute(node, "u_time")), ShaderAttributeType::Vec2);

    EXPECT_TRUE(scene.remove_shader_attribute(node, "u_time"));
    EXPECT_FALSE(scene.remove_shader_attribute(node, "u_time"));
    EXPECT_FALSE(scene.shader_attribute(node, "u_time").has_value());
}

namespace {

class RecordingDelegate : public SceneDelegate {
   public:
    std::vector<std::string> calls;

    void update(Scene&, float) override { calls.push_back("update"); }
    void did_evaluate_actions(Scene&) override { calls.push_back("actions_done"); }
    void did_simulate_physics(Scene&) override { calls.push_back("physics_done"); }
    void did_apply_constraints(Scene&) override { calls.push_back("constraints_done"); }
    void did_apply_warps(Scene&) override { calls.push_back("warps_done"); }
    void did_finish_update(Scene&) override { calls.push_back("finished"); }
};

class RecordingPhysics : public PhysicsStepper {
   public:
    explicit RecordingPhysics(std::vector<std::string>& calls) : calls_(calls) {}

    void simulate(Scene&, float) override { calls_.push_back("simulate"); }

   private:
    std::vector<std::string>& calls_;
};

class CountingScene : public Scene {
   public:
    int updates{0};
    int actions{0};
    int finished{0};

    void update(float dt) override {
        Scene::update(dt);
        ++updates;
    }
    void did_evaluate_actions() override { ++actions; }
    void did_finish_update() override { ++finished; }
};

}  // namespace

TEST_F(SceneTest, FramePipelineRunsHooksInOrder) {
    RecordingDelegate delegate;
    RecordingPhysics physics(delegate.calls);
    bool callback_ran = false;
    scene.set_update_callback([&callback_ran](Scene&, float) { callback_ran = true; });
    scene.set_delegate(&delegate);
    scene.set_physics_stepper(&physics);

    scene.process_frame(1.0f / 60.0f);

    EXPECT_EQ(delegate.calls,
              (std::vector<std::string>{"update", "actions_done", "simulate", "physics_done",
                                        "constraints_done", "warps_done", "finished"}));
    EXPECT_FALSE(callback_ran);
    EXPECT_EQ(scene.frame_count(), 1u);
}

TEST(SceneSubclassTest, VirtualHooksRunWithoutDelegate) {
    CountingScene scene;
    int callbacks = 0;
    scene.set_update_callback([&callbacks](Scene&, float) { ++callbacks; });

    scene.process_frame(0.5f);
    scene.process_frame(0.5f);
    EXPECT_EQ(scene.updates, 2);
    EXPECT_EQ(scene.actions, 2);
    EXPECT_EQ(scene.finished, 2);
    EXPECT_EQ(callbacks, 2);
    EXPECT_DOUBLE_EQ(scene.current_time(), 1.0);
}

TEST_F(SceneTest, PausedSceneDoesNotAdvance) {
    int updates = 0;
    scene.set_update_callback([&updates](Scene&, float) { ++updates; });
    scene.set_paused(true);

    scene.process_frame(1.0f);
    EXPECT_EQ(updates, 0);
    EXPECT_DOUBLE_EQ(scene.current_time(), 0.0);
}

TEST_F(SceneTest, DescribeTreeIndentsChildren) {
    NodeId child = scene.create_node("child");
    scene.add_child(scene.root(), child);

    std::string tree = scene.describe_tree();
    EXPECT_NE(tree.find('\n'), std::string::npos);
    EXPECT_NE(tree.find("\n  "), std::string::npos);
}
