#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <entt/entt.hpp>
#include <string>

#include "GameLoop.hpp"
#include "Logger.hpp"
#include "SceneExceptions.hpp"
#include "SimulationSettings.hpp"
#include "actions/Action.hpp"
#include "bridge/FramePacket.hpp"
#include "constraints/Constraint.hpp"
#include "geometry/Range.hpp"
#include "geometry/AffineTransform.hpp"
#include "scene/Camera.hpp"
#include "scene/Scene.hpp"
#include "warp/WarpGeometryGrid.hpp"

// Create a shortcut for nanobind
namespace nb = nanobind;
using namespace nb::literals;
NB_MAKE_OPAQUE(vellum::NodeId);

using namespace vellum;

NB_MODULE(_vellum, m) {
    // Exceptions
    auto scene_exception = nb::exception<SceneException>(m, "SceneException", PyExc_RuntimeError);
    nb::exception<InvalidNodeException>(m, "InvalidNodeException", scene_exception);
    nb::exception<HierarchyCycleException>(m, "HierarchyCycleException", scene_exception);
    nb::exception<FramePacketException>(m, "FramePacketException", PyExc_ValueError);

    // Expose the Logger class
    nb::class_<Logger>(m, "Logger")
        .def(nb::init<>())
        .def_static("initialize", &Logger::initialize, "Initialize the logger")
        .def_static("shutdown", &Logger::shutdown, "Flush and drop the logger")
        .def_static("reinitialize", &Logger::reinitialize, "Rebuild the logger from the settings")
        .def("info", &Logger::info, "Log an info message")
        .def("warn", &Logger::warn, "Log a warning message")
        .def("error", &Logger::error, "Log an error message")
        .def("critical", &Logger::critical, "Log a critical message")
        .def("debug", &Logger::debug, "Log a debug message")
        .def("trace", &Logger::trace, "Log a trace message");

    nb::class_<SimulationSettings>(m, "SimulationSettings")
        .def(nb::init<>())
        .def("set_fixed_timestep", &SimulationSettings::setFixedTimestep)
        .def("set_max_frame_time", &SimulationSettings::setMaxFrameTime)
        .def("set_max_subdivision_levels", &SimulationSettings::setMaxSubdivisionLevels)
        .def("set_log_level", &SimulationSettings::setLogLevel)
        .def("set_log_file_path", &SimulationSettings::setLogFilePath)
        .def("reset_defaults", &SimulationSettings::resetDefaults)
        .def("get_fixed_timestep", &SimulationSettings::getFixedTimestep)
        .def("get_max_frame_time", &SimulationSettings::getMaxFrameTime)
        .def("get_max_subdivision_levels", &SimulationSettings::getMaxSubdivisionLevels)
        .def("get_log_level", &SimulationSettings::getLogLevel)
        .def("get_log_file_path", &SimulationSettings::getLogFilePath);

    // --- Geometry -------------------------------------------------------------

    nb::class_<Vec2>(m, "Vec2")
        .def(nb::init<>())
        .def("__init__", [](Vec2* v, float x, float y) { new (v) Vec2{x, y}; }, "x"_a, "y"_a)
        .def_rw("x", &Vec2::x)
        .def_rw("y", &Vec2::y)
        .def(nb::self + nb::self)
        .def(nb::self - nb::self)
        .def(nb::self * float())
        .def(nb::self == nb::self)
        .def("length", [](const Vec2& v) { return length(v); })
        .def("normalized", [](const Vec2& v) { return normalized(v); })
        .def("distance_to", [](const Vec2& a, const Vec2& b) { return distance(a, b); })
        .def("__repr__", [](const Vec2& v) {
            return "Vec2(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")";
        });
    m.attr("Point") = m.attr("Vec2");

    nb::class_<Vec3>(m, "Vec3")
        .def("__init__", [](Vec3* v, float x, float y, float z) { new (v) Vec3{x, y, z}; },
             "x"_a = 0.0f, "y"_a = 0.0f, "z"_a = 0.0f)
        .def_rw("x", &Vec3::x)
        .def_rw("y", &Vec3::y)
        .def_rw("z", &Vec3::z);

    nb::class_<Vec4>(m, "Vec4")
        .def("__init__",
             [](Vec4* v, float x, float y, float z, float w) { new (v) Vec4{x, y, z, w}; },
             "x"_a = 0.0f, "y"_a = 0.0f, "z"_a = 0.0f, "w"_a = 0.0f)
        .def_rw("x", &Vec4::x)
        .def_rw("y", &Vec4::y)
        .def_rw("z", &Vec4::z)
        .def_rw("w", &Vec4::w);

    nb::class_<Size>(m, "Size")
        .def("__init__", [](Size* s, float w, float h) { new (s) Size{w, h}; },
             "width"_a = 0.0f, "height"_a = 0.0f)
        .def_rw("width", &Size::width)
        .def_rw("height", &Size::height);

    nb::class_<Rect>(m, "Rect")
        .def("__init__",
             [](Rect* r, float x, float y, float w, float h) { new (r) Rect{{x, y}, {w, h}}; },
             "x"_a = 0.0f, "y"_a = 0.0f, "width"_a = 0.0f, "height"_a = 0.0f)
        .def_rw("origin", &Rect::origin)
        .def_rw("size", &Rect::size)
        .def("contains", &Rect::contains)
        .def("intersects", &Rect::intersects);

    nb::class_<Color>(m, "Color")
        .def("__init__",
             [](Color* c, float r, float g, float b, float a) { new (c) Color{r, g, b, a}; },
             "r"_a = 1.0f, "g"_a = 1.0f, "b"_a = 1.0f, "a"_a = 1.0f)
        .def_rw("r", &Color::r)
        .def_rw("g", &Color::g)
        .def_rw("b", &Color::b)
        .def_rw("a", &Color::a);

    nb::class_<Range>(m, "Range")
        .def(nb::init<>())
        .def(nb::init<float, float>(), "lower"_a, "upper"_a)
        .def_static("with_variance", &Range::with_variance, "value"_a, "variance"_a)
        .def_static("lower_only", &Range::lower_only)
        .def_static("upper_only", &Range::upper_only)
        .def_static("constant", &Range::constant)
        .def_static("no_limits", &Range::no_limits)
        .def_prop_ro("lower", &Range::lower)
        .def_prop_ro("upper", &Range::upper)
        .def("clamp", &Range::clamp)
        .def("contains", &Range::contains);

    // --- Input ----------------------------------------------------------------

    nb::class_<InputState>(m, "InputState")
        .def(nb::init<>())
        .def_rw("up", &InputState::up)
        .def_rw("down", &InputState::down)
        .def_rw("left", &InputState::left)
        .def_rw("right", &InputState::right)
        .def_rw("action", &InputState::action)
        .def_rw("action2", &InputState::action2)
        .def_rw("pause", &InputState::pause)
        .def_rw("pointer_position", &InputState::pointer_position)
        .def_rw("pointer_down", &InputState::pointer_down)
        .def_ro("pointer_just_pressed", &InputState::pointer_just_pressed)
        .def_ro("pointer_just_released", &InputState::pointer_just_released)
        .def("direction", &InputState::direction)
        .def("has_directional_input", &InputState::has_directional_input)
        .def("has_action_input", &InputState::has_action_input)
        .def("has_any_input", &InputState::has_any_input);

    // --- Nodes ----------------------------------------------------------------

    // Exposing NodeId as an opaque node handle
    nb::class_<NodeId>(m, "Node")
        .def("__repr__",
             [](const NodeId& e) {
                 return "<Node " + std::to_string(static_cast<uint64_t>(e)) + ">";
             })
        .def("__eq__", [](const NodeId& a, const NodeId& b) { return a == b; })
        .def("__hash__", [](const NodeId& e) { return static_cast<uint64_t>(e); })
        .def(
            "get_id", [](const NodeId& e) { return static_cast<uint64_t>(e); },
            "Get the raw handle value of the node");

    nb::enum_<BlendMode>(m, "BlendMode")
        .value("ALPHA", BlendMode::Alpha)
        .value("ADD", BlendMode::Add)
        .value("SUBTRACT", BlendMode::Subtract)
        .value("MULTIPLY", BlendMode::Multiply)
        .value("MULTIPLY_X2", BlendMode::MultiplyX2)
        .value("SCREEN", BlendMode::Screen)
        .value("REPLACE", BlendMode::Replace)
        .value("MULTIPLY_ALPHA", BlendMode::MultiplyAlpha);

    nb::enum_<TextureFilteringMode>(m, "TextureFilteringMode")
        .value("NEAREST", TextureFilteringMode::Nearest)
        .value("LINEAR", TextureFilteringMode::Linear);

    nb::class_<Transform>(m, "Transform")
        .def(nb::init<>())
        .def_rw("position", &Transform::position)
        .def_rw("rotation", &Transform::rotation)
        .def_rw("scale", &Transform::scale)
        .def_rw("z_position", &Transform::z_position)
        .def_rw("alpha", &Transform::alpha)
        .def_rw("hidden", &Transform::hidden);

    nb::class_<Sprite>(m, "Sprite")
        .def(nb::init<>())
        .def_rw("size", &Sprite::size)
        .def_rw("anchor_point", &Sprite::anchor_point)
        .def_rw("texture_id", &Sprite::texture_id)
        .def_rw("texture_rect", &Sprite::texture_rect)
        .def_rw("filtering_mode", &Sprite::filtering_mode)
        .def_rw("uses_mipmaps", &Sprite::uses_mipmaps)
        .def_rw("color", &Sprite::color)
        .def_rw("color_blend_factor", &Sprite::color_blend_factor)
        .def_rw("blend_mode", &Sprite::blend_mode)
        .def_rw("center_rect", &Sprite::center_rect);

    nb::class_<PhysicsBody>(m, "PhysicsBody")
        .def(nb::init<>())
        .def_rw("body_id", &PhysicsBody::body_id)
        .def_rw("dynamic", &PhysicsBody::dynamic);

    nb::class_<Constraint>(m, "Constraint")
        .def_static("position_x", &Constraint::position_x)
        .def_static("position_y", &Constraint::position_y)
        .def_static("position_in_rect", &Constraint::position_in_rect)
        .def_static("distance", &Constraint::distance, "range"_a, "target"_a)
        .def_static("rotation", &Constraint::rotation)
        .def_static("rotation_degrees", &Constraint::rotation_degrees)
        .def_static("orient_to_node", &Constraint::orient_to_node, "target"_a, "offset"_a = 0.0f)
        .def_static("orient_to_point", &Constraint::orient_to_point, "point"_a,
                    "offset"_a = 0.0f)
        .def_prop_rw("enabled", &Constraint::enabled, &Constraint::set_enabled);

    // --- Actions --------------------------------------------------------------

    nb::enum_<ActionTimingMode>(m, "ActionTimingMode")
        .value("LINEAR", ActionTimingMode::Linear)
        .value("EASE_IN", ActionTimingMode::EaseIn)
        .value("EASE_OUT", ActionTimingMode::EaseOut)
        .value("EASE_IN_OUT", ActionTimingMode::EaseInOut);

    nb::class_<Action>(m, "Action")
        .def_static("move_to", &Action::move_to, "position"_a, "duration"_a)
        .def_static("move_by", &Action::move_by, "delta"_a, "duration"_a)
        .def_static("rotate_to", &Action::rotate_to, "radians"_a, "duration"_a)
        .def_static("rotate_by", &Action::rotate_by, "radians"_a, "duration"_a)
        .def_static("scale_to", nb::overload_cast<float, float>(&Action::scale_to), "scale"_a,
                    "duration"_a)
        .def_static("scale_to", nb::overload_cast<Vec2, float>(&Action::scale_to), "scale"_a,
                    "duration"_a)
        .def_static("scale_by", nb::overload_cast<float, float>(&Action::scale_by), "factor"_a,
                    "duration"_a)
        .def_static("scale_by", nb::overload_cast<Vec2, float>(&Action::scale_by), "factor"_a,
                    "duration"_a)
        .def_static("fade_to", &Action::fade_to, "alpha"_a, "duration"_a)
        .def_static("fade_by", &Action::fade_by, "delta"_a, "duration"_a)
        .def_static("fade_in", &Action::fade_in, "duration"_a)
        .def_static("fade_out", &Action::fade_out, "duration"_a)
        .def_static("wait", &Action::wait, "duration"_a)
        .def_static("hide", &Action::hide)
        .def_static("unhide", &Action::unhide)
        .def_static("remove_from_parent", &Action::remove_from_parent)
        .def_static("run", &Action::run, "block"_a)
        .def_static("sequence", &Action::sequence, "actions"_a)
        .def_static("group", &Action::group, "actions"_a)
        .def_static("repeat", &Action::repeat, "action"_a, "count"_a)
        .def_static("repeat_forever", &Action::repeat_forever, "action"_a)
        .def_prop_ro("duration", &Action::duration)
        .def_prop_rw("timing_mode", &Action::timing_mode, &Action::set_timing_mode)
        .def_prop_rw("speed", &Action::speed, &Action::set_speed)
        .def_prop_ro("is_complete", &Action::is_complete);

    // --- Camera ---------------------------------------------------------------

    nb::class_<AffineTransform>(m, "AffineTransform")
        .def(nb::init<>())
        .def_rw("a", &AffineTransform::a)
        .def_rw("b", &AffineTransform::b)
        .def_rw("c", &AffineTransform::c)
        .def_rw("d", &AffineTransform::d)
        .def_rw("tx", &AffineTransform::tx)
        .def_rw("ty", &AffineTransform::ty)
        .def("apply", &AffineTransform::apply);

    m.def("camera_viewport", &camera_viewport, "position"_a, "scale"_a, "scene_size"_a);
    m.def("camera_smooth_follow", &camera_smooth_follow, "camera"_a, "target"_a, "smoothing"_a,
          "dt"_a);
    m.def("camera_clamp_to_bounds", &camera_clamp_to_bounds, "camera"_a, "bounds"_a,
          "scene_size"_a);
    m.def("set_camera_zoom", &set_camera_zoom, "camera"_a, "zoom"_a);

    // --- Warps ----------------------------------------------------------------

    nb::class_<WarpGeometryGrid>(m, "WarpGeometryGrid")
        .def(nb::init<int, int>(), "columns"_a = 1, "rows"_a = 1)
        .def_prop_ro("columns", &WarpGeometryGrid::columns)
        .def_prop_ro("rows", &WarpGeometryGrid::rows)
        .def_prop_ro("vertex_count", &WarpGeometryGrid::vertex_count)
        .def("vertex_index", &WarpGeometryGrid::vertex_index)
        .def("source_position",
             nb::overload_cast<int>(&WarpGeometryGrid::source_position, nb::const_))
        .def("destination_position",
             nb::overload_cast<int>(&WarpGeometryGrid::destination_position, nb::const_))
        .def("set_destination_position",
             nb::overload_cast<int, Point>(&WarpGeometryGrid::set_destination_position))
        .def("set_destination_position_at",
             nb::overload_cast<int, int, Point>(&WarpGeometryGrid::set_destination_position))
        .def("source_positions", &WarpGeometryGrid::source_positions)
        .def("destination_positions", &WarpGeometryGrid::destination_positions)
        .def("set_all_destination_positions", &WarpGeometryGrid::set_all_destination_positions)
        .def("reset_destinations", &WarpGeometryGrid::reset_destinations)
        .def_static("interpolate", &WarpGeometryGrid::interpolate, "from_grid"_a, "to_grid"_a,
                    "progress"_a)
        .def_static("wave", &WarpGeometryGrid::wave, "columns"_a, "rows"_a, "amplitude"_a,
                    "frequency"_a, "phase"_a = 0.0f, "horizontal"_a = true)
        .def_static("bulge", &WarpGeometryGrid::bulge, "columns"_a, "rows"_a,
                    "center"_a = Point{0.5f, 0.5f}, "radius"_a = 0.5f, "strength"_a = 0.3f)
        .def_static("twist", &WarpGeometryGrid::twist, "columns"_a, "rows"_a,
                    "center"_a = Point{0.5f, 0.5f}, "radius"_a = 0.5f, "angle"_a = kPi / 4.0f);

    // --- Commands -------------------------------------------------------------

    nb::class_<DrawCommand>(m, "DrawCommand")
        .def_ro("world_position", &DrawCommand::world_position)
        .def_ro("world_rotation", &DrawCommand::world_rotation)
        .def_ro("world_scale", &DrawCommand::world_scale)
        .def_ro("size", &DrawCommand::size)
        .def_ro("anchor_point", &DrawCommand::anchor_point)
        .def_ro("texture_id", &DrawCommand::texture_id)
        .def_ro("texture_rect", &DrawCommand::texture_rect)
        .def_ro("filtering_mode", &DrawCommand::filtering_mode)
        .def_ro("uses_mipmaps", &DrawCommand::uses_mipmaps)
        .def_ro("color", &DrawCommand::color)
        .def_ro("alpha", &DrawCommand::alpha)
        .def_ro("z_position", &DrawCommand::z_position)
        .def_ro("blend_mode", &DrawCommand::blend_mode)
        .def_ro("center_rect", &DrawCommand::center_rect)
        .def_ro("warp_mesh", &DrawCommand::warp_mesh);

    nb::class_<WarpMesh>(m, "WarpMesh")
        .def_ro("columns", &WarpMesh::columns)
        .def_ro("rows", &WarpMesh::rows)
        .def_ro("uvs", &WarpMesh::uvs)
        .def_ro("positions", &WarpMesh::positions);

    nb::enum_<AudioCommandType>(m, "AudioCommandType")
        .value("PLAY", AudioCommandType::Play)
        .value("STOP", AudioCommandType::Stop)
        .value("SET_VOLUME", AudioCommandType::SetVolume)
        .value("STOP_ALL", AudioCommandType::StopAll)
        .value("SET_MASTER_VOLUME", AudioCommandType::SetMasterVolume)
        .value("PAUSE_ALL", AudioCommandType::PauseAll)
        .value("RESUME_ALL", AudioCommandType::ResumeAll);

    m.attr("CHANNEL_SFX") = AudioChannel::kSfx;
    m.attr("CHANNEL_MUSIC") = AudioChannel::kMusic;
    m.attr("CHANNEL_AMBIENT") = AudioChannel::kAmbient;
    m.attr("CHANNEL_VOICE") = AudioChannel::kVoice;

    nb::class_<AudioCommand>(m, "AudioCommand")
        .def_ro("type", &AudioCommand::type)
        .def_ro("sound_id", &AudioCommand::sound_id)
        .def_ro("channel", &AudioCommand::channel)
        .def_ro("volume", &AudioCommand::volume)
        .def_ro("pitch", &AudioCommand::pitch)
        .def_ro("pan", &AudioCommand::pan)
        .def_ro("loops", &AudioCommand::loops)
        .def_ro("fade_duration", &AudioCommand::fade_duration);

    nb::class_<AudioSystem>(m, "AudioSystem")
        .def("play", &AudioSystem::play, "sound_id"_a, "volume"_a = 1.0f, "pitch"_a = 1.0f,
             "pan"_a = 0.0f)
        .def("play_music", &AudioSystem::play_music, "sound_id"_a, "volume"_a = 1.0f,
             "fade_duration"_a = 0.0f)
        .def("stop_music", &AudioSystem::stop_music, "fade_duration"_a = 0.0f)
        .def("set_music_volume", &AudioSystem::set_music_volume, "volume"_a,
             "fade_duration"_a = 0.0f)
        .def("play_ambient", &AudioSystem::play_ambient, "sound_id"_a, "volume"_a = 1.0f,
             "fade_duration"_a = 0.0f)
        .def("stop_ambient", &AudioSystem::stop_ambient, "fade_duration"_a = 0.0f)
        .def("play_on_channel", &AudioSystem::play_on_channel, "sound_id"_a, "channel"_a,
             "volume"_a = 1.0f, "pitch"_a = 1.0f, "pan"_a = 0.0f, "loops"_a = false,
             "fade_duration"_a = 0.0f)
        .def("stop", &AudioSystem::stop, "channel"_a, "fade_duration"_a = 0.0f)
        .def("set_volume", &AudioSystem::set_volume, "volume"_a, "channel"_a,
             "fade_duration"_a = 0.0f)
        .def("stop_all", &AudioSystem::stop_all, "fade_duration"_a = 0.0f)
        .def("has_commands", &AudioSystem::has_commands);

    nb::class_<AudioEngine>(m, "AudioEngine")
        .def("start", &AudioEngine::start)
        .def("pause", &AudioEngine::pause)
        .def("resume", &AudioEngine::resume)
        .def("stop", &AudioEngine::stop)
        .def("reset", &AudioEngine::reset)
        .def_prop_rw("output_volume", &AudioEngine::output_volume, &AudioEngine::set_output_volume)
        .def_prop_ro("is_running", &AudioEngine::is_running)
        .def("system", nb::overload_cast<>(&AudioEngine::system), nb::rv_policy::reference_internal);

    // --- Scene ----------------------------------------------------------------

    nb::class_<Scene>(m, "Scene")
        .def(nb::init<Size>(), "size"_a = Size{})
        .def_prop_ro("root", &Scene::root)
        .def("create_node", &Scene::create_node, "name"_a = std::string{})
        .def("create_sprite", &Scene::create_sprite, "sprite"_a, "name"_a = std::string{})
        .def("add_child", &Scene::add_child, "parent"_a, "child"_a)
        .def("insert_child", &Scene::insert_child, "parent"_a, "child"_a, "index"_a)
        .def("remove_from_parent", &Scene::remove_from_parent)
        .def("remove_all_children", &Scene::remove_all_children)
        .def("destroy_node", &Scene::destroy_node)
        .def("contains", &Scene::contains)
        .def("parent", &Scene::parent)
        .def("children", &Scene::children)
        .def("child_node", &Scene::child_node, "parent"_a, "name"_a)
        .def("find_node", &Scene::find_node)
        .def("find_nodes", &Scene::find_nodes)
        .def("depth", &Scene::depth)
        .def("in_tree", &Scene::in_tree)
        .def("transform", nb::overload_cast<NodeId>(&Scene::transform),
             nb::rv_policy::reference_internal)
        .def("set_name", &Scene::set_name)
        .def("name", &Scene::name)
        .def("set_sprite", &Scene::set_sprite, nb::rv_policy::reference_internal)
        .def("sprite", &Scene::sprite, nb::rv_policy::reference_internal)
        .def("add_constraint", &Scene::add_constraint)
        .def("clear_constraints", &Scene::clear_constraints)
        .def("set_warp", &Scene::set_warp, "node"_a, "grid"_a, "subdivision_levels"_a = 0)
        .def("clear_warp", &Scene::clear_warp)
        .def("warp_to", &Scene::warp_to, "node"_a, "target"_a, "duration"_a)
        .def("animate_with_warps",
             nb::overload_cast<NodeId, const std::vector<WarpGeometryGrid>&,
                               const std::vector<float>&>(&Scene::animate_with_warps),
             "node"_a, "grids"_a, "times"_a)
        .def("animate_with_warps",
             nb::overload_cast<NodeId, const std::vector<WarpGeometryGrid>&, float>(
                 &Scene::animate_with_warps),
             "node"_a, "grids"_a, "duration"_a)
        .def("run_action", &Scene::run_action, "node"_a, "action"_a, "key"_a = std::string{})
        .def("remove_action", &Scene::remove_action, "node"_a, "key"_a)
        .def("remove_all_actions", &Scene::remove_all_actions)
        .def("has_actions", &Scene::has_actions)
        .def("action", &Scene::action, "node"_a, "key"_a, nb::rv_policy::reference_internal)
        .def_prop_rw("camera", &Scene::camera, &Scene::set_camera)
        .def_prop_ro("viewport", &Scene::viewport)
        .def("view_transform", &Scene::view_transform, "view_size"_a)
        .def("camera_contains", &Scene::camera_contains)
        .def("visible_nodes", &Scene::visible_nodes)
        .def("set_shader_attribute", &Scene::set_shader_attribute)
        .def("shader_attribute", &Scene::shader_attribute)
        .def("remove_shader_attribute", &Scene::remove_shader_attribute)
        .def("set_physics_body", &Scene::set_physics_body)
        .def("world_position", &Scene::world_position)
        .def("world_rotation", &Scene::world_rotation)
        .def("world_scale", &Scene::world_scale)
        .def("world_alpha", &Scene::world_alpha)
        .def("set_update_callback", &Scene::set_update_callback)
        .def_prop_rw("paused", &Scene::is_paused, &Scene::set_paused)
        .def_prop_ro("input", &Scene::input)
        .def_prop_ro("current_time", &Scene::current_time)
        .def("audio", nb::overload_cast<>(&Scene::audio), nb::rv_policy::reference_internal)
        .def("describe_tree", &Scene::describe_tree);

    // --- Frame output ---------------------------------------------------------

    nb::class_<FramePacket>(m, "FramePacket")
        .def(nb::init<>())
        .def_ro("draw_commands", &FramePacket::draw_commands)
        .def_ro("warp_meshes", &FramePacket::warp_meshes)
        .def_ro("audio_commands", &FramePacket::audio_commands)
        .def_ro("interpolation_alpha", &FramePacket::interpolation_alpha)
        .def_ro("updates_this_tick", &FramePacket::updates_this_tick)
        .def_ro("total_time", &FramePacket::total_time)
        .def_ro("viewport", &FramePacket::viewport)
        .def_ro("view_transform", &FramePacket::view_transform)
        .def("serialize",
             [](const FramePacket& packet) {
                 std::vector<char> buffer = serialize_frame_packet(packet);
                 return nb::bytes(buffer.data(), buffer.size());
             })
        .def_static("deserialize", [](nb::bytes data) {
            return deserialize_frame_packet(data.c_str(), data.size());
        });

    nb::class_<GameLoop>(m, "GameLoop")
        .def(nb::init<double>(), "fixed_timestep"_a = SimulationManager::kDefaultFixedTimestep)
        .def("present", &GameLoop::present)
        .def("remove_scene", &GameLoop::remove_scene)
        .def_prop_ro("scene", &GameLoop::scene)
        .def("tick", &GameLoop::tick, "real_delta_time"_a, "input"_a)
        .def("step", &GameLoop::step, "input"_a)
        .def("reset", &GameLoop::reset)
        .def("generate_draw_commands", &GameLoop::generate_draw_commands)
        .def("warp_meshes", &GameLoop::warp_meshes)
        .def("consume_audio_commands", &GameLoop::consume_audio_commands)
        .def("build_frame_packet", &GameLoop::build_frame_packet)
        .def_prop_ro("interpolation_alpha", &GameLoop::interpolation_alpha)
        .def_prop_ro("updates_this_tick", &GameLoop::updates_this_tick)
        .def_prop_ro("total_time", &GameLoop::total_time)
        .def_prop_ro("updates_per_second", &GameLoop::updates_per_second)
        .def_prop_rw("fixed_timestep", &GameLoop::fixed_timestep, &GameLoop::set_fixed_timestep)
        .def_prop_rw("max_frame_time", &GameLoop::max_frame_time, &GameLoop::set_max_frame_time);
}
