#ifndef VELLUM_FRAME_PACKET_HPP
#define VELLUM_FRAME_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "LowLevelRenderer/DrawCommand.hpp"
#include "audio/AudioTypes.hpp"
#include "geometry/AffineTransform.hpp"
#include "geometry/Geometry.hpp"

namespace vellum {

// Everything a host needs to present one frame. Plain aggregate so it can be
// handed across the scripting / renderer boundary as bytes.
struct FramePacket {
    std::vector<DrawCommand> draw_commands;
    std::vector<WarpMesh> warp_meshes;
    std::vector<AudioCommand> audio_commands;
    double interpolation_alpha{0.0};
    std::uint32_t updates_this_tick{0};
    double total_time{0.0};
    // Visible scene area and the scene-to-view matrix for a view of the
    // scene's size. Draw commands stay in scene coordinates.
    Rect viewport{};
    AffineTransform view_transform{};
};

// struct_pack encoding of the packet.
std::vector<char> serialize_frame_packet(const FramePacket& packet);

// Throws FramePacketException on truncated or malformed input.
FramePacket deserialize_frame_packet(const char* data, std::size_t size);

}  // namespace vellum

#endif  // VELLUM_FRAME_PACKET_HPP
