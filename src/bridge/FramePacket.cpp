#include "bridge/FramePacket.hpp"

#include <string>
#include <utility>
#include <ylt/struct_pack.hpp>

#include "Logger.hpp"
#include "SceneExceptions.hpp"

namespace vellum {

std::vector<char> serialize_frame_packet(const FramePacket& packet) {
    std::vector<char> buffer;
    struct_pack::serialize_to(buffer, packet);
    return buffer;
}

FramePacket deserialize_frame_packet(const char* data, std::size_t size) {
    size_t consume_len = 0;
    auto result = struct_pack::deserialize<FramePacket>(data, size, consume_len);
    if (!result) {
        Logger::getLogger()->error("Failed to decode frame packet of {} bytes", size);
        throw FramePacketException("Failed to deserialize FramePacket");
    }
    if (consume_len != size) {
        throw FramePacketException("FramePacket has " + std::to_string(size - consume_len) +
                                   " trailing bytes");
    }
    return std::move(result.value());
}

}  // namespace vellum
