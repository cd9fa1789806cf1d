#ifndef VELLUM_AUDIO_TYPES_HPP
#define VELLUM_AUDIO_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <vector>

namespace vellum {

enum class AudioCommandType : std::uint8_t {
    Play = 0,
    Stop = 1,
    SetVolume = 2,
    StopAll = 3,
    SetMasterVolume = 4,
    PauseAll = 5,
    ResumeAll = 6
};

// Channel 0 mixes any number of overlapping sounds. Every other channel holds
// one sound; the backend stops the previous one when a new Play arrives.
namespace AudioChannel {
inline constexpr std::uint8_t kSfx = 0;
inline constexpr std::uint8_t kMusic = 1;
inline constexpr std::uint8_t kAmbient = 2;
inline constexpr std::uint8_t kVoice = 3;
}  // namespace AudioChannel

// Plain data handed to the audio backend once per frame.
struct AudioCommand {
    AudioCommandType type{AudioCommandType::Play};
    std::uint16_t sound_id{0};
    std::uint8_t channel{AudioChannel::kSfx};
    float volume{1.0f};  // [0, 1]
    float pitch{1.0f};   // >= 0.1
    float pan{0.0f};     // [-1, 1]
    bool loops{false};
    float fade_duration{0.0f};  // seconds, >= 0

    bool operator==(const AudioCommand&) const = default;
};

class AudioCommandBuffer {
   public:
    void append(const AudioCommand& command) { commands_.push_back(command); }

    void clear() { commands_.clear(); }

    // Hands over everything queued so far and leaves the buffer empty.
    std::vector<AudioCommand> consume() {
        std::vector<AudioCommand> out;
        out.swap(commands_);
        return out;
    }

    const std::vector<AudioCommand>& commands() const { return commands_; }
    bool empty() const { return commands_.empty(); }
    std::size_t size() const { return commands_.size(); }

   private:
    std::vector<AudioCommand> commands_;
};

}  // namespace vellum

#endif  // VELLUM_AUDIO_TYPES_HPP
