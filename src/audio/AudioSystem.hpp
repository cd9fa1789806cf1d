#ifndef VELLUM_AUDIO_SYSTEM_HPP
#define VELLUM_AUDIO_SYSTEM_HPP

#include <cstdint>
#include <vector>

#include "audio/AudioTypes.hpp"

namespace vellum {

/**
 * @brief Per-frame queue of audio intents.
 *
 * Every call appends exactly one AudioCommand with its values clamped:
 * volume to [0, 1], pan to [-1, 1], pitch to at least 0.1 and fade duration
 * to at least 0. Nothing here touches simulation state.
 */
class AudioSystem {
   public:
    // --- Sound effects (channel 0) ---
    void play(std::uint16_t sound_id, float volume = 1.0f, float pitch = 1.0f, float pan = 0.0f);

    // --- Music (channel 1, looping) ---
    void play_music(std::uint16_t sound_id, float volume = 1.0f, float fade_duration = 0.0f);
    void stop_music(float fade_duration = 0.0f);
    void set_music_volume(float volume, float fade_duration = 0.0f);

    // --- Ambient (channel 2, looping) ---
    void play_ambient(std::uint16_t sound_id, float volume = 1.0f, float fade_duration = 0.0f);
    void stop_ambient(float fade_duration = 0.0f);

    // --- Any channel ---
    void play_on_channel(std::uint16_t sound_id, std::uint8_t channel, float volume = 1.0f,
                         float pitch = 1.0f, float pan = 0.0f, bool loops = false,
                         float fade_duration = 0.0f);
    void stop(std::uint8_t channel, float fade_duration = 0.0f);
    void set_volume(float volume, std::uint8_t channel, float fade_duration = 0.0f);
    void stop_all(float fade_duration = 0.0f);

    // --- Engine-level, issued by AudioEngine ---
    void set_master_volume(float volume);
    void pause_all();
    void resume_all();

    // --- Frame handoff ---
    void begin_frame() { buffer_.clear(); }
    std::vector<AudioCommand> consume_commands() { return buffer_.consume(); }
    bool has_commands() const { return !buffer_.empty(); }
    const std::vector<AudioCommand>& pending_commands() const { return buffer_.commands(); }

   private:
    AudioCommandBuffer buffer_;

    void emit_(AudioCommandType type, std::uint16_t sound_id, std::uint8_t channel, float volume,
               float pitch, float pan, bool loops, float fade_duration);
};

}  // namespace vellum

#endif  // VELLUM_AUDIO_SYSTEM_HPP
