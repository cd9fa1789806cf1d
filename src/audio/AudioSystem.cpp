#include "audio/AudioSystem.hpp"

#include <algorithm>
#include <cmath>

namespace vellum {

namespace {

constexpr float kMinPitch = 0.1f;

// NaN collapses to the lower bound so it can never reach the backend.
float clamp_finite(float value, float lo, float hi) {
    if (std::isnan(value)) return lo;
    return std::clamp(value, lo, hi);
}

float floor_at(float value, float lo) {
    if (std::isnan(value)) return lo;
    return std::max(lo, value);
}

}  // namespace

void AudioSystem::emit_(AudioCommandType type, std::uint16_t sound_id, std::uint8_t channel,
                        float volume, float pitch, float pan, bool loops, float fade_duration) {
    AudioCommand command;
    command.type = type;
    command.sound_id = sound_id;
    command.channel = channel;
    command.volume = clamp_finite(volume, 0.0f, 1.0f);
    command.pitch = floor_at(pitch, kMinPitch);
    command.pan = clamp_finite(pan, -1.0f, 1.0f);
    command.loops = loops;
    command.fade_duration = floor_at(fade_duration, 0.0f);
    buffer_.append(command);
}

void AudioSystem::play(std::uint16_t sound_id, float volume, float pitch, float pan) {
    emit_(AudioCommandType::Play, sound_id, AudioChannel::kSfx, volume, pitch, pan, false, 0.0f);
}

void AudioSystem::play_music(std::uint16_t sound_id, float volume, float fade_duration) {
    emit_(AudioCommandType::Play, sound_id, AudioChannel::kMusic, volume, 1.0f, 0.0f, true,
          fade_duration);
}

void AudioSystem::stop_music(float fade_duration) {
    emit_(AudioCommandType::Stop, 0, AudioChannel::kMusic, 0.0f, 1.0f, 0.0f, false, fade_duration);
}

void AudioSystem::set_music_volume(float volume, float fade_duration) {
    emit_(AudioCommandType::SetVolume, 0, AudioChannel::kMusic, volume, 1.0f, 0.0f, false,
          fade_duration);
}

void AudioSystem::play_ambient(std::uint16_t sound_id, float volume, float fade_duration) {
    emit_(AudioCommandType::Play, sound_id, AudioChannel::kAmbient, volume, 1.0f, 0.0f, true,
          fade_duration);
}

void AudioSystem::stop_ambient(float fade_duration) {
    emit_(AudioCommandType::Stop, 0, AudioChannel::kAmbient, 0.0f, 1.0f, 0.0f, false,
          fade_duration);
}

void AudioSystem::play_on_channel(std::uint16_t sound_id, std::uint8_t channel, float volume,
                                  float pitch, float pan, bool loops, float fade_duration) {
    emit_(AudioCommandType::Play, sound_id, channel, volume, pitch, pan, loops, fade_duration);
}

void AudioSystem::stop(std::uint8_t channel, float fade_duration) {
    emit_(AudioCommandType::Stop, 0, channel, 0.0f, 1.0f, 0.0f, false, fade_duration);
}

void AudioSystem::set_volume(float volume, std::uint8_t channel, float fade_duration) {
    emit_(AudioCommandType::SetVolume, 0, channel, volume, 1.0f, 0.0f, false, fade_duration);
}

void AudioSystem::stop_all(float fade_duration) {
    emit_(AudioCommandType::StopAll, 0, AudioChannel::kSfx, 0.0f, 1.0f, 0.0f, false,
          fade_duration);
}

void AudioSystem::set_master_volume(float volume) {
    emit_(AudioCommandType::SetMasterVolume, 0, AudioChannel::kSfx, volume, 1.0f, 0.0f, false,
          0.0f);
}

void AudioSystem::pause_all() {
    emit_(AudioCommandType::PauseAll, 0, AudioChannel::kSfx, 0.0f, 1.0f, 0.0f, false, 0.0f);
}

void AudioSystem::resume_all() {
    emit_(AudioCommandType::ResumeAll, 0, AudioChannel::kSfx, 0.0f, 1.0f, 0.0f, false, 0.0f);
}

}  // namespace vellum
