#ifndef VELLUM_AUDIO_ENGINE_HPP
#define VELLUM_AUDIO_ENGINE_HPP

#include <vector>

#include "audio/AudioSystem.hpp"

namespace vellum {

// Scene-level audio controls. Playback state lives in the backend; this only
// records the running flag and the mixer volume and emits commands.
class AudioEngine {
   public:
    // Emits the mixer volume as the master volume.
    void start();
    void pause();
    void resume();
    void stop();
    // Stops everything, restores full volume and marks the engine running.
    void reset();

    // Clamped to [0, 1]; sent to the backend on the next start().
    void set_output_volume(float volume);
    float output_volume() const { return output_volume_; }

    bool is_running() const { return running_; }

    AudioSystem& system() { return system_; }
    const AudioSystem& system() const { return system_; }

    void begin_frame() { system_.begin_frame(); }
    std::vector<AudioCommand> consume_commands() { return system_.consume_commands(); }
    bool has_commands() const { return system_.has_commands(); }

   private:
    AudioSystem system_;
    float output_volume_{1.0f};
    bool running_{true};
};

}  // namespace vellum

#endif  // VELLUM_AUDIO_ENGINE_HPP
