#include "audio/AudioEngine.hpp"

#include <algorithm>
#include <cmath>

#include "Logger.hpp"

namespace vellum {

void AudioEngine::start() {
    running_ = true;
    system_.set_master_volume(output_volume_);
}

void AudioEngine::pause() {
    running_ = false;
    system_.pause_all();
}

void AudioEngine::resume() {
    running_ = true;
    system_.resume_all();
}

void AudioEngine::stop() {
    running_ = false;
    system_.stop_all();
}

void AudioEngine::reset() {
    system_.stop_all();
    output_volume_ = 1.0f;
    running_ = true;
    Logger::getLogger()->debug("Audio engine reset");
}

void AudioEngine::set_output_volume(float volume) {
    output_volume_ = std::isnan(volume) ? 0.0f : std::clamp(volume, 0.0f, 1.0f);
}

}  // namespace vellum
