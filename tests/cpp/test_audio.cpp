#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "audio/AudioEngine.hpp"
#include "audio/AudioSystem.hpp"

using namespace vellum;

TEST(AudioSystemTest, PlayUsesSfxChannelAndClampsValues) {
    AudioSystem audio;
    audio.play(5, 2.0f, 0.0f, -3.0f);

    auto commands = audio.consume_commands();
    ASSERT_EQ(commands.size(), 1u);
    const AudioCommand& cmd = commands[0];
    EXPECT_EQ(cmd.type, AudioCommandType::Play);
    EXPECT_EQ(cmd.sound_id, 5);
    EXPECT_EQ(cmd.channel, AudioChannel::kSfx);
    EXPECT_FLOAT_EQ(cmd.volume, 1.0f);
    EXPECT_FLOAT_EQ(cmd.pitch, 0.1f);
    EXPECT_FLOAT_EQ(cmd.pan, -1.0f);
    EXPECT_FALSE(cmd.loops);
}

TEST(AudioSystemTest, NanCollapsesToLowerBound) {
    AudioSystem audio;
    const float nan = std::numeric_limits<float>::quiet_NaN();
    audio.play_on_channel(1, AudioChannel::kVoice, nan, nan, nan, false, nan);

    const AudioCommand& cmd = audio.pending_commands().at(0);
    EXPECT_FLOAT_EQ(cmd.volume, 0.0f);
    EXPECT_FLOAT_EQ(cmd.pitch, 0.1f);
    EXPECT_FLOAT_EQ(cmd.pan, -1.0f);
    EXPECT_FLOAT_EQ(cmd.fade_duration, 0.0f);
}

TEST(AudioSystemTest, MusicAndAmbientLoopOnTheirChannels) {
    AudioSystem audio;
    audio.play_music(10, 0.5f, 2.0f);
    audio.set_music_volume(0.25f, 1.0f);
    audio.stop_music(-1.0f);
    audio.play_ambient(11);
    audio.stop_ambient(0.5f);

    auto commands = audio.consume_commands();
    ASSERT_EQ(commands.size(), 5u);

    EXPECT_EQ(commands[0].channel, AudioChannel::kMusic);
    EXPECT_TRUE(commands[0].loops);
    EXPECT_FLOAT_EQ(commands[0].fade_duration, 2.0f);

    EXPECT_EQ(commands[1].type, AudioCommandType::SetVolume);
    EXPECT_FLOAT_EQ(commands[1].volume, 0.25f);

    EXPECT_EQ(commands[2].type, AudioCommandType::Stop);
    EXPECT_FLOAT_EQ(commands[2].fade_duration, 0.0f);

    EXPECT_EQ(commands[3].channel, AudioChannel::kAmbient);
    EXPECT_TRUE(commands[3].loops);
    EXPECT_EQ(commands[4].type, AudioCommandType::Stop);
    EXPECT_EQ(commands[4].channel, AudioChannel::kAmbient);
}

TEST(AudioSystemTest, ChannelControls) {
    AudioSystem audio;
    audio.stop(7, 0.3f);
    audio.set_volume(-1.0f, 7);
    audio.stop_all();

    auto commands = audio.consume_commands();
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0].type, AudioCommandType::Stop);
    EXPECT_EQ(commands[0].channel, 7);
    EXPECT_FLOAT_EQ(commands[1].volume, 0.0f);
    EXPECT_EQ(commands[2].type, AudioCommandType::StopAll);
}

TEST(AudioSystemTest, ConsumeEmptiesAndReturnsIndependentCopy) {
    AudioSystem audio;
    audio.play(1);
    EXPECT_TRUE(audio.has_commands());

    auto first = audio.consume_commands();
    EXPECT_FALSE(audio.has_commands());

    audio.play(2);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].sound_id, 1);
    EXPECT_EQ(audio.consume_commands().at(0).sound_id, 2);
}

TEST(AudioSystemTest, BeginFrameDropsUnconsumedCommands) {
    AudioSystem audio;
    audio.play(1);
    audio.play(2);
    audio.begin_frame();
    EXPECT_FALSE(audio.has_commands());
    EXPECT_TRUE(audio.consume_commands().empty());
}

TEST(AudioEngineTest, LifecycleEmitsEngineCommands) {
    AudioEngine engine;
    engine.set_output_volume(3.0f);
    EXPECT_FLOAT_EQ(engine.output_volume(), 1.0f);
    engine.set_output_volume(0.4f);

    engine.start();
    engine.pause();
    EXPECT_FALSE(engine.is_running());
    engine.resume();
    EXPECT_TRUE(engine.is_running());
    engine.stop();
    EXPECT_FALSE(engine.is_running());

    auto commands = engine.consume_commands();
    ASSERT_EQ(commands.size(), 4u);
    EXPECT_EQ(commands[0].type, AudioCommandType::SetMasterVolume);
    EXPECT_FLOAT_EQ(commands[0].volume, 0.4f);
    EXPECT_EQ(commands[1].type, AudioCommandType::PauseAll);
    EXPECT_EQ(commands[2].type, AudioCommandType::ResumeAll);
    EXPECT_EQ(commands[3].type, AudioCommandType::StopAll);
}

TEST(AudioEngineTest, ResetRestoresDefaults) {
    AudioEngine engine;
    engine.set_output_volume(0.2f);
    engine.stop();
    engine.begin_frame();

    engine.reset();
    EXPECT_TRUE(engine.is_running());
    EXPECT_FLOAT_EQ(engine.output_volume(), 1.0f);
    ASSERT_TRUE(engine.has_commands());
    EXPECT_EQ(engine.consume_commands().at(0).type, AudioCommandType::StopAll);
}
