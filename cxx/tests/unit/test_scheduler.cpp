#include <gtest/gtest.h>
#include "TestHelper.hpp"
#include "core/Scheduler.hpp"
#include <vector>

using namespace keyfall;
using namespace test;

class SchedulerTest : public ::testing::Test {
protected:
    // Long samples so voices only end when stopped
    SampleBank bank = make_bank(40, 90, 48000);
    VoiceMixer mixer{bank};
    QueuedLiveInput input;
    Scheduler scheduler{mixer, &input};

    void tick_and_render(double dt) {
        scheduler.tick(dt);
        render_block(mixer);
    }
};

TEST_F(SchedulerTest, StartsAndStopsTimelineNotes) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 0.5}, {64, 0.2, 0.6}}));

    tick_and_render(0.1);
    EXPECT_TRUE(mixer.is_active(60));
    EXPECT_FALSE(mixer.is_active(64));
    EXPECT_EQ(scheduler.snapshot().sounding, std::set<int>{60});

    tick_and_render(0.2);
    EXPECT_TRUE(mixer.is_active(64));

    tick_and_render(0.25);
    EXPECT_FALSE(mixer.is_active(60));
    EXPECT_TRUE(mixer.is_active(64));

    tick_and_render(0.1);
    EXPECT_EQ(mixer.active_voice_count(), 0);
    EXPECT_TRUE(scheduler.snapshot().sounding.empty());
}

TEST_F(SchedulerTest, RateScalesPlayback) {
    ASSERT_TRUE(scheduler.load({{60, 0.4, 1.0}}));
    scheduler.transport().set_rate(2.0);

    tick_and_render(0.25);
    EXPECT_DOUBLE_EQ(scheduler.transport().current_time(), 0.5);
    EXPECT_TRUE(mixer.is_active(60));
}

TEST_F(SchedulerTest, LoopWrapReplaysNotesInsideLoop) {
    ASSERT_TRUE(scheduler.load({{60, 0.2, 0.4}}));

    tick_and_render(0.3);
    EXPECT_TRUE(mixer.is_active(60));
    ASSERT_TRUE(scheduler.transport().set_loop(0.1, 0.5));

    scheduler.tick(0.3); // 0.6 wraps to 0.1
    EXPECT_DOUBLE_EQ(scheduler.transport().current_time(), 0.1);
    EXPECT_EQ(scheduler.timeline().events()[0].state, NoteEvent::State::Pending);

    tick_and_render(0.15);
    EXPECT_EQ(scheduler.timeline().events()[0].state, NoteEvent::State::Started);
    EXPECT_TRUE(mixer.is_active(60));

    tick_and_render(0.2);
    EXPECT_EQ(scheduler.timeline().events()[0].state, NoteEvent::State::Stopped);
    EXPECT_FALSE(mixer.is_active(60));
}

TEST_F(SchedulerTest, HeldLiveKeySurvivesTimelineStop) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 0.5}}));
    tick_and_render(0.1);

    input.push(LiveEvent{60, 100, true});
    tick_and_render(0.5); // timeline note ends while the key is down
    EXPECT_TRUE(mixer.is_active(60));
    EXPECT_EQ(scheduler.timeline().events()[0].state, NoteEvent::State::Stopped);

    input.push(LiveEvent{60, 0, false});
    tick_and_render(0.1);
    EXPECT_FALSE(mixer.is_active(60));
}

TEST_F(SchedulerTest, LiveReleaseSilencesSharedPitchEarly) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 2.0}}));
    tick_and_render(0.1);

    input.push(LiveEvent{60, 100, true});
    tick_and_render(0.1);
    input.push(LiveEvent{60, 0, false});
    tick_and_render(0.1);

    // One voice per pitch: the release wins although the note is still due
    EXPECT_FALSE(mixer.is_active(60));
    EXPECT_EQ(scheduler.snapshot().sounding, std::set<int>{60});
}

TEST_F(SchedulerTest, RetriggerInSameTickBeatsStop) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 0.5}, {60, 0.5, 1.0}}));
    tick_and_render(0.1);

    tick_and_render(0.5);
    EXPECT_TRUE(mixer.is_active(60));

    tick_and_render(0.5);
    EXPECT_FALSE(mixer.is_active(60));
}

TEST_F(SchedulerTest, NoteInsideOneTickDoesNotRing) {
    ASSERT_TRUE(scheduler.load({{60, 0.1, 0.2}}));

    tick_and_render(0.5); // start and end both passed in this tick
    EXPECT_FALSE(mixer.is_active(60));
    EXPECT_EQ(scheduler.timeline().events()[0].state, NoteEvent::State::Stopped);
    EXPECT_TRUE(scheduler.snapshot().sounding.empty());

    tick_and_render(0.5);
    EXPECT_FALSE(mixer.is_active(60));
    EXPECT_EQ(mixer.active_voice_count(), 0);
}

TEST_F(SchedulerTest, ShortNoteEndingKeepsOverlappingSamePitch) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 1.0}, {60, 0.2, 0.3}}));
    tick_and_render(0.1);

    tick_and_render(0.3); // short note ends, the long one is still due
    EXPECT_TRUE(mixer.is_active(60));

    tick_and_render(0.7);
    EXPECT_FALSE(mixer.is_active(60));
}

TEST_F(SchedulerTest, PauseFreezesTimeAndLiveInput) {
    ASSERT_TRUE(scheduler.load({{60, 0.5, 1.0}}));
    tick_and_render(0.2);

    scheduler.transport().set_paused(true);
    input.push(LiveEvent{64, 100, true});
    tick_and_render(1.0);

    EXPECT_DOUBLE_EQ(scheduler.transport().current_time(), 0.2);
    EXPECT_TRUE(scheduler.live_input().held().empty());
    EXPECT_FALSE(mixer.is_active(60));
    EXPECT_FALSE(mixer.is_active(64));
    EXPECT_TRUE(scheduler.snapshot().paused);

    scheduler.transport().toggle_pause();
    tick_and_render(0.0);
    EXPECT_TRUE(scheduler.live_input().is_held(64));
    EXPECT_TRUE(mixer.is_active(64));
}

TEST_F(SchedulerTest, TimelineAudioToggle) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 1.0}}));
    scheduler.set_timeline_audio_enabled(false);

    tick_and_render(0.1);
    EXPECT_FALSE(mixer.is_active(60));
    EXPECT_EQ(scheduler.snapshot().sounding, std::set<int>{60});
    EXPECT_FALSE(scheduler.snapshot().timeline_audio);
}

TEST_F(SchedulerTest, LiveAudioToggle) {
    ASSERT_TRUE(scheduler.load({}));
    scheduler.set_live_audio_enabled(false);

    input.push(LiveEvent{62, 100, true});
    tick_and_render(0.01);
    EXPECT_FALSE(mixer.is_active(62));
    EXPECT_EQ(scheduler.snapshot().held, std::set<int>{62});
    EXPECT_FALSE(scheduler.snapshot().live_audio);
}

TEST_F(SchedulerTest, RestartRewindsEverything) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 5.0}, {64, 0.1, 5.0}}));
    tick_and_render(0.3);
    ASSERT_TRUE(scheduler.transport().set_loop(0.1, 0.4));
    ASSERT_EQ(mixer.active_voice_count(), 2);

    scheduler.restart();
    render_block(mixer);

    EXPECT_DOUBLE_EQ(scheduler.transport().current_time(), 0.0);
    EXPECT_FALSE(scheduler.transport().has_loop());
    EXPECT_EQ(mixer.active_voice_count(), 0);
    for (const auto& event : scheduler.timeline().events()) {
        EXPECT_EQ(event.state, NoteEvent::State::Pending);
    }

    tick_and_render(0.0);
    EXPECT_TRUE(mixer.is_active(60));
}

TEST_F(SchedulerTest, RejectedLoadKeepsCurrentSession) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 1.0}}));
    tick_and_render(0.3);

    EXPECT_FALSE(scheduler.load({{62, 1.0, 0.5}}));
    ASSERT_EQ(scheduler.timeline().size(), 1u);
    EXPECT_EQ(scheduler.timeline().events()[0].note.pitch, 60);
    EXPECT_DOUBLE_EQ(scheduler.transport().current_time(), 0.3);
    EXPECT_TRUE(mixer.is_active(60));
}

TEST_F(SchedulerTest, LoadClearsLoopAndTime) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 1.0}}));
    tick_and_render(0.3);
    ASSERT_TRUE(scheduler.transport().set_loop(0.1, 0.5));

    ASSERT_TRUE(scheduler.load({{62, 0.0, 1.0}}));
    render_block(mixer);
    EXPECT_DOUBLE_EQ(scheduler.transport().current_time(), 0.0);
    EXPECT_FALSE(scheduler.transport().has_loop());
    EXPECT_FALSE(mixer.is_active(60));
}

TEST_F(SchedulerTest, StopReleasesLiveAndTimelineVoices) {
    ASSERT_TRUE(scheduler.load({{60, 0.0, 5.0}}));
    input.push(LiveEvent{70, 100, true});
    tick_and_render(0.1);
    ASSERT_EQ(mixer.active_voice_count(), 2);

    scheduler.stop();
    render_block(mixer);
    EXPECT_EQ(mixer.active_voice_count(), 0);
    EXPECT_TRUE(scheduler.snapshot().held.empty());
    EXPECT_TRUE(scheduler.snapshot().sounding.empty());
}

TEST(SchedulerNoInputTest, RunsWithoutLiveSource) {
    SampleBank bank = make_bank(60, 60, 1000);
    VoiceMixer mixer(bank);
    Scheduler scheduler(mixer);

    ASSERT_TRUE(scheduler.load({{60, 0.0, 0.1}}));
    scheduler.tick(0.05);
    render_block(mixer);
    EXPECT_TRUE(mixer.is_active(60));
    EXPECT_TRUE(scheduler.snapshot().held.empty());
}
