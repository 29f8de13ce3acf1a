#include <gtest/gtest.h>

#include "core/nav_input_mux.hpp"
#include "fakes.hpp"

using dash::DebounceConfig;
using dash::DebounceMode;
using dash::InputChannel;
using dash::NavEvent;
using dash::NavInputMux;

namespace
{
    constexpr std::int64_t kTickUs = 10 * 1000;

    class TimeMuxTest : public ::testing::Test
    {
    protected:
        TimeMuxTest() : mux_(sampler_, make_cfg()) {}

        static DebounceConfig make_cfg()
        {
            DebounceConfig cfg;
            cfg.mode = DebounceMode::Time;
            cfg.window_us = 30 * 1000;
            return cfg;
        }

        // Advance one 10 ms tick; returns the event or None.
        NavEvent tick()
        {
            now_ += kTickUs;
            NavEvent ev = NavEvent::None;
            if (!mux_.poll_once(now_, ev))
            {
                return NavEvent::None;
            }
            return ev;
        }

        int count_events(int ticks)
        {
            int n = 0;
            for (int i = 0; i < ticks; ++i)
            {
                if (tick() != NavEvent::None)
                {
                    ++n;
                }
            }
            return n;
        }

        fakes::Sampler sampler_;
        NavInputMux mux_;
        std::int64_t now_ = 0;
    };
}

TEST_F(TimeMuxTest, IdleInputsProduceNothing)
{
    EXPECT_EQ(count_events(50), 0);
}

TEST_F(TimeMuxTest, ShortPressIsSuppressed)
{
    sampler_.set(InputChannel::Down, true);
    EXPECT_EQ(count_events(2), 0); // 20 ms < 30 ms window
    sampler_.set(InputChannel::Down, false);
    EXPECT_EQ(count_events(10), 0);
}

TEST_F(TimeMuxTest, HeldPressYieldsExactlyOneEvent)
{
    sampler_.set(InputChannel::Down, true);
    EXPECT_EQ(tick(), NavEvent::None);
    EXPECT_EQ(tick(), NavEvent::None);
    EXPECT_EQ(tick(), NavEvent::None);
    EXPECT_EQ(tick(), NavEvent::ScrollDown);
    EXPECT_EQ(count_events(100), 0);
}

TEST_F(TimeMuxTest, JitterRestartsTheWindow)
{
    for (int i = 0; i < 6; ++i)
    {
        sampler_.set(InputChannel::Up, i % 2 == 0);
        EXPECT_EQ(tick(), NavEvent::None);
    }
    sampler_.set(InputChannel::Up, true);
    EXPECT_EQ(count_events(10), 1);
}

TEST_F(TimeMuxTest, ReleaseAndPressAgainFiresAgain)
{
    sampler_.set(InputChannel::Select, true);
    EXPECT_EQ(count_events(10), 1);
    sampler_.set(InputChannel::Select, false);
    EXPECT_EQ(count_events(10), 0);
    sampler_.set(InputChannel::Select, true);
    EXPECT_EQ(count_events(10), 1);
}

TEST_F(TimeMuxTest, SimultaneousEdgesResolveByPriority)
{
    sampler_.set(InputChannel::Up, true);
    sampler_.set(InputChannel::Down, true);
    sampler_.set(InputChannel::Back, true);
    NavEvent first = NavEvent::None;
    for (int i = 0; i < 10 && first == NavEvent::None; ++i)
    {
        first = tick();
    }
    EXPECT_EQ(first, NavEvent::Back);
    // Lower-priority edges of that tick are gone while held.
    EXPECT_EQ(count_events(20), 0);
}

TEST_F(TimeMuxTest, SubmitBeatsEverything)
{
    sampler_.levels.fill(true);
    NavEvent first = NavEvent::None;
    for (int i = 0; i < 10 && first == NavEvent::None; ++i)
    {
        first = tick();
    }
    EXPECT_EQ(first, NavEvent::Submit);
}

TEST_F(TimeMuxTest, ResetForgetsHeldState)
{
    sampler_.set(InputChannel::Up, true);
    EXPECT_EQ(count_events(10), 1);
    mux_.reset();
    EXPECT_EQ(count_events(10), 1);
}

TEST(SampleMux, FiresAfterWindowSamples)
{
    fakes::Sampler sampler;
    DebounceConfig cfg;
    cfg.mode = DebounceMode::Samples;
    cfg.window_samples = 3;
    NavInputMux mux(sampler, cfg);

    NavEvent ev = NavEvent::None;
    sampler.set(InputChannel::Submit, true);
    EXPECT_FALSE(mux.poll_once(0, ev));
    EXPECT_FALSE(mux.poll_once(0, ev));
    ASSERT_TRUE(mux.poll_once(0, ev));
    EXPECT_EQ(ev, NavEvent::Submit);
    for (int i = 0; i < 20; ++i)
    {
        EXPECT_FALSE(mux.poll_once(0, ev));
    }
}

TEST(SampleMux, GlitchShorterThanWindowIsIgnored)
{
    fakes::Sampler sampler;
    DebounceConfig cfg;
    cfg.mode = DebounceMode::Samples;
    cfg.window_samples = 3;
    NavInputMux mux(sampler, cfg);

    NavEvent ev = NavEvent::None;
    sampler.set(InputChannel::Back, true);
    EXPECT_FALSE(mux.poll_once(0, ev));
    EXPECT_FALSE(mux.poll_once(0, ev));
    sampler.set(InputChannel::Back, false);
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_FALSE(mux.poll_once(0, ev));
    }
}

TEST(NavEventNames, AreStable)
{
    EXPECT_STREQ(dash::nav_event_to_string(NavEvent::ScrollDown), "SCROLL_DOWN");
    EXPECT_STREQ(dash::nav_event_to_string(NavEvent::Submit), "SUBMIT");
}
