#include "core/nav_input_mux.hpp"

#include "esp_log.h"

namespace dash
{

    namespace
    {
        static const char *TAG = "nav_mux";

        struct PriorityEntry
        {
            InputChannel channel;
            NavEvent event;
        };

        // Highest priority first.
        constexpr PriorityEntry kPriority[kInputChannelCount] = {
            {InputChannel::Submit, NavEvent::Submit},
            {InputChannel::Back, NavEvent::Back},
            {InputChannel::Select, NavEvent::Select},
            {InputChannel::Down, NavEvent::ScrollDown},
            {InputChannel::Up, NavEvent::ScrollUp},
        };
    } // namespace

    const char *nav_event_to_string(NavEvent ev)
    {
        switch (ev)
        {
        case NavEvent::None:
            return "NONE";
        case NavEvent::ScrollUp:
            return "SCROLL_UP";
        case NavEvent::ScrollDown:
            return "SCROLL_DOWN";
        case NavEvent::Select:
            return "SELECT";
        case NavEvent::Back:
            return "BACK";
        case NavEvent::Submit:
            return "SUBMIT";
        default:
            return "UNKNOWN";
        }
    }

    NavInputMux::NavInputMux(IInputSampler &sampler, const DebounceConfig &cfg)
        : sampler_(sampler), cfg_(cfg)
    {
        if (cfg_.window_samples < 1)
        {
            cfg_.window_samples = 1;
        }
        if (cfg_.window_us < 0)
        {
            cfg_.window_us = 0;
        }
    }

    void NavInputMux::reset()
    {
        channels_.fill(ChannelState{});
    }

    bool NavInputMux::settled(const ChannelState &ch, std::int64_t now_us) const
    {
        if (cfg_.mode == DebounceMode::Samples)
        {
            return ch.candidate_samples >= cfg_.window_samples;
        }
        return (now_us - ch.candidate_since_us) >= cfg_.window_us;
    }

    bool NavInputMux::poll_once(std::int64_t now_us, NavEvent &out)
    {
        bool rose[kInputChannelCount] = {};

        for (size_t i = 0; i < kInputChannelCount; ++i)
        {
            ChannelState &ch = channels_[i];
            const bool raw = sampler_.read(static_cast<InputChannel>(i));

            if (raw != ch.candidate)
            {
                ch.candidate = raw;
                ch.candidate_since_us = now_us;
                ch.candidate_samples = 1;
            }
            else if (ch.candidate_samples < cfg_.window_samples)
            {
                ++ch.candidate_samples;
            }

            if (ch.candidate != ch.stable && settled(ch, now_us))
            {
                ch.stable = ch.candidate;
                rose[i] = ch.stable;
            }
        }

        for (const auto &p : kPriority)
        {
            if (rose[static_cast<size_t>(p.channel)])
            {
                out = p.event;
                ESP_LOGD(TAG, "event %s", nav_event_to_string(out));
                return true;
            }
        }

        return false;
    }

} // namespace dash
