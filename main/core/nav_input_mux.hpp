#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace dash
{

    enum class InputChannel : std::uint8_t
    {
        Up = 0,
        Select,
        Down,
        Back,
        Submit,
    };

    constexpr std::size_t kInputChannelCount = 5;

    enum class NavEvent
    {
        None,
        ScrollUp,
        ScrollDown,
        Select,
        Back,
        Submit,
    };

    const char *nav_event_to_string(NavEvent ev);

    // Raw, undebounced point-in-time read of one input channel.
    // Must not block; called once per channel per tick.
    class IInputSampler
    {
    public:
        virtual ~IInputSampler() = default;
        virtual bool read(InputChannel channel) = 0;
    };

    enum class DebounceMode
    {
        Time,    // level must hold for window_us
        Samples, // level must hold for window_samples consecutive reads
    };

    struct DebounceConfig
    {
        DebounceMode mode = DebounceMode::Time;
        std::int64_t window_us = 30 * 1000;
        int window_samples = 3;
    };

    // Turns five bouncy channels into at most one edge-triggered event per tick.
    class NavInputMux
    {
    public:
        NavInputMux(IInputSampler &sampler, const DebounceConfig &cfg);

        // Sample every channel once. Returns true and sets out when a channel
        // settled high on this tick; simultaneous edges resolve by priority
        // Submit > Back > Select > ScrollDown > ScrollUp.
        bool poll_once(std::int64_t now_us, NavEvent &out);

        void reset();

    private:
        struct ChannelState
        {
            bool stable = false;
            bool candidate = false;
            std::int64_t candidate_since_us = 0;
            int candidate_samples = 0;
        };

        bool settled(const ChannelState &ch, std::int64_t now_us) const;

        IInputSampler &sampler_;
        DebounceConfig cfg_;
        std::array<ChannelState, kInputChannelCount> channels_{};
    };

} // namespace dash
