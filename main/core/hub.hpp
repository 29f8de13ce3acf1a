#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "esp_err.h"
#include "core/device_registry.hpp"
#include "core/display_view.hpp"
#include "core/feed_bridge.hpp"
#include "core/nav_input_mux.hpp"
#include "core/selection_controller.hpp"

namespace dash
{

    struct HubEvent
    {
        enum class Type
        {
            Navigate,
            ModeChanged,
            Submit,
            FeedUpdated,
            Published,
        };

        Type type = Type::Navigate;
        std::size_t row = 0;
        Mode mode = Mode::Browse;
        std::string feed_key;
        bool success = true;
    };

    using EventSink = std::function<void(const HubEvent &)>;

    // Monotonic microseconds (esp_timer_get_time on target).
    using ClockFn = std::int64_t (*)();

    // Dashboard facade. Single-threaded: add_device(), get(), loop() and publish()
    // must be called from the same task.
    class Hub
    {
    public:
        static constexpr const char *kPlaceholderText = "No devices";

        Hub(IFeedBridge &bridge,
            IInputSampler &sampler,
            IDisplayView &view,
            const DebounceConfig &debounce,
            ClockFn clock);

        Hub(const Hub &) = delete;
        Hub &operator=(const Hub &) = delete;

        // Register a row, subscribe its feed and paint its default text.
        // ESP_ERR_INVALID_ARG on empty/duplicate key or malformed template.
        esp_err_t add_device(const std::string &feed_key,
                             const std::string &default_text = std::string(),
                             const std::string &formatted_text = std::string(),
                             PubMethod pub_method = nullptr,
                             ColorMethod color_method = nullptr,
                             TextMethod text_method = nullptr);

        // Blocking bulk fetch of every registered feed, then render the focused row.
        // Feeds that cannot be fetched keep their default text.
        void get();

        // One non-blocking tick: apply feed updates, then at most one input event.
        void loop();

        // Publish through the bridge. On success a registered device bound to
        // feed_key takes the value locally.
        esp_err_t publish(const std::string &feed_key, const FeedValue &value);

        void set_event_sink(EventSink sink) { sink_ = std::move(sink); }

        const DeviceRegistry &registry() const { return registry_; }
        std::size_t current_index() const { return controller_.current_index(); }
        Mode mode() const { return controller_.mode(); }

    private:
        void apply_update(const FeedUpdate &update);
        void dispatch(NavEvent event);
        void mark_dirty(std::size_t row);
        void flush_render();
        void emit(HubEvent::Type type, std::size_t row, const std::string &feed_key, bool success);

        IFeedBridge &bridge_;
        IDisplayView &view_;
        NavInputMux mux_;
        ClockFn clock_;
        DeviceRegistry registry_;
        SelectionController controller_;
        EventSink sink_;

        std::vector<FeedUpdate> updates_;
        bool in_tick_ = false;
        bool render_pending_ = false;
        bool focus_pending_ = false;
        bool placeholder_shown_ = false;
    };

} // namespace dash
