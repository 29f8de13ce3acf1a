#include "app_events.hpp"

#include "esp_log.h"
#include "esp_timer.h"
#include <cstdio>

ESP_EVENT_DEFINE_BASE(APP_EVENTS);

namespace app_events
{

    namespace
    {
        static const char *TAG = "app_events";
    }

    esp_err_t post_row_event(int32_t id, const dash::HubEvent &event, std::int64_t timestamp_us)
    {
        RowPayload payload{};
        payload.row = static_cast<int>(event.row);
        payload.mode = static_cast<int>(event.mode);
        std::snprintf(payload.feed_key, sizeof(payload.feed_key), "%s", event.feed_key.c_str());
        payload.success = event.success;
        payload.timestamp_us = timestamp_us;

        // Never block the hub loop on a full event queue.
        esp_err_t err = esp_event_post(APP_EVENTS,
                                       id,
                                       &payload,
                                       sizeof(payload),
                                       0);

        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "post %s failed: %s", id_to_string(id), esp_err_to_name(err));
        }
        return err;
    }

    int32_t id_for(dash::HubEvent::Type type)
    {
        switch (type)
        {
        case dash::HubEvent::Type::Navigate:
            return NAVIGATE;
        case dash::HubEvent::Type::ModeChanged:
            return MODE_CHANGED;
        case dash::HubEvent::Type::Submit:
            return SUBMIT;
        case dash::HubEvent::Type::FeedUpdated:
            return FEED_UPDATED;
        case dash::HubEvent::Type::Published:
            return PUBLISH_RESULT;
        }
        return NAVIGATE;
    }

    esp_err_t post_hub_event(const dash::HubEvent &event)
    {
        return post_row_event(id_for(event.type), event, esp_timer_get_time());
    }

    const char *id_to_string(int32_t id)
    {
        switch (id)
        {
        case NAVIGATE:
            return "NAVIGATE";
        case MODE_CHANGED:
            return "MODE_CHANGED";
        case SUBMIT:
            return "SUBMIT";
        case FEED_UPDATED:
            return "FEED_UPDATED";
        case PUBLISH_RESULT:
            return "PUBLISH_RESULT";
        default:
            return "UNKNOWN";
        }
    }

} // namespace app_events
