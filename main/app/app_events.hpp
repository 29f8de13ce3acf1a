#pragma once

#include "esp_event.h"
#include <cstdint>

#include "core/hub.hpp"

// Application-level event base for internal messages
ESP_EVENT_DECLARE_BASE(APP_EVENTS);

namespace app_events
{

    enum Id : int32_t
    {
        NAVIGATE = 1,
        MODE_CHANGED = 2,
        SUBMIT = 3,
        FEED_UPDATED = 20,
        PUBLISH_RESULT = 31,
    };

    struct RowPayload
    {
        int row = 0;
        int mode = 0; // static_cast<int>(dash::Mode)
        char feed_key[48];
        bool success = false;
        std::int64_t timestamp_us = 0;
    };

    const char *id_to_string(int32_t id);

    // Event id carried by a hub notification.
    int32_t id_for(dash::HubEvent::Type type);

    esp_err_t post_row_event(int32_t id, const dash::HubEvent &event, std::int64_t timestamp_us);

    // Forward a hub notification to the default event loop.
    esp_err_t post_hub_event(const dash::HubEvent &event);

} // namespace app_events
