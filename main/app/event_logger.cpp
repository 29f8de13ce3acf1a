#include "event_logger.hpp"

#include "esp_event.h"
#include "esp_log.h"
#include "app_events.hpp"

namespace event_logger
{

    namespace
    {
        static const char *TAG = "APP_EVENT_BUS";
        static esp_event_handler_instance_t s_any_instance = nullptr;

        static void log_event(void * /*arg*/,
                              esp_event_base_t event_base,
                              int32_t event_id,
                              void *event_data)
        {
            const char *base_str = event_base ? event_base : "NULL";
            if (event_base != APP_EVENTS)
            {
                ESP_LOGI(TAG, "event: base=%s id=%ld",
                         base_str,
                         static_cast<long>(event_id));
                return;
            }

            auto *p = static_cast<const app_events::RowPayload *>(event_data);
            const char *key = (p && p->feed_key[0]) ? p->feed_key : "<none>";
            int row = p ? p->row : -1;

            switch (event_id)
            {
            case app_events::NAVIGATE:
            case app_events::SUBMIT:
            case app_events::FEED_UPDATED:
                ESP_LOGI(TAG,
                         "event: id=%s row=%d feed=%s",
                         app_events::id_to_string(event_id),
                         row,
                         key);
                break;
            case app_events::MODE_CHANGED:
            {
                const char *mode = p ? dash::mode_to_string(static_cast<dash::Mode>(p->mode)) : "?";
                ESP_LOGI(TAG,
                         "event: id=MODE_CHANGED row=%d feed=%s mode=%s",
                         row,
                         key,
                         mode);
                break;
            }
            case app_events::PUBLISH_RESULT:
                ESP_LOGI(TAG,
                         "event: id=PUBLISH_RESULT feed=%s success=%d",
                         key,
                         p ? (int)p->success : 0);
                break;
            default:
                ESP_LOGI(TAG,
                         "event: base=%s id=%ld (APP_EVENTS unknown)",
                         base_str,
                         static_cast<long>(event_id));
                break;
            }
        }
    } // namespace

    esp_err_t init()
    {
        // Subscribe only to application-level events on the default loop
        esp_err_t err = esp_event_handler_instance_register(
            APP_EVENTS,
            ESP_EVENT_ANY_ID,
            &log_event,
            nullptr,
            &s_any_instance);

        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "failed to register event logger: %s", esp_err_to_name(err));
        }

        return err;
    }

} // namespace event_logger
