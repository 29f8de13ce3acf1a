#include "device_actions.hpp"

#include "esp_log.h"
#include "app/app_config.hpp"

namespace device_actions
{

    namespace
    {
        static const char *TAG = "device_actions";
    }

    dash::PubMethod make_toggle(dash::Hub &hub, const std::string &feed_key)
    {
        dash::Hub *target = &hub;
        return [target, feed_key](const dash::FeedValue &current)
        {
            const dash::FeedValue next = dash::FeedValue::boolean(!current.as_bool());
            esp_err_t err = target->publish(feed_key, next);
            if (err != ESP_OK)
            {
                ESP_LOGW(TAG, "toggle %s failed: %s", feed_key.c_str(), esp_err_to_name(err));
            }
        };
    }

    dash::ColorMethod make_toggle_color()
    {
        return [](const dash::FeedValue &value) -> std::uint32_t
        {
            return value.as_bool() ? app_config::kToggleOnColorHex : app_config::kToggleOffColorHex;
        };
    }

    esp_err_t register_all(dash::Hub &hub, const config::Settings &settings)
    {
        for (int i = 0; i < settings.device_count; ++i)
        {
            const config::Device &d = settings.devices[i];
            dash::PubMethod pub;
            dash::ColorMethod color;
            if (d.action == config::DeviceAction::Toggle)
            {
                pub = make_toggle(hub, d.key);
                color = make_toggle_color();
            }

            esp_err_t err = hub.add_device(d.key, d.default_text, d.format, pub, color);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "device '%s' rejected: %s", d.key, esp_err_to_name(err));
                return err;
            }
            ESP_LOGI(TAG, "row %d: %s (%s)", i, d.key,
                     d.action == config::DeviceAction::Toggle ? "toggle" : "read-only");
        }
        return ESP_OK;
    }

} // namespace device_actions
