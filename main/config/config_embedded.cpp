#include "config/config.hpp"

#include <cstdint>
#include "esp_log.h"

namespace config
{

    namespace
    {

        extern "C"
        {
            extern const uint8_t _binary_dashboard_yaml_start[];
            extern const uint8_t _binary_dashboard_yaml_end[];
        }

        constexpr const char *TAG = "config";

        Settings s_cfg{};
        bool s_loaded = false;

    } // namespace

    esp_err_t load()
    {
        if (s_loaded)
        {
            return ESP_OK;
        }

        const char *text = reinterpret_cast<const char *>(_binary_dashboard_yaml_start);
        size_t len = _binary_dashboard_yaml_end - _binary_dashboard_yaml_start;
        if (len == 0)
        {
            ESP_LOGE(TAG, "Embedded dashboard.yaml not found");
            return ESP_ERR_INVALID_STATE;
        }

        esp_err_t err = parse(text, len, s_cfg);
        if (err != ESP_OK)
        {
            return err;
        }

        ESP_LOGI(TAG, "Loaded %d device(s), broker %s, feeds %s",
                 s_cfg.device_count, s_cfg.mqtt.broker_uri, s_cfg.mqtt.feeds_topic);
        s_loaded = true;
        return ESP_OK;
    }

    const Settings &settings()
    {
        if (!s_loaded)
        {
            esp_err_t err = load();
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "Config unavailable: %s", esp_err_to_name(err));
            }
        }
        return s_cfg;
    }

} // namespace config
