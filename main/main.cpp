#include "esp_err.h"
#include "esp_event.h"
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "app/app_config.hpp"
#include "app/app_events.hpp"
#include "app/device_actions.hpp"
#include "app/event_logger.hpp"
#include "config/config.hpp"
#include "core/hub.hpp"
#include "devices/display_init.hpp"
#include "devices/input_init.hpp"
#include "devices/lvgl_init.hpp"
#include "infra/transport/mqtt_transport.hpp"
#include "services/feed_service.hpp"
#include "ui/row_list_view.hpp"
#include "wifi_manager.h"

static const char *TAG_APP = "app";

static std::int64_t now_us()
{
    return esp_timer_get_time();
}

static void hub_task(void *arg)
{
    auto *hub = static_cast<dash::Hub *>(arg);
    TickType_t last_wake = xTaskGetTickCount();
    for (;;)
    {
        hub->loop();
        vTaskDelayUntil(&last_wake, pdMS_TO_TICKS(app_config::kHubLoopPeriodMs));
    }
}

extern "C" void app_main(void)
{
    ESP_ERROR_CHECK(config::load());
    const config::Settings &cfg = config::settings();

    // Also brings up NVS and the default event loop.
    ESP_ERROR_CHECK(wifi_manager_init());
    ESP_ERROR_CHECK(event_logger::init());

    ESP_ERROR_CHECK(devices_display_init());
    ESP_ERROR_CHECK(devices_lvgl_init());

    static ui::RowListView view;
    ESP_ERROR_CHECK(view.init(devices_lvgl_get_display()));

    static devices::BoardInputSampler sampler(cfg.input);
    ESP_ERROR_CHECK(sampler.init());

    ESP_ERROR_CHECK(wifi_manager_connect(cfg.wifi.ssid, cfg.wifi.password));
    if (!wifi_manager_wait_ip(app_config::kWifiConnectTimeoutMs))
    {
        ESP_LOGW(TAG_APP, "No IP after %d ms, continuing; MQTT will retry", app_config::kWifiConnectTimeoutMs);
    }

    static transport::MqttTransport mqtt(cfg.mqtt);
    static feeds::MqttFeedBridge bridge(mqtt, cfg.mqtt);
    ESP_ERROR_CHECK(bridge.start());

    dash::DebounceConfig debounce;
    debounce.mode = cfg.input.debounce_by_samples ? dash::DebounceMode::Samples : dash::DebounceMode::Time;
    debounce.window_us = static_cast<std::int64_t>(cfg.input.debounce_ms) * 1000;
    debounce.window_samples = cfg.input.debounce_samples;

    static dash::Hub hub(bridge, sampler, view, debounce, &now_us);
    hub.set_event_sink(
        [](const dash::HubEvent &ev)
        {
            (void)app_events::post_hub_event(ev);
        });

    ESP_ERROR_CHECK(device_actions::register_all(hub, cfg));

    hub.get();

    ESP_LOGI(TAG_APP, "Dashboard running: %u row(s)", static_cast<unsigned>(hub.registry().size()));
    xTaskCreate(hub_task, "hub", app_config::kHubTaskStack, &hub, app_config::kHubTaskPriority, nullptr);
}
