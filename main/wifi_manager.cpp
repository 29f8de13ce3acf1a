#include "wifi_manager.h"

#include <cstring>

#include "esp_event.h"
#include "esp_log.h"
#include "esp_netif.h"
#include "esp_wifi.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "nvs_flash.h"

static const char *TAG_WIFI = "wifi_manager";

static EventGroupHandle_t s_wifi_events = nullptr;
static constexpr EventBits_t kGotIpBit = BIT0;
static bool s_initialized = false;
static bool s_auto_reconnect = false;

static void on_wifi_event(void * /*arg*/, esp_event_base_t base, int32_t id, void *data)
{
    if (base == WIFI_EVENT && id == WIFI_EVENT_STA_START)
    {
        if (s_auto_reconnect)
        {
            esp_wifi_connect();
        }
    }
    else if (base == WIFI_EVENT && id == WIFI_EVENT_STA_DISCONNECTED)
    {
        xEventGroupClearBits(s_wifi_events, kGotIpBit);
        auto *ev = static_cast<wifi_event_sta_disconnected_t *>(data);
        ESP_LOGW(TAG_WIFI, "Disconnected (reason %d)", ev ? ev->reason : -1);
        if (s_auto_reconnect)
        {
            esp_wifi_connect();
        }
    }
    else if (base == IP_EVENT && id == IP_EVENT_STA_GOT_IP)
    {
        auto *ev = static_cast<ip_event_got_ip_t *>(data);
        ESP_LOGI(TAG_WIFI, "Got IP " IPSTR, IP2STR(&ev->ip_info.ip));
        xEventGroupSetBits(s_wifi_events, kGotIpBit);
    }
}

esp_err_t wifi_manager_init(void)
{
    if (s_initialized)
    {
        return ESP_OK;
    }

    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND)
    {
        ESP_LOGW(TAG_WIFI, "NVS partition needs erase: %s", esp_err_to_name(err));
        err = nvs_flash_erase();
        if (err == ESP_OK)
        {
            err = nvs_flash_init();
        }
    }
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_WIFI, "NVS init failed: %s", esp_err_to_name(err));
        return err;
    }

    s_wifi_events = xEventGroupCreate();
    if (!s_wifi_events)
    {
        return ESP_ERR_NO_MEM;
    }

    err = esp_netif_init();
    if (err != ESP_OK)
    {
        return err;
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE)
    {
        ESP_LOGE(TAG_WIFI, "Event loop init failed: %s", esp_err_to_name(err));
        return err;
    }
    esp_netif_create_default_wifi_sta();

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&cfg);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_WIFI, "esp_wifi_init failed: %s", esp_err_to_name(err));
        return err;
    }

    err = esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID, &on_wifi_event, nullptr, nullptr);
    if (err == ESP_OK)
    {
        err = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &on_wifi_event, nullptr, nullptr);
    }
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_WIFI, "Handler registration failed: %s", esp_err_to_name(err));
        return err;
    }

    err = esp_wifi_set_mode(WIFI_MODE_STA);
    if (err != ESP_OK)
    {
        return err;
    }

    s_initialized = true;
    return ESP_OK;
}

esp_err_t wifi_manager_connect(const char *ssid, const char *password)
{
    if (!s_initialized)
    {
        return ESP_ERR_INVALID_STATE;
    }
    if (!ssid || !*ssid)
    {
        ESP_LOGE(TAG_WIFI, "No SSID configured");
        return ESP_ERR_INVALID_ARG;
    }

    wifi_config_t sta = {};
    std::strncpy(reinterpret_cast<char *>(sta.sta.ssid), ssid, sizeof(sta.sta.ssid) - 1);
    if (password)
    {
        std::strncpy(reinterpret_cast<char *>(sta.sta.password), password, sizeof(sta.sta.password) - 1);
    }
    sta.sta.threshold.authmode = (password && *password) ? WIFI_AUTH_WPA2_PSK : WIFI_AUTH_OPEN;

    esp_err_t err = esp_wifi_set_config(WIFI_IF_STA, &sta);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_WIFI, "esp_wifi_set_config failed: %s", esp_err_to_name(err));
        return err;
    }

    s_auto_reconnect = true;
    ESP_LOGI(TAG_WIFI, "Connecting to '%s'", ssid);
    return esp_wifi_start();
}

bool wifi_manager_wait_ip(int wait_ms)
{
    if (!s_wifi_events)
    {
        return false;
    }
    EventBits_t bits = xEventGroupWaitBits(s_wifi_events, kGotIpBit, pdFALSE, pdTRUE, pdMS_TO_TICKS(wait_ms));
    return (bits & kGotIpBit) != 0;
}

bool wifi_manager_is_connected(void)
{
    return s_wifi_events && (xEventGroupGetBits(s_wifi_events) & kGotIpBit) != 0;
}
