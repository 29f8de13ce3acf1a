#pragma once

#include "esp_err.h"
#include <stdbool.h>

// NVS, netif, default event loop and Wi-Fi driver in STA mode.
esp_err_t wifi_manager_init(void);

// Apply credentials and start connecting. Reconnects automatically on drop.
esp_err_t wifi_manager_connect(const char *ssid, const char *password);

// Block until an IP is assigned (true) or wait_ms elapses (false).
bool wifi_manager_wait_ip(int wait_ms);

bool wifi_manager_is_connected(void);
