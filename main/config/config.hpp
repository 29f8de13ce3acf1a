#pragma once

#include <cstddef>

#include "esp_err.h"

namespace config {

constexpr int kMaxDevices = 8;

enum class DeviceAction {
    None,
    Toggle,
};

struct Device {
    char key[48];
    char default_text[48];
    char format[64];
    DeviceAction action;
};

struct WifiSettings {
    char ssid[33];
    char password[65];
};

struct MqttSettings {
    char broker_uri[128];
    char username[64];
    char password[64];
    char client_id[64];
    char feeds_topic[96];
    int fetch_timeout_ms;
};

struct InputSettings {
    int debounce_ms;
    bool debounce_by_samples;
    int debounce_samples;
    int touch_threshold;
};

struct Settings {
    WifiSettings wifi;
    MqttSettings mqtt;
    InputSettings input;
    int device_count;
    Device devices[kMaxDevices];
};

// Parse dashboard YAML (wifi/mqtt/input/devices sections) into out.
// Missing optional fields get defaults; a missing mqtt.uri is an error.
esp_err_t parse(const char* data, std::size_t len, Settings& out);

// Parse the YAML embedded in the firmware image (idempotent).
esp_err_t load();
const Settings& settings();

} // namespace config
