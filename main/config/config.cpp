#include "config/config.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include "esp_log.h"

namespace config
{

    namespace
    {

        constexpr const char *TAG = "config";

        constexpr int kDefaultFetchTimeoutMs = 3000;
        constexpr int kDefaultDebounceMs = 30;
        constexpr int kDefaultDebounceSamples = 3;
        constexpr int kDefaultTouchThreshold = 2000;

        inline void copy_field(char *dst, size_t len, const char *src)
        {
            if (!dst || len == 0)
                return;
            if (!src)
                src = "";
            std::strncpy(dst, src, len - 1);
            dst[len - 1] = '\0';
        }

        inline std::string trim(const std::string &s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string::npos)
                return "";
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string unquote(const std::string &s)
        {
            if (s.size() >= 2)
            {
                char first = s.front();
                char last = s.back();
                if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
                {
                    return s.substr(1, s.size() - 2);
                }
            }
            return s;
        }

        // '#' starts a comment at line start or after whitespace, outside quotes.
        std::string strip_comment(const std::string &line)
        {
            char quote = 0;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];
                if (quote)
                {
                    if (c == quote)
                        quote = 0;
                    continue;
                }
                if (c == '"' || c == '\'')
                {
                    quote = c;
                    continue;
                }
                if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t'))
                {
                    return line.substr(0, i);
                }
            }
            return line;
        }

        void parse_int(const std::string &key, const std::string &value, int &out)
        {
            char *end = nullptr;
            long v = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || !end || *end != '\0' || v < 0)
            {
                ESP_LOGW(TAG, "Ignoring bad value for %s: '%s'", key.c_str(), value.c_str());
                return;
            }
            out = static_cast<int>(v);
        }

        void set_defaults(Settings &s)
        {
            std::memset(&s, 0, sizeof(s));
            s.mqtt.fetch_timeout_ms = kDefaultFetchTimeoutMs;
            s.input.debounce_ms = kDefaultDebounceMs;
            s.input.debounce_by_samples = false;
            s.input.debounce_samples = kDefaultDebounceSamples;
            s.input.touch_threshold = kDefaultTouchThreshold;
        }

        bool push_device(Settings &s, const Device &d)
        {
            if (d.key[0] == '\0')
            {
                ESP_LOGW(TAG, "Skipping device without key");
                return false;
            }
            if (s.device_count >= kMaxDevices)
            {
                ESP_LOGW(TAG, "Device limit reached (%d), dropping '%s'", kMaxDevices, d.key);
                return false;
            }
            s.devices[s.device_count++] = d;
            return true;
        }

    } // namespace

    esp_err_t parse(const char *data, size_t len, Settings &out)
    {
        enum class Section
        {
            None,
            Wifi,
            MQTT,
            Input,
            Devices
        };

        Settings s;
        set_defaults(s);

        if (!data || len == 0)
        {
            ESP_LOGE(TAG, "Empty configuration");
            return ESP_ERR_INVALID_ARG;
        }

        Section section = Section::None;
        Device current{};
        bool device_active = false;

        size_t pos = 0;
        while (pos < len)
        {
            size_t line_end = pos;
            while (line_end < len && data[line_end] != '\n' && data[line_end] != '\r')
            {
                ++line_end;
            }
            std::string line(data + pos, line_end - pos);
            pos = line_end;
            while (pos < len && (data[pos] == '\n' || data[pos] == '\r'))
            {
                ++pos;
            }

            line = trim(strip_comment(line));
            if (line.empty())
            {
                continue;
            }

            bool list_item = false;
            if (line.rfind("- ", 0) == 0)
            {
                list_item = true;
                line = trim(line.substr(2));
            }
            else if (line == "-")
            {
                list_item = true;
                line.clear();
            }

            if (line == "wifi:" || line == "mqtt:" || line == "input:" || line == "devices:")
            {
                if (device_active)
                {
                    push_device(s, current);
                    device_active = false;
                }
                if (line == "wifi:")
                    section = Section::Wifi;
                else if (line == "mqtt:")
                    section = Section::MQTT;
                else if (line == "input:")
                    section = Section::Input;
                else
                    section = Section::Devices;
                continue;
            }

            if (section == Section::Devices && list_item)
            {
                if (device_active)
                {
                    push_device(s, current);
                }
                std::memset(&current, 0, sizeof(current));
                current.action = DeviceAction::None;
                device_active = true;
            }

            size_t colon = line.find(':');
            if (colon == std::string::npos)
            {
                continue;
            }

            std::string key = trim(line.substr(0, colon));
            std::string value = unquote(trim(line.substr(colon + 1)));

            switch (section)
            {
            case Section::Wifi:
                if (key == "ssid")
                    copy_field(s.wifi.ssid, sizeof(s.wifi.ssid), value.c_str());
                else if (key == "password")
                    copy_field(s.wifi.password, sizeof(s.wifi.password), value.c_str());
                break;

            case Section::MQTT:
                if (key == "uri")
                    copy_field(s.mqtt.broker_uri, sizeof(s.mqtt.broker_uri), value.c_str());
                else if (key == "username")
                    copy_field(s.mqtt.username, sizeof(s.mqtt.username), value.c_str());
                else if (key == "password")
                    copy_field(s.mqtt.password, sizeof(s.mqtt.password), value.c_str());
                else if (key == "client_id")
                    copy_field(s.mqtt.client_id, sizeof(s.mqtt.client_id), value.c_str());
                else if (key == "feeds_topic")
                    copy_field(s.mqtt.feeds_topic, sizeof(s.mqtt.feeds_topic), value.c_str());
                else if (key == "fetch_timeout_ms")
                    parse_int(key, value, s.mqtt.fetch_timeout_ms);
                break;

            case Section::Input:
                if (key == "debounce_ms")
                {
                    parse_int(key, value, s.input.debounce_ms);
                }
                else if (key == "debounce_samples")
                {
                    parse_int(key, value, s.input.debounce_samples);
                }
                else if (key == "touch_threshold")
                {
                    parse_int(key, value, s.input.touch_threshold);
                }
                else if (key == "debounce_mode")
                {
                    if (value == "samples")
                        s.input.debounce_by_samples = true;
                    else if (value == "time")
                        s.input.debounce_by_samples = false;
                    else
                        ESP_LOGW(TAG, "Unknown debounce_mode '%s', using time", value.c_str());
                }
                break;

            case Section::Devices:
                if (!device_active)
                {
                    // fields outside a list item
                    break;
                }
                if (key == "key")
                    copy_field(current.key, sizeof(current.key), value.c_str());
                else if (key == "default_text")
                    copy_field(current.default_text, sizeof(current.default_text), value.c_str());
                else if (key == "format")
                    copy_field(current.format, sizeof(current.format), value.c_str());
                else if (key == "action")
                {
                    if (value == "toggle")
                        current.action = DeviceAction::Toggle;
                    else if (value == "none" || value.empty())
                        current.action = DeviceAction::None;
                    else
                        ESP_LOGW(TAG, "Unknown action '%s' for '%s'", value.c_str(), current.key);
                }
                break;

            case Section::None:
            default:
                break;
            }
        }

        if (device_active)
        {
            push_device(s, current);
        }

        if (s.mqtt.broker_uri[0] == '\0')
        {
            ESP_LOGE(TAG, "mqtt.uri is missing");
            return ESP_ERR_INVALID_STATE;
        }
        if (s.mqtt.feeds_topic[0] == '\0')
        {
            std::snprintf(s.mqtt.feeds_topic, sizeof(s.mqtt.feeds_topic), "%s/feeds", s.mqtt.username);
        }
        if (s.input.debounce_samples < 1)
        {
            s.input.debounce_samples = 1;
        }

        out = s;
        return ESP_OK;
    }

} // namespace config
