#include <gtest/gtest.h>

#include <string>

#include "config/config.hpp"

namespace
{
    esp_err_t parse(const std::string &yaml, config::Settings &out)
    {
        return config::parse(yaml.data(), yaml.size(), out);
    }

    const char *kFull = R"(# dashboard
wifi:
  ssid: "home"
  password: 'p#ss word'

mqtt:
  uri: mqtts://io.adafruit.com:8883
  username: aio_user   # trailing comment
  password: "secret"
  client_id: funhouse
  feeds_topic: custom/feeds
  fetch_timeout_ms: 1500

input:
  debounce_mode: samples
  debounce_ms: 20
  debounce_samples: 4
  touch_threshold: 1200

devices:
  - key: lamp
    default_text: "Lamp: ..."
    format: "Lamp: %s"
    action: toggle
  - key: humidity
    format: "Humidity: %.2f%%"
)";
}

TEST(Config, ParsesAllSections)
{
    config::Settings s;
    ASSERT_EQ(parse(kFull, s), ESP_OK);

    EXPECT_STREQ(s.wifi.ssid, "home");
    EXPECT_STREQ(s.wifi.password, "p#ss word");

    EXPECT_STREQ(s.mqtt.broker_uri, "mqtts://io.adafruit.com:8883");
    EXPECT_STREQ(s.mqtt.username, "aio_user");
    EXPECT_STREQ(s.mqtt.password, "secret");
    EXPECT_STREQ(s.mqtt.client_id, "funhouse");
    EXPECT_STREQ(s.mqtt.feeds_topic, "custom/feeds");
    EXPECT_EQ(s.mqtt.fetch_timeout_ms, 1500);

    EXPECT_TRUE(s.input.debounce_by_samples);
    EXPECT_EQ(s.input.debounce_ms, 20);
    EXPECT_EQ(s.input.debounce_samples, 4);
    EXPECT_EQ(s.input.touch_threshold, 1200);

    ASSERT_EQ(s.device_count, 2);
    EXPECT_STREQ(s.devices[0].key, "lamp");
    EXPECT_STREQ(s.devices[0].default_text, "Lamp: ...");
    EXPECT_STREQ(s.devices[0].format, "Lamp: %s");
    EXPECT_EQ(s.devices[0].action, config::DeviceAction::Toggle);
    EXPECT_STREQ(s.devices[1].key, "humidity");
    EXPECT_STREQ(s.devices[1].default_text, "");
    EXPECT_STREQ(s.devices[1].format, "Humidity: %.2f%%");
    EXPECT_EQ(s.devices[1].action, config::DeviceAction::None);
}

TEST(Config, AppliesDefaults)
{
    config::Settings s;
    ASSERT_EQ(parse("mqtt:\n  uri: mqtt://x\n  username: bob\n", s), ESP_OK);
    EXPECT_STREQ(s.mqtt.feeds_topic, "bob/feeds");
    EXPECT_EQ(s.mqtt.fetch_timeout_ms, 3000);
    EXPECT_FALSE(s.input.debounce_by_samples);
    EXPECT_EQ(s.input.debounce_ms, 30);
    EXPECT_EQ(s.input.debounce_samples, 3);
    EXPECT_EQ(s.input.touch_threshold, 2000);
    EXPECT_EQ(s.device_count, 0);
}

TEST(Config, MissingBrokerUriIsAnError)
{
    config::Settings s;
    EXPECT_EQ(parse("wifi:\n  ssid: a\n", s), ESP_ERR_INVALID_STATE);
    EXPECT_EQ(config::parse(nullptr, 0, s), ESP_ERR_INVALID_ARG);
}

TEST(Config, SkipsDevicesWithoutKey)
{
    config::Settings s;
    ASSERT_EQ(parse("mqtt:\n  uri: mqtt://x\n"
                    "devices:\n"
                    "  - default_text: orphan\n"
                    "  - key: fan\n"
                    "    action: blink\n",
                    s),
              ESP_OK);
    ASSERT_EQ(s.device_count, 1);
    EXPECT_STREQ(s.devices[0].key, "fan");
    EXPECT_EQ(s.devices[0].action, config::DeviceAction::None);
}

TEST(Config, CapsDeviceCount)
{
    std::string yaml = "mqtt:\n  uri: mqtt://x\ndevices:\n";
    for (int i = 0; i < config::kMaxDevices + 3; ++i)
    {
        yaml += "  - key: feed" + std::to_string(i) + "\n";
    }
    config::Settings s;
    ASSERT_EQ(parse(yaml, s), ESP_OK);
    EXPECT_EQ(s.device_count, config::kMaxDevices);
    EXPECT_STREQ(s.devices[config::kMaxDevices - 1].key, ("feed" + std::to_string(config::kMaxDevices - 1)).c_str());
}

TEST(Config, BadNumbersKeepDefaults)
{
    config::Settings s;
    ASSERT_EQ(parse("mqtt:\n  uri: mqtt://x\n  fetch_timeout_ms: soon\ninput:\n  debounce_ms: -5\n", s), ESP_OK);
    EXPECT_EQ(s.mqtt.fetch_timeout_ms, 3000);
    EXPECT_EQ(s.input.debounce_ms, 30);
}
