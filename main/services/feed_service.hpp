#pragma once

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "esp_err.h"
#include "config/config.hpp"
#include "core/feed_bridge.hpp"
#include "infra/transport/i_transport.hpp"

namespace feeds {

// IFeedBridge for Adafruit IO style brokers: feed <k> lives on
// "<feeds_topic>/<k>" and a publish to "<feeds_topic>/<k>/get" asks the
// broker to resend the last value there.
class MqttFeedBridge : public dash::IFeedBridge {
public:
    static constexpr std::size_t kMaxInbox = 64;

    MqttFeedBridge(transport::ITransport& transport, const config::MqttSettings& settings);
    ~MqttFeedBridge() override;

    MqttFeedBridge(const MqttFeedBridge&) = delete;
    MqttFeedBridge& operator=(const MqttFeedBridge&) = delete;

    // Install handlers and start the transport. Only one bridge may be started.
    esp_err_t start();

    esp_err_t subscribe(const std::string& feed_key) override;
    // Waits for the session within fetch_timeout_ms before asking for values.
    esp_err_t fetch_all(const std::vector<std::string>& feed_keys,
                        std::map<std::string, dash::FeedValue>& out) override;
    void poll(std::vector<dash::FeedUpdate>& out) override;
    esp_err_t publish(const std::string& feed_key, const dash::FeedValue& value) override;

    bool is_connected() const;

    std::string feed_topic(const std::string& feed_key) const;
    // Feed key for a topic under feeds_topic, or empty for foreign topics.
    std::string key_from_topic(const char* topic) const;

private:
    static void handle_message(const char* topic, const char* data, int len);
    static void handle_connection(bool connected);
    void push(const std::string& key, const dash::FeedValue& value);

    transport::ITransport& transport_;
    const config::MqttSettings& settings_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<dash::FeedUpdate> inbox_;
    bool online_ = false;
};

} // namespace feeds
