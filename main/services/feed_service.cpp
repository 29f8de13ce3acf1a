#include "services/feed_service.hpp"

#include <chrono>
#include <cstring>
#include "esp_check.h"
#include "esp_log.h"

namespace feeds {

namespace {
const char* TAG = "feed_service";
MqttFeedBridge* s_instance = nullptr;
}

MqttFeedBridge::MqttFeedBridge(transport::ITransport& transport, const config::MqttSettings& settings)
    : transport_(transport), settings_(settings)
{
}

MqttFeedBridge::~MqttFeedBridge()
{
    if (s_instance == this) {
        transport_.set_handler(nullptr);
        transport_.set_connection_handler(nullptr);
        s_instance = nullptr;
    }
}

esp_err_t MqttFeedBridge::start()
{
    if (s_instance && s_instance != this) {
        ESP_LOGE(TAG, "Another feed bridge is already running");
        return ESP_ERR_INVALID_STATE;
    }
    s_instance = this;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        online_ = transport_.is_connected();
    }
    transport_.set_handler(&MqttFeedBridge::handle_message);
    transport_.set_connection_handler(&MqttFeedBridge::handle_connection);
    return transport_.start();
}

std::string MqttFeedBridge::feed_topic(const std::string& feed_key) const
{
    std::string topic(settings_.feeds_topic);
    topic += '/';
    topic += feed_key;
    return topic;
}

std::string MqttFeedBridge::key_from_topic(const char* topic) const
{
    if (!topic) {
        return std::string();
    }
    const size_t prefix_len = std::strlen(settings_.feeds_topic);
    if (std::strncmp(topic, settings_.feeds_topic, prefix_len) != 0 || topic[prefix_len] != '/') {
        return std::string();
    }
    const char* key = topic + prefix_len + 1;
    if (*key == '\0' || std::strchr(key, '/') != nullptr) {
        return std::string();
    }
    return std::string(key);
}

esp_err_t MqttFeedBridge::subscribe(const std::string& feed_key)
{
    ESP_RETURN_ON_FALSE(!feed_key.empty(), ESP_ERR_INVALID_ARG, TAG, "subscribe: empty feed key");
    const std::string topic = feed_topic(feed_key);
    esp_err_t err = transport_.subscribe(topic.c_str(), 1);
    if (err == ESP_OK) {
        ESP_LOGI(TAG, "Subscribed %s", topic.c_str());
    }
    return err;
}

esp_err_t MqttFeedBridge::fetch_all(const std::vector<std::string>& feed_keys,
                                    std::map<std::string, dash::FeedValue>& out)
{
    if (feed_keys.empty()) {
        return ESP_OK;
    }

    auto wanted = [&feed_keys](const std::string& key) {
        for (const auto& k : feed_keys) {
            if (k == key) {
                return true;
            }
        }
        return false;
    };

    auto collect = [&]() {
        for (auto it = inbox_.begin(); it != inbox_.end();) {
            if (wanted(it->feed_key)) {
                out[it->feed_key] = it->value;
                it = inbox_.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& k : feed_keys) {
            if (out.find(k) == out.end()) {
                return false;
            }
        }
        return true;
    };

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(settings_.fetch_timeout_ms);
    std::unique_lock<std::mutex> lock(mutex_);

    // Requests are only sent on a live session and resent after a reconnect.
    while (!collect()) {
        if (!cv_.wait_until(lock, deadline, [this] { return online_; })) {
            break;
        }

        std::vector<std::string> missing;
        for (const auto& k : feed_keys) {
            if (out.find(k) == out.end()) {
                missing.push_back(k);
            }
        }

        // Unlocked: a reply may be delivered before publish returns.
        lock.unlock();
        for (const auto& key : missing) {
            const std::string topic = feed_topic(key) + "/get";
            esp_err_t err = transport_.publish(topic.c_str(), "", 1, false);
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "Fetch request for %s failed: %s", key.c_str(), esp_err_to_name(err));
            }
        }
        lock.lock();

        if (!cv_.wait_until(lock, deadline, [&] { return collect() || !online_; })) {
            break;
        }
    }

    if (!collect()) {
        ESP_LOGW(TAG, "Fetch timed out after %d ms (%u/%u feeds)", settings_.fetch_timeout_ms,
                 static_cast<unsigned>(out.size()), static_cast<unsigned>(feed_keys.size()));
        return ESP_ERR_TIMEOUT;
    }
    return ESP_OK;
}

void MqttFeedBridge::poll(std::vector<dash::FeedUpdate>& out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    while (!inbox_.empty()) {
        out.push_back(std::move(inbox_.front()));
        inbox_.pop_front();
    }
}

esp_err_t MqttFeedBridge::publish(const std::string& feed_key, const dash::FeedValue& value)
{
    ESP_RETURN_ON_FALSE(!feed_key.empty() && value.is_set(), ESP_ERR_INVALID_ARG, TAG,
                        "publish: empty key or unset value");
    const std::string topic = feed_topic(feed_key);
    esp_err_t err = transport_.publish(topic.c_str(), value.raw().c_str(), 1, false);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Publish %s failed (%s)", topic.c_str(), esp_err_to_name(err));
    }
    return err;
}

bool MqttFeedBridge::is_connected() const
{
    return transport_.is_connected();
}

void MqttFeedBridge::push(const std::string& key, const dash::FeedValue& value)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inbox_.size() >= kMaxInbox) {
            ESP_LOGW(TAG, "Inbox full, dropping update for %s", inbox_.front().feed_key.c_str());
            inbox_.pop_front();
        }
        inbox_.push_back({key, value});
    }
    cv_.notify_all();
}

void MqttFeedBridge::handle_message(const char* topic, const char* data, int len)
{
    if (!s_instance || !topic) {
        return;
    }
    std::string key = s_instance->key_from_topic(topic);
    if (key.empty()) {
        ESP_LOGD(TAG, "Ignoring message on %s", topic);
        return;
    }
    s_instance->push(key, dash::FeedValue::parse(data, len));
}

void MqttFeedBridge::handle_connection(bool connected)
{
    if (s_instance) {
        {
            std::lock_guard<std::mutex> lock(s_instance->mutex_);
            s_instance->online_ = connected;
        }
        s_instance->cv_.notify_all();
    }
    if (connected) {
        ESP_LOGI(TAG, "Feeds online (%s)", s_instance ? s_instance->settings_.feeds_topic : "?");
    } else {
        ESP_LOGW(TAG, "Feeds offline, updates paused until reconnect");
    }
}

} // namespace feeds
