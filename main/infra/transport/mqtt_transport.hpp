#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "esp_event.h"
#include "mqtt_client.h"

#include "config/config.hpp"
#include "infra/transport/i_transport.hpp"

namespace transport {

// ITransport over esp-mqtt. Auto-reconnect is left to the client; the
// subscription list is replayed on every MQTT_EVENT_CONNECTED.
class MqttTransport : public ITransport {
public:
    explicit MqttTransport(const config::MqttSettings& settings);
    ~MqttTransport() override;

    MqttTransport(const MqttTransport&) = delete;
    MqttTransport& operator=(const MqttTransport&) = delete;

    esp_err_t start() override;
    esp_err_t publish(const char* topic, const char* payload, int qos, bool retain) override;
    esp_err_t subscribe(const char* topic, int qos) override;
    void set_handler(MessageHandler handler) override;
    void set_connection_handler(ConnectionHandler handler) override;
    bool is_connected() const override;

private:
    struct Subscription {
        std::string topic;
        int qos;
    };

    static void on_event(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handle_event(esp_mqtt_event_handle_t event);
    void resubscribe();

    const config::MqttSettings& settings_;
    esp_mqtt_client_handle_t client_ = nullptr;
    std::atomic<bool> connected_{false};
    MessageHandler handler_ = nullptr;
    ConnectionHandler conn_handler_ = nullptr;

    std::mutex subs_mutex_;
    std::vector<Subscription> subs_;
};

} // namespace transport
