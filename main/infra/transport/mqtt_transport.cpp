#include "infra/transport/mqtt_transport.hpp"

#include <cstring>
#include "esp_log.h"

namespace transport {

namespace {
const char* TAG = "mqtt_transport";
}

MqttTransport::MqttTransport(const config::MqttSettings& settings)
    : settings_(settings)
{
}

MqttTransport::~MqttTransport()
{
    if (client_) {
        esp_mqtt_client_stop(client_);
        esp_mqtt_client_destroy(client_);
        client_ = nullptr;
    }
}

void MqttTransport::set_handler(MessageHandler handler)
{
    handler_ = handler;
}

void MqttTransport::set_connection_handler(ConnectionHandler handler)
{
    conn_handler_ = handler;
}

esp_err_t MqttTransport::start()
{
    if (client_) {
        return ESP_OK;
    }
    if (settings_.broker_uri[0] == '\0') {
        ESP_LOGE(TAG, "No broker uri configured");
        return ESP_ERR_INVALID_STATE;
    }

    ESP_LOGI(TAG, "MQTT cfg: uri=%s client_id=%s user=%s feeds=%s",
             settings_.broker_uri,
             settings_.client_id[0] ? settings_.client_id : "<auto>",
             settings_.username[0] ? settings_.username : "<none>",
             settings_.feeds_topic);

    esp_mqtt_client_config_t cfg = {};
    cfg.broker.address.uri = settings_.broker_uri;
    cfg.session.keepalive = 30;
    // Keep the MQTT task ahead of LVGL under load.
    cfg.task.priority = 8;
    cfg.task.stack_size = 6144;
    if (settings_.username[0] != '\0')
        cfg.credentials.username = settings_.username;
    if (settings_.password[0] != '\0')
        cfg.credentials.authentication.password = settings_.password;
    if (settings_.client_id[0] != '\0')
        cfg.credentials.client_id = settings_.client_id;
    cfg.buffer.size = 2048;
    cfg.network.reconnect_timeout_ms = 3000;

    client_ = esp_mqtt_client_init(&cfg);
    if (!client_) {
        return ESP_ERR_NO_MEM;
    }
    esp_err_t err = esp_mqtt_client_register_event(client_, MQTT_EVENT_ANY, &MqttTransport::on_event, this);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register MQTT events: %s", esp_err_to_name(err));
        return err;
    }
    err = esp_mqtt_client_start(client_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start MQTT client: %s", esp_err_to_name(err));
        return err;
    }
    return ESP_OK;
}

esp_err_t MqttTransport::publish(const char* topic, const char* payload, int qos, bool retain)
{
    if (!topic || !*topic) {
        return ESP_ERR_INVALID_ARG;
    }
    if (!client_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (!connected_) {
        ESP_LOGW(TAG, "PUB %s dropped: not connected", topic);
        return ESP_ERR_INVALID_STATE;
    }
    int len = payload ? static_cast<int>(std::strlen(payload)) : 0;
    int msg_id = esp_mqtt_client_publish(client_, topic, payload, len, qos, retain);
    ESP_LOGI(TAG, "PUB %s qos=%d retain=%d mid=%d len=%d", topic, qos, retain ? 1 : 0, msg_id, len);
    return (msg_id >= 0) ? ESP_OK : ESP_FAIL;
}

esp_err_t MqttTransport::subscribe(const char* topic, int qos)
{
    if (!topic || !*topic) {
        return ESP_ERR_INVALID_ARG;
    }
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        bool known = false;
        for (const auto& s : subs_) {
            if (s.topic == topic) {
                known = true;
                break;
            }
        }
        if (!known) {
            subs_.push_back({topic, qos});
        }
    }
    if (client_ && connected_) {
        int mid = esp_mqtt_client_subscribe(client_, topic, qos);
        ESP_LOGI(TAG, "SUB %s qos=%d mid=%d", topic, qos, mid);
        return (mid >= 0) ? ESP_OK : ESP_FAIL;
    }
    // Sent on the next MQTT_EVENT_CONNECTED.
    return ESP_OK;
}

bool MqttTransport::is_connected() const
{
    return connected_;
}

void MqttTransport::resubscribe()
{
    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (const auto& s : subs_) {
        int mid = esp_mqtt_client_subscribe(client_, s.topic.c_str(), s.qos);
        ESP_LOGI(TAG, "SUB %s qos=%d mid=%d", s.topic.c_str(), s.qos, mid);
    }
}

void MqttTransport::on_event(void* handler_args, esp_event_base_t /*base*/, int32_t /*event_id*/, void* event_data)
{
    auto* self = static_cast<MqttTransport*>(handler_args);
    if (self && event_data) {
        self->handle_event(static_cast<esp_mqtt_event_handle_t>(event_data));
    }
}

void MqttTransport::handle_event(esp_mqtt_event_handle_t event)
{
    switch (event->event_id) {
    case MQTT_EVENT_CONNECTED:
        connected_ = true;
        ESP_LOGI(TAG, "Connected to broker");
        resubscribe();
        if (conn_handler_) {
            conn_handler_(true);
        }
        break;
    case MQTT_EVENT_DISCONNECTED:
        connected_ = false;
        ESP_LOGW(TAG, "Disconnected from broker");
        if (conn_handler_) {
            conn_handler_(false);
        }
        break;
    case MQTT_EVENT_SUBSCRIBED:
        ESP_LOGD(TAG, "SUBACK mid=%d", event->msg_id);
        break;
    case MQTT_EVENT_PUBLISHED:
        ESP_LOGD(TAG, "PUBACK mid=%d", event->msg_id);
        break;
    case MQTT_EVENT_ERROR:
        ESP_LOGW(TAG, "MQTT error");
        if (event->error_handle) {
            ESP_LOGW(TAG, "err_type=%d tls_last=%d stack=%d sock=%d",
                     event->error_handle->error_type,
                     event->error_handle->esp_tls_last_esp_err,
                     event->error_handle->esp_tls_stack_err,
                     event->error_handle->esp_transport_sock_errno);
        }
        break;
    case MQTT_EVENT_DATA:
        // Payloads larger than the client buffer arrive in pieces; none are passed on.
        if (is_fragment(event->current_data_offset, event->data_len, event->total_data_len)) {
            if (event->current_data_offset == 0) {
                ESP_LOGW(TAG, "Dropping fragmented %d byte message", event->total_data_len);
            }
            break;
        }
        if (handler_ && event->topic && event->topic_len > 0) {
            char topic_buf[192];
            size_t tlen = static_cast<size_t>(event->topic_len);
            if (tlen >= sizeof(topic_buf)) {
                tlen = sizeof(topic_buf) - 1;
            }
            std::memcpy(topic_buf, event->topic, tlen);
            topic_buf[tlen] = '\0';
            handler_(topic_buf, event->data, event->data_len);
        }
        break;
    default:
        break;
    }
}

} // namespace transport
