#pragma once

#include "esp_err.h"

namespace transport {

// Broker connection. Handlers run on the transport's own task.
class ITransport {
public:
    // topic is null-terminated; data is not and carries len bytes.
    using MessageHandler = void(*)(const char* topic, const char* data, int len);
    using ConnectionHandler = void(*)(bool connected);

    virtual ~ITransport() = default;
    virtual esp_err_t start() = 0;
    virtual esp_err_t publish(const char* topic, const char* payload, int qos, bool retain) = 0;
    // Remembered and re-subscribed after every reconnect.
    virtual esp_err_t subscribe(const char* topic, int qos) = 0;
    virtual void set_handler(MessageHandler handler) = 0;
    virtual void set_connection_handler(ConnectionHandler handler) = 0;
    virtual bool is_connected() const = 0;
};

// True when a received chunk is only part of a message (offset into the
// payload, bytes in this chunk, full payload size).
inline bool is_fragment(int offset, int len, int total)
{
    return offset != 0 || len != total;
}

} // namespace transport
