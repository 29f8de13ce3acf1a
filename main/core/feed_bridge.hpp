#pragma once

#include <map>
#include <string>
#include <vector>

#include "esp_err.h"
#include "core/feed_value.hpp"

namespace dash
{

    struct FeedUpdate
    {
        std::string feed_key;
        FeedValue value;
    };

    // Adapter over the pub/sub client. poll() must not block; fetch_all() may.
    class IFeedBridge
    {
    public:
        virtual ~IFeedBridge() = default;

        virtual esp_err_t subscribe(const std::string &feed_key) = 0;

        // Last known value per key. Keys that could not be fetched are absent
        // from out; ESP_ERR_TIMEOUT is returned when any key is missing.
        virtual esp_err_t fetch_all(const std::vector<std::string> &feed_keys,
                                    std::map<std::string, FeedValue> &out) = 0;

        // Append pending asynchronous updates (zero or more) in arrival order.
        virtual void poll(std::vector<FeedUpdate> &out) = 0;

        virtual esp_err_t publish(const std::string &feed_key, const FeedValue &value) = 0;
    };

} // namespace dash
