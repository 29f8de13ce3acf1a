#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "esp_err.h"
#include "core/feed_value.hpp"
#include "core/row_template.hpp"

namespace dash
{

    // Called on Submit with the device's current value. Presence makes a row editable.
    using PubMethod = std::function<void(const FeedValue &current)>;

    // Optional per-row text colour (RGB888) derived from the current value.
    using ColorMethod = std::function<std::uint32_t(const FeedValue &current)>;

    // Optional row text built from the current value, used instead of the template.
    using TextMethod = std::function<std::string(const FeedValue &current)>;

    struct Device
    {
        std::string feed_key;
        std::string default_text;
        RowTemplate formatted_text;
        PubMethod pub_method;
        ColorMethod color_method;
        TextMethod text_method;
        FeedValue current_value;

        bool editable() const { return static_cast<bool>(pub_method); }
    };

    // Append-only, insertion-ordered list of dashboard rows.
    class DeviceRegistry
    {
    public:
        static constexpr int kNotFound = -1;

        // ESP_ERR_INVALID_ARG for an empty or duplicate key or a malformed template.
        // Empty default_text falls back to the key, empty formatted_text to "<key> : %s".
        esp_err_t add(const std::string &feed_key,
                      const std::string &default_text,
                      const std::string &formatted_text,
                      PubMethod pub_method,
                      ColorMethod color_method,
                      TextMethod text_method = nullptr);

        std::size_t size() const { return devices_.size(); }
        bool empty() const { return devices_.empty(); }

        const Device &at(std::size_t index) const { return devices_[index]; }
        Device &at(std::size_t index) { return devices_[index]; }

        int index_of(const std::string &feed_key) const;

        std::vector<std::string> keys() const;

        // Overwrite the cached value of the device bound to feed_key.
        // Returns the device index, or kNotFound for an unknown key.
        int set_value(const std::string &feed_key, const FeedValue &value);

        // Text for a row: default_text while unset, then text_method or the
        // formatted value. The raw value when the template does not fit or
        // text_method returns nothing.
        std::string row_text(std::size_t index) const;

    private:
        std::vector<Device> devices_;
    };

} // namespace dash
