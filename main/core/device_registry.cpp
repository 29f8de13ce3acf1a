#include "core/device_registry.hpp"

#include <utility>

#include "esp_log.h"

namespace dash
{

    namespace
    {
        static const char *TAG = "registry";
    }

    esp_err_t DeviceRegistry::add(const std::string &feed_key,
                                  const std::string &default_text,
                                  const std::string &formatted_text,
                                  PubMethod pub_method,
                                  ColorMethod color_method,
                                  TextMethod text_method)
    {
        if (feed_key.empty())
        {
            ESP_LOGE(TAG, "add: empty feed key");
            return ESP_ERR_INVALID_ARG;
        }
        if (index_of(feed_key) != kNotFound)
        {
            ESP_LOGE(TAG, "add: duplicate feed key '%s'", feed_key.c_str());
            return ESP_ERR_INVALID_ARG;
        }

        Device d;
        d.feed_key = feed_key;
        d.default_text = default_text.empty() ? feed_key : default_text;

        const std::string tmpl = formatted_text.empty() ? feed_key + " : %s" : formatted_text;
        esp_err_t err = RowTemplate::compile(tmpl, d.formatted_text);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "add: bad template for '%s'", feed_key.c_str());
            return err;
        }

        d.pub_method = std::move(pub_method);
        d.color_method = std::move(color_method);
        d.text_method = std::move(text_method);

        ESP_LOGI(TAG, "row %u: key=%s template='%s'%s",
                 static_cast<unsigned>(devices_.size()),
                 d.feed_key.c_str(),
                 tmpl.c_str(),
                 d.editable() ? " (editable)" : "");

        devices_.push_back(std::move(d));
        return ESP_OK;
    }

    int DeviceRegistry::index_of(const std::string &feed_key) const
    {
        for (size_t i = 0; i < devices_.size(); ++i)
        {
            if (devices_[i].feed_key == feed_key)
            {
                return static_cast<int>(i);
            }
        }
        return kNotFound;
    }

    std::vector<std::string> DeviceRegistry::keys() const
    {
        std::vector<std::string> out;
        out.reserve(devices_.size());
        for (const auto &d : devices_)
        {
            out.push_back(d.feed_key);
        }
        return out;
    }

    int DeviceRegistry::set_value(const std::string &feed_key, const FeedValue &value)
    {
        int idx = index_of(feed_key);
        if (idx == kNotFound)
        {
            return kNotFound;
        }
        devices_[static_cast<size_t>(idx)].current_value = value;
        return idx;
    }

    std::string DeviceRegistry::row_text(std::size_t index) const
    {
        const Device &d = devices_[index];
        if (!d.current_value.is_set())
        {
            return d.default_text;
        }

        std::string text;
        if (d.text_method)
        {
            text = d.text_method(d.current_value);
            if (!text.empty())
            {
                return text;
            }
            ESP_LOGW(TAG, "'%s': text callback returned nothing, showing raw value", d.feed_key.c_str());
            return d.current_value.raw();
        }

        if (d.formatted_text.format(d.current_value, text))
        {
            return text;
        }

        ESP_LOGW(TAG, "'%s': %s value '%s' does not fit '%s', showing raw value",
                 d.feed_key.c_str(),
                 kind_to_string(d.current_value.kind()),
                 d.current_value.raw().c_str(),
                 d.formatted_text.source().c_str());
        return d.current_value.raw();
    }

} // namespace dash
