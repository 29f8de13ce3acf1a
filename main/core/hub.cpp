#include "core/hub.hpp"

#include <map>

#include "esp_log.h"

namespace dash
{

    namespace
    {
        static const char *TAG = "hub";
    }

    Hub::Hub(IFeedBridge &bridge,
             IInputSampler &sampler,
             IDisplayView &view,
             const DebounceConfig &debounce,
             ClockFn clock)
        : bridge_(bridge),
          view_(view),
          mux_(sampler, debounce),
          clock_(clock)
    {
    }

    esp_err_t Hub::add_device(const std::string &feed_key,
                              const std::string &default_text,
                              const std::string &formatted_text,
                              PubMethod pub_method,
                              ColorMethod color_method,
                              TextMethod text_method)
    {
        esp_err_t err = registry_.add(feed_key, default_text, formatted_text,
                                      std::move(pub_method), std::move(color_method),
                                      std::move(text_method));
        if (err != ESP_OK)
        {
            return err;
        }

        const std::size_t row = registry_.size() - 1;

        err = bridge_.subscribe(feed_key);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "subscribe '%s' failed: %s", feed_key.c_str(), esp_err_to_name(err));
        }

        view_.render(row, registry_.at(row).default_text);
        if (row == 0)
        {
            placeholder_shown_ = false;
            focus_pending_ = true;
        }
        return ESP_OK;
    }

    void Hub::get()
    {
        in_tick_ = true;

        const std::vector<std::string> keys = registry_.keys();
        if (!keys.empty())
        {
            std::map<std::string, FeedValue> values;
            esp_err_t err = bridge_.fetch_all(keys, values);
            if (err != ESP_OK)
            {
                ESP_LOGW(TAG, "bulk fetch incomplete: %s", esp_err_to_name(err));
            }

            for (const auto &key : keys)
            {
                auto it = values.find(key);
                if (it == values.end())
                {
                    ESP_LOGW(TAG, "no value for '%s', keeping default text", key.c_str());
                    continue;
                }
                registry_.set_value(key, it->second);
                ESP_LOGI(TAG, "fetched %s = %s", key.c_str(), it->second.raw().c_str());
            }
        }

        focus_pending_ = true;
        render_pending_ = true;

        in_tick_ = false;
        flush_render();
    }

    void Hub::loop()
    {
        in_tick_ = true;

        // Remote updates first: a submit later in the same tick wins.
        updates_.clear();
        bridge_.poll(updates_);
        for (const auto &u : updates_)
        {
            apply_update(u);
        }

        NavEvent event = NavEvent::None;
        if (mux_.poll_once(clock_(), event))
        {
            dispatch(event);
        }

        in_tick_ = false;
        flush_render();
    }

    esp_err_t Hub::publish(const std::string &feed_key, const FeedValue &value)
    {
        esp_err_t err = bridge_.publish(feed_key, value);
        const int idx = registry_.index_of(feed_key);
        const std::size_t row = idx == DeviceRegistry::kNotFound ? 0 : static_cast<std::size_t>(idx);
        emit(HubEvent::Type::Published, row, feed_key, err == ESP_OK);

        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "publish %s = %s failed: %s",
                     feed_key.c_str(), value.raw().c_str(), esp_err_to_name(err));
            return err;
        }

        ESP_LOGI(TAG, "published %s = %s", feed_key.c_str(), value.raw().c_str());

        if (idx != DeviceRegistry::kNotFound)
        {
            registry_.set_value(feed_key, value);
            mark_dirty(row);
        }

        if (!in_tick_)
        {
            flush_render();
        }
        return ESP_OK;
    }

    void Hub::apply_update(const FeedUpdate &update)
    {
        const int idx = registry_.set_value(update.feed_key, update.value);
        if (idx == DeviceRegistry::kNotFound)
        {
            ESP_LOGD(TAG, "update for unregistered feed '%s' ignored", update.feed_key.c_str());
            return;
        }

        ESP_LOGI(TAG, "feed %s <- %s", update.feed_key.c_str(), update.value.raw().c_str());
        emit(HubEvent::Type::FeedUpdated, static_cast<std::size_t>(idx), update.feed_key, true);
        mark_dirty(static_cast<std::size_t>(idx));
    }

    void Hub::dispatch(NavEvent event)
    {
        const SelectionController::Outcome out = controller_.handle(event, registry_);
        if (!out.needs_render())
        {
            return;
        }

        const std::size_t row = controller_.current_index();
        const std::string &key = registry_.at(row).feed_key;

        if (out.cursor_changed)
        {
            emit(HubEvent::Type::Navigate, row, key, true);
        }
        if (out.mode_changed)
        {
            emit(HubEvent::Type::ModeChanged, row, key, true);
        }
        if (out.cursor_changed || out.mode_changed)
        {
            focus_pending_ = true;
        }

        if (out.submit)
        {
            emit(HubEvent::Type::Submit, row, key, true);
            // Copies: the callback may publish, which rewrites current_value.
            PubMethod pub = registry_.at(row).pub_method;
            const FeedValue current = registry_.at(row).current_value;
            if (pub)
            {
                pub(current);
            }
        }

        render_pending_ = true;
    }

    void Hub::mark_dirty(std::size_t row)
    {
        if (!registry_.empty() && row == controller_.current_index())
        {
            render_pending_ = true;
        }
    }

    void Hub::flush_render()
    {
        if (registry_.empty())
        {
            if (!placeholder_shown_)
            {
                view_.render(0, kPlaceholderText);
                placeholder_shown_ = true;
            }
            render_pending_ = false;
            focus_pending_ = false;
            return;
        }

        if (!render_pending_ && !focus_pending_)
        {
            return;
        }

        const std::size_t row = controller_.current_index();
        const Device &d = registry_.at(row);

        if (focus_pending_)
        {
            view_.set_focus(row, controller_.mode() == Mode::Edit);
        }

        view_.render(row, registry_.row_text(row));

        if (d.color_method && d.current_value.is_set())
        {
            view_.set_row_color(row, d.color_method(d.current_value));
        }

        render_pending_ = false;
        focus_pending_ = false;
    }

    void Hub::emit(HubEvent::Type type, std::size_t row, const std::string &feed_key, bool success)
    {
        if (!sink_)
        {
            return;
        }
        HubEvent ev;
        ev.type = type;
        ev.row = row;
        ev.mode = controller_.mode();
        ev.feed_key = feed_key;
        ev.success = success;
        sink_(ev);
    }

} // namespace dash
