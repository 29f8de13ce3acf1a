#include "core/selection_controller.hpp"

#include "esp_log.h"

namespace dash
{

    namespace
    {
        static const char *TAG = "selection";
    }

    const char *mode_to_string(Mode mode)
    {
        return mode == Mode::Edit ? "EDIT" : "BROWSE";
    }

    SelectionController::Outcome SelectionController::handle(NavEvent event, const DeviceRegistry &registry)
    {
        Outcome out;

        const std::size_t n = registry.size();
        if (n == 0 || event == NavEvent::None)
        {
            return out;
        }

        if (mode_ == Mode::Edit)
        {
            switch (event)
            {
            case NavEvent::Back:
                mode_ = Mode::Browse;
                out.mode_changed = true;
                ESP_LOGI(TAG, "row %u: leave edit", static_cast<unsigned>(cursor_));
                break;
            case NavEvent::Submit:
                out.submit = true;
                ESP_LOGI(TAG, "row %u: submit", static_cast<unsigned>(cursor_));
                break;
            default:
                // Cursor stays put while editing.
                break;
            }
            return out;
        }

        switch (event)
        {
        case NavEvent::ScrollUp:
            cursor_ = (cursor_ + n - 1) % n;
            out.cursor_changed = true;
            break;
        case NavEvent::ScrollDown:
            cursor_ = (cursor_ + 1) % n;
            out.cursor_changed = true;
            break;
        case NavEvent::Select:
            if (registry.at(cursor_).editable())
            {
                mode_ = Mode::Edit;
                out.mode_changed = true;
                ESP_LOGI(TAG, "row %u: enter edit", static_cast<unsigned>(cursor_));
            }
            else
            {
                ESP_LOGD(TAG, "row %u is read-only, select ignored", static_cast<unsigned>(cursor_));
            }
            break;
        case NavEvent::Back:
        case NavEvent::Submit:
        default:
            break;
        }

        if (out.cursor_changed)
        {
            ESP_LOGI(TAG, "%s -> row %u/%u",
                     nav_event_to_string(event),
                     static_cast<unsigned>(cursor_),
                     static_cast<unsigned>(n));
        }
        return out;
    }

} // namespace dash
