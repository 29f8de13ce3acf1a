#include "row_list_view.hpp"

#include "esp_log.h"
#include "esp_lvgl_port.h"

#include "app/app_config.hpp"

namespace ui
{

    namespace
    {
        static const char *TAG = "row_list_view";

        constexpr int32_t kRowHeight = 40;
        constexpr int32_t kRowPadding = 6;
    }

    esp_err_t RowListView::init(lv_display_t *disp)
    {
        if (list_)
        {
            return ESP_OK;
        }
        if (!disp)
        {
            return ESP_ERR_INVALID_ARG;
        }

        if (!lvgl_port_lock(0))
        {
            return ESP_ERR_TIMEOUT;
        }
        lv_obj_t *screen = lv_display_get_screen_active(disp);
        lv_obj_set_style_bg_color(screen, lv_color_black(), 0);

        list_ = lv_obj_create(screen);
        lv_obj_set_size(list_, lv_pct(100), lv_pct(100));
        lv_obj_set_flex_flow(list_, LV_FLEX_FLOW_COLUMN);
        lv_obj_set_style_pad_all(list_, kRowPadding, 0);
        lv_obj_set_style_pad_row(list_, kRowPadding, 0);
        lv_obj_set_style_border_width(list_, 0, 0);
        lv_obj_set_style_radius(list_, 0, 0);
        lv_obj_set_style_bg_color(list_, lv_color_black(), 0);
        lv_obj_set_scrollbar_mode(list_, LV_SCROLLBAR_MODE_OFF);
        lvgl_port_unlock();

        ESP_LOGI(TAG, "Row list ready");
        return ESP_OK;
    }

    lv_obj_t *RowListView::ensure_row(std::size_t row)
    {
        while (rows_.size() <= row)
        {
            lv_obj_t *label = lv_label_create(list_);
            lv_obj_set_width(label, lv_pct(100));
            lv_obj_set_height(label, kRowHeight);
            lv_label_set_long_mode(label, LV_LABEL_LONG_DOT);
            lv_obj_set_style_pad_hor(label, kRowPadding, 0);
            lv_obj_set_style_pad_ver(label, (kRowHeight - lv_font_get_line_height(LV_FONT_DEFAULT)) / 2, 0);
            lv_obj_set_style_radius(label, 6, 0);
            lv_obj_set_style_text_color(label, lv_color_white(), 0);
            lv_label_set_text(label, "");
            apply_focus_style(label, false, false);
            rows_.push_back(label);
        }
        return rows_[row];
    }

    void RowListView::apply_focus_style(lv_obj_t *label, bool focused, bool editing)
    {
        if (!focused)
        {
            lv_obj_set_style_bg_opa(label, LV_OPA_TRANSP, 0);
            lv_obj_set_style_border_width(label, 0, 0);
            return;
        }
        const std::uint32_t hex = editing ? app_config::kEditAccentColorHex : app_config::kThemePrimaryColorHex;
        lv_obj_set_style_bg_color(label, lv_color_hex(hex), 0);
        lv_obj_set_style_bg_opa(label, editing ? LV_OPA_COVER : LV_OPA_60, 0);
        lv_obj_set_style_border_width(label, editing ? 2 : 0, 0);
        lv_obj_set_style_border_color(label, lv_color_white(), 0);
    }

    void RowListView::render(std::size_t row, const std::string &text)
    {
        if (!list_)
        {
            ESP_LOGW(TAG, "render before init (row %u)", static_cast<unsigned>(row));
            return;
        }
        if (!lvgl_port_lock(0))
        {
            return;
        }
        lv_label_set_text(ensure_row(row), text.c_str());
        lvgl_port_unlock();
    }

    void RowListView::set_focus(std::size_t row, bool editing)
    {
        if (!list_)
        {
            return;
        }
        if (!lvgl_port_lock(0))
        {
            return;
        }
        if (has_focus_ && focused_ < rows_.size() && focused_ != row)
        {
            apply_focus_style(rows_[focused_], false, false);
        }
        lv_obj_t *label = ensure_row(row);
        apply_focus_style(label, true, editing);
        lv_obj_scroll_to_view(label, LV_ANIM_ON);
        focused_ = row;
        has_focus_ = true;
        lvgl_port_unlock();
    }

    void RowListView::set_row_color(std::size_t row, std::uint32_t rgb)
    {
        if (!list_)
        {
            return;
        }
        if (!lvgl_port_lock(0))
        {
            return;
        }
        lv_obj_set_style_text_color(ensure_row(row), lv_color_hex(rgb), 0);
        lvgl_port_unlock();
    }

} // namespace ui
