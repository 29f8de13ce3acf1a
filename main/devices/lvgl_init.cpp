#include "lvgl_init.hpp"

#include "esp_log.h"
#include "esp_lvgl_port.h"

#include "app/app_config.hpp"
#include "display_init.hpp"

static const char *TAG_LVGL = "devices_lvgl";

static lv_display_t *s_lvgl_disp = nullptr;

esp_err_t devices_lvgl_init(void)
{
    if (s_lvgl_disp)
    {
        return ESP_OK;
    }
    if (!devices_display_get_panel())
    {
        ESP_LOGE(TAG_LVGL, "Display not initialized");
        return ESP_ERR_INVALID_STATE;
    }

    lvgl_port_cfg_t lvgl_cfg = {};
    lvgl_cfg.task_priority = 4;
    lvgl_cfg.task_stack = 6144;
    lvgl_cfg.task_affinity = -1;
    lvgl_cfg.task_max_sleep_ms = 100;
    lvgl_cfg.timer_period_ms = 5;
    esp_err_t err = lvgl_port_init(&lvgl_cfg);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_LVGL, "LVGL port initialization failed: %s", esp_err_to_name(err));
        return err;
    }

    lvgl_port_display_cfg_t disp_cfg = {};
    disp_cfg.io_handle = devices_display_get_panel_io();
    disp_cfg.panel_handle = devices_display_get_panel();
    disp_cfg.buffer_size = LCD_H_RES * LCD_DRAW_BUFF_HEIGHT;
    disp_cfg.double_buffer = LCD_DRAW_BUFF_DOUBLE;
    disp_cfg.hres = LCD_H_RES;
    disp_cfg.vres = LCD_V_RES;
    disp_cfg.monochrome = false;
    disp_cfg.color_format = LV_COLOR_FORMAT_RGB565;
    disp_cfg.rotation.swap_xy = false;
    disp_cfg.rotation.mirror_x = false;
    disp_cfg.rotation.mirror_y = false;
    disp_cfg.flags.buff_dma = true;
    disp_cfg.flags.swap_bytes = true;

    s_lvgl_disp = lvgl_port_add_disp(&disp_cfg);
    if (!s_lvgl_disp)
    {
        ESP_LOGE(TAG_LVGL, "Failed to register LVGL display");
        return ESP_FAIL;
    }

    lvgl_port_lock(-1);
    lv_color_t primary = lv_color_hex(app_config::kThemePrimaryColorHex);
    lv_color_t secondary = lv_color_hex(app_config::kThemeSecondaryColorHex);
    lv_theme_t *theme = lv_theme_default_init(s_lvgl_disp, primary, secondary, true, LV_FONT_DEFAULT);
    lv_display_set_theme(s_lvgl_disp, theme);
    lvgl_port_unlock();

    return ESP_OK;
}

lv_display_t *devices_lvgl_get_display(void)
{
    return s_lvgl_disp;
}

esp_err_t devices_lvgl_deinit(void)
{
    esp_err_t err = lvgl_port_deinit();
    s_lvgl_disp = nullptr;
    return err;
}
