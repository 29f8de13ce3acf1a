#pragma once

#include "esp_err.h"
#include "lvgl.h"

#ifdef __cplusplus
extern "C" {
#endif

// Start the esp_lvgl_port task and register the panel from devices_display_init().
esp_err_t devices_lvgl_init(void);

lv_display_t *devices_lvgl_get_display(void);

esp_err_t devices_lvgl_deinit(void);

#ifdef __cplusplus
}
#endif
