#pragma once

#include "esp_err.h"
#include "esp_lcd_panel_io.h"
#include "esp_lcd_panel_ops.h"
#include "driver/gpio.h"
#include "driver/spi_master.h"

// LCD and SPI bus configuration (FunHouse 1.54" ST7789)
#define LCD_HOST (SPI2_HOST)
#define LCD_DRAW_BUFF_DOUBLE (0)
#define LCD_DRAW_BUFF_HEIGHT (40)
#define LCD_SPI_SPEED_MHZ (40)
#define LCD_TRANS_QUEUE_DEPTH (10)
#define LCD_CMD_BITS (8)
#define LCD_PARAM_BITS (8)
#define LCD_BK_LIGHT_ON_LEVEL 1
#define LCD_BK_LIGHT_OFF_LEVEL (!LCD_BK_LIGHT_ON_LEVEL)
#define PIN_LCD_MOSI (GPIO_NUM_35)
#define PIN_LCD_SCLK (GPIO_NUM_36)
#define PIN_LCD_CS (GPIO_NUM_40)
#define PIN_LCD_DC (GPIO_NUM_39)
#define PIN_LCD_RST (GPIO_NUM_41)
#define PIN_BK_LIGHT (GPIO_NUM_21)

#define LCD_H_RES 240
#define LCD_V_RES 240
#define LCD_BIT_PER_PIXEL (16)

#ifdef __cplusplus
extern "C" {
#endif

// Initialize display: SPI bus, ST7789 panel and backlight.
esp_err_t devices_display_init(void);

// Accessors used by LVGL.
esp_lcd_panel_io_handle_t devices_display_get_panel_io(void);
esp_lcd_panel_handle_t devices_display_get_panel(void);

#ifdef __cplusplus
}
#endif
