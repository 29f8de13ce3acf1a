#include "display_init.hpp"

#include "esp_check.h"
#include "esp_log.h"
#include "esp_lcd_panel_vendor.h"

static const char *TAG_DISPLAY = "devices_display";

static esp_lcd_panel_io_handle_t s_panel_io = nullptr;
static esp_lcd_panel_handle_t s_panel = nullptr;

esp_err_t devices_display_init(void)
{
    if (s_panel)
    {
        return ESP_OK;
    }

    gpio_config_t bk_cfg = {};
    bk_cfg.pin_bit_mask = 1ULL << PIN_BK_LIGHT;
    bk_cfg.mode = GPIO_MODE_OUTPUT;
    ESP_RETURN_ON_ERROR(gpio_config(&bk_cfg), TAG_DISPLAY, "backlight GPIO config failed");
    ESP_RETURN_ON_ERROR(gpio_set_level(PIN_BK_LIGHT, LCD_BK_LIGHT_OFF_LEVEL), TAG_DISPLAY, "backlight off failed");

    spi_bus_config_t bus_cfg = {};
    bus_cfg.mosi_io_num = PIN_LCD_MOSI;
    bus_cfg.miso_io_num = GPIO_NUM_NC;
    bus_cfg.sclk_io_num = PIN_LCD_SCLK;
    bus_cfg.quadwp_io_num = GPIO_NUM_NC;
    bus_cfg.quadhd_io_num = GPIO_NUM_NC;
    bus_cfg.max_transfer_sz = LCD_H_RES * LCD_DRAW_BUFF_HEIGHT * sizeof(uint16_t);
    ESP_RETURN_ON_ERROR(spi_bus_initialize(LCD_HOST, &bus_cfg, SPI_DMA_CH_AUTO), TAG_DISPLAY, "SPI init failed");

    esp_lcd_panel_io_spi_config_t io_cfg = {};
    io_cfg.cs_gpio_num = PIN_LCD_CS;
    io_cfg.dc_gpio_num = PIN_LCD_DC;
    io_cfg.spi_mode = 0;
    io_cfg.pclk_hz = LCD_SPI_SPEED_MHZ * 1000 * 1000;
    io_cfg.trans_queue_depth = LCD_TRANS_QUEUE_DEPTH;
    io_cfg.lcd_cmd_bits = LCD_CMD_BITS;
    io_cfg.lcd_param_bits = LCD_PARAM_BITS;
    ESP_RETURN_ON_ERROR(esp_lcd_new_panel_io_spi((esp_lcd_spi_bus_handle_t)LCD_HOST, &io_cfg, &s_panel_io),
                        TAG_DISPLAY, "panel IO init failed");

    esp_lcd_panel_dev_config_t panel_cfg = {};
    panel_cfg.reset_gpio_num = PIN_LCD_RST;
    panel_cfg.rgb_ele_order = LCD_RGB_ELEMENT_ORDER_RGB;
    panel_cfg.bits_per_pixel = LCD_BIT_PER_PIXEL;
    ESP_RETURN_ON_ERROR(esp_lcd_new_panel_st7789(s_panel_io, &panel_cfg, &s_panel), TAG_DISPLAY, "ST7789 init failed");

    ESP_RETURN_ON_ERROR(esp_lcd_panel_reset(s_panel), TAG_DISPLAY, "panel reset failed");
    ESP_RETURN_ON_ERROR(esp_lcd_panel_init(s_panel), TAG_DISPLAY, "panel init failed");
    // The FunHouse panel is IPS: colors are inverted by default.
    ESP_RETURN_ON_ERROR(esp_lcd_panel_invert_color(s_panel, true), TAG_DISPLAY, "invert failed");
    ESP_RETURN_ON_ERROR(esp_lcd_panel_disp_on_off(s_panel, true), TAG_DISPLAY, "display on failed");

    ESP_RETURN_ON_ERROR(gpio_set_level(PIN_BK_LIGHT, LCD_BK_LIGHT_ON_LEVEL), TAG_DISPLAY, "backlight on failed");
    ESP_LOGI(TAG_DISPLAY, "ST7789 %dx%d ready", LCD_H_RES, LCD_V_RES);
    return ESP_OK;
}

esp_lcd_panel_io_handle_t devices_display_get_panel_io(void)
{
    return s_panel_io;
}

esp_lcd_panel_handle_t devices_display_get_panel(void)
{
    return s_panel;
}
