#include "input_init.hpp"

#include "esp_check.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

static const char *TAG_INPUT = "devices_input";

namespace devices {

BoardInputSampler::BoardInputSampler(const config::InputSettings& settings)
    : settings_(settings)
{
}

esp_err_t BoardInputSampler::init()
{
    if (ready_) {
        return ESP_OK;
    }

    gpio_config_t btn_cfg = {};
    btn_cfg.pin_bit_mask = (1ULL << PIN_BTN_UP) | (1ULL << PIN_BTN_SELECT) | (1ULL << PIN_BTN_DOWN);
    btn_cfg.mode = GPIO_MODE_INPUT;
    btn_cfg.pull_up_en = GPIO_PULLUP_DISABLE;
    btn_cfg.pull_down_en = GPIO_PULLDOWN_ENABLE;
    btn_cfg.intr_type = GPIO_INTR_DISABLE;
    ESP_RETURN_ON_ERROR(gpio_config(&btn_cfg), TAG_INPUT, "button GPIO config failed");

    ESP_RETURN_ON_ERROR(touch_pad_init(), TAG_INPUT, "touch init failed");
    ESP_RETURN_ON_ERROR(touch_pad_config(TOUCH_PAD_BACK), TAG_INPUT, "touch pad %d config failed", TOUCH_PAD_BACK);
    ESP_RETURN_ON_ERROR(touch_pad_config(TOUCH_PAD_SUBMIT), TAG_INPUT, "touch pad %d config failed", TOUCH_PAD_SUBMIT);
    ESP_RETURN_ON_ERROR(touch_pad_set_fsm_mode(TOUCH_FSM_MODE_TIMER), TAG_INPUT, "touch FSM mode failed");
    ESP_RETURN_ON_ERROR(touch_pad_fsm_start(), TAG_INPUT, "touch FSM start failed");

    // Let the FSM finish a few measurement cycles before sampling the baseline.
    vTaskDelay(pdMS_TO_TICKS(100));
    ESP_RETURN_ON_ERROR(touch_pad_read_raw_data(TOUCH_PAD_BACK, &back_baseline_), TAG_INPUT, "baseline read failed");
    ESP_RETURN_ON_ERROR(touch_pad_read_raw_data(TOUCH_PAD_SUBMIT, &submit_baseline_), TAG_INPUT, "baseline read failed");

    ESP_LOGI(TAG_INPUT, "Input ready: back baseline=%u submit baseline=%u threshold=%d",
             static_cast<unsigned>(back_baseline_), static_cast<unsigned>(submit_baseline_),
             settings_.touch_threshold);
    ready_ = true;
    return ESP_OK;
}

bool BoardInputSampler::read_pad(touch_pad_t pad, uint32_t baseline)
{
    uint32_t raw = 0;
    if (touch_pad_read_raw_data(pad, &raw) != ESP_OK) {
        return false;
    }
    // On the S2 the raw count rises with touch.
    return raw > baseline && (raw - baseline) > static_cast<uint32_t>(settings_.touch_threshold);
}

bool BoardInputSampler::read(dash::InputChannel channel)
{
    if (!ready_) {
        return false;
    }
    switch (channel) {
    case dash::InputChannel::Up:
        return gpio_get_level(PIN_BTN_UP) == 1;
    case dash::InputChannel::Select:
        return gpio_get_level(PIN_BTN_SELECT) == 1;
    case dash::InputChannel::Down:
        return gpio_get_level(PIN_BTN_DOWN) == 1;
    case dash::InputChannel::Back:
        return read_pad(TOUCH_PAD_BACK, back_baseline_);
    case dash::InputChannel::Submit:
        return read_pad(TOUCH_PAD_SUBMIT, submit_baseline_);
    }
    return false;
}

} // namespace devices
