#pragma once

#include <cstdint>

#include "esp_err.h"
#include "driver/gpio.h"
#include "driver/touch_pad.h"

#include "config/config.hpp"
#include "core/nav_input_mux.hpp"

// FunHouse front buttons: active high, external pull-down.
#define PIN_BTN_UP (GPIO_NUM_5)
#define PIN_BTN_SELECT (GPIO_NUM_4)
#define PIN_BTN_DOWN (GPIO_NUM_3)

// Capacitive pads used as Back and Submit.
#define TOUCH_PAD_BACK (TOUCH_PAD_NUM7)
#define TOUCH_PAD_SUBMIT (TOUCH_PAD_NUM8)

namespace devices {

// Raw levels for the navigation mux. Debouncing happens in the mux, not here.
class BoardInputSampler : public dash::IInputSampler {
public:
    explicit BoardInputSampler(const config::InputSettings& settings);

    // Configure GPIOs and the touch FSM, then capture the pad baselines.
    // Pads must not be touched while this runs.
    esp_err_t init();

    bool read(dash::InputChannel channel) override;

private:
    bool read_pad(touch_pad_t pad, uint32_t baseline);

    const config::InputSettings& settings_;
    uint32_t back_baseline_ = 0;
    uint32_t submit_baseline_ = 0;
    bool ready_ = false;
};

} // namespace devices
