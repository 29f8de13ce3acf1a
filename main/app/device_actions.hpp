#pragma once

#include "esp_err.h"
#include "config/config.hpp"
#include "core/hub.hpp"

namespace device_actions
{

    // Publish the negation of the current value through the hub.
    dash::PubMethod make_toggle(dash::Hub &hub, const std::string &feed_key);

    // Row color for toggle devices: on/off accent by truthiness.
    dash::ColorMethod make_toggle_color();

    // Register every configured device with the hub, in config order.
    // Stops at the first registration error.
    esp_err_t register_all(dash::Hub &hub, const config::Settings &settings);

} // namespace device_actions
