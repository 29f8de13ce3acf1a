#pragma once

#include "esp_err.h"

namespace event_logger
{

    // Log every APP_EVENTS notification posted on the default event loop.
    esp_err_t init();

} // namespace event_logger
