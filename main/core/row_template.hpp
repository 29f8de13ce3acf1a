#pragma once

#include <string>

#include "esp_err.h"
#include "core/feed_value.hpp"

namespace dash
{

    // printf-style row template with exactly one conversion, e.g.
    // "Temperature: %.1f C" or "Humidity: %.2f%%".
    class RowTemplate
    {
    public:
        // Validate and split the template. ESP_ERR_INVALID_ARG when the template
        // has zero or several conversions, '*' widths, length modifiers or an
        // unknown conversion character.
        static esp_err_t compile(const std::string &text, RowTemplate &out);

        // Apply value to the template. Returns false on a value/conversion
        // mismatch (e.g. text into "%.1f"); out is left untouched then.
        bool format(const FeedValue &value, std::string &out) const;

        const std::string &source() const { return source_; }
        char conversion() const { return conv_; }

    private:
        std::string source_;
        std::string prefix_;
        std::string suffix_;
        std::string spec_; // "%-08.2" without the conversion character
        char conv_ = 's';
    };

} // namespace dash
