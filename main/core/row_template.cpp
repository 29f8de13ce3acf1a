#include "core/row_template.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <vector>

#include "esp_log.h"

namespace dash
{

    namespace
    {
        static const char *TAG = "row_template";

        constexpr const char *kFlags = "-+ #0";
        constexpr const char *kConversions = "sdiuxXfFeEgG";

        bool is_integer_conv(char c)
        {
            return c == 'd' || c == 'i' || c == 'u' || c == 'x' || c == 'X';
        }

        bool is_float_conv(char c)
        {
            return std::strchr("fFeEgG", c) != nullptr;
        }

        template <typename T>
        std::string print(const std::string &fmt, T arg)
        {
            int n = std::snprintf(nullptr, 0, fmt.c_str(), arg);
            if (n <= 0)
            {
                return std::string();
            }
            std::vector<char> buf(static_cast<size_t>(n) + 1);
            std::snprintf(buf.data(), buf.size(), fmt.c_str(), arg);
            return std::string(buf.data(), static_cast<size_t>(n));
        }
    } // namespace

    esp_err_t RowTemplate::compile(const std::string &text, RowTemplate &out)
    {
        RowTemplate t;
        t.source_ = text;

        bool have_conv = false;
        std::string *literal = &t.prefix_;

        size_t i = 0;
        while (i < text.size())
        {
            char c = text[i];
            if (c != '%')
            {
                literal->push_back(c);
                ++i;
                continue;
            }

            if (i + 1 < text.size() && text[i + 1] == '%')
            {
                literal->push_back('%');
                i += 2;
                continue;
            }

            if (have_conv)
            {
                ESP_LOGE(TAG, "template '%s' has more than one conversion", text.c_str());
                return ESP_ERR_INVALID_ARG;
            }

            size_t j = i + 1;
            while (j < text.size() && std::strchr(kFlags, text[j]) != nullptr)
            {
                ++j;
            }
            while (j < text.size() && text[j] >= '0' && text[j] <= '9')
            {
                ++j;
            }
            if (j < text.size() && text[j] == '.')
            {
                ++j;
                while (j < text.size() && text[j] >= '0' && text[j] <= '9')
                {
                    ++j;
                }
            }
            if (j >= text.size() || text[j] == '\0' || std::strchr(kConversions, text[j]) == nullptr)
            {
                ESP_LOGE(TAG, "template '%s' has an unsupported conversion at offset %u",
                         text.c_str(), static_cast<unsigned>(i));
                return ESP_ERR_INVALID_ARG;
            }

            t.spec_ = text.substr(i, j - i);
            t.conv_ = text[j];
            have_conv = true;
            literal = &t.suffix_;
            i = j + 1;
        }

        if (!have_conv)
        {
            ESP_LOGE(TAG, "template '%s' has no conversion", text.c_str());
            return ESP_ERR_INVALID_ARG;
        }

        out = t;
        return ESP_OK;
    }

    bool RowTemplate::format(const FeedValue &value, std::string &out) const
    {
        if (!value.is_set())
        {
            return false;
        }

        std::string body;
        const FeedValue::Kind kind = value.kind();

        if (conv_ == 's')
        {
            body = print(spec_ + "s", value.raw().c_str());
        }
        else if (is_integer_conv(conv_))
        {
            double n = 0.0;
            if (kind == FeedValue::Kind::Bool)
            {
                n = value.as_bool() ? 1.0 : 0.0;
            }
            else if (kind == FeedValue::Kind::Number)
            {
                n = value.as_number();
            }
            else
            {
                return false;
            }
            if (!std::isfinite(n) || std::floor(n) != n || std::fabs(n) > 9.0e18)
            {
                return false;
            }
            if (conv_ == 'd' || conv_ == 'i')
            {
                body = print(spec_ + "ll" + conv_, static_cast<long long>(n));
            }
            else
            {
                if (n < 0)
                {
                    return false;
                }
                body = print(spec_ + "ll" + conv_, static_cast<unsigned long long>(n));
            }
        }
        else if (is_float_conv(conv_))
        {
            double n = 0.0;
            if (kind == FeedValue::Kind::Bool)
            {
                n = value.as_bool() ? 1.0 : 0.0;
            }
            else if (kind == FeedValue::Kind::Number)
            {
                n = value.as_number();
            }
            else
            {
                return false;
            }
            body = print(spec_ + conv_, n);
        }
        else
        {
            return false;
        }

        out = prefix_ + body + suffix_;
        return true;
    }

} // namespace dash
