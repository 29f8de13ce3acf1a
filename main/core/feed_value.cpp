#include "core/feed_value.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace dash
{

    namespace
    {
        bool iequals(const std::string &a, const char *b)
        {
            size_t i = 0;
            for (; i < a.size() && b[i] != '\0'; ++i)
            {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i])))
                {
                    return false;
                }
            }
            return i == a.size() && b[i] == '\0';
        }

        bool parse_number(const std::string &s, double &out)
        {
            if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())) ||
                std::isspace(static_cast<unsigned char>(s.back())))
            {
                return false;
            }
            // strtod also accepts "inf"/"nan"/hex; feeds only carry decimal numbers.
            for (char c : s)
            {
                if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' ||
                      c == '+' || c == 'e' || c == 'E'))
                {
                    return false;
                }
            }
            errno = 0;
            char *end = nullptr;
            double v = std::strtod(s.c_str(), &end);
            if (errno != 0 || end != s.c_str() + s.size())
            {
                return false;
            }
            out = v;
            return true;
        }
    } // namespace

    FeedValue FeedValue::boolean(bool value)
    {
        FeedValue v;
        v.kind_ = Kind::Bool;
        v.bool_ = value;
        v.raw_ = value ? "True" : "False";
        return v;
    }

    FeedValue FeedValue::number(double value)
    {
        FeedValue v;
        v.kind_ = Kind::Number;
        v.number_ = value;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.15g", value);
        v.raw_ = buf;
        return v;
    }

    FeedValue FeedValue::text(const std::string &value)
    {
        FeedValue v;
        v.kind_ = Kind::Text;
        v.raw_ = value;
        return v;
    }

    FeedValue FeedValue::parse(const char *data, int len)
    {
        std::string s;
        if (data && len > 0)
        {
            s.assign(data, data + len);
        }

        if (iequals(s, "true"))
        {
            return boolean(true);
        }
        if (iequals(s, "false"))
        {
            return boolean(false);
        }

        double n = 0.0;
        if (parse_number(s, n))
        {
            FeedValue v;
            v.kind_ = Kind::Number;
            v.number_ = n;
            v.raw_ = s;
            return v;
        }

        return text(s);
    }

    bool FeedValue::as_bool() const
    {
        switch (kind_)
        {
        case Kind::Bool:
            return bool_;
        case Kind::Number:
            return number_ != 0.0;
        case Kind::Text:
            return iequals(raw_, "on") || iequals(raw_, "true") || raw_ == "1";
        case Kind::None:
        default:
            return false;
        }
    }

    bool FeedValue::operator==(const FeedValue &other) const
    {
        if (kind_ != other.kind_)
        {
            return false;
        }
        switch (kind_)
        {
        case Kind::None:
            return true;
        case Kind::Bool:
            return bool_ == other.bool_;
        case Kind::Number:
            return number_ == other.number_;
        case Kind::Text:
        default:
            return raw_ == other.raw_;
        }
    }

    const char *kind_to_string(FeedValue::Kind kind)
    {
        switch (kind)
        {
        case FeedValue::Kind::None:
            return "none";
        case FeedValue::Kind::Bool:
            return "bool";
        case FeedValue::Kind::Number:
            return "number";
        case FeedValue::Kind::Text:
            return "text";
        default:
            return "unknown";
        }
    }

} // namespace dash
