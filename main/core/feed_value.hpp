#pragma once

#include <string>

namespace dash
{

    // Typed value carried by a feed. Payloads arrive as text on the wire and are
    // classified once, at the bridge, so nothing downstream re-interprets strings.
    class FeedValue
    {
    public:
        enum class Kind
        {
            None,
            Bool,
            Number,
            Text,
        };

        FeedValue() = default;

        static FeedValue boolean(bool value);
        static FeedValue number(double value);
        static FeedValue text(const std::string &value);

        // Classify a wire payload: true/false (any case) -> Bool,
        // fully numeric -> Number (wire text kept), else Text.
        static FeedValue parse(const char *data, int len);

        Kind kind() const { return kind_; }
        bool is_set() const { return kind_ != Kind::None; }

        bool as_bool() const;
        double as_number() const { return number_; }

        // Raw/wire form: "True"/"False", the numeric text, or the text itself.
        const std::string &raw() const { return raw_; }

        bool operator==(const FeedValue &other) const;
        bool operator!=(const FeedValue &other) const { return !(*this == other); }

    private:
        Kind kind_ = Kind::None;
        bool bool_ = false;
        double number_ = 0.0;
        std::string raw_;
    };

    const char *kind_to_string(FeedValue::Kind kind);

} // namespace dash
