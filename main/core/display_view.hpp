#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dash
{

    // Text row sink. Knows nothing about feeds or input.
    class IDisplayView
    {
    public:
        virtual ~IDisplayView() = default;

        virtual void render(std::size_t row, const std::string &text) = 0;

        // Move the highlight to row; editing selects the edit accent.
        virtual void set_focus(std::size_t /*row*/, bool /*editing*/) {}

        virtual void set_row_color(std::size_t /*row*/, std::uint32_t /*rgb*/) {}
    };

} // namespace dash
