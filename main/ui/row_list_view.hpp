#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "esp_err.h"
#include "lvgl.h"
#include "core/display_view.hpp"

namespace ui
{

    // One LVGL label per dashboard row in a scrolling column. Labels are created
    // on first render of their row. Safe to call from any task: every LVGL call
    // is taken under lvgl_port_lock.
    class RowListView : public dash::IDisplayView
    {
    public:
        RowListView() = default;
        RowListView(const RowListView &) = delete;
        RowListView &operator=(const RowListView &) = delete;

        esp_err_t init(lv_display_t *disp);

        void render(std::size_t row, const std::string &text) override;
        void set_focus(std::size_t row, bool editing) override;
        void set_row_color(std::size_t row, std::uint32_t rgb) override;

    private:
        lv_obj_t *ensure_row(std::size_t row);
        void apply_focus_style(lv_obj_t *label, bool focused, bool editing);

        lv_obj_t *list_ = nullptr;
        std::vector<lv_obj_t *> rows_;
        std::size_t focused_ = 0;
        bool has_focus_ = false;
    };

} // namespace ui
