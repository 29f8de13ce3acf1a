#pragma once

#include <cstddef>

#include "core/device_registry.hpp"
#include "core/nav_input_mux.hpp"

namespace dash
{

    enum class Mode
    {
        Browse,
        Edit,
    };

    const char *mode_to_string(Mode mode);

    // Cursor + mode state machine over the registry.
    //
    //   event       | Browse (N>0)               | Edit
    //   ------------+----------------------------+-----------------------
    //   ScrollUp    | cursor-1 (wraps)           | ignored
    //   ScrollDown  | cursor+1 (wraps)           | ignored
    //   Select      | -> Edit if row is editable | ignored
    //   Back        | no-op                      | -> Browse
    //   Submit      | no-op                      | submit, stays in Edit
    //
    // With N=0 every event is ignored. Mode changes never move the cursor.
    class SelectionController
    {
    public:
        struct Outcome
        {
            bool cursor_changed = false;
            bool mode_changed = false;
            bool submit = false;

            bool needs_render() const { return cursor_changed || mode_changed || submit; }
        };

        Outcome handle(NavEvent event, const DeviceRegistry &registry);

        std::size_t current_index() const { return cursor_; }
        Mode mode() const { return mode_; }
        bool has_cursor(const DeviceRegistry &registry) const { return !registry.empty(); }

    private:
        std::size_t cursor_ = 0;
        Mode mode_ = Mode::Browse;
    };

} // namespace dash
