#include <gtest/gtest.h>

#include "core/selection_controller.hpp"

using dash::DeviceRegistry;
using dash::FeedValue;
using dash::Mode;
using dash::NavEvent;
using dash::SelectionController;

namespace
{
    // Rows: 0 editable, 1 read-only, 2 editable, 3 read-only.
    DeviceRegistry make_registry(std::size_t n)
    {
        DeviceRegistry reg;
        for (std::size_t i = 0; i < n; ++i)
        {
            dash::PubMethod pub;
            if (i % 2 == 0)
            {
                pub = [](const FeedValue &) {};
            }
            EXPECT_EQ(reg.add("feed" + std::to_string(i), "", "", pub, nullptr), ESP_OK);
        }
        return reg;
    }
}

TEST(SelectionController, StartsInBrowseAtRowZero)
{
    SelectionController c;
    EXPECT_EQ(c.mode(), Mode::Browse);
    EXPECT_EQ(c.current_index(), 0u);
}

TEST(SelectionController, EmptyRegistryIgnoresEverything)
{
    DeviceRegistry reg;
    SelectionController c;
    for (NavEvent ev : {NavEvent::ScrollUp, NavEvent::ScrollDown, NavEvent::Select, NavEvent::Back, NavEvent::Submit})
    {
        EXPECT_FALSE(c.handle(ev, reg).needs_render());
    }
    EXPECT_EQ(c.current_index(), 0u);
    EXPECT_EQ(c.mode(), Mode::Browse);
    EXPECT_FALSE(c.has_cursor(reg));
}

TEST(SelectionController, ScrollDownWrapsAfterNSteps)
{
    for (std::size_t n = 1; n <= 5; ++n)
    {
        DeviceRegistry reg = make_registry(n);
        SelectionController c;
        for (std::size_t i = 0; i < n; ++i)
        {
            EXPECT_TRUE(c.handle(NavEvent::ScrollDown, reg).cursor_changed);
        }
        EXPECT_EQ(c.current_index(), 0u) << "n=" << n;
    }
}

TEST(SelectionController, ScrollUpFromZeroGoesToLastRow)
{
    DeviceRegistry reg = make_registry(3);
    SelectionController c;
    c.handle(NavEvent::ScrollUp, reg);
    EXPECT_EQ(c.current_index(), 2u);
}

TEST(SelectionController, SelectOnReadOnlyRowNeverEntersEdit)
{
    DeviceRegistry reg = make_registry(4);
    SelectionController c;
    c.handle(NavEvent::ScrollDown, reg); // row 1, read-only
    SelectionController::Outcome out = c.handle(NavEvent::Select, reg);
    EXPECT_FALSE(out.mode_changed);
    EXPECT_EQ(c.mode(), Mode::Browse);

    c.handle(NavEvent::ScrollDown, reg);
    c.handle(NavEvent::ScrollDown, reg); // row 3, read-only
    c.handle(NavEvent::Select, reg);
    EXPECT_EQ(c.mode(), Mode::Browse);
}

TEST(SelectionController, EditIgnoresScrollAndSelect)
{
    DeviceRegistry reg = make_registry(4);
    SelectionController c;
    c.handle(NavEvent::ScrollDown, reg);
    c.handle(NavEvent::ScrollDown, reg); // row 2, editable
    ASSERT_TRUE(c.handle(NavEvent::Select, reg).mode_changed);
    ASSERT_EQ(c.mode(), Mode::Edit);

    const NavEvent noise[] = {NavEvent::ScrollUp, NavEvent::ScrollDown, NavEvent::Select,
                              NavEvent::ScrollDown, NavEvent::ScrollUp, NavEvent::ScrollUp};
    for (NavEvent ev : noise)
    {
        EXPECT_FALSE(c.handle(ev, reg).needs_render());
        EXPECT_EQ(c.current_index(), 2u);
        EXPECT_EQ(c.mode(), Mode::Edit);
    }
}

TEST(SelectionController, SubmitOnlyInEdit)
{
    DeviceRegistry reg = make_registry(2);
    SelectionController c;
    EXPECT_FALSE(c.handle(NavEvent::Submit, reg).submit);

    c.handle(NavEvent::Select, reg);
    SelectionController::Outcome out = c.handle(NavEvent::Submit, reg);
    EXPECT_TRUE(out.submit);
    EXPECT_FALSE(out.mode_changed);
    EXPECT_EQ(c.mode(), Mode::Edit);
}

TEST(SelectionController, BackLeavesEditWithoutMovingCursor)
{
    DeviceRegistry reg = make_registry(3);
    SelectionController c;
    c.handle(NavEvent::ScrollUp, reg); // row 2
    c.handle(NavEvent::Select, reg);
    SelectionController::Outcome out = c.handle(NavEvent::Back, reg);
    EXPECT_TRUE(out.mode_changed);
    EXPECT_FALSE(out.cursor_changed);
    EXPECT_EQ(c.mode(), Mode::Browse);
    EXPECT_EQ(c.current_index(), 2u);

    EXPECT_FALSE(c.handle(NavEvent::Back, reg).needs_render());
}
