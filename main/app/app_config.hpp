#pragma once

#include <cstdint>

namespace app_config
{

    // Accent/theme colors (RGB888 hex).
    constexpr std::uint32_t kThemePrimaryColorHex = 0x006aa3;
    constexpr std::uint32_t kThemeSecondaryColorHex = 0x303030;

    // Focused row background while editing.
    constexpr std::uint32_t kEditAccentColorHex = 0xd34836;

    // Row text colors for toggle devices.
    constexpr std::uint32_t kToggleOnColorHex = 0x00c853;
    constexpr std::uint32_t kToggleOffColorHex = 0x9e9e9e;

    // Period of the hub loop task.
    constexpr std::uint32_t kHubLoopPeriodMs = 10;

    constexpr std::uint32_t kHubTaskStack = 6144;
    constexpr std::uint32_t kHubTaskPriority = 5;

    // How long app_main waits for an IP before starting without one.
    constexpr int kWifiConnectTimeoutMs = 15000;

} // namespace app_config
