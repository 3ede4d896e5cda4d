// Build targets and the tag matrix that decides which platform-specific code each one keeps.
#pragma once
#include <array>
#include <optional>
#include <string_view>

namespace ppass {

enum class PlatformTarget
{
    NodeServer,
    EdgeWorker,
    BrowserWeb,
    DesktopWebview,
    MobileWebview,
    MobileNative
};

inline constexpr std::array<PlatformTarget, 6> all_targets{
    PlatformTarget::NodeServer, PlatformTarget::EdgeWorker, PlatformTarget::BrowserWeb,
    PlatformTarget::DesktopWebview, PlatformTarget::MobileWebview, PlatformTarget::MobileNative};

// Every tag some target accepts. Anything else never matches.
inline constexpr std::array<std::string_view, 10> known_tags{
    "node", "edge-worker", "web", "desktop-webview", "mobile-webview", "mobile-native",
    "server", "browser", "client", "user-agent"};

// True when `tag` (a directive label or runOn() argument) applies to `target`.
bool accepts(PlatformTarget target, std::string_view tag) noexcept;

// Client targets get server declarations stripped.
bool is_client_target(PlatformTarget target) noexcept;

std::string_view target_name(PlatformTarget target) noexcept;
std::optional<PlatformTarget> parse_target(std::string_view name) noexcept;

} // namespace ppass
