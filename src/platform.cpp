#include "ppass/platform.hpp"

namespace ppass {

bool accepts(PlatformTarget target, std::string_view tag) noexcept {
    switch(target){
        case PlatformTarget::NodeServer:
            return tag == "node" || tag == "server";
        case PlatformTarget::EdgeWorker:
            return tag == "edge-worker" || tag == "server";
        case PlatformTarget::BrowserWeb:
            return tag == "web" || tag == "browser" || tag == "client" || tag == "user-agent";
        case PlatformTarget::DesktopWebview:
            return tag == "desktop-webview" || tag == "browser" || tag == "client" || tag == "user-agent";
        case PlatformTarget::MobileWebview:
            return tag == "mobile-webview" || tag == "browser" || tag == "client";
        case PlatformTarget::MobileNative:
            return tag == "mobile-native" || tag == "user-agent";
    }
    return false;
}

bool is_client_target(PlatformTarget target) noexcept {
    switch(target){
        case PlatformTarget::NodeServer:
        case PlatformTarget::EdgeWorker:
            return false;
        case PlatformTarget::BrowserWeb:
        case PlatformTarget::DesktopWebview:
        case PlatformTarget::MobileWebview:
        case PlatformTarget::MobileNative:
            return true;
    }
    // Out-of-range values are treated as client so server code is stripped rather than shipped.
    return true;
}

std::string_view target_name(PlatformTarget target) noexcept {
    switch(target){
        case PlatformTarget::NodeServer: return "node-server";
        case PlatformTarget::EdgeWorker: return "edge-worker";
        case PlatformTarget::BrowserWeb: return "browser-web";
        case PlatformTarget::DesktopWebview: return "desktop-webview";
        case PlatformTarget::MobileWebview: return "mobile-webview";
        case PlatformTarget::MobileNative: return "mobile-native";
    }
    return "unknown";
}

std::optional<PlatformTarget> parse_target(std::string_view name) noexcept {
    for(auto t : all_targets){
        if(target_name(t) == name) return t;
    }
    return std::nullopt;
}

} // namespace ppass
