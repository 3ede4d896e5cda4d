#include <gtest/gtest.h>
#include <set>
#include <string>
#include "ppass/platform.hpp"

using namespace ppass;

static std::set<std::string> accepted_tags(PlatformTarget t){
    std::set<std::string> out;
    for(auto tag : known_tags) if(accepts(t, tag)) out.emplace(tag);
    return out;
}

TEST(PlatformMatrix, RowsMatchTheTable){
    using S = std::set<std::string>;
    EXPECT_EQ(accepted_tags(PlatformTarget::NodeServer), (S{"node", "server"}));
    EXPECT_EQ(accepted_tags(PlatformTarget::EdgeWorker), (S{"edge-worker", "server"}));
    EXPECT_EQ(accepted_tags(PlatformTarget::BrowserWeb), (S{"web", "browser", "client", "user-agent"}));
    EXPECT_EQ(accepted_tags(PlatformTarget::DesktopWebview), (S{"desktop-webview", "browser", "client", "user-agent"}));
    EXPECT_EQ(accepted_tags(PlatformTarget::MobileWebview), (S{"mobile-webview", "browser", "client"}));
    EXPECT_EQ(accepted_tags(PlatformTarget::MobileNative), (S{"mobile-native", "user-agent"}));
}

TEST(PlatformMatrix, UnknownTagsNeverMatch){
    const char* unknown[] = {"", "Node", "SERVER", "ios", "android", "web ", " web", "node-server",
                             "browser-web", "edge", "desktop", "mobile", "native", "user_agent"};
    for(auto t : all_targets){
        for(auto tag : unknown) EXPECT_FALSE(accepts(t, tag)) << target_name(t) << " accepted '" << tag << "'";
    }
}

TEST(PlatformMatrix, EveryKnownTagHasAnOwner){
    for(auto tag : known_tags){
        bool owned = false;
        for(auto t : all_targets) owned = owned || accepts(t, tag);
        EXPECT_TRUE(owned) << tag;
    }
}

TEST(PlatformMatrix, ClientClassification){
    EXPECT_FALSE(is_client_target(PlatformTarget::NodeServer));
    EXPECT_FALSE(is_client_target(PlatformTarget::EdgeWorker));
    EXPECT_TRUE(is_client_target(PlatformTarget::BrowserWeb));
    EXPECT_TRUE(is_client_target(PlatformTarget::DesktopWebview));
    EXPECT_TRUE(is_client_target(PlatformTarget::MobileWebview));
    EXPECT_TRUE(is_client_target(PlatformTarget::MobileNative));
}

TEST(PlatformMatrix, TargetNamesRoundTrip){
    for(auto t : all_targets){
        auto parsed = parse_target(target_name(t));
        ASSERT_TRUE(parsed.has_value()) << target_name(t);
        EXPECT_EQ(*parsed, t);
    }
    EXPECT_FALSE(parse_target("browser").has_value());
    EXPECT_FALSE(parse_target("").has_value());
    EXPECT_EQ(target_name(PlatformTarget::MobileWebview), "mobile-webview");
}
