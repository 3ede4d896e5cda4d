#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "ppass/directives.hpp"

using namespace ppass;

static std::size_t line_count(const std::string& s){
    return static_cast<std::size_t>(std::count(s.begin(), s.end(), '\n')) + 1;
}

static const std::string SCENARIO =
    "// @platform \"node\"\n"
    "const secret = \"node-only-secret\";\n"
    "// @platform end\n"
    "console.log(\"shared\");\n";

TEST(DirectiveBlocks, ScenarioOnBrowserErasesWithBlankLines){
    auto out = resolve_blocks(SCENARIO, PlatformTarget::BrowserWeb);
    EXPECT_EQ(out, "\n\n\nconsole.log(\"shared\");\n");
    EXPECT_EQ(out.find("node-only-secret"), std::string::npos);
}

TEST(DirectiveBlocks, ScenarioOnNodeKeepsInnerText){
    auto out = resolve_blocks(SCENARIO, PlatformTarget::NodeServer);
    EXPECT_EQ(out, "\nconst secret = \"node-only-secret\";\n\nconsole.log(\"shared\");\n");
}

TEST(DirectiveBlocks, NoMarkersIsIdentity){
    std::string src = "const a = 1;\n// @platform is mentioned here\n";
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::EdgeWorker), src);
}

TEST(DirectiveBlocks, ScanFindsBlocksInOrder){
    std::string src =
        "a();\n"
        "// @platform \"web\"\n"
        "b();\n"
        "// @platform end\n"
        "// @platform \"mobile-native\"\n"
        "c();\n"
        "// @platform end\n";
    auto blocks = scan_blocks(src);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].tag, "web");
    EXPECT_EQ(blocks[1].tag, "mobile-native");
    EXPECT_EQ(blocks[0].begin, src.find("// @platform \"web\""));
    EXPECT_EQ(src.substr(blocks[0].inner_begin, blocks[0].inner_end - blocks[0].inner_begin), "\nb();\n");
    EXPECT_EQ(blocks[1].end, src.size() - 1);

    EXPECT_EQ(resolve_blocks(src, PlatformTarget::BrowserWeb), "a();\n\nb();\n\n\n\n\n");
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::MobileNative), "a();\n\n\n\n\nc();\n\n");
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::NodeServer), "a();\n\n\n\n\n\n\n");
}

TEST(DirectiveBlocks, ContextAliasesFollowTheMatrix){
    std::string src = "// @platform \"client\"\nui();\n// @platform end\n";
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::MobileWebview), "\nui();\n\n");
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::MobileNative), "\n\n\n");
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::EdgeWorker), "\n\n\n");
}

TEST(DirectiveBlocks, UnknownTagIsErasedEverywhere){
    std::string src = "// @platform \"ios\"\nnative();\n// @platform end\nrest();\n";
    for(auto t : all_targets) EXPECT_EQ(resolve_blocks(src, t), "\n\n\nrest();\n");
}

TEST(DirectiveBlocks, BlocksDoNotNest){
    // The first end marker closes the outer block; the second end is left over.
    std::string src =
        "// @platform \"server\"\n"
        "// @platform \"node\"\n"
        "x();\n"
        "// @platform end\n"
        "y();\n"
        "// @platform end\n";
    auto blocks = scan_blocks(src);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].tag, "server");
    auto stray = unmatched_markers(src);
    ASSERT_EQ(stray.size(), 2u);
    EXPECT_EQ(stray[0], src.find("// @platform \"node\""));
    EXPECT_EQ(stray[1], src.rfind("// @platform end"));
}

TEST(DirectiveBlocks, UnmatchedStartPassesThrough){
    std::string src = "// @platform \"node\"\nconst a = 1;\n";
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::BrowserWeb), src);
    auto stray = unmatched_markers(src);
    ASSERT_EQ(stray.size(), 1u);
    EXPECT_EQ(stray[0], 0u);
}

TEST(DirectiveBlocks, EmptyTagIsNotAMarker){
    std::string src = "// @platform \"\"\nz();\n// @platform end\n";
    EXPECT_TRUE(scan_blocks(src).empty());
    EXPECT_EQ(resolve_blocks(src, PlatformTarget::NodeServer), src);
}

TEST(DirectiveBlocks, LineCountIsPreservedForEveryTarget){
    const std::string inputs[] = {
        SCENARIO,
        "",
        "// @platform \"web\"\n// @platform end",
        "// @platform \"web\"\r\nlet a;\r\n// @platform end\r\n",
        "x\n// @platform \"edge-worker\"\n\n\n// @platform end\ny\n// @platform \"node\"\nz",
        "/* @platform \"web\" */\n// @platform \"browser\" trailing\nq();\n// @platform end and more\n",
    };
    for(const auto& src : inputs){
        for(auto t : all_targets){
            auto out = resolve_blocks(src, t);
            EXPECT_EQ(line_count(out), line_count(src)) << target_name(t) << " on:\n" << src;
        }
    }
}
