#include <gtest/gtest.h>
#include "ppass/options.hpp"
#include "test_env.hpp"

using namespace ppass;

TEST(Options, DefaultsWithoutEnvironment){
    ScopedEnv a("PPASS_DEBUG", "");
    ScopedEnv b("PPASS_STRICT", "");
    ScopedEnv c("PPASS_PRESERVE_SERVER", "");
    ScopedEnv d("PPASS_DISPATCH_NAMESPACE", "");
    ScopedEnv e("PPASS_LANG", "");
    auto o = detect_options();
    EXPECT_FALSE(o.debug);
    EXPECT_FALSE(o.strict);
    EXPECT_FALSE(o.preserve_server_declarations);
    EXPECT_EQ(o.dispatch_namespace, "springboard");
    EXPECT_EQ(o.language, SourceLanguage::Tsx);
    EXPECT_EQ(o.path, "<memory>");
}

TEST(Options, ReadsEnvironment){
    ScopedEnv a("PPASS_DEBUG", "true");
    ScopedEnv b("PPASS_STRICT", "1");
    ScopedEnv c("PPASS_PRESERVE_SERVER", "yes");
    ScopedEnv d("PPASS_DISPATCH_NAMESPACE", "host");
    ScopedEnv e("PPASS_LANG", "TS");
    auto o = detect_options();
    EXPECT_TRUE(o.debug);
    EXPECT_TRUE(o.strict);
    EXPECT_TRUE(o.preserve_server_declarations);
    EXPECT_EQ(o.dispatch_namespace, "host");
    EXPECT_EQ(o.language, SourceLanguage::Ts);
}

TEST(Options, FalseyAndUnknownValues){
    ScopedEnv a("PPASS_STRICT", "0");
    ScopedEnv b("PPASS_LANG", "flow");
    auto o = detect_options();
    EXPECT_FALSE(o.strict);
    EXPECT_EQ(o.language, SourceLanguage::Tsx);
}

TEST(Options, EnvironmentLanguageBeatsTheExtension){
    {
        ScopedEnv lang("PPASS_LANG", "tsx");
        EXPECT_EQ(language_for_input("src/view.ts"), SourceLanguage::Tsx);
    }
    {
        ScopedEnv lang("PPASS_LANG", "ts");
        EXPECT_EQ(language_for_input("src/view.jsx"), SourceLanguage::Ts);
    }
    {
        ScopedEnv lang("PPASS_LANG", "flow");
        EXPECT_EQ(language_for_input("src/view.ts"), SourceLanguage::Ts);
    }
    ScopedEnv lang("PPASS_LANG", "");
    EXPECT_EQ(language_for_input("src/view.ts"), SourceLanguage::Ts);
    EXPECT_EQ(language_for_input("src/view.tsx"), SourceLanguage::Tsx);
}

TEST(Options, ParseLanguageNames){
    EXPECT_TRUE(parse_language("TSX") == SourceLanguage::Tsx);
    EXPECT_TRUE(parse_language("ts") == SourceLanguage::Ts);
    EXPECT_FALSE(parse_language("js").has_value());
}

TEST(Options, LanguageFromPath){
    EXPECT_EQ(language_for_path("a/b.ts"), SourceLanguage::Ts);
    EXPECT_EQ(language_for_path("a/b.mts"), SourceLanguage::Ts);
    EXPECT_EQ(language_for_path("a/b.cts"), SourceLanguage::Ts);
    EXPECT_EQ(language_for_path("a/b.tsx"), SourceLanguage::Tsx);
    EXPECT_EQ(language_for_path("a/b.jsx"), SourceLanguage::Tsx);
    EXPECT_EQ(language_for_path("a/b.js"), SourceLanguage::Tsx);
}
