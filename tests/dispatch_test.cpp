#include <gtest/gtest.h>
#include <string>
#include "ppass/dispatch.hpp"
#include "ppass/syntax/parser.hpp"

using namespace ppass;

namespace {

struct DispatchRun {
    std::string code;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
};

DispatchRun run(const std::string& src, PlatformTarget target, TransformOptions options = TransformOptions{}){
    DispatchRun r;
    DiagnosticSink quiet([](Severity, const Diagnostic&){});
    Reporter reporter{&r.errors, &r.warnings, &quiet};
    r.code = rewrite_dispatch(src, target, options, reporter);
    return r;
}

} // namespace

TEST(Dispatch, OutcomeFollowsTheMatrix){
    EXPECT_EQ(resolve_outcome(PlatformTarget::NodeServer, "server"), DispatchOutcome::InlineInvoke);
    EXPECT_EQ(resolve_outcome(PlatformTarget::MobileNative, "browser"), DispatchOutcome::NeutralValue);
    EXPECT_EQ(resolve_outcome(PlatformTarget::DesktopWebview, "user-agent"), DispatchOutcome::InlineInvoke);
    EXPECT_EQ(resolve_outcome(PlatformTarget::BrowserWeb, "nowhere"), DispatchOutcome::NeutralValue);
}

TEST(Dispatch, TokenPreCheck){
    EXPECT_TRUE(has_dispatch_token("x = springboard.runOn(\"node\", f)", "springboard"));
    EXPECT_FALSE(has_dispatch_token("x = springboard.runOn", "springboard"));
    EXPECT_FALSE(has_dispatch_token("x = springboard . runOn(\"node\", f)", "springboard"));
    EXPECT_FALSE(has_dispatch_token("x = springboard.runOn(\"node\", f)", "platform"));
}

TEST(Dispatch, InlinesAcceptedTag){
    auto r = run("const r = springboard.runOn(\"node\", () => 42);\n", PlatformTarget::NodeServer);
    EXPECT_EQ(r.code, "const r = (() => 42)();\n");
    EXPECT_TRUE(r.warnings.empty());
}

TEST(Dispatch, NeutralizesRejectedTag){
    auto r = run("const r = springboard.runOn(\"node\", () => 42);\n", PlatformTarget::BrowserWeb);
    EXPECT_EQ(r.code, "const r = undefined;\n");
}

TEST(Dispatch, IdentifierActionNeedsNoParens){
    auto r = run("springboard.runOn(\"server\", start);\n", PlatformTarget::EdgeWorker);
    EXPECT_EQ(r.code, "start();\n");
    r = run("springboard.runOn(\"web\", handlers.boot);\n", PlatformTarget::BrowserWeb);
    EXPECT_EQ(r.code, "handlers.boot();\n");
}

TEST(Dispatch, OptionalChainActionsAreParenthesized){
    std::string src =
        "const a = springboard.runOn(\"web\", hooks?.boot);\n"
        "const b = springboard.runOn(\"web\", hooks?.client.boot);\n"
        "const c = springboard.runOn(\"web\", hooks.client.boot);\n";
    EXPECT_EQ(run(src, PlatformTarget::BrowserWeb).code,
              "const a = (hooks?.boot)();\n"
              "const b = (hooks?.client.boot)();\n"
              "const c = hooks.client.boot();\n");
}

TEST(Dispatch, ParenthesizedPartsStillMatch){
    std::string src =
        "const a = springboard.runOn((\"web\"), boot);\n"
        "const b = (springboard.runOn)(\"web\", boot);\n"
        "const c = (springboard).runOn(\"node\", boot);\n";
    auto r = run(src, PlatformTarget::BrowserWeb);
    EXPECT_EQ(r.code,
              "const a = boot();\n"
              "const b = boot();\n"
              "const c = undefined;\n");
    EXPECT_TRUE(r.warnings.empty());
}

TEST(Dispatch, KeepsEnclosingAwaitAndLines){
    std::string src =
        "const v = await springboard.runOn(\"browser\", async () => {\n"
        "  return load();\n"
        "});\n"
        "done(v);\n";
    auto web = run(src, PlatformTarget::BrowserWeb);
    EXPECT_EQ(web.code,
              "const v = await (async () => {\n"
              "  return load();\n"
              "})();\n"
              "done(v);\n");
    auto node = run(src, PlatformTarget::NodeServer);
    EXPECT_EQ(node.code, "const v = await undefined\n\n;\ndone(v);\n");
}

TEST(Dispatch, FallbackChainsStayIntact){
    auto r = run("const x = springboard.runOn(\"web\", () => 1) ?? 2;", PlatformTarget::NodeServer);
    EXPECT_EQ(r.code, "const x = undefined ?? 2;");
    r = run("const x = springboard.runOn(\"web\", () => 1) ?? 2;", PlatformTarget::BrowserWeb);
    EXPECT_EQ(r.code, "const x = (() => 1)() ?? 2;");
}

TEST(Dispatch, NestedCallsAreAllResolved){
    std::string src = "const n = springboard.runOn(\"node\", () => springboard.runOn(\"web\", () => 1));";
    EXPECT_EQ(run(src, PlatformTarget::NodeServer).code, "const n = (() => undefined)();");
    EXPECT_EQ(run(src, PlatformTarget::BrowserWeb).code, "const n = undefined;");
}

TEST(Dispatch, CallsInsideFunctionsClassesAndJsx){
    std::string src =
        "class Player {\n"
        "  play() { return springboard.runOn(\"mobile-native\", () => native.play()); }\n"
        "}\n"
        "const el = <div>{springboard.runOn(\"web\", () => <span />)}</div>;\n";
    auto r = run(src, PlatformTarget::BrowserWeb);
    EXPECT_EQ(r.code,
              "class Player {\n"
              "  play() { return undefined; }\n"
              "}\n"
              "const el = <div>{(() => <span />)()}</div>;\n");
}

TEST(Dispatch, LeadingSemicolonGuardsStatementStarts){
    std::string src = "foo()\nspringboard.runOn(\"node\", () => go())\n";
    EXPECT_EQ(run(src, PlatformTarget::NodeServer).code, "foo()\n;(() => go())()\n");
    // undefined cannot continue the previous line
    EXPECT_EQ(run(src, PlatformTarget::BrowserWeb).code, "foo()\nundefined\n");
}

TEST(Dispatch, OnlyTheExactShapeMatches){
    std::string src =
        "other.runOn(\"node\", a);\n"
        "springboard.runOn(tag, b);\n"
        "springboard?.runOn(\"node\", c);\n"
        "springboard.runOn?.(\"node\", d);\n"
        "springboard[\"runOn\"](\"node\", e);\n"
        "springboard.runOn(`node`, f);\n"
        "springboard.runOn(\"node\");\n"
        "springboard.runOn(\"node\", ...rest);\n"
        "app.springboard.runOn(\"node\", g);\n";
    auto r = run(src, PlatformTarget::NodeServer);
    EXPECT_EQ(r.code, src);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(Dispatch, ExtraArgumentsAreDropped){
    auto r = run("springboard.runOn(\"node\", run, \"ignored\");", PlatformTarget::NodeServer);
    EXPECT_EQ(r.code, "run();");
}

TEST(Dispatch, CustomNamespace){
    TransformOptions options;
    options.dispatch_namespace = "platform";
    std::string src = "platform.runOn(\"server\", boot); springboard.runOn(\"server\", boot);";
    EXPECT_EQ(run(src, PlatformTarget::NodeServer, options).code, "boot(); springboard.runOn(\"server\", boot);");
}

TEST(Dispatch, TypeScriptAnnotationsSurvive){
    TransformOptions options;
    options.language = SourceLanguage::Ts;
    std::string src = "const x = springboard.runOn(\"node\", (): number => 1) as number;";
    EXPECT_EQ(run(src, PlatformTarget::NodeServer, options).code, "const x = ((): number => 1)() as number;");
}

TEST(Dispatch, ParseFailureIsFailOpen){
    std::string src = "const a = 1;\nspringboard.runOn(\"node\", () => {)\n";
    auto r = run(src, PlatformTarget::NodeServer);
    EXPECT_EQ(r.code, src);
    EXPECT_TRUE(r.errors.empty());
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].code, "W3101");
    EXPECT_EQ(r.warnings[0].line, 2);
    EXPECT_FALSE(r.warnings[0].hint.empty());
}

TEST(Dispatch, StrictParseFailureStaysAWarningOnServerTargets){
    TransformOptions options;
    options.strict = true;
    auto r = run("springboard.runOn(\"node\", () => {)", PlatformTarget::NodeServer, options);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.warnings.size(), 1u);
}

TEST(Dispatch, StrictParseFailureIsAnErrorOnClientTargets){
    TransformOptions options;
    options.strict = true;
    options.path = "boot.tsx";
    std::string src = "const k = springboard.runOn(\"server\", () => \"sk-live\");\nif (;\n";
    auto r = run(src, PlatformTarget::BrowserWeb, options);
    EXPECT_EQ(r.code, src);
    EXPECT_TRUE(r.warnings.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "E3101");
    EXPECT_EQ(r.errors[0].path, "boot.tsx");
    EXPECT_EQ(r.errors[0].line, 2);
}

TEST(Dispatch, RewriteCountsOnTheTree){
    std::string src = "a(springboard.runOn(\"node\", x), springboard.runOn(\"web\", y), springboard.runOn(\"server\", z));";
    auto program = syntax::Parser().parse(src);
    auto stats = rewrite_dispatch_calls(program, PlatformTarget::NodeServer, "springboard");
    EXPECT_EQ(stats.inlined, 2);
    EXPECT_EQ(stats.neutralized, 1);
}

TEST(Dispatch, ReplacementBuilders){
    auto action = syntax::Parser().parse("() => 1;")->children[0]->children[0];
    auto inlined = make_dispatch_replacement(DispatchOutcome::InlineInvoke, action);
    EXPECT_EQ(inlined->kind, syntax::node_kind::CallExpression);
    EXPECT_EQ(inlined->children.front()->kind, syntax::node_kind::Parenthesized);
    auto neutral = make_dispatch_replacement(DispatchOutcome::NeutralValue, action);
    EXPECT_EQ(neutral->kind, syntax::node_kind::Identifier);
    EXPECT_EQ(neutral->value, "undefined");
}
