#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include "ppass/pipeline.hpp"

using namespace ppass;

// transform() keeps no shared state, so concurrent calls must agree with serial ones.
TEST(Concurrency, ParallelTransformsMatchSerialResults){
    const std::vector<std::string> sources = {
        "// @platform \"web\"\nconst w = 1;\n// @platform end\nconst s = api.createServerState(\"k\", \"t-secret\");\n",
        "const x = springboard.runOn(\"server\", () => boot()) ?? springboard.runOn(\"client\", hydrate);\n",
        "export const act = api.createServerActions({\n  run(a) { return a * 2; },\n});\n",
        "const broken = springboard.runOn(\"node\", () => {);\n",
        "export const plain = 42;\n",
    };
    std::vector<std::string> expected;
    for(const auto& s : sources)
        for(auto t : all_targets) expected.push_back(transform(s, t));

    const DiagnosticSink quiet([](Severity, const Diagnostic&){});
    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for(int w = 0; w < 8; ++w){
        workers.emplace_back([&]{
            for(int round = 0; round < 25; ++round){
                std::size_t i = 0;
                for(const auto& s : sources){
                    for(auto t : all_targets){
                        auto r = transform_module(s, t, TransformOptions{}, quiet);
                        if(r.code != expected[i]) ++mismatches;
                        ++i;
                    }
                }
            }
        });
    }
    for(auto& th : workers) th.join();
    EXPECT_EQ(mismatches.load(), 0);
}
