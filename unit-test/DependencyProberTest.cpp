#include <thread>
#include <vector>
#include "exec/dependency_prober.hpp"
#include "gtest/gtest.h"
#include "test/fake_sandbox.hpp"

using namespace std;
using namespace kata;
using namespace kata::test;

static const chrono::milliseconds PROBE_TIMEOUT(1000);

TEST(DependencyProberTest, DetectsAllToolchains) {
    fake_sandbox sb;
    sb.respond = all_toolchains;
    dependency_prober prober(sb, PROBE_TIMEOUT);

    auto deps = prober.probe();
    EXPECT_TRUE(deps->all_available);

    EXPECT_TRUE(deps->python.available);
    EXPECT_EQ(deps->python.command, "python3");
    EXPECT_EQ(deps->python.version.value_or(""), "3.11.4");

    EXPECT_TRUE(deps->nodejs.available);
    EXPECT_EQ(deps->nodejs.version.value_or(""), "v20.5.1");

    EXPECT_TRUE(deps->typescript.available);
    EXPECT_EQ(deps->typescript.version.value_or(""), "5.1.6");

    EXPECT_TRUE(deps->cpp.available);
    EXPECT_EQ(deps->cpp.command, "g++");
    EXPECT_EQ(deps->cpp.version.value_or(""), "g++ (Ubuntu 11.4.0-1ubuntu1~22.04) 11.4.0");

    for (auto lang : all_languages)
        EXPECT_EQ(deps->missing_toolchain(lang), nullptr);
}

TEST(DependencyProberTest, MissingToolchainsHaveGuides) {
    fake_sandbox sb;
    dependency_prober prober(sb, PROBE_TIMEOUT);

    auto deps = prober.probe();
    EXPECT_FALSE(deps->all_available);
    for (auto *status : {&deps->python, &deps->nodejs, &deps->typescript, &deps->cpp}) {
        EXPECT_FALSE(status->available) << status->name;
        EXPECT_TRUE(status->error) << status->name;
        EXPECT_TRUE(status->installation_guide) << status->name;
    }
    EXPECT_EQ(deps->missing_toolchain(language::CPP), &deps->cpp);
}

TEST(DependencyProberTest, FallsBackToAlternativeCommands) {
    fake_sandbox sb;
    sb.respond = [](const runguard_options &opt) {
        const string &command = opt.command.at(0);
        if (command == "python") return exited(0, "", "Python 3.9.2\n");
        if (command == "clang++") return exited(0, "Ubuntu clang version 14.0.0-1ubuntu1\nTarget: x86_64-pc-linux-gnu\n");
        return not_found(command);
    };
    dependency_prober prober(sb, PROBE_TIMEOUT);

    auto deps = prober.probe();
    EXPECT_TRUE(deps->python.available);
    EXPECT_EQ(deps->python.command, "python");
    EXPECT_EQ(deps->python.version.value_or(""), "3.9.2");
    EXPECT_TRUE(deps->cpp.available);
    EXPECT_EQ(deps->cpp.command, "clang++");
    EXPECT_EQ(deps->cpp.version.value_or(""), "Ubuntu clang version 14.0.0-1ubuntu1");
}

TEST(DependencyProberTest, RejectsOutdatedVersions) {
    fake_sandbox sb;
    sb.respond = [](const runguard_options &opt) {
        const string &command = opt.command.at(0);
        if (command == "python3") return exited(0, "Python 3.6.9\n");
        if (command == "node") return exited(0, "v16.20.0\n");
        if (command == "tsc") return exited(0, "Version 5.1.6\n");
        return not_found(command);
    };
    dependency_prober prober(sb, PROBE_TIMEOUT);

    auto deps = prober.probe();
    EXPECT_FALSE(deps->python.available);
    EXPECT_NE(deps->python.error.value_or("").find("3.8"), string::npos);
    EXPECT_FALSE(deps->nodejs.available);
    EXPECT_NE(deps->nodejs.error.value_or("").find("18"), string::npos);

    // TypeScript 需要 Node.js
    EXPECT_TRUE(deps->typescript.available);
    EXPECT_EQ(deps->missing_toolchain(language::TYPESCRIPT), &deps->nodejs);
}

TEST(DependencyProberTest, FailingVersionQueryIsUnavailable) {
    fake_sandbox sb;
    sb.respond = [](const runguard_options &opt) {
        if (opt.command.at(0) == "node") {
            runguard_result result;
            result.timed_out = true;
            return result;
        }
        if (opt.command.at(0) == "tsc") return exited(1, "", "error");
        return not_found(opt.command.at(0));
    };
    dependency_prober prober(sb, PROBE_TIMEOUT);

    auto deps = prober.probe();
    EXPECT_FALSE(deps->nodejs.available);
    EXPECT_NE(deps->nodejs.error.value_or("").find("1000ms"), string::npos);
    EXPECT_FALSE(deps->typescript.available);
}

TEST(DependencyProberTest, ResultsAreCachedUntilRefresh) {
    fake_sandbox sb;
    sb.respond = all_toolchains;
    dependency_prober prober(sb, PROBE_TIMEOUT);
    EXPECT_FALSE(prober.cached());

    auto first = prober.probe();
    size_t spawned = sb.spawn_count();
    EXPECT_GT(spawned, 0);

    auto second = prober.probe();
    EXPECT_EQ(first, second);
    EXPECT_EQ(sb.spawn_count(), spawned);

    sb.respond = nullptr;
    auto refreshed = prober.refresh();
    EXPECT_NE(refreshed, first);
    EXPECT_FALSE(refreshed->python.available);
    EXPECT_EQ(prober.cached(), refreshed);

    // 旧快照不受刷新影响
    EXPECT_TRUE(first->python.available);
}

TEST(DependencyProberTest, ConcurrentProbesShareOneSnapshot) {
    fake_sandbox sb;
    sb.respond = all_toolchains;
    dependency_prober prober(sb, PROBE_TIMEOUT);

    vector<shared_ptr<const system_dependencies>> snapshots(8);
    vector<thread> threads;
    for (size_t i = 0; i < snapshots.size(); ++i)
        threads.emplace_back([&, i] { snapshots[i] = prober.probe(); });
    for (auto &t : threads) t.join();

    for (auto &snapshot : snapshots) EXPECT_EQ(snapshot, snapshots[0]);
}
