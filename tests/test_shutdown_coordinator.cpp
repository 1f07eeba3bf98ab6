#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"
#include "sandbox/sandbox_runner.hpp"
#include "store/memory_audit_store.hpp"
#include "validation/validation_pipeline.hpp"
#include "mocks/mock_sandbox_runner.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

using namespace codeauditor;
using codeauditor::testing::MockSandboxRunner;
using codeauditor::testing::TempDir;
using codeauditor::testing::sh_sandbox;

namespace {

ShutdownCoordinator::Config drain_within(std::chrono::milliseconds timeout) {
    ShutdownCoordinator::Config cfg;
    cfg.drain_timeout = timeout;
    return cfg;
}

} // anonymous namespace

TEST_CASE("ShutdownCoordinator: admission counts while held", "[shutdown]") {
    ShutdownCoordinator sc;
    CHECK(sc.accepting());
    {
        auto a = sc.admit();
        REQUIRE(a);
        auto b = sc.admit();
        REQUIRE(b);
        CHECK(sc.in_flight() == 2);
    }
    CHECK(sc.in_flight() == 0);
}

TEST_CASE("ShutdownCoordinator: no admission after shutdown begins", "[shutdown]") {
    ShutdownCoordinator sc;
    auto held = sc.admit();
    REQUIRE(held);

    sc.begin_shutdown();
    sc.begin_shutdown();
    CHECK_FALSE(sc.accepting());
    CHECK_FALSE(sc.admit().has_value());
    // An admission taken before shutdown stays valid
    CHECK(sc.in_flight() == 1);
}

TEST_CASE("ShutdownCoordinator: idle server drains at once", "[shutdown]") {
    ShutdownCoordinator sc(drain_within(std::chrono::milliseconds(2000)));
    sc.begin_shutdown();

    const auto report = sc.drain();
    CHECK(report.drained);
    CHECK(report.abandoned == 0);
    CHECK(report.waited < std::chrono::milliseconds(500));
}

TEST_CASE("ShutdownCoordinator: moved admission is released exactly once", "[shutdown]") {
    ShutdownCoordinator sc;
    auto first = sc.admit();
    REQUIRE(first);

    std::optional<ShutdownCoordinator::Admission> second = std::move(first);
    first.reset();
    CHECK(sc.in_flight() == 1);

    auto third = sc.admit();
    REQUIRE(third);
    *third = std::move(*second);  // third's own slot is released, second's moves over
    CHECK(sc.in_flight() == 1);

    second.reset();
    CHECK(sc.in_flight() == 1);
    third.reset();
    CHECK(sc.in_flight() == 0);
}

TEST_CASE("ShutdownCoordinator: drain waits for a compile in progress and keeps its verdict",
          "[shutdown][sandbox]") {
    TempDir root;
    auto cfg = sh_sandbox("sleep 0.3; exit 0", root.path());
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(std::make_shared<ProcessSandboxRunner>(cfg),
                                DiagnosticNormalizer(), store, ValidationConfig{});
    ShutdownCoordinator sc(drain_within(std::chrono::milliseconds(10000)));

    std::promise<void> admitted;
    std::atomic<bool> stored{false};
    std::thread submission([&] {
        auto admission = sc.admit();
        admitted.set_value();
        if (!admission) return;
        stored = pipeline.validate("slow", "fn slow() {}").is_ok();
    });

    admitted.get_future().wait();
    sc.begin_shutdown();
    CHECK_FALSE(sc.admit().has_value());

    const auto report = sc.drain();
    submission.join();

    CHECK(report.drained);
    CHECK(report.abandoned == 0);
    CHECK(report.waited >= std::chrono::milliseconds(100));
    CHECK(stored);
    CHECK(store->size() == 1);
    CHECK(root.entry_count() == 0);
}

TEST_CASE("ShutdownCoordinator: stuck submission is reported as abandoned", "[shutdown]") {
    std::promise<void> release;
    auto released = release.get_future().share();
    auto sandbox = std::make_shared<MockSandboxRunner>([released](std::string_view) {
        released.wait();
        SandboxOutcome o;
        o.status = SandboxStatus::COMPILED;
        o.exit_code = 0;
        return o;
    });
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(sandbox, DiagnosticNormalizer(), store, ValidationConfig{});
    ShutdownCoordinator sc(drain_within(std::chrono::milliseconds(100)));

    std::thread submission([&] {
        auto admission = sc.admit();
        if (admission) {
            [[maybe_unused]] auto result = pipeline.validate("p", "fn f() {}");
        }
    });
    while (sandbox->run_count() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    sc.begin_shutdown();
    const auto report = sc.drain();
    CHECK_FALSE(report.drained);
    CHECK(report.abandoned == 1);
    CHECK(report.waited >= std::chrono::milliseconds(100));

    release.set_value();
    submission.join();
    CHECK(sc.in_flight() == 0);
}

TEST_CASE("ShutdownCoordinator: admissions racing shutdown all drain", "[shutdown][concurrency]") {
    ShutdownCoordinator sc(drain_within(std::chrono::milliseconds(5000)));
    std::atomic<int> admitted{0};
    std::atomic<int> refused{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> workers;
    for (int i = 0; i < 32; ++i) {
        workers.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            for (int j = 0; j < 100; ++j) {
                auto admission = sc.admit();
                if (admission) {
                    ++admitted;
                } else {
                    ++refused;
                }
            }
        });
    }

    go = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    sc.begin_shutdown();
    const auto report = sc.drain();
    for (auto& t : workers) t.join();

    CHECK(report.drained);
    CHECK(sc.in_flight() == 0);
    CHECK(admitted + refused == 3200);
    CHECK_FALSE(sc.admit().has_value());
}
