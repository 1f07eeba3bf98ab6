#include <catch2/catch_test_macros.hpp>
#include "validation/validation_pipeline.hpp"
#include "store/memory_audit_store.hpp"
#include "mocks/failing_audit_store.hpp"
#include "mocks/mock_sandbox_runner.hpp"
#include "test_support.hpp"

#include <format>
#include <set>
#include <thread>
#include <vector>

using namespace codeauditor;
using codeauditor::testing::FailingAuditStore;
using codeauditor::testing::MockSandboxRunner;
using codeauditor::testing::TempDir;
using codeauditor::testing::sh_sandbox;

namespace {

// Compiler stand-in: fails when the source contains "ERROR", echoing the source
std::shared_ptr<MockSandboxRunner> echo_compiler() {
    return std::make_shared<MockSandboxRunner>([](std::string_view source) {
        SandboxOutcome o;
        if (source.find("ERROR") != std::string_view::npos) {
            o.status = SandboxStatus::COMPILE_FAILED;
            o.exit_code = 1;
            o.output = std::format("error: {}\n", source);
        } else {
            o.status = SandboxStatus::COMPILED;
            o.exit_code = 0;
        }
        return o;
    });
}

} // anonymous namespace

TEST_CASE("ValidationPipeline: compiling code is stored as valid", "[pipeline]") {
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(echo_compiler(), DiagnosticNormalizer(), store);

    const auto before = utils::now();
    auto result = pipeline.validate("add two numbers", "fn add(a: i32, b: i32) -> i32 { a + b }");
    REQUIRE(result.is_ok());

    const auto& r = result.value();
    CHECK(utils::is_uuid(r.id));
    CHECK(r.is_valid);
    CHECK_FALSE(r.diagnostic.has_value());
    CHECK(r.prompt == "add two numbers");
    CHECK(r.generated_code == "fn add(a: i32, b: i32) -> i32 { a + b }");
    CHECK(r.created_at >= before);

    auto stored = store->find_by_id(r.id);
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->is_valid);
}

TEST_CASE("ValidationPipeline: failing code is stored with its diagnostic", "[pipeline]") {
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(echo_compiler(), DiagnosticNormalizer(), store);

    auto result = pipeline.validate("p", "ERROR here");
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().is_valid);
    CHECK(result.value().diagnostic == std::optional<std::string>("error: ERROR here"));
    CHECK(store->size() == 1);
}

TEST_CASE("ValidationPipeline: timeout is an invalid verdict", "[pipeline]") {
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(MockSandboxRunner::fixed(SandboxStatus::TIMED_OUT), DiagnosticNormalizer(), store);

    auto result = pipeline.validate("p", "loop {}");
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().is_valid);
    CHECK(result.value().diagnostic == std::optional<std::string>("compilation timed out"));
}

TEST_CASE("ValidationPipeline: blank input is rejected before compiling", "[pipeline]") {
    auto store = std::make_shared<MemoryAuditStore>();
    auto sandbox = echo_compiler();
    ValidationPipeline pipeline(sandbox, DiagnosticNormalizer(), store);

    auto no_prompt = pipeline.validate("", "fn f() {}");
    REQUIRE(no_prompt.is_error());
    CHECK(no_prompt.error_category() == ErrorCategory::INVALID_INPUT);
    CHECK(no_prompt.error_message() == "prompt must not be empty");

    auto blank_code = pipeline.validate("p", " \n\t ");
    REQUIRE(blank_code.is_error());
    CHECK(blank_code.error_category() == ErrorCategory::INVALID_INPUT);
    CHECK(blank_code.error_message() == "generated_code must not be empty");

    CHECK(sandbox->run_count() == 0);
    CHECK(store->size() == 0);
}

TEST_CASE("ValidationPipeline: oversized input is rejected", "[pipeline]") {
    auto store = std::make_shared<MemoryAuditStore>();
    auto sandbox = echo_compiler();
    ValidationConfig limits;
    limits.max_prompt_bytes = 10;
    limits.max_code_bytes = 20;
    ValidationPipeline pipeline(sandbox, DiagnosticNormalizer(), store, limits);

    auto long_prompt = pipeline.validate(std::string(11, 'p'), "fn f() {}");
    REQUIRE(long_prompt.is_error());
    CHECK(long_prompt.error_message() == "prompt exceeds 10 bytes");

    auto long_code = pipeline.validate("p", std::string(21, 'c'));
    REQUIRE(long_code.is_error());
    CHECK(long_code.error_message() == "generated_code exceeds 20 bytes");

    CHECK(pipeline.validate(std::string(10, 'p'), std::string(20, 'c')).is_ok());
    CHECK(sandbox->run_count() == 1);
}

TEST_CASE("ValidationPipeline: sandbox infrastructure failure stores nothing", "[pipeline]") {
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(MockSandboxRunner::fixed(SandboxStatus::INFRASTRUCTURE_ERROR),
                                DiagnosticNormalizer(), store);

    auto result = pipeline.validate("p", "fn f() {}");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INFRASTRUCTURE_ERROR);
    CHECK(result.error_message().find("mock spawn failure") != std::string::npos);
    CHECK(store->size() == 0);
}

TEST_CASE("ValidationPipeline: storage failure is reported", "[pipeline]") {
    auto store = std::make_shared<FailingAuditStore>();
    store->set_fail_writes(true);
    ValidationPipeline pipeline(echo_compiler(), DiagnosticNormalizer(), store);

    auto result = pipeline.validate("p", "fn f() {}");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORAGE_ERROR);
    CHECK(store->size() == 0);
}

TEST_CASE("ValidationPipeline: concurrent submissions keep their own verdicts", "[pipeline][concurrency]") {
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(echo_compiler(), DiagnosticNormalizer(), store);

    constexpr size_t kSubmissions = 50;
    std::vector<Result<AuditRecord>> results(kSubmissions, Result<AuditRecord>::error(ErrorCategory::NONE, ""));
    std::vector<std::thread> threads;
    for (size_t i = 0; i < kSubmissions; ++i) {
        threads.emplace_back([&, i] {
            const std::string code = (i % 2 == 0) ? std::format("fn f{}() {{}}", i)
                                                  : std::format("ERROR in snippet {}", i);
            results[i] = pipeline.validate(std::format("prompt {}", i), code);
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> ids;
    for (size_t i = 0; i < kSubmissions; ++i) {
        const auto& res = results[i];
        REQUIRE(res.is_ok());
        const auto& r = res.value();
        ids.insert(r.id);
        CHECK(r.prompt == std::format("prompt {}", i));
        if (i % 2 == 0) {
            CHECK(r.is_valid);
        } else {
            CHECK(r.diagnostic == std::optional<std::string>(std::format("error: ERROR in snippet {}", i)));
        }
    }
    CHECK(ids.size() == kSubmissions);
    CHECK(store->size() == kSubmissions);
}

TEST_CASE("ValidationPipeline: NUL bytes are rejected before compiling", "[pipeline]") {
    auto store = std::make_shared<MemoryAuditStore>();
    auto sandbox = echo_compiler();
    ValidationPipeline pipeline(sandbox, DiagnosticNormalizer(), store);

    auto nul_prompt = pipeline.validate(std::string("\0x", 2), "fn f() {}");
    REQUIRE(nul_prompt.is_error());
    CHECK(nul_prompt.error_category() == ErrorCategory::INVALID_INPUT);
    CHECK(nul_prompt.error_message() == "prompt must not contain NUL bytes");

    auto nul_code = pipeline.validate("p", std::string("fn f() {}\0// hidden", 19));
    REQUIRE(nul_code.is_error());
    CHECK(nul_code.error_category() == ErrorCategory::INVALID_INPUT);
    CHECK(nul_code.error_message() == "generated_code must not contain NUL bytes");

    CHECK(sandbox->run_count() == 0);
    CHECK(store->size() == 0);
}

TEST_CASE("ValidationPipeline: concurrent submissions through real sandboxes stay isolated",
          "[pipeline][concurrency][sandbox]") {
    TempDir root;
    // Fails with the snippet text as its diagnostic when the snippet mentions ERROR
    auto cfg = sh_sandbox("if grep -q ERROR \"$1\"; then cat \"$1\" >&2; exit 1; fi; exit 0", root.path());
    cfg.timeout = std::chrono::milliseconds(20000);
    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(std::make_shared<ProcessSandboxRunner>(cfg), DiagnosticNormalizer(), store);

    constexpr size_t kSubmissions = 64;
    std::vector<Result<AuditRecord>> results(kSubmissions, Result<AuditRecord>::error(ErrorCategory::NONE, ""));
    std::vector<std::thread> threads;
    threads.reserve(kSubmissions);
    for (size_t i = 0; i < kSubmissions; ++i) {
        threads.emplace_back([&, i] {
            const std::string code = (i % 3 == 0) ? std::format("fn ok_{}() {{}}", i)
                                                  : std::format("ERROR unique to snippet {}", i);
            results[i] = pipeline.validate(std::format("prompt {}", i), code);
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> ids;
    for (size_t i = 0; i < kSubmissions; ++i) {
        const auto& res = results[i];
        REQUIRE(res.is_ok());
        const auto& r = res.value();
        ids.insert(r.id);
        CHECK(r.prompt == std::format("prompt {}", i));
        if (i % 3 == 0) {
            CHECK(r.is_valid);
            CHECK_FALSE(r.diagnostic.has_value());
        } else {
            CHECK_FALSE(r.is_valid);
            CHECK(r.diagnostic == std::optional<std::string>(std::format("ERROR unique to snippet {}", i)));
        }
    }
    CHECK(ids.size() == kSubmissions);
    CHECK(store->size() == kSubmissions);
    CHECK(root.entry_count() == 0);
}

TEST_CASE("ValidationPipeline: missing compiler toolchain stores nothing", "[pipeline][sandbox]") {
    TempDir root;
    auto cfg = sh_sandbox("echo 'error: would be recorded as a code defect' >&2; exit 1", root.path());
    cfg.version_command = {"/bin/sh", "-c", "echo 'error: no default toolchain configured' >&2; exit 1"};
    auto runner = std::make_shared<ProcessSandboxRunner>(cfg);
    REQUIRE(runner->probe_compiler().is_error());

    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(runner, DiagnosticNormalizer(), store);

    auto result = pipeline.validate("p", "fn f() {}");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INFRASTRUCTURE_ERROR);
    CHECK(result.error_message().find("no default toolchain configured") != std::string::npos);
    CHECK(store->size() == 0);
}

// ---------------------------------------------------------------------------
// Real compiler (the system C++ compiler in syntax-only mode)
// ---------------------------------------------------------------------------

TEST_CASE("ValidationPipeline: real compiler end to end", "[pipeline][compiler]") {
    TempDir root;
    SandboxConfig cfg;
    cfg.command = {"c++", "-fsyntax-only", "-fno-diagnostics-color", "-x", "c++", "{source}"};
    cfg.version_command = {"c++", "--version"};
    cfg.source_file = "snippet.cpp";
    cfg.scratch_root = root.path().string();
    cfg.timeout = std::chrono::milliseconds(30000);
    cfg.memory_limit_mb = 0;
    cfg.network_isolation = NetworkIsolation::OFF;
    cfg.path = "/usr/local/bin:/usr/bin:/bin";

    auto runner = std::make_shared<ProcessSandboxRunner>(cfg);
    if (runner->probe_compiler().is_error()) {
        WARN("c++ not available; skipping real compiler checks");
        return;
    }

    auto store = std::make_shared<MemoryAuditStore>();
    ValidationPipeline pipeline(runner, DiagnosticNormalizer(), store);

    auto good = pipeline.validate("sum", "int add(int a, int b) { return a + b; }\n");
    REQUIRE(good.is_ok());
    CHECK(good.value().is_valid);

    auto bad = pipeline.validate("sum", "int add(int a, int b) { return a + c; }\n");
    REQUIRE(bad.is_ok());
    CHECK_FALSE(bad.value().is_valid);
    REQUIRE(bad.value().diagnostic.has_value());
    const auto& diag = *bad.value().diagnostic;
    CHECK(diag.find("error") != std::string::npos);
    CHECK(diag.find("'c'") != std::string::npos);
    CHECK(diag.find(root.path().string()) == std::string::npos);
    CHECK(diag.find("snippet.cpp") != std::string::npos);

    // Unterminated function body
    auto unterminated = pipeline.validate("sum", "int add(int a, int b) { return a + b;\n");
    REQUIRE(unterminated.is_ok());
    CHECK_FALSE(unterminated.value().is_valid);
    REQUIRE(unterminated.value().diagnostic.has_value());
    CHECK_FALSE(unterminated.value().diagnostic->empty());
    CHECK(unterminated.value().diagnostic->find("error") != std::string::npos);

    CHECK(root.entry_count() == 0);
}
