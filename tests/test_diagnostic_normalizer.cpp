#include <catch2/catch_test_macros.hpp>
#include "diagnostic/diagnostic_normalizer.hpp"

#include <csignal>
#include <stdexcept>

using namespace codeauditor;

namespace {

SandboxOutcome failed(std::string output, std::string workdir = "") {
    SandboxOutcome o;
    o.status = SandboxStatus::COMPILE_FAILED;
    o.exit_code = 1;
    o.output = std::move(output);
    o.workdir = std::move(workdir);
    return o;
}

} // anonymous namespace

TEST_CASE("DiagnosticNormalizer: compiled outcome has no diagnostic", "[diagnostic]") {
    DiagnosticNormalizer n;
    SandboxOutcome o;
    o.status = SandboxStatus::COMPILED;
    o.exit_code = 0;
    o.output = "warning: unused variable";
    CHECK_FALSE(n.diagnose(o).has_value());
}

TEST_CASE("DiagnosticNormalizer: timeout has a fixed diagnostic", "[diagnostic]") {
    DiagnosticNormalizer n;
    SandboxOutcome o;
    o.status = SandboxStatus::TIMED_OUT;
    o.output = "partial output";
    const auto d = n.diagnose(o);
    REQUIRE(d.has_value());
    CHECK(*d == "compilation timed out");
}

TEST_CASE("DiagnosticNormalizer: compile failure keeps the compiler text", "[diagnostic]") {
    DiagnosticNormalizer n;
    const auto d = n.diagnose(failed("error[E0308]: mismatched types\n  --> snippet.rs:1:14\n"));
    REQUIRE(d.has_value());
    CHECK(*d == "error[E0308]: mismatched types\n  --> snippet.rs:1:14");
}

TEST_CASE("DiagnosticNormalizer: silent failure gets a synthetic diagnostic", "[diagnostic]") {
    DiagnosticNormalizer n;

    auto exited = failed("   \n\t");
    exited.exit_code = 101;
    CHECK(n.diagnose(exited) == std::optional<std::string>("compiler exited with status 101"));

    auto killed = failed("");
    killed.exit_code.reset();
    killed.signal = SIGKILL;
    CHECK(n.diagnose(killed) == std::optional<std::string>("compiler terminated by signal 9"));
}

TEST_CASE("DiagnosticNormalizer: infrastructure errors are rejected", "[diagnostic]") {
    DiagnosticNormalizer n;
    CHECK_THROWS_AS(n.diagnose(SandboxOutcome::infrastructure_error("fork failed")), std::invalid_argument);
}

TEST_CASE("DiagnosticNormalizer: ANSI colour codes are stripped", "[diagnostic]") {
    const std::string raw = "\x1b[0m\x1b[1m\x1b[38;5;9merror\x1b[0m\x1b[0m\x1b[1m: expected `;`\x1b[0m";
    CHECK(DiagnosticNormalizer::strip_escape_sequences(raw) == "error: expected `;`");

    // OSC hyperlink terminated by ST, and one terminated by BEL
    CHECK(DiagnosticNormalizer::strip_escape_sequences("\x1b]8;;file:///x\x1b\\link\x1b]8;;\x07!") == "link!");
    // Dangling escape at the end
    CHECK(DiagnosticNormalizer::strip_escape_sequences("abc\x1b") == "abc");
}

TEST_CASE("DiagnosticNormalizer: line endings are normalized to LF", "[diagnostic]") {
    CHECK(DiagnosticNormalizer::normalize_line_endings("a\r\nb\rc\n") == "a\nb\nc\n");
}

TEST_CASE("DiagnosticNormalizer: control bytes are dropped except newline and tab", "[diagnostic]") {
    const std::string raw = std::string("a\tb\nc") + '\0' + "d\x07\x7f" + "e";
    CHECK(DiagnosticNormalizer::drop_control_bytes(raw) == "a\tb\ncde");
}

TEST_CASE("DiagnosticNormalizer: scratch directory paths are redacted", "[diagnostic]") {
    DiagnosticNormalizer n;
    const std::string workdir = "/tmp/code-auditor/run-42-Ab3dEf";
    const auto text = n.normalize(
        "error: cannot find value `x`\n --> /tmp/code-auditor/run-42-Ab3dEf/snippet.rs:2:5\n"
        "note: output in /tmp/code-auditor/run-42-Ab3dEf",
        workdir);

    CHECK(text == "error: cannot find value `x`\n --> snippet.rs:2:5\nnote: output in <workdir>");
    CHECK(text.find("run-42") == std::string::npos);
}

TEST_CASE("DiagnosticNormalizer: empty workdir redacts nothing", "[diagnostic]") {
    DiagnosticNormalizer n;
    CHECK(n.normalize("error at /tmp/x.rs", "") == "error at /tmp/x.rs");
    CHECK(DiagnosticNormalizer::redact("abc", "", "X") == "abc");
}

TEST_CASE("DiagnosticNormalizer: long output is truncated with a marker", "[diagnostic]") {
    DiagnosticNormalizer n(100);
    const std::string raw(500, 'e');
    const auto text = n.normalize(raw);

    CHECK(text.size() == 100);
    CHECK(text.ends_with(DiagnosticNormalizer::kTruncationMarker));
    CHECK(text.starts_with(std::string(100 - DiagnosticNormalizer::kTruncationMarker.size(), 'e')));
}

TEST_CASE("DiagnosticNormalizer: output at the limit is kept whole", "[diagnostic]") {
    DiagnosticNormalizer n(100);
    const std::string raw(100, 'e');
    CHECK(n.normalize(raw) == raw);
}

TEST_CASE("DiagnosticNormalizer: truncation never splits a UTF-8 sequence", "[diagnostic]") {
    // "é" is two bytes; put one straddling the cut point
    const size_t marker = DiagnosticNormalizer::kTruncationMarker.size();
    const size_t limit = 64;
    std::string raw(limit - marker - 1, 'a');
    raw += "\xc3\xa9";
    raw += std::string(100, 'b');

    const auto text = DiagnosticNormalizer::truncate_utf8(raw, limit);
    CHECK(text.size() == limit - 1);
    CHECK(text == std::string(limit - marker - 1, 'a') + std::string(DiagnosticNormalizer::kTruncationMarker));
}

TEST_CASE("DiagnosticNormalizer: full pipeline on coloured CRLF output", "[diagnostic]") {
    DiagnosticNormalizer n;
    const auto d = n.diagnose(failed(
        "\x1b[1;31merror\x1b[0m: aborting due to previous error\r\n\r\n",
        "/scratch/run-1"));
    REQUIRE(d.has_value());
    CHECK(*d == "error: aborting due to previous error");
}
