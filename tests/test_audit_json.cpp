#include <catch2/catch_test_macros.hpp>
#include "server/audit_json.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

using namespace codeauditor;
using namespace codeauditor::http;

TEST_CASE("AuditJson: parse_submission reads both fields", "[json]") {
    auto sub = parse_submission(R"({"prompt":"add","generated_code":"fn a() {}\n"})");
    REQUIRE(sub.is_ok());
    CHECK(sub.value().prompt == "add");
    CHECK(sub.value().generated_code == "fn a() {}\n");
}

TEST_CASE("AuditJson: client-supplied verdict fields are ignored", "[json]") {
    auto sub = parse_submission(
        R"({"prompt":"p","generated_code":"c","is_valid":true,"diagnostic":"none","id":"x"})");
    REQUIRE(sub.is_ok());
    CHECK(sub.value().prompt == "p");
    CHECK(sub.value().generated_code == "c");
}

TEST_CASE("AuditJson: malformed bodies are INVALID_INPUT", "[json]") {
    auto bad_json = parse_submission("{\"prompt\": ");
    REQUIRE(bad_json.is_error());
    CHECK(bad_json.error_category() == ErrorCategory::INVALID_INPUT);
    CHECK(bad_json.error_message() == "Invalid JSON body");

    auto not_object = parse_submission(R"(["prompt","code"])");
    REQUIRE(not_object.is_error());
    CHECK(not_object.error_message() == "Request body must be a JSON object");

    auto missing = parse_submission(R"({"prompt":"p"})");
    REQUIRE(missing.is_error());
    CHECK(missing.error_message() == "Missing required string field: generated_code");

    auto wrong_type = parse_submission(R"({"prompt":42,"generated_code":"c"})");
    REQUIRE(wrong_type.is_error());
    CHECK(wrong_type.error_message() == "Missing required string field: prompt");
}

TEST_CASE("AuditJson: empty strings parse; emptiness is checked later", "[json]") {
    auto sub = parse_submission(R"({"prompt":"","generated_code":""})");
    REQUIRE(sub.is_ok());
    CHECK(sub.value().prompt.empty());
}

TEST_CASE("AuditJson: record serializes every field", "[json]") {
    AuditRecord r;
    r.id = "0b6f3c1e-2a44-4d5b-9a7e-1f2e3d4c5b6a";
    r.prompt = "say \"hi\"";
    r.generated_code = "fn main() {\n\tprintln!(\"hi\");\n}";
    r.is_valid = false;
    r.diagnostic = "error: expected `;`\n --> snippet.rs:1:5";
    r.created_at = utils::from_epoch_millis(1'700'000'000'123);

    const auto doc = JsonValue::parse(audit_record_json(r));
    REQUIRE(doc.is_object());
    CHECK(doc["id"].get_string() == r.id);
    CHECK(doc["prompt"].get_string() == r.prompt);
    CHECK(doc["generated_code"].get_string() == r.generated_code);
    CHECK(doc["is_valid"].is_boolean());
    CHECK_FALSE(doc["is_valid"].get_bool());
    CHECK(doc["diagnostic"].get_string() == *r.diagnostic);
    CHECK(doc["created_at"].get_string() == "2023-11-14T22:13:20.123Z");
}

TEST_CASE("AuditJson: valid record has null diagnostic", "[json]") {
    AuditRecord r;
    r.id = "0b6f3c1e-2a44-4d5b-9a7e-1f2e3d4c5b6a";
    r.prompt = "p";
    r.generated_code = "c";
    r.is_valid = true;

    const auto doc = JsonValue::parse(audit_record_json(r));
    CHECK(doc.contains("diagnostic"));
    CHECK(doc["diagnostic"].is_null());
    CHECK(doc["is_valid"].get_bool());
}

TEST_CASE("AuditJson: page wraps records with paging info", "[json]") {
    AuditRecord a;
    a.id = "a";
    a.is_valid = true;
    AuditRecord b;
    b.id = "b";
    b.diagnostic = "error";

    const auto doc = JsonValue::parse(audit_page_json({a, b}, 2, 10));
    REQUIRE(doc["audits"].is_array());
    CHECK(doc["audits"].size() == 2);
    CHECK(doc["audits"][0]["id"].get_string() == "a");
    CHECK(doc["audits"][1]["diagnostic"].get_string() == "error");
    CHECK(doc["limit"].get_number() == 2);
    CHECK(doc["offset"].get_number() == 10);
    CHECK(doc["count"].get_number() == 2);

    const auto empty = JsonValue::parse(audit_page_json({}, 50, 0));
    CHECK(empty["audits"].size() == 0);
    CHECK(empty["count"].get_number() == 0);
}

TEST_CASE("AuditJson: summary serializes counts, rate and diagnostics", "[json]") {
    AuditSummary s;
    s.total = 8;
    s.valid = 3;
    s.invalid = 5;
    s.validity_rate = 0.375;
    s.common_diagnostics = {{"error: \"x\" not found", 4}, {"error: y", 1}};

    const auto doc = JsonValue::parse(summary_json(s));
    CHECK(doc["total"].get_number() == 8);
    CHECK(doc["valid"].get_number() == 3);
    CHECK(doc["invalid"].get_number() == 5);
    CHECK(doc["validity_rate"].get_number() == 0.375);
    REQUIRE(doc["common_diagnostics"].size() == 2);
    CHECK(doc["common_diagnostics"][0]["diagnostic"].get_string() == "error: \"x\" not found");
    CHECK(doc["common_diagnostics"][0]["count"].get_number() == 4);

    const auto zero = JsonValue::parse(summary_json(AuditSummary{}));
    CHECK(zero["validity_rate"].is_number());
    CHECK(zero["validity_rate"].get_number() == 0.0);
    CHECK(zero["common_diagnostics"].is_array());
}

TEST_CASE("AuditJson: error body and status mapping", "[json]") {
    const auto doc = JsonValue::parse(error_json("bad \"input\""));
    CHECK(doc["error"].get_string() == "bad \"input\"");

    CHECK(status_for(ErrorCategory::INVALID_INPUT) == 400);
    CHECK(status_for(ErrorCategory::NOT_FOUND) == 404);
    CHECK(status_for(ErrorCategory::INFRASTRUCTURE_ERROR) == 503);
    CHECK(status_for(ErrorCategory::STORAGE_ERROR) == 500);
    CHECK(status_for(ErrorCategory::INTERNAL_ERROR) == 500);
}
