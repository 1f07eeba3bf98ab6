#include "server/graphql_handler.hpp"
#include "server/graphiql_html.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "stats/stats_aggregator.hpp"
#include "store/iaudit_store.hpp"
#include "validation/validation_pipeline.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <optional>
#include <span>
#include <stdexcept>

namespace codeauditor {

namespace {

// ============================================================================
// Document parser
// ============================================================================

constexpr uint32_t kMaxInputNesting = 16;

/**
 * Recursive-descent parser for the executable subset of GraphQL: query and
 * mutation operations, aliases, arguments, variables and input objects.
 * Fragments, directives and list values are rejected with a message.
 */
class DocumentParser {
public:
    DocumentParser(std::string_view document, uint32_t max_depth)
        : sv_(document), size_(document.size()), max_depth_(max_depth) {}

    Result<std::vector<GraphQLOperation>> parse() {
        try {
            std::vector<GraphQLOperation> operations;
            skip_ignored();
            while (!sv_.empty()) {
                operations.push_back(parse_operation());
            }
            if (operations.empty()) {
                return Result<std::vector<GraphQLOperation>>::error(
                    ErrorCategory::INVALID_INPUT, "Document contains no operations");
            }
            return Result<std::vector<GraphQLOperation>>::ok(std::move(operations));
        } catch (const syntax_error& e) {
            return Result<std::vector<GraphQLOperation>>::error(ErrorCategory::INVALID_INPUT, e.what());
        }
    }

private:
    struct syntax_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    [[noreturn]] void fail(std::string_view message) const {
        throw syntax_error(std::format("Syntax error at offset {}: {}", size_ - sv_.size(), message));
    }

    // Whitespace, commas, comments and a byte order mark are insignificant
    void skip_ignored() {
        while (!sv_.empty()) {
            const char c = sv_.front();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
                sv_.remove_prefix(1);
            } else if (c == '#') {
                const auto eol = sv_.find_first_of("\r\n");
                sv_.remove_prefix(eol == std::string_view::npos ? sv_.size() : eol);
            } else if (sv_.starts_with("\xEF\xBB\xBF")) {
                sv_.remove_prefix(3);
            } else {
                break;
            }
        }
    }

    [[nodiscard]] char peek() const { return sv_.empty() ? '\0' : sv_.front(); }

    void expect(char c) {
        if (peek() != c) {
            fail(sv_.empty() ? std::format("expected '{}', found end of document", c)
                             : std::format("expected '{}', found '{}'", c, sv_.front()));
        }
        sv_.remove_prefix(1);
        skip_ignored();
    }

    [[nodiscard]] static bool is_name_start(char c) {
        return c == '_' || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] static bool is_name_char(char c) {
        return is_name_start(c) || (c >= '0' && c <= '9');
    }

    std::string read_name() {
        if (!is_name_start(peek())) fail("expected a name");
        size_t end = 1;
        while (end < sv_.size() && is_name_char(sv_[end])) ++end;
        std::string name(sv_.substr(0, end));
        sv_.remove_prefix(end);
        skip_ignored();
        return name;
    }

    void reject_unsupported() {
        if (peek() == '@') fail("directives are not supported");
    }

    GraphQLOperation parse_operation() {
        GraphQLOperation op;
        if (peek() == '{') {
            op.selections = parse_selection_set(1);
            return op;
        }

        const std::string keyword = read_name();
        if (keyword == "mutation") {
            op.type = OperationType::MUTATION;
        } else if (keyword == "subscription") {
            fail("subscriptions are not supported");
        } else if (keyword == "fragment") {
            fail("fragments are not supported");
        } else if (keyword != "query") {
            fail(std::format("expected an operation, found '{}'", keyword));
        }

        if (is_name_start(peek())) op.name = read_name();
        if (peek() == '(') skip_variable_definitions();
        reject_unsupported();
        op.selections = parse_selection_set(1);
        return op;
    }

    // Variable types and defaults are not needed; values come from "variables"
    void skip_variable_definitions() {
        expect('(');
        while (peek() != ')') {
            if (sv_.empty()) fail("unterminated variable definitions");
            if (peek() == '"') {
                [[maybe_unused]] const auto skipped = parse_string();
            } else if (peek() == '(') {
                fail("unexpected '(' in variable definitions");
            } else {
                sv_.remove_prefix(1);
                skip_ignored();
            }
        }
        expect(')');
    }

    std::vector<GraphQLField> parse_selection_set(uint32_t depth) {
        if (depth > max_depth_) {
            fail(std::format("query exceeds maximum depth of {}", max_depth_));
        }
        expect('{');
        std::vector<GraphQLField> fields;
        while (peek() != '}') {
            if (sv_.empty()) fail("unterminated selection set");
            if (sv_.starts_with("...")) fail("fragments are not supported");
            fields.push_back(parse_field(depth));
        }
        if (fields.empty()) fail("selection set must not be empty");
        expect('}');
        return fields;
    }

    GraphQLField parse_field(uint32_t depth) {
        GraphQLField field;
        field.name = read_name();
        if (peek() == ':') {
            expect(':');
            field.alias = std::move(field.name);
            field.name = read_name();
        }
        if (peek() == '(') field.arguments = parse_arguments();
        reject_unsupported();
        if (peek() == '{') field.selections = parse_selection_set(depth + 1);
        return field;
    }

    std::vector<GraphQLArgument> parse_arguments() {
        expect('(');
        std::vector<GraphQLArgument> args;
        while (peek() != ')') {
            if (sv_.empty()) fail("unterminated argument list");
            GraphQLArgument arg;
            arg.name = read_name();
            expect(':');
            arg.value = parse_value(0);
            args.push_back(std::move(arg));
        }
        if (args.empty()) fail("argument list must not be empty");
        expect(')');
        return args;
    }

    GraphQLValue parse_value(uint32_t nesting) {
        GraphQLValue value;
        const char c = peek();
        if (c == '$') {
            sv_.remove_prefix(1);
            value.kind = GraphQLValue::Kind::VARIABLE;
            value.text = read_name();
        } else if (c == '"') {
            value.kind = GraphQLValue::Kind::STRING;
            value.text = parse_string();
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            value = parse_number();
        } else if (c == '{') {
            if (nesting >= kMaxInputNesting) fail("input object nesting too deep");
            expect('{');
            value.kind = GraphQLValue::Kind::OBJECT;
            while (peek() != '}') {
                if (sv_.empty()) fail("unterminated input object");
                GraphQLArgument member;
                member.name = read_name();
                expect(':');
                member.value = parse_value(nesting + 1);
                value.fields.push_back(std::move(member));
            }
            expect('}');
        } else if (c == '[') {
            fail("list values are not supported");
        } else if (is_name_start(c)) {
            const std::string name = read_name();
            if (name == "true" || name == "false") {
                value.kind = GraphQLValue::Kind::BOOLEAN;
                value.boolean = name == "true";
            } else if (name == "null") {
                value.kind = GraphQLValue::Kind::NULL_VALUE;
            } else {
                value.kind = GraphQLValue::Kind::ENUM;
                value.text = name;
            }
        } else {
            fail(sv_.empty() ? "expected a value, found end of document" : "expected a value");
        }
        return value;
    }

    GraphQLValue parse_number() {
        size_t end = 0;
        if (sv_[end] == '-') ++end;
        const size_t digits_start = end;
        while (end < sv_.size() && sv_[end] >= '0' && sv_[end] <= '9') ++end;
        if (end == digits_start) fail("expected digits");

        bool is_float = false;
        while (end < sv_.size() && (sv_[end] == '.' || sv_[end] == 'e' || sv_[end] == 'E' ||
                                    sv_[end] == '+' || (sv_[end] == '-' && is_float) ||
                                    (sv_[end] >= '0' && sv_[end] <= '9'))) {
            if (sv_[end] == '.' || sv_[end] == 'e' || sv_[end] == 'E') is_float = true;
            ++end;
        }

        GraphQLValue value;
        const std::string_view literal = sv_.substr(0, end);
        if (is_float) {
            value.kind = GraphQLValue::Kind::FLOAT;
            value.text = std::string(literal);
        } else {
            value.kind = GraphQLValue::Kind::INT;
            const auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(),
                                                   value.integer);
            if (ec != std::errc{}) fail(std::format("integer {} is out of range", literal));
        }
        sv_.remove_prefix(end);
        skip_ignored();
        return value;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    uint32_t read_hex4() {
        if (sv_.size() < 4) fail("truncated \\u escape");
        uint32_t cp = 0;
        const auto [ptr, ec] = std::from_chars(sv_.data(), sv_.data() + 4, cp, 16);
        if (ec != std::errc{} || ptr != sv_.data() + 4) fail("invalid \\u escape");
        sv_.remove_prefix(4);
        return cp;
    }

    std::string parse_string() {
        if (sv_.starts_with("\"\"\"")) return parse_block_string();
        sv_.remove_prefix(1);

        std::string out;
        while (true) {
            if (sv_.empty() || sv_.front() == '\n' || sv_.front() == '\r') fail("unterminated string");
            const char c = sv_.front();
            sv_.remove_prefix(1);
            if (c == '"') break;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (sv_.empty()) fail("unterminated string");
            const char esc = sv_.front();
            sv_.remove_prefix(1);
            switch (esc) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = read_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!sv_.starts_with("\\u")) fail("unpaired surrogate in \\u escape");
                        sv_.remove_prefix(2);
                        const uint32_t low = read_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("unpaired surrogate in \\u escape");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("unpaired surrogate in \\u escape");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail(std::format("invalid escape sequence \\{}", esc));
            }
        }
        skip_ignored();
        return out;
    }

    // Raw contents; common indentation is kept as written
    std::string parse_block_string() {
        sv_.remove_prefix(3);
        std::string out;
        while (true) {
            if (sv_.empty()) fail("unterminated block string");
            if (sv_.starts_with("\\\"\"\"")) {
                out += "\"\"\"";
                sv_.remove_prefix(4);
            } else if (sv_.starts_with("\"\"\"")) {
                sv_.remove_prefix(3);
                break;
            } else {
                out += sv_.front();
                sv_.remove_prefix(1);
            }
        }
        skip_ignored();
        return out;
    }

    std::string_view sv_;
    const size_t size_;
    const uint32_t max_depth_;
};

// ============================================================================
// Schema
// ============================================================================

struct FieldDef {
    std::string_view name;
    std::string_view type;      // Empty for scalars
};

constexpr FieldDef kQueryFields[] = {{"audits", "Audit"}, {"audit", "Audit"}, {"stats", "AuditStats"}};
constexpr FieldDef kMutationFields[] = {{"createAudit", "Audit"}};
constexpr FieldDef kAuditFields[] = {
    {"id", ""}, {"prompt", ""}, {"generatedCode", ""},
    {"isValid", ""}, {"diagnostic", ""}, {"createdAt", ""}};
constexpr FieldDef kAuditStatsFields[] = {
    {"total", ""}, {"valid", ""}, {"invalid", ""}, {"validityRate", ""},
    {"commonDiagnostics", "DiagnosticCount"}};
constexpr FieldDef kDiagnosticCountFields[] = {{"diagnostic", ""}, {"count", ""}};

struct ArgumentDef {
    std::string_view field;
    std::string_view name;
    std::string_view type;
    bool required;
};

// Root field names are unique across Query and Mutation
constexpr ArgumentDef kArguments[] = {
    {"audits", "limit", "Int", false},
    {"audits", "offset", "Int", false},
    {"audit", "id", "ID!", true},
    {"createAudit", "input", "CreateAuditInput!", true},
};

std::span<const FieldDef> fields_of(std::string_view type) {
    if (type == "Query") return kQueryFields;
    if (type == "Mutation") return kMutationFields;
    if (type == "Audit") return kAuditFields;
    if (type == "AuditStats") return kAuditStatsFields;
    if (type == "DiagnosticCount") return kDiagnosticCountFields;
    return {};
}

void validate_arguments(std::string_view type, const GraphQLField& field, std::vector<std::string>& errors) {
    const bool root = type == "Query" || type == "Mutation";
    for (const auto& arg : field.arguments) {
        const bool known = root && std::any_of(std::begin(kArguments), std::end(kArguments),
            [&](const ArgumentDef& def) { return def.field == field.name && def.name == arg.name; });
        if (!known) {
            errors.push_back(std::format(R"(Unknown argument "{}" on field "{}.{}")", arg.name, type, field.name));
        }
    }
    if (!root) return;
    for (const auto& def : kArguments) {
        if (def.field != field.name || !def.required) continue;
        const bool present = std::any_of(field.arguments.begin(), field.arguments.end(),
            [&](const GraphQLArgument& a) { return a.name == def.name; });
        if (!present) {
            errors.push_back(std::format(R"(Field "{}" argument "{}" of type "{}" is required)",
                                         field.name, def.name, def.type));
        }
    }
}

void validate_selections(std::string_view type, const std::vector<GraphQLField>& selections,
                         std::vector<std::string>& errors) {
    const auto defs = fields_of(type);
    for (const auto& field : selections) {
        if (field.name == "__typename") {
            if (!field.selections.empty() || !field.arguments.empty()) {
                errors.push_back(R"(Field "__typename" takes no arguments or selections)");
            }
            continue;
        }
        if (field.name.starts_with("__")) {
            errors.push_back(std::format(R"(Introspection field "{}" is not supported)", field.name));
            continue;
        }

        const auto def = std::find_if(defs.begin(), defs.end(),
            [&](const FieldDef& d) { return d.name == field.name; });
        if (def == defs.end()) {
            errors.push_back(std::format(R"(Cannot query field "{}" on type "{}")", field.name, type));
            continue;
        }

        validate_arguments(type, field, errors);
        if (def->type.empty()) {
            if (!field.selections.empty()) {
                errors.push_back(std::format(R"(Field "{}" on type "{}" is a scalar and takes no selection)",
                                             field.name, type));
            }
        } else if (field.selections.empty()) {
            errors.push_back(std::format(R"(Field "{}" of type "{}" must have a selection of subfields)",
                                         field.name, def->type));
        } else {
            validate_selections(def->type, field.selections, errors);
        }
    }
}

// ============================================================================
// Argument resolution
// ============================================================================

const GraphQLValue* find_argument(const std::vector<GraphQLArgument>& args, std::string_view name) {
    const auto it = std::find_if(args.begin(), args.end(),
        [&](const GraphQLArgument& a) { return a.name == name; });
    return it == args.end() ? nullptr : &it->value;
}

/// Int argument; nullopt when absent or null.
Result<std::optional<int64_t>> resolve_int(const GraphQLValue* value, const JsonValue& variables,
                                           std::string_view what) {
    using R = Result<std::optional<int64_t>>;
    if (!value || value->kind == GraphQLValue::Kind::NULL_VALUE) return R::ok(std::nullopt);
    if (value->kind == GraphQLValue::Kind::INT) return R::ok(value->integer);
    if (value->kind == GraphQLValue::Kind::VARIABLE) {
        const JsonValue v = variables[value->text];
        if (v.is_null()) return R::ok(std::nullopt);
        if (v.is_number()) {
            const double d = v.get_number();
            if (std::trunc(d) == d && std::abs(d) <= 9.0e15) {
                return R::ok(static_cast<int64_t>(d));
            }
        }
        return R::error(ErrorCategory::INVALID_INPUT,
            std::format(R"(Variable "${}" must be an Int for {})", value->text, what));
    }
    return R::error(ErrorCategory::INVALID_INPUT, std::format("{} must be an Int", what));
}

/// String argument; nullopt when absent or null.
Result<std::optional<std::string>> resolve_string(const GraphQLValue* value, const JsonValue& variables,
                                                  std::string_view what) {
    using R = Result<std::optional<std::string>>;
    if (!value || value->kind == GraphQLValue::Kind::NULL_VALUE) return R::ok(std::nullopt);
    if (value->kind == GraphQLValue::Kind::STRING) return R::ok(value->text);
    if (value->kind == GraphQLValue::Kind::VARIABLE) {
        const JsonValue v = variables[value->text];
        if (v.is_null()) return R::ok(std::nullopt);
        if (v.is_string()) return R::ok(v.get_string());
        return R::error(ErrorCategory::INVALID_INPUT,
            std::format(R"(Variable "${}" must be a String for {})", value->text, what));
    }
    return R::error(ErrorCategory::INVALID_INPUT, std::format("{} must be a String", what));
}

struct CreateAuditInput {
    std::string prompt;
    std::string generated_code;
};

Result<CreateAuditInput> resolve_create_input(const GraphQLValue* value, const JsonValue& variables) {
    using R = Result<CreateAuditInput>;
    if (!value || value->kind == GraphQLValue::Kind::NULL_VALUE) {
        return R::error(ErrorCategory::INVALID_INPUT, "input must not be null");
    }

    std::optional<std::string> prompt;
    std::optional<std::string> code;
    if (value->kind == GraphQLValue::Kind::VARIABLE) {
        const JsonValue v = variables[value->text];
        if (!v.is_object()) {
            return R::error(ErrorCategory::INVALID_INPUT,
                std::format(R"(Variable "${}" must be a CreateAuditInput object)", value->text));
        }
        prompt = v.string_field("prompt");
        code = v.string_field("generatedCode");
    } else if (value->kind == GraphQLValue::Kind::OBJECT) {
        for (const auto& member : value->fields) {
            if (member.name != "prompt" && member.name != "generatedCode") {
                return R::error(ErrorCategory::INVALID_INPUT,
                    std::format(R"(Unknown field "{}" on input type "CreateAuditInput")", member.name));
            }
        }
        auto p = resolve_string(find_argument(value->fields, "prompt"), variables, "input.prompt");
        if (p.is_error()) return R::error(p.error_category(), p.error_message());
        auto c = resolve_string(find_argument(value->fields, "generatedCode"), variables, "input.generatedCode");
        if (c.is_error()) return R::error(c.error_category(), c.error_message());
        prompt = std::move(p.value());
        code = std::move(c.value());
    } else {
        return R::error(ErrorCategory::INVALID_INPUT, "input must be a CreateAuditInput object");
    }

    if (!prompt) return R::error(ErrorCategory::INVALID_INPUT, "input.prompt must be a non-null String");
    if (!code) return R::error(ErrorCategory::INVALID_INPUT, "input.generatedCode must be a non-null String");
    return R::ok({std::move(*prompt), std::move(*code)});
}

// ============================================================================
// Response writing
// ============================================================================

const char* error_code(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVALID_INPUT:        return "BAD_USER_INPUT";
        case ErrorCategory::NOT_FOUND:            return "NOT_FOUND";
        case ErrorCategory::INFRASTRUCTURE_ERROR: return "SERVICE_UNAVAILABLE";
        case ErrorCategory::STORAGE_ERROR:        return "INTERNAL_SERVER_ERROR";
        case ErrorCategory::INTERNAL_ERROR:       return "INTERNAL_SERVER_ERROR";
        case ErrorCategory::NONE:                 break;
    }
    return "INTERNAL_SERVER_ERROR";
}

std::string error_entry(std::string_view message, std::string_view code, std::string_view path = {}) {
    if (path.empty()) {
        return std::format(R"({{"message":"{}","extensions":{{"code":"{}"}}}})",
                           utils::escape_json(message), code);
    }
    return std::format(R"({{"message":"{}","path":["{}"],"extensions":{{"code":"{}"}}}})",
                       utils::escape_json(message), utils::escape_json(path), code);
}

std::string errors_only(const std::vector<std::string>& errors, bool with_null_data) {
    std::string body = with_null_data ? R"({"data":null,"errors":[)" : R"({"errors":[)";
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) body += ',';
        body += errors[i];
    }
    body += "]}";
    return body;
}

std::string quoted(std::string_view s) {
    return std::format("\"{}\"", utils::escape_json(s));
}

template<typename Leaf>
std::string write_object(const std::vector<GraphQLField>& selections, std::string_view type_name, Leaf&& leaf) {
    std::string json = "{";
    for (size_t i = 0; i < selections.size(); ++i) {
        if (i > 0) json += ',';
        const auto& f = selections[i];
        json += quoted(f.response_key());
        json += ':';
        json += f.name == "__typename" ? quoted(type_name) : leaf(f);
    }
    json += '}';
    return json;
}

std::string write_audit(const AuditRecord& record, const std::vector<GraphQLField>& selections) {
    return write_object(selections, "Audit", [&record](const GraphQLField& f) -> std::string {
        if (f.name == "id") return quoted(record.id);
        if (f.name == "prompt") return quoted(record.prompt);
        if (f.name == "generatedCode") return quoted(record.generated_code);
        if (f.name == "isValid") return utils::booltostr(record.is_valid);
        if (f.name == "diagnostic") return record.diagnostic ? quoted(*record.diagnostic) : "null";
        return quoted(utils::format_timestamp_utc(record.created_at));   // createdAt
    });
}

std::string write_stats(const AuditSummary& summary, const std::vector<GraphQLField>& selections) {
    return write_object(selections, "AuditStats", [&summary](const GraphQLField& f) -> std::string {
        if (f.name == "total") return std::to_string(summary.total);
        if (f.name == "valid") return std::to_string(summary.valid);
        if (f.name == "invalid") return std::to_string(summary.invalid);
        if (f.name == "validityRate") return std::format("{}", summary.validity_rate);

        std::string list = "[";   // commonDiagnostics
        for (size_t i = 0; i < summary.common_diagnostics.size(); ++i) {
            if (i > 0) list += ',';
            const auto& d = summary.common_diagnostics[i];
            list += write_object(f.selections, "DiagnosticCount", [&d](const GraphQLField& g) -> std::string {
                if (g.name == "diagnostic") return quoted(d.diagnostic);
                return std::to_string(d.count);
            });
        }
        list += ']';
        return list;
    });
}

} // anonymous namespace

// ============================================================================
// GraphQLHandler
// ============================================================================

GraphQLHandler::GraphQLHandler(std::shared_ptr<ValidationPipeline> pipeline,
                               std::shared_ptr<StatsAggregator> stats,
                               std::shared_ptr<IAuditStore> store,
                               GraphQLConfig config)
    : pipeline_(std::move(pipeline)),
      stats_(std::move(stats)),
      store_(std::move(store)),
      config_(std::move(config)) {}

Result<GraphQLOperation> GraphQLHandler::parse(std::string_view document,
                                               std::string_view operation_name) const {
    auto parsed = DocumentParser(document, config_.max_query_depth).parse();
    if (parsed.is_error()) {
        return Result<GraphQLOperation>::error(parsed.error_category(), parsed.error_message());
    }

    auto& operations = parsed.value();
    if (operation_name.empty()) {
        if (operations.size() > 1) {
            return Result<GraphQLOperation>::error(ErrorCategory::INVALID_INPUT,
                "operationName is required when the document has several operations");
        }
        return Result<GraphQLOperation>::ok(std::move(operations.front()));
    }

    const auto it = std::find_if(operations.begin(), operations.end(),
        [&](const GraphQLOperation& op) { return op.name == operation_name; });
    if (it == operations.end()) {
        return Result<GraphQLOperation>::error(ErrorCategory::INVALID_INPUT,
            std::format(R"(Unknown operation "{}")", operation_name));
    }
    return Result<GraphQLOperation>::ok(std::move(*it));
}

GraphQLResponse GraphQLHandler::handle(const std::string& body) const {
    auto bad_request = [](std::string_view message) {
        return GraphQLResponse{400, errors_only({error_entry(message, "BAD_REQUEST")}, false)};
    };

    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return bad_request("Invalid JSON body");
    }
    if (!doc.is_object()) {
        return bad_request("Request body must be a JSON object");
    }

    const auto query = doc.string_field("query");
    if (!query) {
        return bad_request("Missing required string field: query");
    }
    const JsonValue variables = doc["variables"];
    if (!variables.is_null() && !variables.is_object()) {
        return bad_request("variables must be a JSON object");
    }
    const JsonValue operation_name = doc["operationName"];
    if (!operation_name.is_null() && !operation_name.is_string()) {
        return bad_request("operationName must be a string");
    }

    return execute(*query, variables, operation_name.is_string() ? operation_name.get_string() : "");
}

GraphQLResponse GraphQLHandler::execute(std::string_view document,
                                        const JsonValue& variables,
                                        std::string_view operation_name) const {
    auto op = parse(document, operation_name);
    if (op.is_error()) {
        return {200, errors_only({error_entry(op.error_message(), "GRAPHQL_PARSE_FAILED")}, true)};
    }
    const auto& operation = op.value();
    const bool mutation = operation.type == OperationType::MUTATION;

    std::vector<std::string> problems;
    if (mutation && !config_.mutations_enabled) {
        problems.emplace_back("Mutations are disabled");
    } else {
        validate_selections(mutation ? "Mutation" : "Query", operation.selections, problems);
    }
    if (!problems.empty()) {
        std::vector<std::string> errors;
        for (const auto& p : problems) errors.push_back(error_entry(p, "GRAPHQL_VALIDATION_FAILED"));
        return {200, errors_only(errors, true)};
    }

    std::optional<ShutdownCoordinator::Admission> admission;
    if (mutation && shutdown_coordinator_) {
        admission = shutdown_coordinator_->admit();
        if (!admission) {
            return {503, errors_only({error_entry("Server shutting down", "SHUTTING_DOWN")}, true)};
        }
    }

    utils::log::debug(std::format("GraphQL {} '{}' with {} root fields",
        mutation ? "mutation" : "query", operation.name, operation.selections.size()));

    std::vector<std::string> errors;
    bool null_data = false;
    std::string data = "{";
    for (size_t i = 0; i < operation.selections.size(); ++i) {
        const auto& field = operation.selections[i];
        if (i > 0) data += ',';
        data += quoted(field.response_key());
        data += ':';
        if (field.name == "__typename") {
            data += quoted(mutation ? "Mutation" : "Query");
        } else if (mutation) {
            data += run_mutation_field(field, variables, errors, null_data);
        } else {
            data += run_query_field(field, variables, errors, null_data);
        }
    }
    data += '}';

    std::string body = std::format(R"({{"data":{})", null_data ? "null" : data);
    if (!errors.empty()) {
        body += R"(,"errors":[)";
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) body += ',';
            body += errors[i];
        }
        body += ']';
    }
    body += '}';
    return {200, std::move(body)};
}

std::string GraphQLHandler::run_query_field(const GraphQLField& field, const JsonValue& variables,
                                            std::vector<std::string>& errors, bool& null_data) const {
    const auto& key = field.response_key();
    // Non-null fields null out the whole response on error
    auto fail = [&](ErrorCategory category, std::string_view message, bool nullable) {
        errors.push_back(error_entry(message, error_code(category), key));
        if (!nullable) null_data = true;
        return std::string("null");
    };

    if (field.name == "audits") {
        const auto limit = resolve_int(find_argument(field.arguments, "limit"), variables, "limit");
        if (limit.is_error()) return fail(limit.error_category(), limit.error_message(), false);
        const auto offset = resolve_int(find_argument(field.arguments, "offset"), variables, "offset");
        if (offset.is_error()) return fail(offset.error_category(), offset.error_message(), false);

        const int64_t requested = limit.value().value_or(static_cast<int64_t>(http::kDefaultPageLimit));
        if (requested < 1) return fail(ErrorCategory::INVALID_INPUT, "limit must be at least 1", false);
        const int64_t skip = offset.value().value_or(0);
        if (skip < 0) return fail(ErrorCategory::INVALID_INPUT, "offset must not be negative", false);

        const size_t page = std::min(static_cast<size_t>(requested), http::kMaxPageLimit);
        const auto records = store_->list_recent(page, static_cast<size_t>(skip));
        if (records.is_error()) return fail(records.error_category(), records.error_message(), false);

        std::string list = "[";
        for (size_t i = 0; i < records.value().size(); ++i) {
            if (i > 0) list += ',';
            list += write_audit(records.value()[i], field.selections);
        }
        list += ']';
        return list;
    }

    if (field.name == "audit") {
        const auto id = resolve_string(find_argument(field.arguments, "id"), variables, "id");
        if (id.is_error()) return fail(id.error_category(), id.error_message(), true);
        if (!id.value()) return fail(ErrorCategory::INVALID_INPUT, "id must not be null", true);
        if (!utils::is_uuid(*id.value())) {
            return fail(ErrorCategory::INVALID_INPUT, std::format("id '{}' is not a UUID", *id.value()), true);
        }
        const auto found = store_->find_by_id(*id.value());
        if (found.is_error()) return fail(found.error_category(), found.error_message(), true);
        if (!found.value()) return "null";
        return write_audit(*found.value(), field.selections);
    }

    // stats
    const auto summary = stats_->summary();
    if (summary.is_error()) return fail(summary.error_category(), summary.error_message(), false);
    return write_stats(summary.value(), field.selections);
}

std::string GraphQLHandler::run_mutation_field(const GraphQLField& field, const JsonValue& variables,
                                               std::vector<std::string>& errors, bool& null_data) const {
    // createAudit: Audit!
    const auto input = resolve_create_input(find_argument(field.arguments, "input"), variables);
    const auto result = input.is_ok()
        ? pipeline_->validate(input.value().prompt, input.value().generated_code)
        : Result<AuditRecord>::error(input.error_category(), input.error_message());
    if (result.is_error()) {
        errors.push_back(error_entry(result.error_message(), error_code(result.error_category()),
                                     field.response_key()));
        null_data = true;
        return "null";
    }
    return write_audit(result.value(), field.selections);
}

std::string GraphQLHandler::playground_html() const {
    std::string html = kGraphiQLHtml;
    constexpr std::string_view placeholder = "{{ENDPOINT}}";
    const auto pos = html.find(placeholder);
    if (pos != std::string::npos) {
        html.replace(pos, placeholder.size(), config_.endpoint);
    }
    return html;
}

} // namespace codeauditor
