#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace codeauditor {

class ValidationPipeline;
class StatsAggregator;
class IAuditStore;
class ShutdownCoordinator;
class JsonValue;

struct GraphQLArgument;

/// Argument value as written in the document. Variables resolve at execution.
struct GraphQLValue {
    enum class Kind { NULL_VALUE, BOOLEAN, INT, FLOAT, STRING, ENUM, VARIABLE, OBJECT };

    Kind kind = Kind::NULL_VALUE;
    bool boolean = false;
    int64_t integer = 0;
    std::string text;                       // STRING contents, FLOAT/ENUM literal, VARIABLE name
    std::vector<GraphQLArgument> fields;    // OBJECT members in document order
};

struct GraphQLArgument {
    std::string name;
    GraphQLValue value;
};

// Parsed field selection
struct GraphQLField {
    std::string alias;
    std::string name;
    std::vector<GraphQLArgument> arguments;
    std::vector<GraphQLField> selections;   // Nested selections

    [[nodiscard]] const std::string& response_key() const { return alias.empty() ? name : alias; }
};

enum class OperationType { QUERY, MUTATION };

struct GraphQLOperation {
    OperationType type = OperationType::QUERY;
    std::string name;
    std::vector<GraphQLField> selections;
};

struct GraphQLResponse {
    int status = 200;
    std::string body;
};

/**
 * @brief GraphQL view over the audit log
 *
 * Schema:
 *   type Query {
 *     audits(limit: Int = 50, offset: Int = 0): [Audit!]!
 *     audit(id: ID!): Audit
 *     stats: AuditStats!
 *   }
 *   type Mutation { createAudit(input: CreateAuditInput!): Audit! }
 *   input CreateAuditInput { prompt: String!, generatedCode: String! }
 *   type Audit { id prompt generatedCode isValid diagnostic createdAt }
 *   type AuditStats { total valid invalid validityRate commonDiagnostics: [DiagnosticCount!]! }
 *   type DiagnosticCount { diagnostic count }
 *
 * Request errors (parse, unknown field, bad argument) answer 200 with
 * {"data":null,"errors":[...]}. Only a body that is not a JSON object with a
 * string "query" is a 400. createAudit during shutdown is a 503.
 */
class GraphQLHandler {
public:
    GraphQLHandler(std::shared_ptr<ValidationPipeline> pipeline,
                   std::shared_ptr<StatsAggregator> stats,
                   std::shared_ptr<IAuditStore> store,
                   GraphQLConfig config = {});

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    /**
     * @brief Parse a document and select the operation to run
     * @param operation_name Required when the document holds several operations
     * @return INVALID_INPUT with a positioned message on a syntax error
     */
    [[nodiscard]] Result<GraphQLOperation> parse(std::string_view document,
                                                 std::string_view operation_name = {}) const;

    /// Decode a POST body {"query", "variables", "operationName"} and execute it.
    [[nodiscard]] GraphQLResponse handle(const std::string& body) const;

    [[nodiscard]] GraphQLResponse execute(std::string_view document,
                                          const JsonValue& variables,
                                          std::string_view operation_name = {}) const;

    /// GraphiQL page pointed at the configured endpoint.
    [[nodiscard]] std::string playground_html() const;

    [[nodiscard]] const GraphQLConfig& config() const { return config_; }

private:
    [[nodiscard]] std::string run_query_field(const GraphQLField& field, const JsonValue& variables,
                                              std::vector<std::string>& errors, bool& null_data) const;
    [[nodiscard]] std::string run_mutation_field(const GraphQLField& field, const JsonValue& variables,
                                                 std::vector<std::string>& errors, bool& null_data) const;

    std::shared_ptr<ValidationPipeline> pipeline_;
    std::shared_ptr<StatsAggregator> stats_;
    std::shared_ptr<IAuditStore> store_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;
    GraphQLConfig config_;
};

} // namespace codeauditor
