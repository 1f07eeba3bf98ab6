#pragma once

#include "config/config_types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace codeauditor {

class ValidationPipeline;
class StatsAggregator;
class IAuditStore;
class ShutdownCoordinator;
class GraphQLHandler;

/**
 * @brief HTTP surface of the auditor
 *
 * Routes:
 *   POST /audit         validate + record a submission   201 / 400 / 503 / 500
 *   GET  /stats         aggregate counts (liveness)      200 / 503
 *   GET  /audits        newest-first page                200 / 400 / 503
 *   GET  /audits/:id    single record                    200 / 404 / 503
 *   POST /graphql       GraphQL queries and createAudit  200 / 400 / 503
 *   GET  /graphql       GraphiQL page (when enabled)
 *
 * REST errors are returned as {"error": "..."}; GraphQL errors use the
 * GraphQL response shape.
 */
class HttpServer {
public:
    HttpServer(
        std::shared_ptr<ValidationPipeline> pipeline,
        std::shared_ptr<StatsAggregator> stats,
        std::shared_ptr<IAuditStore> store,
        ServerConfig config = {});

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve; blocks until stop(). Port 0 binds an ephemeral port.
    /// @throws std::runtime_error if the address cannot be bound
    void start();
    void stop();

    /// Wait until start() is accepting connections
    [[nodiscard]] bool wait_until_ready(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) const;

    /// Port actually bound (differs from config when config port is 0)
    [[nodiscard]] int port() const { return bound_port_.load(std::memory_order_acquire); }

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    /// Registers the GraphQL routes at handler->config().endpoint. Call before start().
    void set_graphql_handler(std::shared_ptr<GraphQLHandler> handler);

private:
    void register_routes();

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_audit(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_list_audits(const httplib::Request& req, httplib::Response& res);
    void handle_get_audit(const httplib::Request& req, httplib::Response& res);
    void handle_graphql(const httplib::Request& req, httplib::Response& res);
    void handle_graphiql(const httplib::Request& req, httplib::Response& res);

    // ── Members ─────────────────────────────────────────────────────────
    std::shared_ptr<ValidationPipeline> pipeline_;
    std::shared_ptr<StatsAggregator> stats_;
    std::shared_ptr<IAuditStore> store_;
    const ServerConfig config_;
    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;
    std::shared_ptr<GraphQLHandler> graphql_handler_;

    std::unique_ptr<httplib::Server> svr_;
    std::atomic<int> bound_port_{0};
};

} // namespace codeauditor
