#include "server/http_server.hpp"
#include "server/audit_json.hpp"
#include "server/graphql_handler.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "stats/stats_aggregator.hpp"
#include "store/iaudit_store.hpp"
#include "validation/validation_pipeline.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <format>
#include <optional>
#include <stdexcept>
#include <thread>

namespace codeauditor {

namespace {

void send_error(httplib::Response& res, int status, std::string_view message) {
    res.status = status;
    res.set_content(http::error_json(message), http::kJsonContentType);
}

/// Optional non-negative integer query parameter; nullopt value means absent.
Result<std::optional<size_t>> size_param(const httplib::Request& req, const std::string& name) {
    if (!req.has_param(name)) {
        return Result<std::optional<size_t>>::ok(std::nullopt);
    }
    const auto parsed = utils::try_parse_int<size_t>(req.get_param_value(name));
    if (!parsed) {
        return Result<std::optional<size_t>>::error(ErrorCategory::INVALID_INPUT,
            std::format("{} must be a non-negative integer", name));
    }
    return Result<std::optional<size_t>>::ok(*parsed);
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(
    std::shared_ptr<ValidationPipeline> pipeline,
    std::shared_ptr<StatsAggregator> stats,
    std::shared_ptr<IAuditStore> store,
    ServerConfig config)
    : pipeline_(std::move(pipeline)),
      stats_(std::move(stats)),
      store_(std::move(store)),
      config_(std::move(config)),
      svr_(std::make_unique<httplib::Server>()) {
    register_routes();
}

HttpServer::~HttpServer() = default;

// ============================================================================
// start() — binds, listens (blocking)
// ============================================================================

void HttpServer::start() {
    auto& svr = *svr_;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(config_.max_body_bytes);

    int port = config_.port;
    if (port == 0) {
        port = svr.bind_to_any_port(config_.host);
        if (port < 0) {
            throw std::runtime_error(std::format("Failed to bind HTTP server on {}", config_.host));
        }
    } else if (!svr.bind_to_port(config_.host, port)) {
        throw std::runtime_error(std::format("Failed to bind HTTP server on {}:{}", config_.host, port));
    }
    bound_port_.store(port, std::memory_order_release);

    utils::log::info(std::format("Code Auditor listening on {}:{} ({} threads)",
        config_.host, port, config_.thread_pool_size));

    if (!svr.listen_after_bind()) {
        throw std::runtime_error("HTTP server stopped with an accept error");
    }
}

void HttpServer::stop() {
    if (svr_->is_running()) {
        svr_->stop();
    }
    utils::log::info("Server stopped");
}

bool HttpServer::wait_until_ready(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!svr_->is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes() {
    auto& svr = *svr_;

    svr.Post(http::kAuditPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_audit(req, res);
    });
    svr.Get(http::kStatsPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });
    svr.Get(http::kAuditsPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_list_audits(req, res);
    });
    svr.Get(http::kAuditByIdPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_audit(req, res);
    });
}

void HttpServer::set_graphql_handler(std::shared_ptr<GraphQLHandler> handler) {
    graphql_handler_ = std::move(handler);
    if (!graphql_handler_ || !graphql_handler_->config().enabled) return;

    const auto& gql = graphql_handler_->config();
    svr_->Post(gql.endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handle_graphql(req, res);
    });
    if (gql.playground) {
        svr_->Get(gql.endpoint, [this](const httplib::Request& req, httplib::Response& res) {
            handle_graphiql(req, res);
        });
    }
    utils::log::info(std::format("GraphQL endpoint {} (playground {}, mutations {})", gql.endpoint,
        gql.playground ? "on" : "off", gql.mutations_enabled ? "on" : "off"));
}

// ============================================================================
// Handler: POST /audit
// ============================================================================

void HttpServer::handle_audit(const httplib::Request& req, httplib::Response& res) {
    std::optional<ShutdownCoordinator::Admission> admission;
    if (shutdown_coordinator_) {
        admission = shutdown_coordinator_->admit();
        if (!admission) {
            send_error(res, httplib::StatusCode::ServiceUnavailable_503, "Server shutting down");
            return;
        }
    }

    try {
        const std::string content_type = req.get_header_value("Content-Type");
        if (!content_type.contains(http::kJsonContentType)) {
            send_error(res, httplib::StatusCode::BadRequest_400, "Content-Type must be application/json");
            return;
        }

        const auto submission = http::parse_submission(req.body);
        if (submission.is_error()) {
            send_error(res, http::status_for(submission.error_category()), submission.error_message());
            return;
        }

        const auto result = pipeline_->validate(submission.value().prompt,
                                                submission.value().generated_code);
        if (result.is_error()) {
            send_error(res, http::status_for(result.error_category()), result.error_message());
            return;
        }

        res.status = httplib::StatusCode::Created_201;
        res.set_content(http::audit_record_json(result.value()), http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("POST {} failed: {}", http::kAuditPath, e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, "Internal server error");
    }
}

// ============================================================================
// Handler: GET /stats
// ============================================================================

void HttpServer::handle_stats(const httplib::Request& /*req*/, httplib::Response& res) {
    try {
        const auto summary = stats_->summary();
        if (summary.is_error()) {
            // Unreachable store = unhealthy service
            send_error(res, httplib::StatusCode::ServiceUnavailable_503, summary.error_message());
            return;
        }
        res.status = httplib::StatusCode::OK_200;
        res.set_content(http::summary_json(summary.value()), http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("GET {} failed: {}", http::kStatsPath, e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, "Internal server error");
    }
}

// ============================================================================
// Handler: GET /audits?limit=N&offset=M
// ============================================================================

void HttpServer::handle_list_audits(const httplib::Request& req, httplib::Response& res) {
    try {
        const auto limit_param = size_param(req, "limit");
        const auto offset_param = size_param(req, "offset");
        for (const auto* p : {&limit_param, &offset_param}) {
            if (p->is_error()) {
                send_error(res, httplib::StatusCode::BadRequest_400, p->error_message());
                return;
            }
        }

        const size_t limit = std::min(limit_param.value().value_or(http::kDefaultPageLimit),
                                      http::kMaxPageLimit);
        const size_t offset = offset_param.value().value_or(0);
        if (limit == 0) {
            send_error(res, httplib::StatusCode::BadRequest_400, "limit must be at least 1");
            return;
        }

        const auto page = store_->list_recent(limit, offset);
        if (page.is_error()) {
            send_error(res, httplib::StatusCode::ServiceUnavailable_503, page.error_message());
            return;
        }
        res.status = httplib::StatusCode::OK_200;
        res.set_content(http::audit_page_json(page.value(), limit, offset), http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("GET {} failed: {}", http::kAuditsPath, e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, "Internal server error");
    }
}

// ============================================================================
// Handler: GET /audits/:id
// ============================================================================

void HttpServer::handle_get_audit(const httplib::Request& req, httplib::Response& res) {
    try {
        const auto& id = req.path_params.at("id");
        const auto found = store_->find_by_id(id);
        if (found.is_error()) {
            send_error(res, httplib::StatusCode::ServiceUnavailable_503, found.error_message());
            return;
        }
        if (!found.value()) {
            send_error(res, httplib::StatusCode::NotFound_404, std::format("audit {} not found", id));
            return;
        }
        res.status = httplib::StatusCode::OK_200;
        res.set_content(http::audit_record_json(*found.value()), http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("GET {} failed: {}", http::kAuditByIdPath, e.what()));
        send_error(res, httplib::StatusCode::InternalServerError_500, "Internal server error");
    }
}

// ============================================================================
// Handler: POST /graphql
// ============================================================================

void HttpServer::handle_graphql(const httplib::Request& req, httplib::Response& res) {
    try {
        const std::string content_type = req.get_header_value("Content-Type");
        if (!content_type.contains(http::kJsonContentType)) {
            res.status = httplib::StatusCode::BadRequest_400;
            res.set_content(R"({"errors":[{"message":"Content-Type must be application/json"}]})",
                            http::kJsonContentType);
            return;
        }

        const auto response = graphql_handler_->handle(req.body);
        res.status = response.status;
        res.set_content(response.body, http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("POST {} failed: {}", graphql_handler_->config().endpoint, e.what()));
        res.status = httplib::StatusCode::InternalServerError_500;
        res.set_content(R"({"data":null,"errors":[{"message":"Internal server error"}]})",
                        http::kJsonContentType);
    }
}

void HttpServer::handle_graphiql(const httplib::Request& /*req*/, httplib::Response& res) {
    res.status = httplib::StatusCode::OK_200;
    res.set_content(graphql_handler_->playground_html(), "text/html; charset=utf-8");
}

} // namespace codeauditor
