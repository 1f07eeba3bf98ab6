#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "diagnostic/diagnostic_normalizer.hpp"
#include "sandbox/sandbox_runner.hpp"
#include "server/graphql_handler.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "stats/stats_aggregator.hpp"
#include "store/memory_audit_store.hpp"
#include "store/pg_audit_store.hpp"
#include "validation/validation_pipeline.hpp"

#include <csignal>
#include <format>
#include <memory>
#include <pthread.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace codeauditor;

namespace {

struct StorageHandles {
    std::shared_ptr<IAuditStore> store;
    std::shared_ptr<GenericConnectionPool> pool;    // null for the memory backend
};

StorageHandles build_storage(const StorageConfig& cfg) {
    StorageHandles handles;
    if (cfg.backend == "memory") {
        utils::log::warn("Storage: in-memory backend, audit records are lost on exit");
        handles.store = std::make_shared<MemoryAuditStore>();
        return handles;
    }

    PoolConfig pool_cfg;
    pool_cfg.connection_string = cfg.connection_string;
    pool_cfg.min_connections = cfg.min_connections;
    pool_cfg.max_connections = cfg.max_connections;
    pool_cfg.connection_timeout = cfg.connection_timeout;

    handles.pool = std::make_shared<GenericConnectionPool>(
        "ai_audits", pool_cfg, std::make_shared<PgConnectionFactory>());
    auto pg_store = std::make_shared<PgAuditStore>(handles.pool, cfg.connection_timeout);

    if (cfg.auto_migrate) {
        const auto schema = pg_store->ensure_schema();
        if (schema.is_error()) {
            throw std::runtime_error(std::format("Schema bootstrap failed: {}", schema.error_message()));
        }
        utils::log::info("Schema: ai_audits ready");
    }
    handles.store = std::move(pg_store);
    return handles;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Code Auditor starting...");

        // SIGINT/SIGTERM are consumed by a watcher thread via sigwait(); block
        // them before any other thread exists so every thread inherits the mask
        sigset_t termination;
        sigemptyset(&termination);
        sigaddset(&termination, SIGINT);
        sigaddset(&termination, SIGTERM);
        if (pthread_sigmask(SIG_BLOCK, &termination, nullptr) != 0) {
            throw std::runtime_error("Failed to block termination signals");
        }

        std::string config_file = "config/auditor.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            throw std::runtime_error(loaded.error_message);
        }
        const AuditorConfig config = std::move(loaded.config);
        utils::log::set_level(utils::log::parse_level(config.logging.level).value_or(utils::log::Level::INFO));

        utils::log::info(std::format("[2/6] Storage backend: {}", config.storage.backend));
        auto storage = build_storage(config.storage);

        utils::log::info(std::format("[3/6] Sandbox: timeout={}ms, memory={}MB, network isolation={}",
            config.sandbox.timeout.count(), config.sandbox.memory_limit_mb,
            network_isolation_to_string(config.sandbox.network_isolation)));
        auto sandbox = std::make_shared<ProcessSandboxRunner>(config.sandbox);
        const auto version = sandbox->probe_compiler();
        if (version.is_ok()) {
            utils::log::info(std::format("Compiler: {}", version.value()));
        } else {
            utils::log::warn(std::format(
                "Compiler unavailable: {}; submissions get 503 until it passes (rechecked every {}ms)",
                version.error_message(), config.sandbox.toolchain_recheck_interval.count()));
        }

        utils::log::info(std::format("[4/6] Validation pipeline: diagnostics capped at {} bytes",
            config.diagnostics.max_length));
        auto pipeline = std::make_shared<ValidationPipeline>(
            sandbox, DiagnosticNormalizer(config.diagnostics.max_length),
            storage.store, config.validation);
        auto stats = std::make_shared<StatsAggregator>(
            storage.store, config.storage.common_diagnostics_limit);

        utils::log::info("[5/6] HTTP server initializing...");
        auto shutdown = std::make_shared<ShutdownCoordinator>(ShutdownCoordinator::Config{
            std::chrono::milliseconds(config.server.shutdown_timeout_ms)});
        auto server = std::make_shared<HttpServer>(pipeline, stats, storage.store, config.server);
        server->set_shutdown_coordinator(shutdown);
        if (config.graphql.enabled) {
            auto graphql = std::make_shared<GraphQLHandler>(pipeline, stats, storage.store, config.graphql);
            graphql->set_shutdown_coordinator(shutdown);
            server->set_graphql_handler(graphql);
        }

        utils::log::info("[6/6] Signal handling: SIGINT/SIGTERM drain in-flight submissions");
        std::thread watcher([termination, shutdown, server] {
            int sig = 0;
            if (sigwait(&termination, &sig) != 0) {
                utils::log::error("sigwait failed; stopping server");
            } else {
                utils::log::info(std::format("Received signal {}, shutting down...", sig));
            }

            shutdown->begin_shutdown();
            const auto report = shutdown->drain();
            if (report.drained) {
                utils::log::info(std::format("All in-flight submissions drained in {}ms", report.waited.count()));
            } else {
                utils::log::warn(std::format("Shutdown timeout after {}ms: {} submissions abandoned",
                    report.waited.count(), report.abandoned));
            }
            server->stop();
        });

        try {
            server->start();
        } catch (const std::exception&) {
            // Wake the watcher so it can be joined, then report the failure
            if (::kill(::getpid(), SIGTERM) != 0) {
                utils::log::error("Failed to signal the shutdown watcher");
                watcher.detach();
                throw;
            }
            watcher.join();
            throw;
        }
        watcher.join();

        if (storage.pool) {
            storage.pool->drain();
        }
        utils::log::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
