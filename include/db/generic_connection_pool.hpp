#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace codeauditor {

/**
 * @brief Bounded connection pool over any IConnectionFactory
 *
 * Design:
 * - Bounded: max_connections enforced via counting_semaphore
 * - Lazy: connections created on demand up to max (min pre-warmed)
 * - Health checking: connections idle longer than idle_timeout are checked
 *   before being handed out; connections older than max_lifetime are recycled
 * - Thread-safe: mutex protects the idle deque, semaphore prevents oversubscription
 * - RAII: PooledConnection returns itself on destruction
 *
 * The pool must outlive every PooledConnection it hands out.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const { return name_; }

private:
    struct IdleEntry {
        std::unique_ptr<IDbConnection> conn;
        std::chrono::steady_clock::time_point last_used;
    };

    std::unique_ptr<IDbConnection> create_connection();
    void discard(std::unique_ptr<IDbConnection> conn);
    bool needs_recycle(IDbConnection* conn, std::chrono::steady_clock::time_point now) const;
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<IdleEntry> idle_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> born_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace codeauditor
