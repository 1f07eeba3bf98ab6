#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace codeauditor {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}'",
                i + 1, name_));
            continue;
        }
        std::lock_guard lock(mutex_);
        idle_.push_back({std::move(conn), std::chrono::steady_clock::now()});
    }

    utils::log::info(std::format("ConnectionPool '{}' initialized: {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have started while we were waiting
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point last_used{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_.empty()) {
            conn = std::move(idle_.front().conn);
            last_used = idle_.front().last_used;
            idle_.pop_front();
        }
    }

    const auto now = std::chrono::steady_clock::now();
    if (conn && needs_recycle(conn.get(), now)) {
        discard(std::move(conn));
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
    } else if (conn && now - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Only long-idle connections pay for a health-check round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        discard(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    return std::make_unique<PooledConnection>(std::move(conn),
        [this](std::unique_ptr<IDbConnection> c) { return_connection(std::move(c)); });
}

PoolStats GenericConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.idle_connections = idle_.size();
    }
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.active_connections = stats.total_connections > stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<IdleEntry> closing;
    {
        std::lock_guard lock(mutex_);
        closing.swap(idle_);
    }
    for (auto& entry : closing) {
        discard(std::move(entry.conn));
    }

    utils::log::info(std::format("ConnectionPool '{}' drained", name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(mutex_);
        born_[conn.get()] = std::chrono::steady_clock::now();
    }
    return conn;
}

void GenericConnectionPool::discard(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        born_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

bool GenericConnectionPool::needs_recycle(IDbConnection* conn,
                                          std::chrono::steady_clock::time_point now) const {
    if (config_.max_lifetime.count() <= 0) return false;
    std::lock_guard lock(mutex_);
    const auto it = born_.find(conn);
    return it != born_.end() && now - it->second > config_.max_lifetime;
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    // Broken or shutting down: close instead of pooling
    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        idle_.push_back({std::move(conn), std::chrono::steady_clock::now()});
    }
    semaphore_.release();
}

} // namespace codeauditor
