#include "server/shutdown_coordinator.hpp"
#include "core/utils.hpp"

#include <format>

namespace codeauditor {

// ============================================================================
// Admission
// ============================================================================

ShutdownCoordinator::Admission&
ShutdownCoordinator::Admission::operator=(Admission&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void ShutdownCoordinator::Admission::release() {
    if (owner_) {
        owner_->finish_one();
        owner_ = nullptr;
    }
}

// ============================================================================
// ShutdownCoordinator
// ============================================================================

ShutdownCoordinator::ShutdownCoordinator() : config_{} {}

ShutdownCoordinator::ShutdownCoordinator(Config config) : config_(config) {}

std::optional<ShutdownCoordinator::Admission> ShutdownCoordinator::admit() {
    std::lock_guard lock(mutex_);
    if (!accepting_) return std::nullopt;
    ++in_flight_;
    return Admission(this);
}

void ShutdownCoordinator::begin_shutdown() {
    uint32_t pending = 0;
    {
        std::lock_guard lock(mutex_);
        if (!accepting_) return;
        accepting_ = false;
        pending = in_flight_;
    }
    idle_cv_.notify_all();
    utils::log::info(std::format("Shutdown: no longer accepting submissions, {} in flight", pending));
}

ShutdownCoordinator::DrainReport ShutdownCoordinator::drain() {
    utils::Timer timer;
    std::unique_lock lock(mutex_);
    DrainReport report;
    report.drained = idle_cv_.wait_for(lock, config_.drain_timeout, [this] { return in_flight_ == 0; });
    report.abandoned = in_flight_;
    report.waited = timer.elapsed_ms();
    return report;
}

bool ShutdownCoordinator::accepting() const {
    std::lock_guard lock(mutex_);
    return accepting_;
}

uint32_t ShutdownCoordinator::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

void ShutdownCoordinator::finish_one() {
    bool idle = false;
    {
        std::lock_guard lock(mutex_);
        --in_flight_;
        idle = in_flight_ == 0;
    }
    if (idle) idle_cv_.notify_all();
}

} // namespace codeauditor
