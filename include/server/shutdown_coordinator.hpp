#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace codeauditor {

/**
 * @brief Admission gate for submissions during graceful shutdown
 *
 * Every submission (POST /audit, the createAudit mutation) holds an
 * Admission while it compiles and stores its verdict. After
 * begin_shutdown() no new Admission is issued, and drain() waits for the
 * outstanding ones so no verdict is lost half-written. Reads are never gated.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds drain_timeout{30000};
    };

    /// Move-only token for one in-flight submission.
    class Admission {
    public:
        Admission(Admission&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Admission& operator=(Admission&& other) noexcept;
        ~Admission() { release(); }

        Admission(const Admission&) = delete;
        Admission& operator=(const Admission&) = delete;

    private:
        friend class ShutdownCoordinator;
        explicit Admission(ShutdownCoordinator* owner) : owner_(owner) {}
        void release();

        ShutdownCoordinator* owner_;
    };

    struct DrainReport {
        bool drained = true;                    // false when the timeout expired first
        uint32_t abandoned = 0;                 // submissions still running at the deadline
        std::chrono::milliseconds waited{0};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(Config config);

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /// nullopt once shutdown has begun.
    [[nodiscard]] std::optional<Admission> admit();

    /// Stop admitting. Idempotent.
    void begin_shutdown();

    /// Wait up to Config::drain_timeout for outstanding admissions.
    [[nodiscard]] DrainReport drain();

    [[nodiscard]] bool accepting() const;
    [[nodiscard]] uint32_t in_flight() const;

private:
    void finish_one();

    const Config config_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool accepting_ = true;
    uint32_t in_flight_ = 0;
};

} // namespace codeauditor
