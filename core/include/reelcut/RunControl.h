#pragma once

#include <atomic>

namespace reelcut {

/**
 * RunHandle: single-flight guard owned by the orchestrator
 *
 * tryAcquire() succeeds for exactly one caller until release(). The scoring
 * and selection classes never see it.
 */
class RunHandle {
  public:
    RunHandle() = default;
    RunHandle(const RunHandle&) = delete;
    RunHandle& operator=(const RunHandle&) = delete;

    bool tryAcquire();
    void release();
    bool busy() const;

  private:
    std::atomic<bool> running_{false};
};

// Releases the handle on scope exit if it was acquired.
class RunLease {
  public:
    explicit RunLease(RunHandle& handle);
    ~RunLease();

    RunLease(const RunLease&) = delete;
    RunLease& operator=(const RunLease&) = delete;

    bool acquired() const { return acquired_; }

  private:
    RunHandle& handle_;
    bool acquired_{false};
};

// Set from any thread; observed by the engine between stages.
class CancellationToken {
  public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    void reset() { cancelled_.store(false, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace reelcut
