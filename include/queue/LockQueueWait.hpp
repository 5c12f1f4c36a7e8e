#pragma once

#include "config/Config.hpp"
#include "queue/BacklogEstimator.hpp"
#include "queue/Clock.hpp"
#include "notify/Notifier.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace lc::queue {

enum class WaitState { Waiting, Ready, TimedOut };

[[nodiscard]] std::string to_string(WaitState state);

// One side (source or target share) of a coordinated transfer
struct QueueSide {
    std::optional<std::filesystem::path> queue;
    std::optional<Intent> intent;
    bool slowShare = false;
};

/**
 * Polls the source and target queues until the backlog ahead of a request is small enough.
 *
 * Waiting -> Ready once either queue holds at most one earlier announcement on both sides,
 * once both sides are under the transfer threshold (or past their own max wait), or once
 * every announcement of this request was withdrawn by an operator.
 * Waiting -> TimedOut after lock_queue.max_wait; the caller copies anyway.
 */
class LockQueueWait {
public:
    LockQueueWait(const config::LockQueueConfig& config,
                  const BacklogEstimator& estimator,
                  Clock& clock,
                  const notify::Notifier& notifier,
                  TransferRequest request,
                  QueueSide source,
                  QueueSide target);

    // Single poll; sleeps on the clock when the request must keep waiting
    WaitState step();

    // Polls until Ready or TimedOut
    WaitState run();

    [[nodiscard]] WaitState state() const { return state_; }
    [[nodiscard]] uintmax_t backlogSourceMB() const { return backlogSourceMB_; }
    [[nodiscard]] uintmax_t backlogTargetMB() const { return backlogTargetMB_; }
    [[nodiscard]] unsigned int polls() const { return polls_; }
    [[nodiscard]] double elapsedMinutes() const;

    // Sleep between polls for a given backlog
    [[nodiscard]] static std::chrono::seconds pollInterval(const config::LockQueueConfig& config, uintmax_t backlogMB);

    [[nodiscard]] static std::string adminBypassMessage(const std::string& sourceLock, const std::string& targetLock);

private:
    const config::LockQueueConfig& config_;
    const BacklogEstimator& estimator_;
    Clock& clock_;
    const notify::Notifier& notifier_;

    TransferRequest request_;
    QueueSide source_, target_;
    uintmax_t sizeMB_;

    std::chrono::minutes maxWaitSource_, maxWaitTarget_;
    util::TimePoint start_;
    bool watchSourceIntent_ = false, watchTargetIntent_ = false;
    bool notifiedLockPaths_ = false;

    WaitState state_ = WaitState::Waiting;
    uintmax_t backlogSourceMB_ = 0, backlogTargetMB_ = 0;
    unsigned int polls_ = 0;

    [[nodiscard]] bool waitedTooLong(std::chrono::minutes limit) const;
    [[nodiscard]] bool intentsWithdrawn() const;
    [[nodiscard]] Backlog measure(const QueueSide& side) const;
    void notifyLockPaths() const;
};

}
