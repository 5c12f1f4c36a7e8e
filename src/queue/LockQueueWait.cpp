#include "queue/LockQueueWait.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <cmath>

using namespace lc::queue;
using namespace lc::logging;

std::string lc::queue::to_string(const WaitState state) {
    switch (state) {
        case WaitState::Waiting: return "waiting";
        case WaitState::Ready: return "ready";
        case WaitState::TimedOut: return "timed_out";
    }
    return "unknown";
}

LockQueueWait::LockQueueWait(const config::LockQueueConfig& config,
                             const BacklogEstimator& estimator,
                             Clock& clock,
                             const notify::Notifier& notifier,
                             TransferRequest request,
                             QueueSide source,
                             QueueSide target)
    : config_(config), estimator_(estimator), clock_(clock), notifier_(notifier),
      request_(std::move(request)), source_(std::move(source)), target_(std::move(target)),
      sizeMB_(util::bytesToMB(request_.sizeBytes)),
      maxWaitSource_(config.max_wait), maxWaitTarget_(config.max_wait),
      start_(clock.now()) {
    if (source_.queue && source_.slowShare) maxWaitSource_ = std::min(maxWaitSource_, config.slow_share_max_wait);
    if (target_.queue && target_.slowShare) maxWaitTarget_ = std::min(maxWaitTarget_, config.slow_share_max_wait);

    // Only announcements present now can be withdrawn later
    watchSourceIntent_ = source_.intent && !estimator_.withdrawn(*source_.intent);
    watchTargetIntent_ = target_.intent && !estimator_.withdrawn(*target_.intent);
}

WaitState LockQueueWait::run() {
    while (step() == WaitState::Waiting) {}
    return state_;
}

WaitState LockQueueWait::step() {
    if (state_ != WaitState::Waiting) return state_;
    ++polls_;

    const auto src = measure(source_);
    const auto tgt = measure(target_);

    bool ready = false;
    if (src.count <= 1 && tgt.count <= 1) {
        ready = true;
    } else {
        backlogSourceMB_ = src.totalMB;
        backlogTargetMB_ = tgt.totalMB;

        const bool sourceOk = backlogSourceMB_ + sizeMB_ < config_.transfer_threshold_mb || waitedTooLong(maxWaitSource_);
        const bool targetOk = backlogTargetMB_ + sizeMB_ < config_.transfer_threshold_mb || waitedTooLong(maxWaitTarget_);
        ready = sourceOk && targetOk;
    }

    if (!ready && intentsWithdrawn()) {
        LogRegistry::queue()->info("[LockQueueWait] Lock files for {} were deleted; bypassing the queue",
                                   request_.source.string());
        ready = true;
    }

    if (ready) {
        state_ = WaitState::Ready;
        notifier_.publish(notify::LockQueueWaitComplete{request_.source.string(), request_.target.string(), elapsedMinutes()});
        return state_;
    }

    const auto elapsed = elapsedMinutes();
    const auto sleep = pollInterval(config_, std::max(backlogSourceMB_, backlogTargetMB_));

    if (!notifiedLockPaths_ && elapsed >= static_cast<double>(config_.notify_lock_paths_after.count())) {
        notifyLockPaths();
        notifiedLockPaths_ = true;
    }

    notifier_.publish(notify::WaitingForLockQueue{
        request_.source.string(), request_.target.string(), backlogSourceMB_, backlogTargetMB_});

    clock_.sleepFor(sleep);

    // Measured after the sleep so the wait never outlasts max_wait by more than one poll
    const auto waited = elapsedMinutes();
    if (waited < static_cast<double>(config_.max_wait.count())) return state_;

    state_ = WaitState::TimedOut;
    LogRegistry::queue()->warn("[LockQueueWait] Gave up waiting after {:.1f} minutes for {}", waited, request_.source.string());
    notifier_.publish(notify::LockQueueTimedOut{request_.source.string(), request_.target.string(), waited});
    return state_;
}

double LockQueueWait::elapsedMinutes() const {
    return std::chrono::duration<double, std::ratio<60>>(clock_.now() - start_).count();
}

std::chrono::seconds LockQueueWait::pollInterval(const config::LockQueueConfig& config, const uintmax_t backlogMB) {
    const auto minSec = static_cast<double>(config.min_poll_interval.count());
    const auto maxSec = static_cast<double>(std::max(config.max_poll_interval, config.min_poll_interval).count());
    const auto throughput = config.throughput_mb_per_sec > 0 ? config.throughput_mb_per_sec : 1.0;

    const auto seconds = std::clamp(static_cast<double>(backlogMB) / throughput, minSec, maxSec);
    return std::chrono::seconds(std::llround(seconds));
}

std::string LockQueueWait::adminBypassMessage(const std::string& sourceLock, const std::string& targetLock) {
    static const std::string base = "To force the file copy and bypass the lock file queue";

    if (!sourceLock.empty() && !targetLock.empty()) return base + ", delete " + sourceLock + " and " + targetLock;
    if (!sourceLock.empty()) return base + ", delete " + sourceLock;
    if (!targetLock.empty()) return base + ", delete " + targetLock;
    return "No lock files were created; unable to bypass the lock file queue";
}

bool LockQueueWait::waitedTooLong(const std::chrono::minutes limit) const {
    return elapsedMinutes() >= static_cast<double>(limit.count());
}

bool LockQueueWait::intentsWithdrawn() const {
    const int watched = (watchSourceIntent_ ? 1 : 0) + (watchTargetIntent_ ? 1 : 0);
    if (watched == 0) return false;

    int deleted = 0;
    if (watchSourceIntent_ && estimator_.withdrawn(*source_.intent)) ++deleted;
    if (watchTargetIntent_ && estimator_.withdrawn(*target_.intent)) ++deleted;
    return deleted >= watched;
}

Backlog LockQueueWait::measure(const QueueSide& side) const {
    if (!side.queue) return {};
    return estimator_.backlog(*side.queue, request_.timestampMs);
}

void LockQueueWait::notifyLockPaths() const {
    const auto sourceLock = source_.intent ? source_.intent->marker.string() : std::string();
    const auto targetLock = target_.intent ? target_.intent->marker.string() : std::string();
    notifier_.publish(notify::LockFilePathsForBypass{sourceLock, targetLock, adminBypassMessage(sourceLock, targetLock)});
}
