#include "queue/Coordinator.hpp"
#include "queue/LockDirectoryEstimator.hpp"
#include "queue/LockQueueWait.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

using namespace lc::queue;
using namespace lc::logging;
namespace fs = std::filesystem;

std::string lc::queue::to_string(const CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Idle: return "idle";
        case CoordinatorState::Waiting: return "waiting";
        case CoordinatorState::Ready: return "ready";
        case CoordinatorState::TimedOut: return "timed_out";
        case CoordinatorState::Copying: return "copying";
        case CoordinatorState::Done: return "done";
    }
    return "unknown";
}

Coordinator::Coordinator(config::Config config,
                         std::shared_ptr<notify::Notifier> notifier,
                         std::shared_ptr<BacklogEstimator> estimator,
                         std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      notifier_(notifier ? std::move(notifier) : std::make_shared<notify::Notifier>()),
      estimator_(estimator ? std::move(estimator) : std::make_shared<LockDirectoryEstimator>(config_.lock_queue.stale_lock)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      shares_(config_.shares, config_.lock_queue.slow_share_prefixes),
      plain_(notifier_),
      resumable_(config_.copy, notifier_) {}

bool Coordinator::copyWithLockCoordination(const fs::path& source, const fs::path& target, const bool overwrite) {
    return copyWithLockCoordination(source, target, config_.lock_queue.manager_name, overwrite);
}

bool Coordinator::copyWithLockCoordination(const fs::path& source, const fs::path& target,
                                           const std::string& managerName, const bool overwrite) {
    state_ = CoordinatorState::Idle;

    if (!overwrite && fs::exists(target)) {
        LogRegistry::queue()->debug("[Coordinator] Skipping {}; target exists", target.string());
        state_ = CoordinatorState::Done;
        return true;
    }

    const auto sizeBytes = fs::file_size(source);
    const auto sourceQueue = shares_.lockDirectory(source);
    const auto targetQueue = shares_.lockDirectory(target);

    if (sizeBytes < config_.lock_queue.min_source_size_mb * config::MiB || (!sourceQueue && !targetQueue)) {
        LogRegistry::queue()->debug("[Coordinator] Copying {} ({}) without lock files",
                                    source.filename().string(), util::bytesToHumanReadable(sizeBytes));
        state_ = CoordinatorState::Copying;
        transfer(source, target, sizeBytes, overwrite);
        state_ = CoordinatorState::Done;
        return true;
    }

    const TransferRequest request{
        .timestampMs = util::lockTimestampMs(clock_->now()),
        .source = fs::absolute(source),
        .target = target,
        .sizeBytes = sizeBytes,
        .manager = managerName
    };

    std::optional<Intent> sourceIntent, targetIntent;
    bool announced = true;
    if (sourceQueue) {
        sourceIntent = estimator_->announce(*sourceQueue, request);
        announced = announced && sourceIntent.has_value();
    }
    if (targetQueue) {
        targetIntent = estimator_->announce(*targetQueue, request);
        announced = announced && targetIntent.has_value();
    }

    if (!announced) {
        LogRegistry::queue()->warn("[Coordinator] Unable to create lock files for {}; copying without the lock queue",
                                   source.string());
        release(sourceIntent, targetIntent);
        state_ = CoordinatorState::Copying;
        transfer(source, target, sizeBytes, overwrite);
        state_ = CoordinatorState::Done;
        return true;
    }

    try {
        state_ = CoordinatorState::Waiting;

        LockQueueWait wait(config_.lock_queue, *estimator_, *clock_, *notifier_, request,
                           {sourceQueue, sourceIntent, sourceQueue && shares_.isSlowShare(*sourceQueue)},
                           {targetQueue, targetIntent, targetQueue && shares_.isSlowShare(*targetQueue)});

        state_ = wait.run() == WaitState::Ready ? CoordinatorState::Ready : CoordinatorState::TimedOut;

        LogRegistry::queue()->debug("[Coordinator] Copying {} using locks", source.filename().string());
        state_ = CoordinatorState::Copying;
        transfer(source, target, sizeBytes, overwrite);
    } catch (...) {
        release(sourceIntent, targetIntent);
        throw;
    }

    release(sourceIntent, targetIntent);
    state_ = CoordinatorState::Done;
    return true;
}

void Coordinator::transfer(const fs::path& source, const fs::path& target, const uintmax_t sizeBytes, const bool overwrite) {
    const auto threshold = config_.copy.resumable_threshold_mb;
    if (threshold > 0 && sizeBytes > threshold * config::MiB) {
        resumable_.copyWithResume(source, target);
        return;
    }
    plain_.copy(source, target, overwrite);
}

void Coordinator::release(const std::optional<Intent>& source, const std::optional<Intent>& target) const {
    if (source) estimator_->release(*source);
    if (target) estimator_->release(*target);
}
