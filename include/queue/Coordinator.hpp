#pragma once

#include "config/Config.hpp"
#include "copy/FileCopier.hpp"
#include "copy/ResumableCopier.hpp"
#include "notify/Notifier.hpp"
#include "queue/BacklogEstimator.hpp"
#include "queue/Clock.hpp"
#include "share/ShareResolver.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace lc::queue {

enum class CoordinatorState { Idle, Waiting, Ready, TimedOut, Copying, Done };

[[nodiscard]] std::string to_string(CoordinatorState state);

/**
 * Copies a file after queueing behind other large transfers on the source and target shares.
 *
 * Small files and files that touch no lock-capable share are copied directly. Larger
 * ones are announced in each share's DMS_LockFiles directory, wait in LockQueueWait,
 * are copied, and have their announcements released whether or not the copy succeeds.
 */
class Coordinator {
public:
    explicit Coordinator(config::Config config,
                         std::shared_ptr<notify::Notifier> notifier = nullptr,
                         std::shared_ptr<BacklogEstimator> estimator = nullptr,
                         std::shared_ptr<Clock> clock = nullptr);

    // Returns true without copying when the target exists and overwrite is false
    bool copyWithLockCoordination(const std::filesystem::path& source,
                                  const std::filesystem::path& target,
                                  const std::string& managerName,
                                  bool overwrite);

    // Announces under the configured lock_queue.manager_name
    bool copyWithLockCoordination(const std::filesystem::path& source,
                                  const std::filesystem::path& target,
                                  bool overwrite);

    [[nodiscard]] CoordinatorState state() const { return state_; }
    [[nodiscard]] const share::ShareResolver& shares() const { return shares_; }
    [[nodiscard]] const config::Config& config() const { return config_; }
    [[nodiscard]] copy::ResumableCopier& resumableCopier() { return resumable_; }

private:
    config::Config config_;
    std::shared_ptr<notify::Notifier> notifier_;
    std::shared_ptr<BacklogEstimator> estimator_;
    std::shared_ptr<Clock> clock_;

    share::ShareResolver shares_;
    copy::FileCopier plain_;
    copy::ResumableCopier resumable_;

    CoordinatorState state_ = CoordinatorState::Idle;

    void transfer(const std::filesystem::path& source, const std::filesystem::path& target, uintmax_t sizeBytes, bool overwrite);
    void release(const std::optional<Intent>& source, const std::optional<Intent>& target) const;
};

}
