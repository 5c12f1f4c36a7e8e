#pragma once

#include "queue/BacklogEstimator.hpp"

#include <chrono>

namespace lc::queue {

// Backlog estimation over DMS_LockFiles directories, one .lock file per announced transfer.
class LockDirectoryEstimator : public BacklogEstimator {
public:
    explicit LockDirectoryEstimator(std::chrono::minutes staleWindow = std::chrono::minutes(180));

    [[nodiscard]] std::optional<Intent> announce(const std::filesystem::path& queue,
                                                 const TransferRequest& request) override;

    [[nodiscard]] Backlog backlog(const std::filesystem::path& queue, int64_t timestampMs) const override;

    [[nodiscard]] bool withdrawn(const Intent& intent) const override;

    void release(const Intent& intent) noexcept override;

    [[nodiscard]] std::chrono::minutes staleWindow() const { return staleWindow_; }

private:
    std::chrono::minutes staleWindow_;
    std::chrono::steady_clock::time_point lastRetryPause_{};

    void pauseBeforeRetry();
};

}
