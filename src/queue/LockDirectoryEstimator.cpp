#include "queue/LockDirectoryEstimator.hpp"
#include "queue/LockFile.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <cstdlib>
#include <thread>

using namespace lc::queue;
using namespace lc::logging;
namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds RETRY_PAUSE{250};
constexpr std::chrono::milliseconds RETRY_PAUSE_THROTTLE{500};

}

LockDirectoryEstimator::LockDirectoryEstimator(const std::chrono::minutes staleWindow)
    : staleWindow_(staleWindow) {}

std::optional<Intent> LockDirectoryEstimator::announce(const fs::path& queue, const TransferRequest& request) {
    const LockFile lock{
        .timestampMs = request.timestampMs,
        .sizeBytes = request.sizeBytes,
        .host = util::hostName(),
        .manager = request.manager,
        .source = request.source,
        .target = request.target
    };

    try {
        const auto path = createLockFile(queue, lock);
        LogRegistry::queue()->debug("[LockDirectoryEstimator] Created lock file {}", path.string());
        return Intent{queue, path};
    } catch (const std::exception& e) {
        LogRegistry::queue()->warn("[LockDirectoryEstimator] Error creating lock file in {}: {}", queue.string(), e.what());
        return std::nullopt;
    }
}

Backlog LockDirectoryEstimator::backlog(const fs::path& queue, const int64_t timestampMs) const {
    Backlog result;
    const auto staleMs = std::chrono::duration_cast<std::chrono::milliseconds>(staleWindow_).count();

    std::error_code ec;
    fs::directory_iterator it(queue, ec);
    if (ec) {
        LogRegistry::queue()->warn("[LockDirectoryEstimator] Unable to list {}: {}", queue.string(), ec.message());
        return result;
    }

    // Entries may vanish while listing; other processes add and remove lock files at will
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;

        const auto parsed = parseLockFileName(it->path().filename().string());
        if (!parsed) continue;
        if (parsed->timestampMs >= timestampMs) continue;
        if (std::llabs(timestampMs - parsed->timestampMs) >= staleMs) continue;

        ++result.count;
        result.totalMB += parsed->sizeMB;
    }

    return result;
}

bool LockDirectoryEstimator::withdrawn(const Intent& intent) const {
    std::error_code ec;
    return !fs::exists(intent.marker, ec) && !ec;
}

void LockDirectoryEstimator::release(const Intent& intent) noexcept {
    try {
        if (util::removeFileIgnoreErrors(intent.marker, [this] { pauseBeforeRetry(); }))
            LogRegistry::queue()->debug("[LockDirectoryEstimator] Released lock file {}", intent.marker.string());
    } catch (const std::exception& e) {
        LogRegistry::queue()->warn("[LockDirectoryEstimator] Error releasing {}: {}", intent.marker.string(), e.what());
    }
}

void LockDirectoryEstimator::pauseBeforeRetry() {
    const auto now = std::chrono::steady_clock::now();
    if (now - lastRetryPause_ < RETRY_PAUSE_THROTTLE) return;
    lastRetryPause_ = now;
    std::this_thread::sleep_for(RETRY_PAUSE);
}
