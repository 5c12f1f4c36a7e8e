#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace lc::notify {

struct CopyStarting {
    std::string sourcePath;
};

struct ResumeStarting {
    std::string sourcePath;
};

struct CopyProgress {
    std::string fileName;
    float percentComplete{};   // 0 - 100
};

struct WaitingForLockQueue {
    std::string sourcePath, targetPath;
    uint64_t backlogSourceMB{}, backlogTargetMB{};
};

struct LockQueueTimedOut {
    std::string sourcePath, targetPath;
    double waitMinutes{};
};

struct LockQueueWaitComplete {
    std::string sourcePath, targetPath;
    double waitMinutes{};
};

// Tells an operator which lock files to delete to force a waiting copy to start.
struct LockFilePathsForBypass {
    std::string sourceLockPath, targetLockPath;
    std::string adminBypassMessage;
};

using Event = std::variant<CopyStarting,
                           ResumeStarting,
                           CopyProgress,
                           WaitingForLockQueue,
                           LockQueueTimedOut,
                           LockQueueWaitComplete,
                           LockFilePathsForBypass>;

[[nodiscard]] std::string_view eventName(const Event& event);

[[nodiscard]] std::string describe(const Event& event);

void to_json(nlohmann::json& j, const Event& event);

}
