#include "notify/LoggingObserver.hpp"
#include "logging/LogRegistry.hpp"

using namespace lc::notify;
using namespace lc::logging;

void LoggingObserver::notify(const Event& event) {
    const auto msg = describe(event);

    // Progress is chatty; keep it out of info
    if (std::holds_alternative<CopyProgress>(event)) {
        LogRegistry::notify()->debug("[Progress] {}", msg);
        return;
    }

    if (std::holds_alternative<LockQueueTimedOut>(event) || std::holds_alternative<LockFilePathsForBypass>(event)) {
        LogRegistry::notify()->warn("[LockQueue] {}", msg);
        return;
    }

    LogRegistry::notify()->info("[{}] {}", eventName(event), msg);
}
