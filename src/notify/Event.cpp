#include "notify/Event.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace lc::notify {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

std::string_view eventName(const Event& event) {
    return std::visit(overloaded{
        [](const CopyStarting&) { return std::string_view("copy_starting"); },
        [](const ResumeStarting&) { return std::string_view("resume_starting"); },
        [](const CopyProgress&) { return std::string_view("copy_progress"); },
        [](const WaitingForLockQueue&) { return std::string_view("waiting_for_lock_queue"); },
        [](const LockQueueTimedOut&) { return std::string_view("lock_queue_timed_out"); },
        [](const LockQueueWaitComplete&) { return std::string_view("lock_queue_wait_complete"); },
        [](const LockFilePathsForBypass&) { return std::string_view("lock_file_paths_for_bypass"); },
    }, event);
}

std::string describe(const Event& event) {
    return std::visit(overloaded{
        [](const CopyStarting& e) { return fmt::format("Copying {}", e.sourcePath); },
        [](const ResumeStarting& e) { return fmt::format("Resuming copy of {}", e.sourcePath); },
        [](const CopyProgress& e) { return fmt::format("{}: {:.1f}% complete", e.fileName, e.percentComplete); },
        [](const WaitingForLockQueue& e) {
            return fmt::format("Waiting for lock queue: {} -> {} (backlog source {} MB, target {} MB)",
                               e.sourcePath, e.targetPath, e.backlogSourceMB, e.backlogTargetMB);
        },
        [](const LockQueueTimedOut& e) {
            return fmt::format("Lock queue timed out after {:.1f} minutes; copying {} -> {} anyway",
                               e.waitMinutes, e.sourcePath, e.targetPath);
        },
        [](const LockQueueWaitComplete& e) {
            return fmt::format("Lock queue wait complete after {:.1f} minutes: {} -> {}",
                               e.waitMinutes, e.sourcePath, e.targetPath);
        },
        [](const LockFilePathsForBypass& e) { return e.adminBypassMessage; },
    }, event);
}

void to_json(nlohmann::json& j, const Event& event) {
    j = std::visit(overloaded{
        [](const CopyStarting& e) { return nlohmann::json{{"source", e.sourcePath}}; },
        [](const ResumeStarting& e) { return nlohmann::json{{"source", e.sourcePath}}; },
        [](const CopyProgress& e) {
            return nlohmann::json{{"file", e.fileName}, {"percent", e.percentComplete}};
        },
        [](const WaitingForLockQueue& e) {
            return nlohmann::json{
                {"source", e.sourcePath}, {"target", e.targetPath},
                {"backlog_source_mb", e.backlogSourceMB}, {"backlog_target_mb", e.backlogTargetMB}
            };
        },
        [](const LockQueueTimedOut& e) {
            return nlohmann::json{{"source", e.sourcePath}, {"target", e.targetPath}, {"wait_minutes", e.waitMinutes}};
        },
        [](const LockQueueWaitComplete& e) {
            return nlohmann::json{{"source", e.sourcePath}, {"target", e.targetPath}, {"wait_minutes", e.waitMinutes}};
        },
        [](const LockFilePathsForBypass& e) {
            return nlohmann::json{
                {"source_lock", e.sourceLockPath}, {"target_lock", e.targetLockPath},
                {"message", e.adminBypassMessage}
            };
        },
    }, event);

    j["event"] = std::string(eventName(event));
}

}
