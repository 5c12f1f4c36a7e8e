#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lc::queue {

struct TransferRequest {
    int64_t timestampMs{};     // shared by every intent announced for this transfer
    std::filesystem::path source;
    std::filesystem::path target;
    uintmax_t sizeBytes{};
    std::string manager;
};

struct Backlog {
    std::size_t count = 0;
    uintmax_t totalMB = 0;
};

// Handle to an announced transfer
struct Intent {
    std::filesystem::path queue;
    std::filesystem::path marker;
};

/**
 * Soft admission control for large transfers.
 *
 * Every participant announces its transfer in a queue, measures the backlog ahead
 * of it, and releases the announcement once done. Nothing here grants exclusive
 * access; two requests can be admitted at the same time.
 */
class BacklogEstimator {
public:
    virtual ~BacklogEstimator() = default;

    // nullopt when the announcement could not be recorded
    [[nodiscard]] virtual std::optional<Intent> announce(const std::filesystem::path& queue,
                                                         const TransferRequest& request) = 0;

    // Announcements strictly older than timestampMs and still inside the stale window
    [[nodiscard]] virtual Backlog backlog(const std::filesystem::path& queue, int64_t timestampMs) const = 0;

    // True once the announcement was removed by someone else
    [[nodiscard]] virtual bool withdrawn(const Intent& intent) const = 0;

    virtual void release(const Intent& intent) noexcept = 0;
};

}
