#pragma once

#include "config/Config.hpp"
#include "notify/Notifier.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace lc::copy {

enum class CopyStatus { Idle, NormalCopy, BufferedCopy, BufferedCopyResume };

[[nodiscard]] std::string to_string(CopyStatus status);

struct ResumeResult {
    bool success = false;
    bool resumed = false;
};

/**
 * Copies large files in chunks into target.#FilePart#, recording the source in
 * target.#FilePartInfo#. An interrupted copy leaves both sidecars behind; the next
 * call resumes from the end of the FilePart when the recorded source still matches,
 * otherwise it starts over. The target path only appears once the copy is complete.
 *
 * Not thread-safe: one instance tracks a single status.
 */
class ResumableCopier {
public:
    explicit ResumableCopier(const config::CopyConfig& config = {}, std::shared_ptr<notify::Notifier> notifier = nullptr);

    // ignoreFileLocks skips the shared advisory lock on the source, allowing a copy of a file still being written
    ResumeResult copyWithResume(const std::filesystem::path& source,
                                const std::filesystem::path& target,
                                bool ignoreFileLocks = false);

    void setChunkSizeMB(unsigned int mb);
    void setFlushThresholdMB(unsigned int mb);

    [[nodiscard]] unsigned int chunkSizeMB() const { return chunkSizeMB_; }
    [[nodiscard]] unsigned int flushThresholdMB() const { return flushThresholdMB_; }

    [[nodiscard]] CopyStatus status() const { return status_; }
    [[nodiscard]] const std::filesystem::path& currentSource() const { return currentSource_; }

private:
    std::shared_ptr<notify::Notifier> notifier_;
    unsigned int chunkSizeMB_;
    unsigned int flushThresholdMB_;

    CopyStatus status_ = CopyStatus::Idle;
    std::filesystem::path currentSource_;
    std::chrono::steady_clock::time_point lastHandleRelease_{};

    ResumeResult copyChunked(const std::filesystem::path& source, const std::filesystem::path& target, bool ignoreFileLocks);
    void updateStatus(CopyStatus status, const std::filesystem::path& source = {});
    void releaseHandles();
    void publish(const notify::Event& event) const;
};

}
