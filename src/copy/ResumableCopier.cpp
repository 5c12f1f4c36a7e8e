#include "copy/ResumableCopier.hpp"
#include "copy/FilePart.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace lc::copy;
using namespace lc::logging;
namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds HANDLE_RELEASE_PAUSE{250};
constexpr std::chrono::milliseconds HANDLE_RELEASE_THROTTLE{500};

[[noreturn]] void throwErrno(const std::string& what, const fs::path& path) {
    throw std::runtime_error(fmt::format("{} {}: {}", what, path.string(), std::strerror(errno)));
}

class FileDescriptor {
public:
    FileDescriptor(const fs::path& path, const int flags, const mode_t mode = 0644)
        : path_(path), fd_(::open(path.c_str(), flags | O_CLOEXEC, mode)) {
        if (fd_ < 0) throwErrno("Unable to open", path);
    }

    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const { return fd_; }

    void seek(const off_t offset) const {
        if (::lseek(fd_, offset, SEEK_SET) < 0) throwErrno("Unable to seek", path_);
    }

    size_t read(char* buf, const size_t len) const {
        size_t total = 0;
        while (total < len) {
            const auto n = ::read(fd_, buf + total, len - total);
            if (n < 0) {
                if (errno == EINTR) continue;
                throwErrno("Error reading", path_);
            }
            if (n == 0) break;
            total += static_cast<size_t>(n);
        }
        return total;
    }

    void write(const char* buf, const size_t len) const {
        size_t total = 0;
        while (total < len) {
            const auto n = ::write(fd_, buf + total, len - total);
            if (n < 0) {
                if (errno == EINTR) continue;
                throwErrno("Error writing", path_);
            }
            total += static_cast<size_t>(n);
        }
    }

    void sync() const {
        if (::fsync(fd_) != 0) throwErrno("Error flushing", path_);
    }

    // Shared advisory lock; fails when a writer holds an exclusive lock
    void lockShared() const {
        if (::flock(fd_, LOCK_SH | LOCK_NB) != 0) throwErrno("Source file is locked by another process:", path_);
    }

    void close() {
        if (fd_ < 0) return;
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) throwErrno("Error closing", path_);
    }

private:
    fs::path path_;
    int fd_;
};

}

std::string lc::copy::to_string(const CopyStatus status) {
    switch (status) {
        case CopyStatus::Idle: return "idle";
        case CopyStatus::NormalCopy: return "normal_copy";
        case CopyStatus::BufferedCopy: return "buffered_copy";
        case CopyStatus::BufferedCopyResume: return "buffered_copy_resume";
    }
    return "unknown";
}

ResumableCopier::ResumableCopier(const config::CopyConfig& config, std::shared_ptr<notify::Notifier> notifier)
    : notifier_(std::move(notifier)),
      chunkSizeMB_(std::max(1u, config.chunk_size_mb)),
      flushThresholdMB_(std::max(chunkSizeMB_, config.flush_threshold_mb)) {}

void ResumableCopier::setChunkSizeMB(const unsigned int mb) {
    chunkSizeMB_ = std::max(1u, mb);
    flushThresholdMB_ = std::max(flushThresholdMB_, chunkSizeMB_);
}

void ResumableCopier::setFlushThresholdMB(const unsigned int mb) {
    flushThresholdMB_ = std::max({1u, mb, chunkSizeMB_});
}

ResumeResult ResumableCopier::copyWithResume(const fs::path& source, const fs::path& target, const bool ignoreFileLocks) {
    const auto chunkBytes = static_cast<uintmax_t>(chunkSizeMB_) * config::MiB;

    try {
        if (fs::file_size(source) <= chunkBytes) {
            updateStatus(CopyStatus::NormalCopy, source);
            publish(notify::CopyStarting{source.string()});

            const auto parent = target.parent_path();
            if (!parent.empty()) fs::create_directories(parent);
            fs::copy_file(source, target, fs::copy_options::overwrite_existing);
            fs::last_write_time(target, fs::last_write_time(source));

            updateStatus(CopyStatus::Idle);
            return {true, false};
        }

        return copyChunked(source, target, ignoreFileLocks);
    } catch (const std::exception& e) {
        updateStatus(CopyStatus::Idle);
        releaseHandles();
        LogRegistry::copy()->error("[ResumableCopier] Copy of {} to {} failed: {}", source.string(), target.string(), e.what());
        throw std::runtime_error(std::string("Exception copying file with resume: ") + e.what());
    }
}

ResumeResult ResumableCopier::copyChunked(const fs::path& source, const fs::path& target, const bool ignoreFileLocks) {
    const auto chunkBytes = static_cast<size_t>(chunkSizeMB_) * config::MiB;
    const auto flushBytes = static_cast<uintmax_t>(flushThresholdMB_) * config::MiB;

    // The target only exists once complete
    if (fs::exists(target)) fs::remove(target);

    const auto filePart = filePartPath(target);
    const auto infoFile = filePartInfoPath(target);
    const auto current = FilePartInfo::describe(source);

    uintmax_t offset = 0;
    bool resume = false;

    if (fs::exists(filePart)) {
        if (const auto recorded = FilePartInfo::read(infoFile); recorded && recorded->matches(current)) {
            offset = fs::file_size(filePart);
            resume = offset <= current.length;
        }
        if (!resume)
            LogRegistry::copy()->info("[ResumableCopier] Discarding {}; source {} changed since it was written",
                                      filePart.string(), source.string());
    }

    const auto parent = target.parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    if (resume) {
        updateStatus(CopyStatus::BufferedCopyResume, source);
        publish(notify::ResumeStarting{source.string()});
        LogRegistry::copy()->info("[ResumableCopier] Resuming {} at {}", source.string(), util::bytesToHumanReadable(offset));
    } else {
        updateStatus(CopyStatus::BufferedCopy, source);
        if (fs::exists(filePart)) fs::remove(filePart);
        current.write(infoFile);
        offset = 0;
    }

    FileDescriptor reader(source, O_RDONLY);
    if (!ignoreFileLocks) reader.lockShared();

    FileDescriptor writer(filePart, O_WRONLY | O_CREAT | (resume ? O_APPEND : O_TRUNC));

    try {
        if (offset > 0) reader.seek(static_cast<off_t>(offset));

        const auto fileName = source.filename().string();
        const auto totalBytes = static_cast<double>(current.length);

        std::vector<char> buffer(chunkBytes);
        uintmax_t bytesWritten = offset;
        uintmax_t bytesSinceLastFlush = 0;

        while (true) {
            const auto bytesRead = reader.read(buffer.data(), chunkBytes);
            writer.write(buffer.data(), bytesRead);
            bytesWritten += bytesRead;
            bytesSinceLastFlush += bytesRead;

            if (bytesSinceLastFlush >= flushBytes) {
                writer.sync();
                bytesSinceLastFlush = 0;
                publish(notify::CopyProgress{fileName, static_cast<float>(static_cast<double>(bytesWritten) / totalBytes * 100.0)});
            }

            if (bytesRead < chunkBytes) break;
        }

        publish(notify::CopyProgress{fileName, 100.0f});

        writer.sync();
        writer.close();
    } catch (const std::exception&) {
        // Keep what was written so the next attempt can resume
        if (::fsync(writer.get()) != 0)
            LogRegistry::copy()->warn("[ResumableCopier] Unable to flush {}: {}", filePart.string(), std::strerror(errno));
        throw;
    }

    fs::last_write_time(filePart, fs::last_write_time(source));
    fs::rename(filePart, target);
    util::removeFileIgnoreErrors(infoFile, [this] { releaseHandles(); });

    updateStatus(CopyStatus::Idle);
    return {true, resume};
}

void ResumableCopier::updateStatus(const CopyStatus status, const fs::path& source) {
    status_ = status;
    currentSource_ = status == CopyStatus::Idle ? fs::path() : source;
}

void ResumableCopier::releaseHandles() {
    const auto now = std::chrono::steady_clock::now();
    if (now - lastHandleRelease_ < HANDLE_RELEASE_THROTTLE) return;
    lastHandleRelease_ = now;
    std::this_thread::sleep_for(HANDLE_RELEASE_PAUSE);
}

void ResumableCopier::publish(const notify::Event& event) const {
    if (notifier_) notifier_->publish(event);
}
