#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>

namespace sifinder {

enum class FileOutcome {
    Hashed,
    Unchanged,
    Failed
};

struct ProgressInfo {
    size_t total = 0;
    size_t processed = 0;
    size_t hashed = 0;
    size_t unchanged = 0;
    size_t failed = 0;

    float fraction() const {
        if (total == 0) return 1.0f;
        return static_cast<float>(processed) / static_cast<float>(total);
    }

    size_t percentComplete() const {
        return static_cast<size_t>(fraction() * 100.0f);
    }
};

// Thread-safe progress tracker with rate-limited callbacks
class ProgressTracker {
public:
    using ProgressCallback = std::function<void(const ProgressInfo&)>;

    ProgressTracker(size_t total, ProgressCallback callback = nullptr,
                    std::chrono::milliseconds minInterval = std::chrono::milliseconds(500));

    void record(FileOutcome outcome);
    void forceUpdate();

    ProgressInfo getProgress() const;

private:
    std::atomic<size_t> m_total;
    std::atomic<size_t> m_hashed;
    std::atomic<size_t> m_unchanged;
    std::atomic<size_t> m_failed;

    ProgressCallback m_callback;
    mutable std::mutex m_callbackMutex;
    std::chrono::steady_clock::time_point m_lastCallbackTime;
    const std::chrono::milliseconds m_minCallbackInterval;

    void tryInvokeCallback();
};

} // namespace sifinder
