#include "progress_tracker.hpp"

namespace sifinder {

ProgressTracker::ProgressTracker(size_t total, ProgressCallback callback, std::chrono::milliseconds minInterval)
    : m_total(total),
      m_hashed(0),
      m_unchanged(0),
      m_failed(0),
      m_callback(std::move(callback)),
      m_lastCallbackTime(std::chrono::steady_clock::now()),
      m_minCallbackInterval(minInterval)
{
}

void ProgressTracker::record(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Hashed:
            m_hashed.fetch_add(1, std::memory_order_relaxed);
            break;
        case FileOutcome::Unchanged:
            m_unchanged.fetch_add(1, std::memory_order_relaxed);
            break;
        case FileOutcome::Failed:
            m_failed.fetch_add(1, std::memory_order_relaxed);
            break;
    }

    tryInvokeCallback();
}

void ProgressTracker::forceUpdate() {
    if (!m_callback) return;

    std::lock_guard<std::mutex> lock(m_callbackMutex);

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = std::chrono::steady_clock::now();
}

ProgressInfo ProgressTracker::getProgress() const {
    ProgressInfo info;

    info.total = m_total.load(std::memory_order_relaxed);
    info.hashed = m_hashed.load(std::memory_order_relaxed);
    info.unchanged = m_unchanged.load(std::memory_order_relaxed);
    info.failed = m_failed.load(std::memory_order_relaxed);
    info.processed = info.hashed + info.unchanged + info.failed;

    return info;
}

void ProgressTracker::tryInvokeCallback() {
    if (!m_callback) return;

    std::unique_lock<std::mutex> lock(m_callbackMutex, std::try_to_lock);
    if (!lock.owns_lock()) return;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastCallbackTime);
    if (elapsed < m_minCallbackInterval) return;

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = now;
}

} // namespace sifinder
