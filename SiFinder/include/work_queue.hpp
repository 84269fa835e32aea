#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sifinder {

// Bounded FIFO handing items from worker threads to a consumer. Once the
// sentinel is set, push() drops items and pop() drains what is left, then
// returns nullopt.
template <typename T>
class WorkQueue {
private:
    std::deque<T> m_items;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    bool m_sentinel = false;
    size_t m_maxCapacity;
    std::string m_name;

public:
    WorkQueue(size_t maxCapacity, std::string name)
        : m_maxCapacity(maxCapacity), m_name(std::move(name)) {
    }

    const std::string& name() const { return m_name; }

    // Blocks while full. Returns false if the sentinel was set.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] { return m_sentinel || m_items.size() < m_maxCapacity; });
        if (m_sentinel) return false;

        m_items.push_back(std::move(item));
        m_notEmpty.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] { return !m_items.empty() || m_sentinel; });
        return takeFront();
    }

    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait_for(lock, timeout, [this] { return !m_items.empty() || m_sentinel; });
        return takeFront();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return takeFront();
    }

    // Up to maxItems without waiting
    std::vector<T> popMax(size_t maxItems) {
        std::vector<T> items;
        std::lock_guard<std::mutex> lock(m_mutex);
        const size_t count = std::min(m_items.size(), maxItems);
        items.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            items.push_back(std::move(m_items.front()));
            m_items.pop_front();
        }
        m_notFull.notify_all();
        return items;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.empty();
    }

    bool isSentinel() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sentinel;
    }

    void setSentinel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sentinel = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

private:
    // Caller holds m_mutex
    std::optional<T> takeFront() {
        if (m_items.empty()) return std::nullopt;

        std::optional<T> result(std::move(m_items.front()));
        m_items.pop_front();
        m_notFull.notify_one();
        return result;
    }
};

} // namespace sifinder
