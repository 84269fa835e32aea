#include "coordinator.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace sifinder {

Slot slotOf(const Event& event)
{
    return std::visit([](const auto& e) { return e.slot; }, event);
}

uint64_t generationOf(const Event& event)
{
    return std::visit([](const auto& e) { return e.generation; }, event);
}

Coordinator::Coordinator(Finder& finder, size_t queueCapacity)
    : m_finder(finder), m_events(queueCapacity, "events")
{
}

Coordinator::~Coordinator()
{
    // Unblocks workers stuck on a full queue; their events are dropped
    m_events.setSentinel();

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        workers.swap(m_workers);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

size_t Coordinator::workerCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workers.size();
}

void Coordinator::reapFinished()
{
    auto finished = std::ranges::partition(m_workers, [](const Worker& w) {
        return !w.done->load(std::memory_order_acquire);
    });
    for (auto& worker : finished) {
        if (worker.thread.joinable()) worker.thread.join();
    }
    m_workers.erase(finished.begin(), finished.end());
}

uint64_t Coordinator::beginRequest(const Slot& slot)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const uint64_t generation = m_nextGeneration++;
    m_latest[slot] = generation;
    return generation;
}

bool Coordinator::isCurrent(const Slot& slot, uint64_t generation) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_latest.find(slot);
    return it != m_latest.end() && it->second == generation;
}

void Coordinator::publish(Event event)
{
    if (!m_events.push(std::move(event))) {
        SIFINDER_DEBUG("coordinator", "event dropped after shutdown");
    }
}

template <typename Work>
void Coordinator::launch(const Slot& slot, uint64_t generation, Work work)
{
    m_inFlight.fetch_add(1, std::memory_order_acq_rel);
    auto done = std::make_shared<std::atomic<bool>>(false);

    auto body = [this, slot, generation, done, work = std::move(work)]() mutable {
        auto fail = [&](ErrorKind kind, bool recoverable, const char* what) {
            SIFINDER_WARN("coordinator", "request ", generation, " on ", slot.index, " failed: ", what);
            publish(OperationFailedEvent{ slot, generation, kind, recoverable, what });
        };

        try {
            work();
        }
        catch (const DecodeError& e) { fail(ErrorKind::Decode, true, e.what()); }
        catch (const NotFoundError& e) { fail(ErrorKind::NotFound, true, e.what()); }
        catch (const StoreError& e) { fail(ErrorKind::Store, false, e.what()); }
        catch (const std::invalid_argument& e) { fail(ErrorKind::InvalidArgument, true, e.what()); }
        catch (const std::exception& e) { fail(ErrorKind::Other, false, e.what()); }

        done->store(true, std::memory_order_release);
        m_inFlight.fetch_sub(1, std::memory_order_acq_rel);
    };

    std::lock_guard<std::mutex> lock(m_mutex);
    reapFinished();
    m_workers.push_back(Worker{ std::thread(std::move(body)), std::move(done) });
}

uint64_t Coordinator::submitIndex(const IndexHandle& handle)
{
    const Slot slot{ OperationKind::Index, handle.name };
    const uint64_t generation = beginRequest(slot);

    launch(slot, generation, [this, slot, generation, handle] {
        auto onProgress = [this, &slot, generation](const ProgressInfo& progress) {
            publish(IndexProgressEvent{ slot, generation, progress });
        };
        auto summary = m_finder.runIndex(handle, onProgress);
        publish(IndexCompletedEvent{ slot, generation, summary });
    });

    SIFINDER_DEBUG("coordinator", "index request ", generation, " for ", handle.name);
    return generation;
}

uint64_t Coordinator::submitSearch(const IndexHandle& handle, const std::filesystem::path& queryImage,
                                   int threshold, size_t limit)
{
    const Slot slot{ OperationKind::Search, handle.name };
    const uint64_t generation = beginRequest(slot);

    launch(slot, generation, [this, slot, generation, handle, queryImage, threshold, limit] {
        auto result = m_finder.runSearch(handle, queryImage, threshold, limit);
        publish(SearchCompletedEvent{ slot, generation, std::move(result) });
    });

    SIFINDER_DEBUG("coordinator", "search request ", generation, " for ", handle.name);
    return generation;
}

std::optional<Event> Coordinator::nextEvent(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        const auto now = std::chrono::steady_clock::now();
        const auto remaining = now < deadline ? deadline - now : std::chrono::steady_clock::duration::zero();

        auto event = m_events.popFor(remaining);
        if (!event) return std::nullopt;

        if (isCurrent(slotOf(*event), generationOf(*event))) return event;

        m_discarded.fetch_add(1, std::memory_order_relaxed);
        SIFINDER_TRACE("coordinator", "discarded superseded event of request ", generationOf(*event));
    }
}

} // namespace sifinder
