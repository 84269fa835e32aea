#pragma once

#include <atomic>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "finder.hpp"
#include "work_queue.hpp"

namespace sifinder {

enum class OperationKind { Index, Search };

// Requests on the same slot supersede each other
struct Slot {
    OperationKind kind = OperationKind::Index;
    std::string index;

    friend auto operator<=>(const Slot&, const Slot&) = default;
};

enum class ErrorKind { Decode, Store, NotFound, InvalidArgument, Other };

struct IndexProgressEvent {
    Slot slot;
    uint64_t generation = 0;
    ProgressInfo progress;
};

struct IndexCompletedEvent {
    Slot slot;
    uint64_t generation = 0;
    IndexSummary summary;
};

struct SearchCompletedEvent {
    Slot slot;
    uint64_t generation = 0;
    SearchResult result;
};

struct OperationFailedEvent {
    Slot slot;
    uint64_t generation = 0;
    ErrorKind kind = ErrorKind::Other;
    bool recoverable = false;
    std::string message;
};

using Event = std::variant<IndexProgressEvent, IndexCompletedEvent, SearchCompletedEvent, OperationFailedEvent>;

Slot slotOf(const Event& event);
uint64_t generationOf(const Event& event);

// Runs every request on its own worker thread. Workers only talk back through
// the event queue; nextEvent() hands out events of the newest request per
// slot and drops the rest.
class Coordinator {
public:
    explicit Coordinator(Finder& finder, size_t queueCapacity = 1024);
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;
    ~Coordinator();

    uint64_t submitIndex(const IndexHandle& handle);
    uint64_t submitSearch(const IndexHandle& handle, const std::filesystem::path& queryImage,
                          int threshold, size_t limit = 0);

    // nullopt on timeout
    std::optional<Event> nextEvent(std::chrono::milliseconds timeout);

    bool isCurrent(const Slot& slot, uint64_t generation) const;

    size_t discarded() const { return m_discarded.load(std::memory_order_relaxed); }
    size_t inFlight() const { return m_inFlight.load(std::memory_order_acquire); }

    // Threads not yet joined. Finished workers are joined at the next submit.
    size_t workerCount() const;

private:
    uint64_t beginRequest(const Slot& slot);

    template <typename Work>
    void launch(const Slot& slot, uint64_t generation, Work work);

    void publish(Event event);

    // Caller holds m_mutex
    void reapFinished();

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    Finder& m_finder;
    WorkQueue<Event> m_events;

    mutable std::mutex m_mutex;
    std::map<Slot, uint64_t> m_latest;
    uint64_t m_nextGeneration = 1;
    std::vector<Worker> m_workers;

    std::atomic<size_t> m_discarded{ 0 };
    std::atomic<size_t> m_inFlight{ 0 };
};

} // namespace sifinder
