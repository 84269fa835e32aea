#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <charconv>

#define SIFINDER_TRACE(...) logger::log(logger::TRACE, __VA_ARGS__)
#define SIFINDER_DEBUG(...) logger::log(logger::DEBUG, __VA_ARGS__)
#define SIFINDER_INFO(...) logger::log(logger::INFO, __VA_ARGS__)
#define SIFINDER_WARN(...) logger::log(logger::WARN, __VA_ARGS__)
#define SIFINDER_ERROR(...) logger::log(logger::ERROR_L, __VA_ARGS__)

/**
 * -------------
 * USAGE OVERVIEW
 * -------------
 *
 * // Initialize once, specifying log level and ring size (power-of-two):
 * logger::init(logger::Level::INFO, 4096);
 *
 * // Log from any thread, first argument is the component tag:
 * SIFINDER_INFO("indexer", "hashed ", count, " files");
 *
 * // On shutdown (drains what is still queued):
 * logger::shutdown();
 *
 * Messages logged before init() or after shutdown() are dropped. So are
 * messages that find the ring full; shutdown() reports how many.
*/

namespace logger
{
    enum Level : uint8_t
    {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR_L
    };

    constexpr const char* levelToStr(Level lv) noexcept
    {
        switch (lv)
        {
        case TRACE: return "TRACE";
        case DEBUG: return "DEBUG";
        case INFO:  return "INFO";
        case WARN:  return "WARN";
        case ERROR_L: return "ERROR";
        }
        return "UNKNOWN";
    }

    // CLI verbosity: 1=trace, 2=debug, 3=info, 4=warnings and errors
    constexpr Level levelFromVerbosity(int verbosity) noexcept
    {
        switch (verbosity)
        {
        case 1: return TRACE;
        case 2: return DEBUG;
        case 3: return INFO;
        default: return WARN;
        }
    }

    //-----------------------------------
    // Internal Helper to Build Strings
    //-----------------------------------
    namespace detail
    {
        inline void appendOne(std::string& dest, const char* str)
        {
            if (str) {
                dest += str;
            }
        }

        inline void appendOne(std::string& dest, const std::string& s)
        {
            dest += s;
        }

        inline void appendOne(std::string& dest, bool b)
        {
            dest += b ? "true" : "false";
        }

        // Integers via std::to_chars
        template <typename T,
            typename std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        inline void appendOne(std::string& dest, T val)
        {
            char buf[32];
            auto end = std::to_chars(buf, buf + sizeof(buf), val).ptr;
            dest.append(buf, static_cast<size_t>(end - buf));
        }

        // Anything else that implements operator<< (paths, doubles, durations)
        template <typename T,
            typename std::enable_if_t<!std::is_integral_v<std::decay_t<T>> &&
            !std::is_same_v<std::decay_t<T>, std::string> &&
            !std::is_convertible_v<const T&, const char*>, int> = 0>
        inline void appendOne(std::string& dest, const T& val)
        {
            thread_local std::ostringstream oss;
            oss.str(std::string{});
            oss.clear();
            oss << val;
            dest += oss.str();
        }

        template <typename... Ts>
        inline void buildString(std::string& dest, Ts&&... args)
        {
            (appendOne(dest, std::forward<Ts>(args)), ...);
        }
    } // namespace detail

    //-----------------------------------
    // Internal Ring Buffer
    //-----------------------------------
    struct LogMessage
    {
        Level level = INFO;
        int64_t microsSinceEpoch = 0;
        std::string id;
        std::string text;
    };

    // Bounded multi-producer ring. Each cell carries a sequence number so a
    // consumer never reads a cell a producer is still writing.
    class LogRing
    {
    public:
        explicit LogRing(size_t size)
            : size_(size), mask_(size - 1), cells_(new Cell[size]), head_(0), tail_(0)
        {
            for (size_t i = 0; i < size_; ++i) {
                cells_[i].sequence.store(i, std::memory_order_relaxed);
            }
        }

        LogRing(const LogRing&) = delete;
        LogRing& operator=(const LogRing&) = delete;

        // Non-blocking push. Returns false if the ring was full.
        bool tryPush(LogMessage&& msg)
        {
            uint64_t pos = tail_.load(std::memory_order_relaxed);
            for (;;) {
                Cell& cell = cells_[pos & mask_];
                const uint64_t seq = cell.sequence.load(std::memory_order_acquire);
                const auto diff = static_cast<int64_t>(seq) - static_cast<int64_t>(pos);

                if (diff == 0) {
                    if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                        cell.message = std::move(msg);
                        cell.sequence.store(pos + 1, std::memory_order_release);
                        return true;
                    }
                }
                else if (diff < 0) {
                    return false;
                }
                else {
                    pos = tail_.load(std::memory_order_relaxed);
                }
            }
        }

        // Single consumer
        bool tryPop(LogMessage& out)
        {
            const uint64_t pos = head_.load(std::memory_order_relaxed);
            Cell& cell = cells_[pos & mask_];
            const uint64_t seq = cell.sequence.load(std::memory_order_acquire);
            if (seq != pos + 1) return false;

            out = std::move(cell.message);
            cell.sequence.store(pos + size_, std::memory_order_release);
            head_.store(pos + 1, std::memory_order_relaxed);
            return true;
        }

    private:
        struct Cell
        {
            std::atomic<uint64_t> sequence{ 0 };
            LogMessage message;
        };

        size_t size_;
        size_t mask_;
        std::unique_ptr<Cell[]> cells_;
        alignas(64) std::atomic<uint64_t> head_;
        alignas(64) std::atomic<uint64_t> tail_;
    };

    //-----------------------------------
    // The Logger Singleton
    //-----------------------------------
    class Logger
    {
    public:
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& instance()
        {
            static Logger s;
            return s;
        }

        // Called once at startup. ringSize is rounded up to a power of two.
        void init(Level level, size_t ringSize, std::ostream& sink)
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            currentLevel_.store(level, std::memory_order_relaxed);
            if (running_.load(std::memory_order_acquire)) return;

            dropped_.store(0, std::memory_order_relaxed);

            size_t size = 1;
            while (size < ringSize) size <<= 1;

            ring_ = std::make_unique<LogRing>(size);
            sink_ = &sink;
            running_.store(true, std::memory_order_release);
            consumerThread_ = std::thread(&Logger::consumerLoop, this);
        }

        bool enabled(Level lv) const
        {
            return running_.load(std::memory_order_acquire) && lv >= currentLevel_.load(std::memory_order_relaxed);
        }

        // Non-blocking log function
        template<typename IdType, typename... Args>
        void log(Level lv, IdType&& id, Args&&... args)
        {
            if (!enabled(lv)) return;

            std::string text;
            text.reserve(128);
            detail::buildString(text, std::forward<Args>(args)...);

            LogMessage msg;
            msg.level = lv;
            msg.microsSinceEpoch = nowMicrosSinceEpoch();
            msg.id = std::forward<IdType>(id);
            msg.text = std::move(text);

            if (!ring_->tryPush(std::move(msg))) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

        void shutdown()
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (running_.exchange(false, std::memory_order_acq_rel))
            {
                if (consumerThread_.joinable()) {
                    consumerThread_.join();
                }
            }
        }

    private:
        Logger() : currentLevel_(WARN), running_(false), sink_(&std::clog) {}
        ~Logger() { shutdown(); }

        static int64_t nowMicrosSinceEpoch()
        {
            using namespace std::chrono;
            return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
        }

        void consumerLoop()
        {
            while (running_.load(std::memory_order_acquire))
            {
                LogMessage msg;
                while (ring_->tryPop(msg)) { printMessage(msg); }

                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }

            LogMessage leftover;
            while (ring_->tryPop(leftover)) { printMessage(leftover); }

            if (const auto lost = dropped(); lost > 0) {
                *sink_ << "[logger] " << lost << " message(s) dropped, ring full\n";
            }
            sink_->flush();
        }

        void printMessage(const LogMessage& lm) const
        {
            using namespace std::chrono;
            auto tp = system_clock::time_point(microseconds(lm.microsSinceEpoch));

            std::time_t t = system_clock::to_time_t(tp);
            std::tm tmBuf{};
            gmtime_r(&t, &tmBuf);

            auto msPart = (lm.microsSinceEpoch / 1000) % 1000;

            char timeBuf[32];
            std::snprintf(timeBuf, sizeof(timeBuf),
                "%02d:%02d:%02d.%03d",
                tmBuf.tm_hour, tmBuf.tm_min, tmBuf.tm_sec,
                static_cast<int>(msPart));

            std::ostream& out = *sink_;
            out << "[" << timeBuf << "] "
                << "[" << levelToStr(lm.level) << "] ";
            if (!lm.id.empty()) {
                out << "[" << lm.id << "] ";
            }
            out << lm.text << "\n";
        }

        std::mutex lifecycleMutex_;
        std::unique_ptr<LogRing> ring_;
        std::atomic<Level> currentLevel_;
        std::atomic<bool> running_;
        std::atomic<uint64_t> dropped_{ 0 };
        std::ostream* sink_;
        std::thread consumerThread_;
    };

    //-----------------------------------
    // Public API
    //-----------------------------------
    inline void init(Level lv, size_t ringSize = 4096, std::ostream& sink = std::clog)
    {
        Logger::instance().init(lv, ringSize, sink);
    }

    inline void shutdown()
    {
        Logger::instance().shutdown();
    }

    template<typename IdType, typename... Args>
    inline void log(Level lv, IdType&& id, Args&&... args)
    {
        Logger::instance().log(lv, std::forward<IdType>(id), std::forward<Args>(args)...);
    }

    // Messages lost to a full ring since the last init()
    inline uint64_t dropped()
    {
        return Logger::instance().dropped();
    }

} // namespace logger
