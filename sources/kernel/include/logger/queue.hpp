#pragma once

#include "std/ringbuffer.hpp"
#include "std/static_string.hpp"
#include "std/spinlock.hpp"

#include "util/format.hpp"

#include <array>
#include <source_location>
#include <string_view>

namespace vsp {
    class Logger;
    class LogQueue;
    class ILogAppender;

    static constexpr size_t kLogMessageSize = 256;

    enum class LogLevel : uint8_t {
        eDebug = 1,
        eInfo = 2,
        eWarning = 3,
        eError = 4,
        eFatal = 5,
    };

    namespace detail {
        struct LogMessage {
            LogLevel level;
            std::source_location location;
            const Logger *logger;
            stdx::StaticString<kLogMessageSize> message;
        };
    }

    struct LogMessageView {
        std::source_location location;
        std::string_view message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        virtual void write(const LogMessageView& message) = 0;
    };

    class LogQueue {
        using MessageQueue = sm::AtomicRingQueue<detail::LogMessage>;

        static constexpr size_t kMaxAppenders = 4;

        constinit static LogQueue sLogQueue;

        stdx::SpinLock mLock;
        std::array<ILogAppender*, kMaxAppenders> mAppenders GUARDED_BY(mLock) {};
        size_t mAppenderCount GUARDED_BY(mLock) = 0;
        MessageQueue mQueue;

        /// @brief Number of messages that were dropped due to the queue being full.
        std::atomic<uint32_t> mDroppedCount{0};

        /// @brief Number of messages that were written out to the appenders.
        std::atomic<uint32_t> mComittedCount{0};

        void write(const LogMessageView& message) REQUIRES(mLock);
        size_t writeAllMessages() REQUIRES(mLock);
    public:
        constexpr LogQueue() noexcept = default;

        OsStatus addAppender(ILogAppender *appender) noexcept;
        void removeAppender(ILogAppender *appender) noexcept;

        /// @brief Store a message to be written on the next flush.
        ///
        /// @retval OsStatusOutOfMemory The ring is full or not setup, the message was dropped.
        OsStatus recordMessage(const detail::LogMessage& message) noexcept;

        /// @brief Write a message to the appenders, or record it if the queue is busy.
        OsStatus submit(const detail::LogMessage& message) noexcept;

        size_t flush();

        uint32_t getDroppedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mDroppedCount.load(order);
        }

        uint32_t getCommittedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mComittedCount.load(order);
        }

        [[nodiscard]]
        static OsStatus create(uint32_t messageQueueCapacity, LogQueue *queue) noexcept;

        static constexpr LogQueue &getGlobalQueue() noexcept {
            return sLogQueue;
        }

        static OsStatus addGlobalAppender(ILogAppender *appender) {
            return getGlobalQueue().addAppender(appender);
        }

        static void removeGlobalAppender(ILogAppender *appender) noexcept {
            getGlobalQueue().removeAppender(appender);
        }
    };

    constinit inline LogQueue LogQueue::sLogQueue{};
}
