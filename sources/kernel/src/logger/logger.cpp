#include "logger/logger.hpp"

#include <algorithm>

void vsp::LogQueue::write(const LogMessageView& message) {
    for (size_t i = 0; i < mAppenderCount; i++) {
        mAppenders[i]->write(message);
    }
}

size_t vsp::LogQueue::writeAllMessages() {
    size_t count = 0;
    detail::LogMessage message;
    while (mQueue.tryPop(message)) {
        write({ message.location, message.message, message.logger, message.level });
        count++;
    }

    mComittedCount.fetch_add(count, std::memory_order_relaxed);

    return count;
}

OsStatus vsp::LogQueue::addAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    if (mAppenderCount >= mAppenders.size()) {
        return OsStatusOutOfMemory;
    }

    mAppenders[mAppenderCount++] = appender;
    return OsStatusSuccess;
}

void vsp::LogQueue::removeAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    auto begin = mAppenders.begin();
    auto end = begin + mAppenderCount;
    auto it = std::remove(begin, end, appender);
    mAppenderCount = it - begin;
}

OsStatus vsp::LogQueue::recordMessage(const detail::LogMessage& message) noexcept {
    if (mQueue.tryPush(message)) {
        return OsStatusSuccess;
    }

    mDroppedCount.fetch_add(1, std::memory_order_relaxed);

    return OsStatusOutOfMemory;
}

OsStatus vsp::LogQueue::submit(const detail::LogMessage& message) noexcept {
    if (mLock.try_lock()) {
        if (mQueue.isSetup()) writeAllMessages();
        write({ message.location, message.message, message.logger, message.level });
        mComittedCount.fetch_add(1, std::memory_order_relaxed);
        mLock.unlock();
        return OsStatusSuccess;
    } else {
        return recordMessage(message);
    }
}

size_t vsp::LogQueue::flush() {
    stdx::LockGuard guard(mLock);
    return writeAllMessages();
}

OsStatus vsp::LogQueue::create(uint32_t messageQueueCapacity, LogQueue *queue) noexcept {
    return MessageQueue::create(messageQueueCapacity, &queue->mQueue);
}

std::string_view vsp::Logger::getName() const noexcept {
    return mName;
}

void vsp::Logger::submit(LogLevel level, std::string_view message, std::source_location location) noexcept {
    detail::LogMessage logMessage {
        .level = level,
        .location = location,
        .logger = this,
        .message = message,
    };

    // Dropped messages are counted by the queue.
    (void)mQueue->submit(logMessage);
}

void vsp::Logger::dbg(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eDebug, message, location);
}

void vsp::Logger::info(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eInfo, message, location);
}

void vsp::Logger::warn(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eWarning, message, location);
}

void vsp::Logger::error(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eError, message, location);
}

void vsp::Logger::fatal(std::string_view message, std::source_location location) noexcept {
    submit(LogLevel::eFatal, message, location);
}
