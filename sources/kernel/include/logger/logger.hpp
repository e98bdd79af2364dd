#pragma once

#include "logger/queue.hpp"

namespace vsp {
    class Logger {
        LogQueue *mQueue;
        std::string_view mName;
    public:
        constexpr Logger() noexcept
            : Logger("DEFAULT")
        { }

        constexpr Logger(std::string_view name, LogQueue *queue) noexcept
            : mQueue(queue)
            , mName(name)
        { }

        constexpr Logger(std::string_view name) noexcept
            : Logger(name, &LogQueue::getGlobalQueue())
        { }

        std::string_view getName() const noexcept;

        void submit(LogLevel level, std::string_view message, std::source_location location) noexcept;

        void dbg(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void info(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void warn(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void error(std::string_view message, std::source_location location = std::source_location::current()) noexcept;
        void fatal(std::string_view message, std::source_location location = std::source_location::current()) noexcept;

        template<typename... Args>
        void dbgfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            stdx::StaticString message = vsp::concat<kLogMessageSize>(std::forward<Args>(args)...);
            dbg(message, location);
        }

        template<typename... Args>
        void infofImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            stdx::StaticString message = vsp::concat<kLogMessageSize>(std::forward<Args>(args)...);
            info(message, location);
        }

        template<typename... Args>
        void warnfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            stdx::StaticString message = vsp::concat<kLogMessageSize>(std::forward<Args>(args)...);
            warn(message, location);
        }

        template<typename... Args>
        void errorfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            stdx::StaticString message = vsp::concat<kLogMessageSize>(std::forward<Args>(args)...);
            error(message, location);
        }

        template<typename... Args>
        void fatalfImpl(std::source_location location, Args&&... args) noexcept {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            stdx::StaticString message = vsp::concat<kLogMessageSize>(std::forward<Args>(args)...);
            fatal(message, location);
        }
    };
}

#define dbgf(...) dbgfImpl(std::source_location::current(), __VA_ARGS__)
#define infof(...) infofImpl(std::source_location::current(), __VA_ARGS__)
#define warnf(...) warnfImpl(std::source_location::current(), __VA_ARGS__)
#define errorf(...) errorfImpl(std::source_location::current(), __VA_ARGS__)
#define fatalf(...) fatalfImpl(std::source_location::current(), __VA_ARGS__)
