#pragma once
#include <type_traits>
#include <array>
#include <ostream>
#include <iostream>
#include <utility>
#include <fmt/core.h>

#define ESMC_ERROR_COLOR "\033[1;31m"
#define ESMC_WARNING_COLOR "\033[1;33m"
#define ESMC_DEBUG_COLOR "\033[1;32m"
#define ESMC_INFO_COLOR "\033[1;34m"
#define ESMC_RESET_COLOR "\033[0m"

#define ESMC_COLOR_E(str) ESMC_ERROR_COLOR str ESMC_RESET_COLOR
#define ESMC_COLOR_W(str) ESMC_WARNING_COLOR str ESMC_RESET_COLOR
#define ESMC_COLOR_D(str) ESMC_DEBUG_COLOR str ESMC_RESET_COLOR
#define ESMC_COLOR_I(str) ESMC_INFO_COLOR str ESMC_RESET_COLOR

namespace esmc
{
    class Logger
    {
        // Direct mapping of LogLevel to the corresponding stream. Nullptr if disabled.
        std::array<std::ostream *, 4> streams{};

    public:
        enum LogLevel
        {
            Error,
            Warning,
            Info,
            Debug,
        };

        // Errors go to stderr, everything up to maxLevel to stdout.
        static Logger console(unsigned maxLevel)
        {
            Logger log;
            log.setStream(Error, &std::cerr);
            for (unsigned i = 1; i <= maxLevel && i <= Debug; i++)
                log.setStream(static_cast<LogLevel>(i), &std::cout);
            return log;
        }

        // Every level disabled. Used by tests and library callers that do not care.
        static Logger silent()
        {
            return Logger{};
        }

        // The requires clauses stand in for an explicit specialization on LogLevel
        template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, LogLevel>)
            Logger &
            operator<<(T &&t)
        {
            if (auto stream = streams[static_cast<unsigned>(logLevel)])
                (*stream) << std::forward<T>(t);
            return *this;
        }

        Logger &operator<<(LogLevel lvl)
        {
            if (auto stream = streams[static_cast<unsigned>(lvl)])
                switch (lvl)
                {
                case LogLevel::Error:
                    (*stream) << ESMC_COLOR_E("Error: ");
                    break;
                case LogLevel::Warning:
                    (*stream) << ESMC_COLOR_W("Warning: ");
                    break;
                case LogLevel::Debug:
                    (*stream) << ESMC_COLOR_D("Debug: ");
                    break;
                case LogLevel::Info:
                    (*stream) << ESMC_COLOR_I("Info: ");
                }
            logLevel = lvl;
            return *this;
        }

        // Tagged, formatted, newline terminated
        template <typename... Args>
        void print(LogLevel lvl, fmt::format_string<Args...> format, Args &&...args)
        {
            if (!enabled(lvl))
                return;
            *this << lvl << fmt::format(format, std::forward<Args>(args)...) << '\n';
        }

        bool enabled(LogLevel lvl) const
        {
            return streams[static_cast<unsigned>(lvl)] != nullptr;
        }

        void setLogLevel(LogLevel lvl)
        {
            logLevel = lvl;
        }

        std::ostream *getStream(LogLevel lvl)
        {
            return streams[static_cast<unsigned>(lvl)];
        }

        void setStream(LogLevel lvl, std::ostream *stream)
        {
            streams[static_cast<unsigned>(lvl)] = stream;
        }

    private:
        LogLevel logLevel = LogLevel::Info;
    };
}
