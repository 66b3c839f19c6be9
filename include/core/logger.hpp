/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mva::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
     * "critical", "off")
     * @return The level, or std::nullopt for an unknown name
     */
    std::optional<LogLevel> parse_log_level(std::string_view name);

    /**
     * @brief Process-wide logger backed by spdlog
     *
     * Messages are formatted with std::format before they reach spdlog, so the
     * LOG_* macros accept the same format strings as std::format.
     */
    class Logger {
    public:
        static Logger& get();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief (Re)initialize sinks
         * @param level Minimum level that is emitted
         * @param log_file Optional file sink path; empty means stdout only
         */
        void init(LogLevel level = LogLevel::Info, const std::string& log_file = "");

        void set_level(LogLevel level);
        LogLevel level() const noexcept { return _level; }
        bool should_log(LogLevel level) const noexcept {
            return level >= _level && level != LogLevel::Off;
        }

        template <typename... Args>
        void log(LogLevel level, const std::source_location& location,
                 std::format_string<Args...> fmt, Args&&... args) {
            if (!should_log(level)) {
                return;
            }
            write(level, location, std::format(fmt, std::forward<Args>(args)...));
        }

        void flush();

    private:
        Logger();
        ~Logger();

        void write(LogLevel level, const std::source_location& location, const std::string& message);

        struct Impl;
        std::unique_ptr<Impl> _impl;
        LogLevel _level = LogLevel::Info;
    };

    // Logs the lifetime of a scope on destruction
    class ScopedTimer {
    public:
        ScopedTimer(std::string name, LogLevel level,
                    std::source_location location = std::source_location::current());
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string _name;
        LogLevel _level;
        std::source_location _location;
        std::chrono::steady_clock::time_point _start;
    };

} // namespace mva::core

#define LOG_TRACE(...) ::mva::core::Logger::get().log(::mva::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)
#define LOG_DEBUG(...) ::mva::core::Logger::get().log(::mva::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)
#define LOG_INFO(...)  ::mva::core::Logger::get().log(::mva::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)
#define LOG_WARN(...)  ::mva::core::Logger::get().log(::mva::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)
#define LOG_ERROR(...) ::mva::core::Logger::get().log(::mva::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)
#define LOG_CRITICAL(...) ::mva::core::Logger::get().log(::mva::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define MVA_LOG_CONCAT_INNER(a, b) a##b
#define MVA_LOG_CONCAT(a, b)       MVA_LOG_CONCAT_INNER(a, b)

#define LOG_TIMER_TRACE(name) \
    ::mva::core::ScopedTimer MVA_LOG_CONCAT(mva_scoped_timer_, __LINE__)(name, ::mva::core::LogLevel::Trace)
#define LOG_TIMER(name) \
    ::mva::core::ScopedTimer MVA_LOG_CONCAT(mva_scoped_timer_, __LINE__)(name, ::mva::core::LogLevel::Debug)
