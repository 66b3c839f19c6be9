/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <vector>

namespace mva::core {

    namespace {

        constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

        spdlog::level::level_enum to_spdlog(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        std::shared_ptr<spdlog::logger> make_logger(const std::string& log_file) {
            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            if (!log_file.empty()) {
                const auto parent = std::filesystem::path(log_file).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
            }
            auto logger = std::make_shared<spdlog::logger>("mva", sinks.begin(), sinks.end());
            logger->set_pattern(LOG_PATTERN);
            return logger;
        }

    } // namespace

    struct Logger::Impl {
        std::mutex mutex;
        std::shared_ptr<spdlog::logger> logger;
    };

    std::optional<LogLevel> parse_log_level(std::string_view name) {
        static const std::unordered_map<std::string_view, LogLevel> levels = {
            {"trace", LogLevel::Trace},
            {"debug", LogLevel::Debug},
            {"info", LogLevel::Info},
            {"warn", LogLevel::Warn},
            {"warning", LogLevel::Warn},
            {"error", LogLevel::Error},
            {"critical", LogLevel::Critical},
            {"off", LogLevel::Off}};
        const auto it = levels.find(name);
        if (it == levels.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger()
        : _impl(std::make_unique<Impl>()) {
        _impl->logger = make_logger("");
        _impl->logger->set_level(to_spdlog(_level));
    }

    Logger::~Logger() = default;

    void Logger::init(LogLevel level, const std::string& log_file) {
        std::lock_guard<std::mutex> lock(_impl->mutex);
        try {
            _impl->logger = make_logger(log_file);
        } catch (const spdlog::spdlog_ex& ex) {
            // Keep the stdout-only logger when the file sink cannot be opened
            std::cerr << "Log file initialization failed: " << ex.what() << std::endl;
            _impl->logger = make_logger("");
        }
        _level = level;
        _impl->logger->set_level(to_spdlog(level));
        _impl->logger->flush_on(spdlog::level::warn);
    }

    void Logger::set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(_impl->mutex);
        _level = level;
        _impl->logger->set_level(to_spdlog(level));
    }

    void Logger::write(LogLevel level, const std::source_location& location, const std::string& message) {
        std::lock_guard<std::mutex> lock(_impl->mutex);
        const auto file = std::filesystem::path(location.file_name()).filename().string();
        _impl->logger->log(to_spdlog(level), "[{}:{}] {}", file, location.line(), message);
    }

    void Logger::flush() {
        std::lock_guard<std::mutex> lock(_impl->mutex);
        _impl->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, LogLevel level, std::source_location location)
        : _name(std::move(name)),
          _level(level),
          _location(location),
          _start(std::chrono::steady_clock::now()) {
    }

    ScopedTimer::~ScopedTimer() {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - _start);
        Logger::get().log(_level, _location, "{} took {:.3f} ms", _name, elapsed.count());
    }

} // namespace mva::core
