/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <source_location>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace gsf::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    // Derived from the source path of the call site
    enum class LogModule : uint8_t {
        Core = 0,
        Training = 1,
        Checkpoint = 2,
        Telemetry = 3,
        Cli = 4,
        Unknown = 5,
        Count = 6
    };

    inline std::optional<LogLevel> parse_log_level(std::string_view name) {
        if (name == "trace")
            return LogLevel::Trace;
        if (name == "debug")
            return LogLevel::Debug;
        if (name == "info")
            return LogLevel::Info;
        if (name == "warn" || name == "warning")
            return LogLevel::Warn;
        if (name == "error")
            return LogLevel::Error;
        if (name == "critical")
            return LogLevel::Critical;
        if (name == "off")
            return LogLevel::Off;
        return std::nullopt;
    }

    inline std::optional<LogModule> parse_log_module(std::string_view name) {
        if (name == "core")
            return LogModule::Core;
        if (name == "training")
            return LogModule::Training;
        if (name == "checkpoint")
            return LogModule::Checkpoint;
        if (name == "telemetry")
            return LogModule::Telemetry;
        if (name == "cli")
            return LogModule::Cli;
        return std::nullopt;
    }

    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Console at `level`, optional file sink. Clears every per-module override.
        void init(LogLevel level = LogLevel::Info,
                  const std::string& log_file = "") {
            std::lock_guard lock(mutex_);

            std::vector<spdlog::sink_ptr> sinks;

            // Filtering happens in is_enabled(), the sinks pass everything through
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %s:%# %v");
            sinks.push_back(console_sink);

            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
                sinks.push_back(file_sink);
            }

            logger_ = std::make_shared<spdlog::logger>("gsforge", sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger_);

            global_level_ = static_cast<uint8_t>(level);
            for (auto& module_level : module_level_) {
                module_level = kInheritLevel;
            }
        }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (!logger_ || !is_enabled(level, detect_module(loc.file_name()))) {
                return;
            }

            auto msg = std::format(fmt, std::forward<Args>(args)...);

            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                to_spdlog_level(level),
                msg);
        }

        // A module override replaces the global level for that module, in both directions
        void set_module_level(LogModule module, LogLevel level) {
            module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
        }

        bool is_enabled(LogLevel level, LogModule module) const {
            const uint8_t override_level = module_level_[static_cast<size_t>(module)];
            const uint8_t threshold = override_level == kInheritLevel ? global_level_.load() : override_level;
            return level != LogLevel::Off && static_cast<uint8_t>(level) >= threshold;
        }

        void flush() {
            if (logger_)
                logger_->flush();
        }

    private:
        static constexpr uint8_t kInheritLevel = 0xFF;

        Logger() {
            for (auto& module_level : module_level_) {
                module_level = kInheritLevel;
            }
        }

        static LogModule detect_module(std::string_view path) {
            if (path.find("checkpoint") != std::string_view::npos)
                return LogModule::Checkpoint;
            if (path.find("telemetry") != std::string_view::npos)
                return LogModule::Telemetry;
            if (path.find("training") != std::string_view::npos)
                return LogModule::Training;
            if (path.find("argument_parser") != std::string_view::npos ||
                path.find("application") != std::string_view::npos ||
                path.find("main.cpp") != std::string_view::npos)
                return LogModule::Cli;
            if (path.find("core") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        static constexpr spdlog::level::level_enum to_spdlog_level(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            default: return spdlog::level::info;
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Logs the lifetime of the enclosing scope at debug level
    class ScopedTimer {
        std::chrono::steady_clock::time_point start_;
        std::string name_;
        std::source_location loc_;

    public:
        explicit ScopedTimer(std::string name,
                             std::source_location loc = std::source_location::current())
            : start_(std::chrono::steady_clock::now()),
              name_(std::move(name)),
              loc_(loc) {}

        ~ScopedTimer() {
            const auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
            Logger::get().log_internal(LogLevel::Debug, loc_, "{} took {:.2f}ms", name_, ms);
        }
    };

} // namespace gsf::core

#define LOG_TRACE(...) \
    ::gsf::core::Logger::get().log_internal(::gsf::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::gsf::core::Logger::get().log_internal(::gsf::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::gsf::core::Logger::get().log_internal(::gsf::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::gsf::core::Logger::get().log_internal(::gsf::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::gsf::core::Logger::get().log_internal(::gsf::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::gsf::core::Logger::get().log_internal(::gsf::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define LOG_TIMER(name) ::gsf::core::ScopedTimer _timer##__LINE__(name)
